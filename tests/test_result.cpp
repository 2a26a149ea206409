#include <raylink/runtime/result.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "fake_evaluator.hpp"

using namespace raylink;
using runtime::Result;
using runtime::ResultKind;

namespace {

auto evaluate_native(const std::shared_ptr<testing::FakeEvaluator>& engine, std::string_view code)
    -> Result {
    auto handle = engine->evaluate(code);
    REQUIRE(handle.has_value());
    return Result::from_native(engine::OwnedHandle(engine, *handle));
}

}  // namespace

TEST_CASE("Decoded table results", "[runtime][result]") {
    auto result = Result::from_value(testing::trades_table());

    REQUIRE(result.kind() == ResultKind::Table);
    REQUIRE(result.columns() == std::vector<std::string>{"sym", "price"});
    REQUIRE(result.column_types() == std::vector<std::string>{"sym", "f64"});
    REQUIRE(result.row_count() == 3);
    REQUIRE_FALSE(result.execution().has_value());

    SECTION("fixed-width columns have a zero-copy view") {
        auto price = result.column("price");
        REQUIRE(price.has_value());
        REQUIRE(price->type == codec::TypeCode::F64);
        auto values = price->as<double>();
        REQUIRE(values.size() == 3);
        REQUIRE(values[1] == 2.25);
        REQUIRE(price->as<std::int32_t>().empty());
    }

    SECTION("symbol and unknown columns have none") {
        REQUIRE_FALSE(result.column("sym").has_value());
        REQUIRE_FALSE(result.column("volume").has_value());
    }

    SECTION("materialize projects rows once") {
        const auto& first = result.materialize();
        const auto& again = result.materialize();
        REQUIRE(&first == &again);

        const auto& records = std::get<std::vector<codec::Record>>(first);
        REQUIRE(records.size() == 3);
        REQUIRE(records[2].at("sym") ==
                codec::Value{codec::Atom{.type = codec::TypeCode::Symbol,
                                         .value = std::string("AAPL")}});
    }
}

TEST_CASE("Decoded scalar, vector, error and null results", "[runtime][result]") {
    SECTION("scalar") {
        auto result = Result::from_value(
            codec::Value{codec::Atom{.type = codec::TypeCode::I64, .value = std::int64_t{7}}});
        REQUIRE(result.kind() == ResultKind::Scalar);
        REQUIRE(std::holds_alternative<codec::Value>(result.materialize()));
    }

    SECTION("vector") {
        auto result = Result::from_value(testing::i64_vector({4, 5, 6}));
        REQUIRE(result.kind() == ResultKind::Vector);
        REQUIRE(result.row_count() == 3);
        auto view = result.vector_view();
        REQUIRE(view.has_value());
        REQUIRE(view->as<std::int64_t>()[2] == 6);
        REQUIRE(result.columns().empty());
    }

    SECTION("lists count as vectors") {
        REQUIRE(Result::from_value(codec::Value{codec::List{}}).kind() == ResultKind::Vector);
    }

    SECTION("plain dictionaries are scalars") {
        auto symbol_keyed = Result::from_value(
            codec::make_dict(testing::symbol_vector({"a"}), testing::i64_vector({1})));
        REQUIRE(symbol_keyed.kind() == ResultKind::Scalar);
        REQUIRE_FALSE(symbol_keyed.vector_view().has_value());
        REQUIRE(symbol_keyed.row_count() == 0);

        auto number_keyed = Result::from_value(
            codec::make_dict(testing::i64_vector({1, 2}), testing::i64_vector({3, 4})));
        REQUIRE(number_keyed.kind() == ResultKind::Scalar);
        REQUIRE(std::holds_alternative<codec::Value>(number_keyed.materialize()));
    }

    SECTION("error") {
        auto result = Result::from_error("Connection closed");
        REQUIRE(result.is_error());
        REQUIRE(result.error_message() == "Connection closed");
        REQUIRE(std::holds_alternative<std::monostate>(result.materialize()));
    }

    SECTION("null") {
        auto result = Result::null();
        REQUIRE(result.kind() == ResultKind::Null);
        REQUIRE(result.row_count() == 0);
        REQUIRE(result.error_message().empty());
    }
}

TEST_CASE("with_execution stamps a copy", "[runtime][result]") {
    auto result = Result::null();
    auto stamped = result.with_execution(12.5, runtime::Origin::Remote);

    REQUIRE_FALSE(result.execution().has_value());
    REQUIRE(stamped.execution().has_value());
    REQUIRE(stamped.execution()->elapsed_ms == 12.5);
    REQUIRE(stamped.execution()->origin == runtime::Origin::Remote);
    REQUIRE(runtime::to_string(runtime::Origin::Local) == "local");
    REQUIRE(runtime::to_string(ResultKind::Table) == "table");
}

TEST_CASE("Native results read the engine directly", "[runtime][result]") {
    auto engine = std::make_shared<testing::FakeEvaluator>();
    engine->script("trades", testing::trades_table());
    engine->script("nums", testing::i64_vector({1, 2, 3, 4}));
    engine->script("one", codec::Value{codec::Atom{.type = codec::TypeCode::F64, .value = 1.0}});

    SECTION("table metadata and column views") {
        {
            auto result = evaluate_native(engine, "trades");
            REQUIRE(result.kind() == ResultKind::Table);
            REQUIRE(result.columns() == std::vector<std::string>{"sym", "price"});
            REQUIRE(result.column_types() == std::vector<std::string>{"sym", "f64"});
            REQUIRE(result.row_count() == 3);
            REQUIRE_FALSE(result.column("sym").has_value());

            auto price = result.column("price");
            REQUIRE(price.has_value());
            REQUIRE(price->as<double>()[0] == 1.5);

            REQUIRE(result.value() == testing::trades_table());
            REQUIRE(engine->live_objects() == 3);
        }
        REQUIRE(engine->live_objects() == 0);
        REQUIRE(engine->double_releases() == 0);
    }

    SECTION("copies share one handle") {
        {
            auto result = evaluate_native(engine, "nums");
            auto copy = result;
            auto stamped = copy.with_execution(1.0, runtime::Origin::Local);
            REQUIRE(engine->live_objects() == 1);
            REQUIRE(stamped.vector_view()->as<std::int64_t>()[3] == 4);
            REQUIRE(stamped.row_count() == 4);
        }
        REQUIRE(engine->live_objects() == 0);
    }

    SECTION("scalars") {
        auto result = evaluate_native(engine, "one");
        REQUIRE(result.kind() == ResultKind::Scalar);
        REQUIRE_FALSE(result.vector_view().has_value());
        REQUIRE(result.value() ==
                codec::Value{codec::Atom{.type = codec::TypeCode::F64, .value = 1.0}});
    }

    SECTION("engine errors") {
        auto result = evaluate_native(engine, "missing");
        REQUIRE(result.is_error());
        REQUIRE(result.error_message() == "undefined: missing");
        REQUIRE(result.value() == codec::Value{codec::Error{
                                      .code = codec::kErrorCodeWithMessage,
                                      .message = "undefined: missing",
                                  }});
    }

    SECTION("keyed tables are described by their decoded form") {
        engine->script("keyed", codec::Value{codec::Table{
                                    .names = {"id", "qty"},
                                    .columns = {testing::i64_vector({1, 2}),
                                                testing::i64_vector({5, 6})},
                                    .key_columns = 1,
                                }});
        auto result = evaluate_native(engine, "keyed");
        REQUIRE(result.kind() == ResultKind::Table);
        REQUIRE(result.columns() == std::vector<std::string>{"id", "qty"});
        REQUIRE(result.row_count() == 2);
        REQUIRE(result.column_types() == std::vector<std::string>{"i64", "i64"});
    }

    SECTION("plain dictionaries are scalars") {
        engine->script("prices", codec::make_dict(testing::symbol_vector({"a", "b"}),
                                                  testing::i64_vector({1, 2})));
        auto result = evaluate_native(engine, "prices");
        REQUIRE(result.kind() == ResultKind::Scalar);
        REQUIRE(result.value().is<codec::Dict>());
    }
}
