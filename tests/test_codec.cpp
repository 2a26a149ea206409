#include <raylink/codec/decoder.hpp>
#include <raylink/codec/encoder.hpp>
#include <raylink/codec/value.hpp>

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include "fake_evaluator.hpp"

using namespace raylink;
using codec::TypeCode;
using Bytes = std::vector<std::uint8_t>;

namespace {

void append_i64(Bytes& bytes, std::int64_t value) {
    for (int i = 0; i < 8; ++i) {
        bytes.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> (8 * i)) &
                                                  0xFF));
    }
}

template <typename T>
auto vector_of(TypeCode type, std::initializer_list<T> items) -> codec::Value {
    return codec::Value{codec::Vector{.type = type, .data = Column<T>(items)}};
}

/// One column per element type the codec reads.
auto every_type_table() -> codec::Value {
    codec::Guid first;
    codec::Guid second;
    for (std::uint8_t i = 0; i < 16; ++i) {
        first.bytes[i] = i;
        second.bytes[i] = static_cast<std::uint8_t>(0xF0 | i);
    }
    return codec::Value{codec::Table{
        .names = {"b8", "u8", "i16", "i32", "i64", "sym", "date", "time", "ts", "f64", "guid",
                  "c8"},
        .columns =
            {
                vector_of<std::uint8_t>(TypeCode::B8, {1, 0}),
                vector_of<std::uint8_t>(TypeCode::U8, {7, 255}),
                vector_of<std::int16_t>(TypeCode::I16, {-300, 12}),
                vector_of<std::int32_t>(TypeCode::I32, {-70000, 42}),
                vector_of<std::int64_t>(TypeCode::I64, {-5000000000, 1}),
                vector_of<std::string>(TypeCode::Symbol, {"AAPL", ""}),
                vector_of<std::int32_t>(TypeCode::Date, {0, -365}),
                vector_of<std::int32_t>(TypeCode::Time, {3600000, 1}),
                vector_of<std::int64_t>(TypeCode::Timestamp, {86400000000000, -1}),
                vector_of<double>(TypeCode::F64, {1.5, -0.25}),
                vector_of<codec::Guid>(TypeCode::Guid, {first, second}),
                vector_of<std::uint8_t>(TypeCode::C8, {'y', 'n'}),
            },
        .key_columns = 0,
    }};
}

auto decode(const Bytes& bytes) -> codec::Value {
    auto value = codec::decode_value(bytes);
    REQUIRE(value.has_value());
    return *value;
}

auto decode_error(const Bytes& bytes) -> codec::DecodeError {
    auto value = codec::decode_value(bytes);
    REQUIRE_FALSE(value.has_value());
    return value.error();
}

}  // namespace

TEST_CASE("Decode atoms", "[codec]") {
    SECTION("i32 atom") {
        auto value = decode({0xFC, 0x2A, 0x00, 0x00, 0x00});
        REQUIRE(value == codec::Value{codec::Atom{.type = TypeCode::I32,
                                                  .value = std::int32_t{42}}});
    }

    SECTION("big-endian i32 atom") {
        auto value = codec::decode_value(Bytes{0xFC, 0x00, 0x00, 0x00, 0x2A}, codec::Endian::Big);
        REQUIRE(value.has_value());
        const auto* atom = value->get_if<codec::Atom>();
        REQUIRE(atom != nullptr);
        REQUIRE(std::get<std::int32_t>(atom->value) == 42);
    }

    SECTION("b8 atom decodes as bool") {
        auto value = decode({0xFF, 0x01});
        const auto* atom = value.get_if<codec::Atom>();
        REQUIRE(atom != nullptr);
        REQUIRE(atom->type == TypeCode::B8);
        REQUIRE(std::get<bool>(atom->value));
    }

    SECTION("symbol atom") {
        auto value = decode({0xFA, 'a', 'b', 'c', 0x00});
        const auto* atom = value.get_if<codec::Atom>();
        REQUIRE(atom != nullptr);
        REQUIRE(atom->type == TypeCode::Symbol);
        REQUIRE(std::get<std::string>(atom->value) == "abc");
    }

    SECTION("null") {
        REQUIRE(decode({0x7E}).is<codec::Null>());
    }

    SECTION("trailing bytes are ignored") {
        auto value = decode({0xFC, 0x01, 0x00, 0x00, 0x00, 0xAA, 0xBB});
        REQUIRE(std::get<std::int32_t>(value.get_if<codec::Atom>()->value) == 1);
    }
}

TEST_CASE("Decode vectors", "[codec]") {
    SECTION("i64 vector") {
        Bytes bytes{0x05, 0x00};
        append_i64(bytes, 2);
        append_i64(bytes, 7);
        append_i64(bytes, -3);
        REQUIRE(decode(bytes) == testing::i64_vector({7, -3}));
    }

    SECTION("symbol vector") {
        Bytes bytes{0x06, 0x00};
        append_i64(bytes, 2);
        for (char ch : std::string("AAPL")) {
            bytes.push_back(static_cast<std::uint8_t>(ch));
        }
        bytes.push_back(0);
        bytes.push_back('X');
        bytes.push_back(0);
        REQUIRE(decode(bytes) == testing::symbol_vector({"AAPL", "X"}));
    }

    SECTION("char vector collapses into a string") {
        Bytes bytes{0x0C, 0x00};
        append_i64(bytes, 2);
        bytes.push_back('h');
        bytes.push_back('i');
        auto value = decode(bytes);
        const auto* atom = value.get_if<codec::Atom>();
        REQUIRE(atom != nullptr);
        REQUIRE(atom->type == TypeCode::C8);
        REQUIRE(std::get<std::string>(atom->value) == "hi");
    }

    SECTION("empty vector") {
        Bytes bytes{0x0A, 0x00};
        append_i64(bytes, 0);
        auto value = decode(bytes);
        const auto* vector = value.get_if<codec::Vector>();
        REQUIRE(vector != nullptr);
        REQUIRE(vector->type == TypeCode::F64);
        REQUIRE(vector->length() == 0);
    }
}

TEST_CASE("Decode error values", "[codec]") {
    SECTION("code 255 carries a message") {
        Bytes bytes{0x7F, 0xFF, 0, 0, 0, 0, 0, 0, 0, 0, 'o', 'o', 'p', 's', 0};
        auto value = decode(bytes);
        const auto* error = value.get_if<codec::Error>();
        REQUIRE(error != nullptr);
        REQUIRE(error->code == 255);
        REQUIRE(error->message == "oops");
    }

    SECTION("other codes render their number") {
        auto value = decode({0x7F, 0x03, 0, 0, 0, 0, 0, 0, 0, 0});
        const auto* error = value.get_if<codec::Error>();
        REQUIRE(error != nullptr);
        REQUIRE(error->message == "Error code: 3");
    }
}

TEST_CASE("Decode tables", "[codec]") {
    SECTION("plain table") {
        auto table = testing::trades_table();
        auto value = decode(codec::encode_value(table));
        REQUIRE(value == table);
        const auto* decoded = value.get_if<codec::Table>();
        REQUIRE(decoded->row_count() == 3);
        REQUIRE(decoded->key_columns == 0);
    }

    SECTION("keyed table merges key and value columns") {
        codec::Writer writer;
        writer.put_i8(static_cast<std::int8_t>(TypeCode::Dict));
        codec::encode_value(writer, codec::Value{codec::Table{
                                        .names = {"id"},
                                        .columns = {testing::i64_vector({1, 2})},
                                    }});
        codec::encode_value(writer, codec::Value{codec::Table{
                                        .names = {"qty", "px"},
                                        .columns = {testing::i64_vector({10, 20}),
                                                    testing::f64_vector({1.5, 2.5})},
                                    }});
        auto value = decode(writer.bytes());
        const auto* table = value.get_if<codec::Table>();
        REQUIRE(table != nullptr);
        REQUIRE(table->key_columns == 1);
        REQUIRE(table->names == std::vector<std::string>{"id", "qty", "px"});
        REQUIRE(table->row_count() == 2);

        auto row = table->row(1);
        REQUIRE(row.at("id") ==
                codec::Value{codec::Atom{.type = TypeCode::I64, .value = std::int64_t{2}}});
        REQUIRE(row.at("px") == codec::Value{codec::Atom{.type = TypeCode::F64, .value = 2.5}});
    }

    SECTION("keyed table row counts must agree") {
        codec::Writer writer;
        writer.put_i8(static_cast<std::int8_t>(TypeCode::Dict));
        codec::encode_value(writer, codec::Value{codec::Table{
                                        .names = {"id"},
                                        .columns = {testing::i64_vector({1, 2})},
                                    }});
        codec::encode_value(writer, codec::Value{codec::Table{
                                        .names = {"qty"},
                                        .columns = {testing::i64_vector({10})},
                                    }});
        auto error = decode_error(writer.bytes());
        REQUIRE(error.message == "keyed table has 2 key rows but 1 value rows");
    }

    SECTION("ragged columns are rejected") {
        auto bytes = codec::encode_value(codec::Value{codec::Table{
            .names = {"a", "b"},
            .columns = {testing::i64_vector({1, 2}), testing::i64_vector({1, 2, 3})},
        }});
        REQUIRE(decode_error(bytes).message == "table column 'b' has 3 rows, expected 2");
    }

    SECTION("char columns stay addressable by row") {
        codec::Value table{codec::Table{
            .names = {"flag"},
            .columns = {codec::Value{codec::Vector{.type = TypeCode::C8,
                                                   .data = Column<std::uint8_t>{'y', 'n'}}}},
        }};
        auto value = decode(codec::encode_value(table));
        REQUIRE(value == table);
        auto row = value.get_if<codec::Table>()->row(1);
        REQUIRE(std::get<std::string>(row.at("flag").get_if<codec::Atom>()->value) == "n");
    }
}

TEST_CASE("Tables of every element type round-trip", "[codec]") {
    const auto table = every_type_table();
    for (auto endian : {codec::Endian::Little, codec::Endian::Big}) {
        const auto bytes = codec::encode_value(table, endian);
        auto value = codec::decode_value(bytes, endian);
        REQUIRE(value.has_value());
        REQUIRE(*value == table);
        REQUIRE(value->get_if<codec::Table>()->row_count() == 2);
    }
}

TEST_CASE("Every truncation of a table is rejected", "[codec]") {
    const auto bytes = codec::encode_value(every_type_table());
    const std::span<const std::uint8_t> whole(bytes);
    for (std::size_t length = 0; length < bytes.size(); ++length) {
        INFO("length " << length);
        REQUIRE_FALSE(codec::decode_value(whole.first(length)).has_value());
    }
}

TEST_CASE("Decode dictionaries", "[codec]") {
    auto dict = codec::make_dict(testing::symbol_vector({"a", "b"}), testing::i64_vector({1, 2}));
    auto value = decode(codec::encode_value(dict));
    REQUIRE(value == dict);

    auto entries = codec::dict_entries(*value.get_if<codec::Dict>());
    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 2);
    REQUIRE(entries->at("b") ==
            codec::Value{codec::Atom{.type = TypeCode::I64, .value = std::int64_t{2}}});
}

TEST_CASE("Decode rejects malformed payloads", "[codec]") {
    SECTION("empty input") {
        REQUIRE(decode_error({}).message == "unexpected end of payload");
    }

    SECTION("unknown tag") {
        REQUIRE(decode_error({0x65}).message == "unsupported type tag 101");
    }

    SECTION("unknown atom type") {
        REQUIRE(decode_error({0xF3}).message == "unsupported atom type 13");
    }

    SECTION("truncated atom") {
        auto error = decode_error({0xFB, 0x01, 0x02});
        REQUIRE(error.message == "unexpected end of payload: need 8 bytes, have 2");
        REQUIRE(error.offset == 1);
    }

    SECTION("negative length") {
        Bytes bytes{0x05, 0x00};
        append_i64(bytes, -1);
        auto error = decode_error(bytes);
        REQUIRE(error.message == "negative length -1");
        REQUIRE(error.offset == 2);
    }

    SECTION("length beyond the buffer") {
        Bytes bytes{0x05, 0x00};
        append_i64(bytes, 5);
        bytes.insert(bytes.end(), {1, 0, 0});
        auto error = decode_error(bytes);
        REQUIRE(error.message == "length 5 exceeds remaining 3 bytes");
        REQUIRE(error.format() == "length 5 exceeds remaining 3 bytes (at byte 2)");
    }

    SECTION("unterminated symbol") {
        REQUIRE(decode_error({0xFA, 'a', 'b'}).message == "unterminated string");
    }

    SECTION("nesting beyond the depth limit") {
        Bytes bytes;
        for (std::size_t i = 0; i <= codec::kMaxDecodeDepth + 1; ++i) {
            bytes.insert(bytes.end(), {0x00, 0x00});
            append_i64(bytes, 1);
        }
        bytes.push_back(0x7E);
        REQUIRE(decode_error(bytes).message == "value nesting too deep");
    }

    SECTION("table names must be symbols") {
        Bytes bytes{0x62, 0x00};
        const auto names = codec::encode_value(testing::i64_vector({1}));
        bytes.insert(bytes.end(), names.begin(), names.end());
        REQUIRE(decode_error(bytes).message == "table column names are not a symbol vector");
    }
}

TEST_CASE("Encode writes the wire layout", "[codec]") {
    SECTION("string requests are char vectors") {
        auto bytes = codec::encode_value(codec::make_string_request("1+2"));
        Bytes expected{0x0C, 0x00};
        append_i64(expected, 3);
        expected.insert(expected.end(), {'1', '+', '2'});
        REQUIRE(bytes == expected);
    }

    SECTION("error messages only follow code 255") {
        auto coded = codec::encode_value(codec::Value{codec::Error{.code = 4, .message = "x"}});
        REQUIRE(coded.size() == 10);
        auto messaged = codec::encode_value(
            codec::Value{codec::Error{.code = codec::kErrorCodeWithMessage, .message = "x"}});
        REQUIRE(messaged.size() == 12);
        REQUIRE(messaged.back() == 0);
    }

    SECTION("big-endian lengths") {
        auto bytes = codec::encode_value(testing::i64_vector({1}), codec::Endian::Big);
        REQUIRE(bytes[9] == 0x01);
        auto value = codec::decode_value(bytes, codec::Endian::Big);
        REQUIRE(value.has_value());
        REQUIRE(*value == testing::i64_vector({1}));
    }
}
