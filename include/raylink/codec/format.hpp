#pragma once

#include <raylink/codec/value.hpp>

#include <string>
#include <string_view>

namespace raylink::codec {

/// Render a float with up to 7 significant digits and no trailing zeros.
[[nodiscard]] auto format_float(double value) -> std::string;

/// Wrap text in double quotes, escaping quotes, backslashes and control chars.
[[nodiscard]] auto quote_and_escape(std::string_view text) -> std::string;

/// Render one atom payload as the engine displays it.
[[nodiscard]] auto format_scalar(TypeCode type, const Scalar& scalar) -> std::string;

/// Render any value as text.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

}  // namespace raylink::codec
