// Base-10 number parsing bounded by a target bit width.
#pragma once
#include <cstdint>
#include <string_view>

namespace paramdec {

// Each throws std::invalid_argument("invalid syntax") for malformed text and
// std::out_of_range("value out of range") when the value does not fit in `bits`.
// parse_signed and parse_float accept a single leading '+'; parse_unsigned takes no sign.
int64_t parse_signed(std::string_view text, unsigned bits);
uint64_t parse_unsigned(std::string_view text, unsigned bits);
// bits is 32 or 64; also accepts inf, infinity, nan in any case and hex forms like 0x1p-2.
// With bits == 32 the result is a float widened to double, so narrowing it back is exact.
double parse_float(std::string_view text, unsigned bits);

} // namespace paramdec
