#include "paramdec/numeric.hpp"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace paramdec {

static std::string_view strip_plus(std::string_view text){
    if(text.empty()) throw std::invalid_argument("invalid syntax");
    if(text[0] == '+'){
        text.remove_prefix(1);
        if(text.empty() || text[0] == '+' || text[0] == '-') throw std::invalid_argument("invalid syntax");
    }
    return text;
}

template <typename N>
static N parse_integral(std::string_view text){
    N v{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v, 10);
    if(ec == std::errc::result_out_of_range) throw std::out_of_range("value out of range");
    if(ec != std::errc() || ptr != text.data() + text.size()) throw std::invalid_argument("invalid syntax");
    return v;
}

int64_t parse_signed(std::string_view text, unsigned bits){
    int64_t v = parse_integral<int64_t>(strip_plus(text));
    if(bits < 64){
        const int64_t hi = (int64_t(1) << (bits - 1)) - 1;
        const int64_t lo = -hi - 1;
        if(v < lo || v > hi) throw std::out_of_range("value out of range");
    }
    return v;
}

uint64_t parse_unsigned(std::string_view text, unsigned bits){
    if(!text.empty() && text[0] == '+') throw std::invalid_argument("invalid syntax");
    uint64_t v = parse_integral<uint64_t>(text);
    if(bits < 64 && v > ((uint64_t(1) << bits) - 1)) throw std::out_of_range("value out of range");
    return v;
}

static bool hex_prefixed(std::string_view text){
    return text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

// Parses straight to F so 32-bit targets are rounded once.
template <typename F>
static F parse_floating(std::string_view text){
    std::string_view body = text;
    bool negative = false;
    auto fmt = std::chars_format::general;
    if(!body.empty() && body[0] == '-'){ negative = true; body.remove_prefix(1); }
    if(hex_prefixed(body)){
        body.remove_prefix(2);
        // hex mantissas need a binary exponent
        if(body.find_first_of("pP") == std::string_view::npos || body.empty() || body[0] == '-' || body[0] == '+')
            throw std::invalid_argument("invalid syntax");
        fmt = std::chars_format::hex;
    } else {
        body = text;
        negative = false;
    }
    F v = 0;
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), v, fmt);
    if(ec == std::errc::invalid_argument || ptr != body.data() + body.size())
        throw std::invalid_argument("invalid syntax");
    if(ec == std::errc::result_out_of_range){
        // from_chars reports underflow and overflow alike; strtod tells them apart.
        std::string copy(text);
        if constexpr (std::is_same_v<F, float>) v = std::strtof(copy.c_str(), nullptr);
        else v = std::strtod(copy.c_str(), nullptr);
        if(std::isinf(v)) throw std::out_of_range("value out of range");
        return v;
    }
    return negative ? -v : v;
}

double parse_float(std::string_view text, unsigned bits){
    text = strip_plus(text);
    if(bits == 32) return parse_floating<float>(text);
    return parse_floating<double>(text);
}

} // namespace paramdec
