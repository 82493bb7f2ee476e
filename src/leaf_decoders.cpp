#include "paramdec/decode.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/keypath.hpp"
#include "paramdec/numeric.hpp"
#include "paramdec/shape.hpp"
#include <exception>

namespace paramdec {

static std::string prefix_of(std::string_view key, std::string_view tail){
    return std::string(consumed_prefix(key, tail));
}

void decode_bool(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                 const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    const std::string& v = values[0];
    if(v == "true" || v == "1" || v == "on") shape.store_bool(target, true);
    else if(v == "false" || v == "0" || v.empty()) shape.store_bool(target, false);
    else throw value_error(prefix_of(key, tail), shape.name, v);
}

void decode_int(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    int64_t n = 0;
    try {
        n = parse_signed(values[0], shape.bits);
    } catch(const std::exception& e) {
        throw value_error(prefix_of(key, tail), shape.name, values[0], e.what(), std::current_exception());
    }
    shape.store_int(target, n);
}

void decode_uint(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                 const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    uint64_t n = 0;
    try {
        n = parse_unsigned(values[0], shape.bits);
    } catch(const std::exception& e) {
        throw value_error(prefix_of(key, tail), shape.name, values[0], e.what(), std::current_exception());
    }
    shape.store_uint(target, n);
}

void decode_float(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                  const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    double d = 0;
    try {
        d = parse_float(values[0], shape.bits);
    } catch(const std::exception& e) {
        throw value_error(prefix_of(key, tail), shape.name, values[0], e.what(), std::current_exception());
    }
    shape.store_float(target, d);
}

void decode_string(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                   const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    shape.store_string(target, values[0]);
}

void decode_text(const DecodeContext&, std::string_view key, std::string_view tail, ValueList values,
                 const Shape& shape, void* target){
    require_leaf(key, tail, shape, values);
    try {
        shape.decode_text(target, values[0]);
    } catch(const std::exception& e) {
        throw value_error(prefix_of(key, tail), shape.name, values[0], e.what(), std::current_exception());
    }
}

} // namespace paramdec
