#include "paramdec/decode.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/keypath.hpp"
#include "paramdec/record_cache.hpp"
#include "paramdec/shape.hpp"

namespace paramdec {

void decode_map(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
                const Shape& shape, void* target){
    auto [map_key, rest] = take_bracket(key, tail, shape);
    if(!shape.map_update)
        throw invalid_shape_error(std::string(consumed_prefix(key, tail)), shape.name,
                                  "map keys must be strings, not " + shape.key->name);
    // "[]" is the flat-list marker, never a map key
    if(map_key.empty())
        throw nesting_error(std::string(consumed_prefix(key, tail)), shape.name, std::string(tail));
    const Shape& elem = *shape.elem;
    std::string_view elem_tail = rest;
    shape.map_update(target, std::string(map_key), [&](void* slot){
        decode(ctx, key, elem_tail, values, elem, slot);
    });
}

void decode_pointer(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
                    const Shape& shape, void* target){
    void* pointee = shape.engaged(target) ? shape.deref(target) : shape.emplace(target);
    decode(ctx, key, tail, values, *shape.elem, pointee);
}

void decode_sequence(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
                     const Shape& shape, void* target){
    if(tail != "[]")
        throw nesting_error(std::string(consumed_prefix(key, tail)), shape.name, std::string(tail));
    const std::string path(consumed_prefix(key, tail));
    const Shape& elem = *shape.elem;
    shape.rebuild(target, values.size(), [&](size_t i, void* slot){
        // element keys read "path[i]" so errors point at the offending value
        const std::string elem_key = path + "[" + std::to_string(i) + "]";
        decode(ctx, elem_key, std::string_view(), values.subspan(i, 1), elem, slot);
    });
}

void decode_record(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
                   const Shape& shape, void* target){
    auto [field, rest] = take_bracket(key, tail, shape);
    FieldTablePtr table = ctx.cache.resolve(shape, ctx.env);
    decode_field(ctx, *table, key, field, rest, values, target);
}

} // namespace paramdec
