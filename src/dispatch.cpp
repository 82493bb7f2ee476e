#include "paramdec/decode.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/keypath.hpp"
#include "paramdec/log.hpp"
#include "paramdec/record_cache.hpp"
#include "paramdec/shape.hpp"
#include "paramdec/suggest.hpp"

namespace paramdec {

DecodeFn route(const Shape& shape){
    switch(shape.kind){
        case Shape::Kind::Text: return &decode_text;
        case Shape::Kind::Bool: return &decode_bool;
        case Shape::Kind::Int: return &decode_int;
        case Shape::Kind::Uint: return &decode_uint;
        case Shape::Kind::Float: return &decode_float;
        case Shape::Kind::Map: return &decode_map;
        case Shape::Kind::Pointer: return &decode_pointer;
        case Shape::Kind::Sequence: return &decode_sequence;
        case Shape::Kind::String: return &decode_string;
        case Shape::Kind::Record: return &decode_record;
        case Shape::Kind::Unsupported: return nullptr;
    }
    return nullptr;
}

void decode(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
            const Shape& shape, void* target){
    DecodeFn fn = route(shape);
    if(!fn) throw invalid_shape_error(std::string(consumed_prefix(key, tail)), shape.name, "unsupported type");
    fn(ctx, key, tail, values, shape, target);
}

void decode_field(const DecodeContext& ctx, const FieldTable& table, std::string_view key, std::string_view field,
                  std::string_view tail, ValueList values, void* record){
    const FieldEntry* entry = table.find(field);
    if(!entry){
        std::vector<std::string> suggestions;
        if(ctx.env.suggest) suggestions = fuzzy_candidates(field, table.names());
        throw key_error(std::string(key), std::string(consumed_prefix(key, tail)), table.record_name,
                        std::string(field), std::move(suggestions));
    }
    PARAMDEC_LOG_TRACE(ctx.env, "decode", "%.*s -> %s.%s (%s)", (int)key.size(), key.data(),
                       table.record_name.c_str(), entry->name.c_str(), entry->shape->name.c_str());
    entry->decode(ctx, key, tail, values, *entry->shape, entry->slot(record));
}

} // namespace paramdec
