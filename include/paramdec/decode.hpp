// Type-directed recursive decoding over type-erased targets.
#pragma once
#include <span>
#include <string>
#include <string_view>
#include "paramdec/env.hpp"

namespace paramdec {

struct Shape;
struct FieldTable;
class RecordCache;

using ValueList = std::span<const std::string>;

struct DecodeContext {
    RecordCache& cache;
    const DecodeEnv& env;
};

// key is the whole key being decoded ("foo[bar][]"), tail the part this layer
// is responsible for ("[bar][]"), target a slot holding a value of shape.
using DecodeFn = void (*)(const DecodeContext& ctx, std::string_view key, std::string_view tail,
                          ValueList values, const Shape& shape, void* target);

// Decoder for shape's kind; nullptr for unsupported shapes.
DecodeFn route(const Shape& shape);

// Single recursion point. Throws invalid_shape_error for unsupported shapes.
void decode(const DecodeContext& ctx, std::string_view key, std::string_view tail, ValueList values,
            const Shape& shape, void* target);

void decode_bool(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_int(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_uint(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_float(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_string(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_text(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_map(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_pointer(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_sequence(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);
void decode_record(const DecodeContext&, std::string_view, std::string_view, ValueList, const Shape&, void*);

// Resolve field against table and decode the remaining tail into it. Unknown
// fields raise key_error, with suggestions when ctx.env.suggest is set.
void decode_field(const DecodeContext& ctx, const FieldTable& table, std::string_view key, std::string_view field,
                  std::string_view tail, ValueList values, void* record);

} // namespace paramdec
