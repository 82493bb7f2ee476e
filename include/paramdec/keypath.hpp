// Bracketed key grammar: key := head ('[' segment ']')*
#pragma once
#include <span>
#include <string>
#include <string_view>

namespace paramdec {

struct Shape;

struct KeySplit { std::string_view head; std::string_view tail; };
struct Bracket { std::string_view content; std::string_view rest; };

// head is everything before the first '['; tail starts at it (or is empty).
KeySplit split_head(std::string_view key);

// The part of full_key already consumed when tail is what remains. tail must be a suffix of full_key.
std::string_view consumed_prefix(std::string_view full_key, std::string_view tail);

// Consume the leading "[content]" of tail. Throws syntax_error naming shape.
Bracket take_bracket(std::string_view full_key, std::string_view tail, const Shape& shape);

// Leaf precondition: nothing left to nest into and exactly one value.
void require_leaf(std::string_view full_key, std::string_view tail, const Shape& shape,
                  std::span<const std::string> values);

} // namespace paramdec
