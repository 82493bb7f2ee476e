#include "paramdec/keypath.hpp"
#include "paramdec/errors.hpp"
#include "paramdec/shape.hpp"
#include <vector>

namespace paramdec {

KeySplit split_head(std::string_view key){
    auto i = key.find('[');
    if(i == std::string_view::npos) return {key, std::string_view()};
    return {key.substr(0, i), key.substr(i)};
}

std::string_view consumed_prefix(std::string_view full_key, std::string_view tail){
    return full_key.substr(0, full_key.size() - tail.size());
}

Bracket take_bracket(std::string_view full_key, std::string_view tail, const Shape& shape){
    if(tail.empty() || tail[0] != '[')
        throw syntax_error(std::string(consumed_prefix(full_key, tail)), shape.name, SyntaxKind::MissingOpeningBracket, std::string(tail));
    auto close = tail.find(']');
    if(close == std::string_view::npos)
        throw syntax_error(std::string(consumed_prefix(full_key, tail)), shape.name, SyntaxKind::MissingClosingBracket, std::string(tail.substr(1)));
    return {tail.substr(1, close - 1), tail.substr(close + 1)};
}

void require_leaf(std::string_view full_key, std::string_view tail, const Shape& shape,
                  std::span<const std::string> values){
    if(!tail.empty())
        throw nesting_error(std::string(consumed_prefix(full_key, tail)), shape.name, std::string(tail));
    if(values.size() != 1)
        throw singleton_error(std::string(consumed_prefix(full_key, tail)), shape.name,
                              std::vector<std::string>(values.begin(), values.end()));
}

} // namespace paramdec
