#pragma once
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace paramdec {

// Flat multi-map of keys to values, as submitted by a form.
using Values = std::unordered_map<std::string, std::vector<std::string>>;

// Parse application/x-www-form-urlencoded text ("a=1&b[]=2&b[]=3").
// Pairs are separated by '&' and split at the first '='; '+' decodes to a
// space and %XX to the byte it names. Empty pairs are skipped and repeated
// keys append in order. Throws query_error on a malformed escape or a ';'.
Values parse_query(std::string_view query);

} // namespace paramdec
