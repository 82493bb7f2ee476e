#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace paramdec {

int edit_distance(std::string_view a, std::string_view b);

// Names within max_dist edits of target, in pool order, at most five.
std::vector<std::string> fuzzy_candidates(std::string_view target, const std::vector<std::string>& pool, int max_dist = 2);

} // namespace paramdec
