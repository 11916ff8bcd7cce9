#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace keyscope {

// Keeps the keys that contain `text`, ignoring ASCII case, in input order.
// An empty `text` returns the input unchanged.
std::vector<std::string> filter_keys(const std::vector<std::string>& keys, std::string_view text);

} // namespace keyscope
