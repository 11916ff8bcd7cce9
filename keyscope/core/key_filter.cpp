#include "key_filter.h"
#include "../shared/string_util.h"

namespace keyscope {

std::vector<std::string> filter_keys(const std::vector<std::string>& keys, std::string_view text)
{
    if (text.empty())
        return keys;

    std::string needle = to_lower_copy(text);
    std::vector<std::string> out;
    for (const auto& k : keys)
    {
        if (contains_lower(k, needle))
            out.push_back(k);
    }
    return out;
}

} // namespace keyscope
