#include "type_batcher.h"
#include "../shared/logging.h"

#include <unordered_set>

namespace keyscope {

core_status type_batcher::resolve_types(const std::vector<std::string>& keys, type_map& out)
{
    if (keys.empty())
        return core_status::success();

    std::vector<std::string> distinct;
    distinct.reserve(keys.size());
    std::unordered_set<std::string_view> seen;
    seen.reserve(keys.size());
    for (const auto& k : keys)
    {
        if (seen.insert(k).second)
            distinct.push_back(k);
    }

    type_map resolved;
    ++m_round_trips;
    auto st = m_store.type_of_many(distinct, resolved);
    if (!st)
    {
        LOG_WARNF("type batch of %zu keys rejected: %s", distinct.size(), st.message.c_str());
        return st;
    }

    // Every requested key must come back; a short answer would render some
    // keys as unknown while their siblings resolved.
    for (const auto& k : distinct)
    {
        if (resolved.find(k) == resolved.end())
            return core_status::fail(status_resolution, "no type returned for key: " + k);
    }

    for (auto& [k, t] : resolved)
        out[k] = t;
    return core_status::success();
}

} // namespace keyscope
