#include "virtual_keys.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"

#include <fnmatch.h>

namespace keyscope {

bool glob_match(std::string_view pattern, std::string_view key)
{
    if (pattern.empty() || pattern == "*")
        return true;
    if (key.find('\0') != std::string_view::npos || pattern.find('\0') != std::string_view::npos)
        return false;
    // fnmatch requires null-terminated strings
    std::string pat_str(pattern);
    std::string key_str(key);
    return fnmatch(pat_str.c_str(), key_str.c_str(), 0) == 0;
}

void virtual_keys::declare(std::string_view key, key_type type)
{
    auto it = m_entries.find(key);
    if (it != m_entries.end())
        it->second = type;
    else
        m_entries.emplace(std::string(key), type);
    LOG_DEBUGF("virtual key declared: %.*s (%s)", static_cast<int>(key.size()), key.data(), key_type_name(type));
}

bool virtual_keys::confirm(std::string_view key, key_type observed)
{
    if (observed == key_none || observed == key_unknown)
        return false;

    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;

    m_entries.erase(it);
    LOG_DEBUGF("virtual key committed: %.*s", static_cast<int>(key.size()), key.data());
    return true;
}

bool virtual_keys::erase(std::string_view key)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    m_entries.erase(it);
    return true;
}

std::optional<key_type> virtual_keys::declared_type(std::string_view key) const
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return std::nullopt;
    return it->second;
}

void virtual_keys::merge(std::string_view pattern,
                         const std::vector<std::string>& keys, const type_map& types,
                         std::vector<std::string>& out_keys, type_map& out_types) const
{
    out_keys = keys;
    out_types = types;
    if (m_entries.empty())
        return;

    string_set present(keys.begin(), keys.end());

    for (const auto& [key, declared] : m_entries)
    {
        if (present.find(key) == present.end())
        {
            if (!glob_match(pattern, key))
                continue;
            out_keys.push_back(key);
            out_types[key] = declared;
            continue;
        }

        auto t = out_types.find(key);
        if (t == out_types.end())
            out_types.emplace(key, declared);
        else if (t->second == key_none || t->second == key_unknown)
            t->second = declared;
    }
}

} // namespace keyscope
