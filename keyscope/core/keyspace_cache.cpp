#include "keyspace_cache.h"

#include <algorithm>

namespace keyscope {

void keyspace_cache::reset(std::string_view pattern)
{
    m_keys.clear();
    m_index.clear();
    m_types.clear();
    m_cursor = 0;
    m_pattern.assign(pattern.empty() ? std::string_view("*") : pattern);
}

size_t keyspace_cache::merge(const std::vector<std::string>& new_keys, const type_map& new_types, uint64_t next_cursor)
{
    size_t added = 0;
    m_index.reserve(m_index.size() + new_keys.size());
    for (const auto& k : new_keys)
    {
        if (m_index.insert(k).second)
        {
            m_keys.push_back(k);
            ++added;
        }
    }

    for (const auto& [k, t] : new_types)
        m_types[k] = t;

    m_cursor = next_cursor;
    return added;
}

bool keyspace_cache::forget(std::string_view key)
{
    auto it = m_index.find(key);
    if (it == m_index.end())
        return false;
    m_index.erase(it);

    auto pos = std::find(m_keys.begin(), m_keys.end(), key);
    if (pos != m_keys.end())
        m_keys.erase(pos);

    auto t = m_types.find(key);
    if (t != m_types.end())
        m_types.erase(t);
    return true;
}

bool keyspace_cache::add(std::string_view key, key_type type)
{
    auto t = m_types.find(key);
    if (t != m_types.end())
        t->second = type;
    else
        m_types.emplace(std::string(key), type);

    if (!m_index.emplace(key).second)
        return false;
    m_keys.emplace_back(key);
    return true;
}

} // namespace keyscope
