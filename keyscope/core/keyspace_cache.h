#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "key_type.h"
#include "../shared/string_util.h"

namespace keyscope {

// Every key discovered since the last reset, in discovery order, plus
// the scan position needed to continue.
//
// The key list never holds duplicates (a SCAN may return a key more than
// once). Display order is the tree builder's concern, not the cache's.
class keyspace_cache
{
public:
    struct snapshot_view
    {
        const std::vector<std::string>& keys;
        const type_map& types;
        uint64_t cursor;
    };

    keyspace_cache() = default;

    // Clears keys and types, rewinds the cursor to 0 and adopts `pattern`
    void reset(std::string_view pattern);

    // Appends unseen keys, overwrites types for every supplied key, advances the
    // cursor. Returns the number of keys that were new.
    size_t merge(const std::vector<std::string>& new_keys, const type_map& new_types, uint64_t next_cursor);

    snapshot_view snapshot() const { return {m_keys, m_types, m_cursor}; }

    // Load-more that came back with no keys still moves the cursor
    void set_cursor(uint64_t cursor) { m_cursor = cursor; }

    // Drops a key that no longer exists in the store
    bool forget(std::string_view key);

    // Records a key confirmed by the store outside of a scan
    bool add(std::string_view key, key_type type);

    bool contains(std::string_view key) const { return m_index.find(key) != m_index.end(); }
    size_t size() const { return m_keys.size(); }
    bool empty() const { return m_keys.empty(); }

    uint64_t cursor() const { return m_cursor; }
    bool has_more() const { return m_cursor != 0; }
    const std::string& pattern() const { return m_pattern; }

    const std::vector<std::string>& keys() const { return m_keys; }
    const type_map& types() const { return m_types; }

private:
    std::vector<std::string> m_keys;
    string_set m_index;
    type_map m_types;
    uint64_t m_cursor{0};
    std::string m_pattern{"*"};
};

} // namespace keyscope
