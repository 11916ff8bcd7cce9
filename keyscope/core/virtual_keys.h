#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "key_type.h"

namespace keyscope {

// Glob match with the store's pattern syntax: * ? [abc] [^a] [a-z] and \ escapes.
// fnmatch stops at a NUL byte, so a key or pattern containing one only
// matches the match-all pattern.
bool glob_match(std::string_view pattern, std::string_view key);

// Keys the user created locally that the store does not hold yet.
//
// The store deletes empty collections, so a new hash with no fields would
// vanish from the listing before its first field is written. Entries stay
// here until the store reports the key with a real type.
class virtual_keys
{
public:
    using entry_map = std::map<std::string, key_type, std::less<>>;

    // Re-declaring a key overwrites its intended type
    void declare(std::string_view key, key_type type);

    // Drops the entry once the store reports a non-none type for it.
    // Returns true if an entry was removed.
    bool confirm(std::string_view key, key_type observed);

    // Explicit deletion by the user
    bool erase(std::string_view key);

    void clear() { m_entries.clear(); }

    bool contains(std::string_view key) const { return m_entries.find(key) != m_entries.end(); }
    std::optional<key_type> declared_type(std::string_view key) const;
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    const entry_map& entries() const { return m_entries; }

    // Builds the presented key list: `keys` followed by every virtual key that
    // matches `pattern` and is absent from `keys`, each with its declared type.
    // Virtual keys already in `keys` whose type is none (or unresolved) take the
    // declared type.
    void merge(std::string_view pattern,
               const std::vector<std::string>& keys, const type_map& types,
               std::vector<std::string>& out_keys, type_map& out_types) const;

private:
    entry_map m_entries;
};

} // namespace keyscope
