#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "../shared/string_util.h"

namespace keyscope {

enum key_type : uint8_t
{
    key_string  = 0,
    key_list    = 1,
    key_hash    = 2,
    key_set     = 3,
    key_zset    = 4,
    key_none    = 5,   // store reports the key does not exist
    key_unknown = 6    // not resolved, or a type this client does not model
};

// Ordered so that iteration never depends on hashing
using type_map = std::map<std::string, key_type, std::less<>>;

inline key_type parse_key_type(std::string_view str)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("string"): return key_string;
        case fnv1a("list"):   return key_list;
        case fnv1a("hash"):   return key_hash;
        case fnv1a("set"):    return key_set;
        case fnv1a("zset"):   return key_zset;
        case fnv1a("none"):   return key_none;
        default:              return key_unknown;
    }
}

// Strict variant for user input: only the five writable types are accepted
inline bool parse_declarable_type(std::string_view str, key_type& out)
{
    key_type t = parse_key_type(str);
    if (t == key_none || t == key_unknown)
        return false;
    out = t;
    return true;
}

inline const char* key_type_name(key_type t)
{
    switch (t)
    {
        case key_string:  return "string";
        case key_list:    return "list";
        case key_hash:    return "hash";
        case key_set:     return "set";
        case key_zset:    return "zset";
        case key_none:    return "none";
        default:          return "unknown";
    }
}

inline key_type lookup_type(const type_map& types, std::string_view key)
{
    auto it = types.find(key);
    return it != types.end() ? it->second : key_unknown;
}

} // namespace keyscope
