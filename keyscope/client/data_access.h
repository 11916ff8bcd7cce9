#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/core_status.h"
#include "../core/key_type.h"
#include "../protocol/resp_codec.h"

namespace keyscope {

struct scan_page
{
    uint64_t cursor{0};                 // 0 = enumeration complete
    std::vector<std::string> keys;      // may be empty even when cursor != 0
};

// Contents of one key. Which member is filled depends on `type`.
struct key_value
{
    key_type type{key_none};
    std::optional<std::string> text;                            // string
    std::vector<std::string> members;                           // list in order, set sorted
    std::vector<std::pair<std::string, std::string>> fields;    // hash field/value, zset member/score

    size_t size() const
    {
        if (type == key_string)
            return text ? 1 : 0;
        return members.size() + fields.size();
    }
};

// Everything the browsing core needs from the store. The core never speaks
// the wire protocol itself; tests substitute an in-process implementation.
class data_access
{
public:
    virtual ~data_access() = default;

    // One SCAN round trip. `count` is only a hint to the store.
    virtual core_status scan(uint64_t cursor, std::string_view pattern,
                             size_t count, scan_page& out) = 0;

    virtual core_status type_of(std::string_view key, key_type& out) = 0;

    // One pipelined round trip for every key. All-or-nothing: on failure `out`
    // is left untouched.
    virtual core_status type_of_many(const std::vector<std::string>& keys, type_map& out) = 0;

    // Seconds; -1 = no expiry, -2 = key missing
    virtual core_status ttl(std::string_view key, int64_t& out) = 0;

    // Soft lookups: failures come back as "unknown" / nullopt, never as errors
    virtual std::string encoding(std::string_view key) = 0;
    virtual std::optional<int64_t> memory_usage(std::string_view key) = 0;
    virtual std::map<int, int64_t> keyspace_info() = 0;

    virtual core_status remove(std::string_view key, bool& removed) = 0;
    virtual core_status select_db(int index) = 0;
    virtual int current_db() const = 0;

    // Raw command; server error replies come back as reply_kind::error with an ok status
    virtual core_status command(const std::vector<std::string>& args, resp::reply& out) = 0;

    virtual core_status reconnect() = 0;
    virtual bool is_connected() const = 0;

    // ─── Mutations (built on command()) ───

    // Both map a server error reply to status_invalid
    core_status query(const std::vector<std::string>& args, resp::reply& out);
    core_status write(const std::vector<std::string>& args);

    core_status set_string(std::string_view key, std::string_view value, int64_t ttl_seconds = 0);
    core_status list_push(std::string_view key, std::string_view value);
    core_status list_set(std::string_view key, int64_t index, std::string_view value);
    core_status list_remove(std::string_view key, std::string_view value, int64_t count = 1);
    core_status hash_set(std::string_view key, std::string_view field, std::string_view value);
    core_status hash_delete(std::string_view key, std::string_view field);
    core_status set_add(std::string_view key, std::string_view member);
    core_status set_remove(std::string_view key, std::string_view member);
    core_status zset_add(std::string_view key, std::string_view member, double score);
    core_status zset_remove(std::string_view key, std::string_view member);
    core_status rename(std::string_view from, std::string_view to);

    // ttl < 0 removes the expiry
    core_status set_ttl(std::string_view key, int64_t ttl);

    // ─── Value reads (built on command()) ───

    // Missing key leaves `out` empty
    core_status get_string(std::string_view key, std::optional<std::string>& out);
    core_status get_list(std::string_view key, std::vector<std::string>& out,
                         int64_t start = 0, int64_t stop = -1);
    core_status get_hash(std::string_view key, std::vector<std::pair<std::string, std::string>>& out);
    core_status get_set(std::string_view key, std::vector<std::string>& out);
    // Ascending by score; scores are kept as the store formats them
    core_status get_zset(std::string_view key, std::vector<std::pair<std::string, std::string>>& out,
                         int64_t start = 0, int64_t stop = -1);

    // Reads whichever of the above matches `type`; none/unknown read nothing
    core_status read_value(std::string_view key, key_type type, key_value& out);

    // Whitespace-split command line, reply rendered as redis-cli style text.
    // Server errors are part of the text ("(error) ..."); only transport
    // failures fail the status.
    core_status execute(std::string_view line, std::string& out);
};

// True for commands after which the key listing should be reloaded
bool is_write_command(std::string_view name);

} // namespace keyscope
