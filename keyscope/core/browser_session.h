#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "core_status.h"
#include "cursor_paginator.h"
#include "key_type.h"
#include "keyspace_cache.h"
#include "namespace_tree.h"
#include "type_batcher.h"
#include "virtual_keys.h"
#include "../client/data_access.h"

namespace keyscope {

enum browser_state : uint8_t
{
    state_empty        = 0,
    state_loading      = 1,
    state_ready        = 2,
    state_filtered     = 3,
    state_loading_more = 4
};

const char* browser_state_name(browser_state s);

struct session_settings
{
    std::string separator{":"};
    std::string pattern{"*"};
    size_t page_size{2000};
};

struct key_details
{
    std::string key;
    key_type type{key_unknown};
    bool is_virtual{false};     // type came from the overlay, not the store
    int64_t ttl{-2};
    std::string encoding{"unknown"};
    std::optional<int64_t> memory_bytes;
    key_value value;            // empty for virtual and missing keys
};

// One browsing session over one store connection.
//
// Every operation takes the session lock, so a write can never land in the
// middle of a multi-round-trip scan. Failed fetches leave the cache, overlay
// and tree exactly as they were. cancel() may be called from any thread or
// from a signal handler.
class browser_session
{
public:
    explicit browser_session(data_access& store, session_settings settings = {});

    browser_session(const browser_session&) = delete;
    browser_session& operator=(const browser_session&) = delete;

    // ─── Pagination ───
    core_status load_first_page(std::string_view pattern, size_t min_count);
    core_status load_first_page();
    core_status load_more(size_t min_count);
    core_status load_more();
    core_status refresh();

    // ─── Connection lifecycle ───
    core_status switch_db(int index);
    core_status reconnect();

    // ─── Local view ───
    void apply_filter(std::string_view text);
    void set_separator(std::string_view separator);
    void set_page_size(size_t page_size);

    // ─── Virtual keys ───
    void declare_virtual_key(std::string_view key, key_type type);
    // Call after any successful write to `key`
    core_status on_key_committed(std::string_view key);

    // ─── Key operations ───
    // Runs `fn` under the session lock, then treats `key` as committed
    core_status mutate(std::string_view key, const std::function<core_status(data_access&)>& fn);
    core_status delete_key(std::string_view key);
    core_status inspect_key(std::string_view key, key_details& out);

    // Raw command line. Write commands reload the first page afterwards;
    // SELECT <n> switches the database like switch_db().
    core_status execute(std::string_view line, std::string& out);

    // Soft: empty on failure
    std::map<int, int64_t> keyspace_info();

    void cancel() noexcept;

    // ─── Observers ───
    namespace_tree current_tree() const;
    browser_state state() const;
    std::string filter() const;
    std::string pattern() const;
    uint64_t cursor() const;
    size_t cached_key_count() const;
    size_t virtual_key_count() const;
    session_settings settings() const;
    int current_db() const;

private:
    core_status load_first_page_locked(std::string_view pattern, size_t min_count);
    core_status switch_db_locked(int index);
    core_status commit_locked(std::string_view key);
    void rebuild_locked();
    void settle_locked();
    void clear_locked();

    data_access& m_store;
    cursor_paginator m_paginator;
    type_batcher m_batcher;

    keyspace_cache m_cache;
    virtual_keys m_virtual;
    namespace_tree m_tree;

    session_settings m_settings;
    std::string m_filter;
    std::atomic<browser_state> m_state{state_empty};
    bool m_loaded{false};

    mutable std::mutex m_mutex;
    std::atomic<uint64_t> m_generation{0};
};

} // namespace keyscope
