#include "browser_session.h"
#include "key_filter.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"

#include <charconv>
#include <climits>
#include <vector>

namespace keyscope {

namespace {

bool parse_db_index(std::string_view sv, int& out)
{
    long long v = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || v < 0 || v > INT_MAX)
        return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

const char* browser_state_name(browser_state s)
{
    switch (s)
    {
        case state_empty:        return "empty";
        case state_loading:      return "loading";
        case state_ready:        return "ready";
        case state_filtered:     return "filtered";
        case state_loading_more: return "loading-more";
        default:                 return "?";
    }
}

browser_session::browser_session(data_access& store, session_settings settings)
    : m_store(store), m_paginator(store), m_batcher(store), m_settings(std::move(settings))
{
    if (m_settings.pattern.empty())
        m_settings.pattern = "*";
    if (m_settings.page_size == 0)
        m_settings.page_size = 1;
    m_cache.reset(m_settings.pattern);
}

// ─── State helpers ───

void browser_session::settle_locked()
{
    if (!m_loaded)
        m_state = state_empty;
    else
        m_state = m_filter.empty() ? state_ready : state_filtered;
}

void browser_session::clear_locked()
{
    m_cache.reset(m_cache.pattern());
    m_loaded = false;
    m_tree = namespace_tree{};
    m_state = state_empty;
}

void browser_session::rebuild_locked()
{
    std::vector<std::string> presented;
    type_map presented_types;
    m_virtual.merge(m_cache.pattern(), m_cache.keys(), m_cache.types(), presented, presented_types);

    if (!m_filter.empty())
        presented = filter_keys(presented, m_filter);

    m_tree = namespace_tree::build(presented, presented_types, m_settings.separator);
    m_tree.annotate(m_cache.cursor());
}

// ─── Pagination ───

core_status browser_session::load_first_page_locked(std::string_view pattern, size_t min_count)
{
    std::string pat(pattern.empty() ? std::string_view("*") : pattern);
    cancel_token token = cancel_token::observe(m_generation);

    browser_state before = m_state;
    m_state = state_loading;

    scan_page page;
    auto st = m_paginator.fetch(0, pat, min_count, page, token);
    if (!st)
    {
        m_state = before;
        return st;
    }

    type_map types;
    st = m_batcher.resolve_types(page.keys, types);
    if (!st)
    {
        m_state = before;
        return st;
    }

    if (token.cancelled())
    {
        m_state = before;
        return core_status::fail(status_cancelled, "load cancelled");
    }

    m_cache.reset(pat);
    m_cache.merge(page.keys, types, page.cursor);
    m_settings.pattern = pat;
    m_settings.page_size = min_count ? min_count : 1;
    m_loaded = true;

    rebuild_locked();
    settle_locked();

    LOG_INFOF("loaded %zu keys (pattern %s, cursor %llu)", m_cache.size(), pat.c_str(),
        static_cast<unsigned long long>(m_cache.cursor()));
    return core_status::success();
}

core_status browser_session::load_first_page(std::string_view pattern, size_t min_count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return load_first_page_locked(pattern, min_count);
}

core_status browser_session::load_first_page()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return load_first_page_locked(m_settings.pattern, m_settings.page_size);
}

core_status browser_session::load_more(size_t min_count)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Nothing loaded yet, or the scan already finished
    if (!m_loaded || !m_cache.has_more())
        return core_status::success();

    cancel_token token = cancel_token::observe(m_generation);
    browser_state before = m_state;
    m_state = state_loading_more;

    scan_page page;
    auto st = m_paginator.fetch(m_cache.cursor(), m_cache.pattern(), min_count, page, token);
    if (!st)
    {
        m_state = before;
        return st;
    }

    if (page.keys.empty())
    {
        // Empty batch with a live cursor: only the position moves
        m_cache.set_cursor(page.cursor);
    }
    else
    {
        type_map types;
        st = m_batcher.resolve_types(page.keys, types);
        if (!st)
        {
            m_state = before;
            return st;
        }
        if (token.cancelled())
        {
            m_state = before;
            return core_status::fail(status_cancelled, "load cancelled");
        }

        size_t added = m_cache.merge(page.keys, types, page.cursor);
        LOG_DEBUGF("load more: %zu new keys, cursor %llu", added,
            static_cast<unsigned long long>(page.cursor));
    }

    rebuild_locked();
    settle_locked();
    return core_status::success();
}

core_status browser_session::load_more()
{
    size_t n;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        n = m_settings.page_size;
    }
    return load_more(n);
}

core_status browser_session::refresh()
{
    // The old listing stays visible until the new first page has fully arrived
    std::lock_guard<std::mutex> lock(m_mutex);
    return load_first_page_locked(m_settings.pattern, m_settings.page_size);
}

// ─── Connection lifecycle ───

core_status browser_session::switch_db_locked(int index)
{
    auto st = m_store.select_db(index);
    if (!st)
        return st;

    LOG_INFOF("switched to db %d", index);
    clear_locked();
    return load_first_page_locked(m_settings.pattern, m_settings.page_size);
}

core_status browser_session::switch_db(int index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return switch_db_locked(index);
}

core_status browser_session::reconnect()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto st = m_store.reconnect();
    if (!st)
        return st;

    // Virtual keys survive a reconnect; they belong to the session
    clear_locked();
    return load_first_page_locked(m_settings.pattern, m_settings.page_size);
}

// ─── Local view ───

void browser_session::apply_filter(std::string_view text)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_filter.assign(text);
    if (!m_loaded)
        return;
    rebuild_locked();
    settle_locked();
}

void browser_session::set_separator(std::string_view separator)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.separator.assign(separator);
    if (m_loaded)
        rebuild_locked();
}

void browser_session::set_page_size(size_t page_size)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_settings.page_size = page_size ? page_size : 1;
}

// ─── Virtual keys ───

void browser_session::declare_virtual_key(std::string_view key, key_type type)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_virtual.declare(key, type);
    if (m_loaded)
        rebuild_locked();
}

core_status browser_session::commit_locked(std::string_view key)
{
    key_type observed = key_unknown;
    auto st = m_store.type_of(key, observed);
    if (!st)
        return st;

    m_virtual.confirm(key, observed);

    if (observed != key_none)
    {
        if (m_cache.contains(key) || glob_match(m_cache.pattern(), key))
            m_cache.add(key, observed);
    }
    else if (!m_virtual.contains(key))
    {
        // Last member removed: the store dropped the key
        m_cache.forget(key);
    }

    if (m_loaded)
        rebuild_locked();
    return core_status::success();
}

core_status browser_session::on_key_committed(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return commit_locked(key);
}

// ─── Key operations ───

core_status browser_session::mutate(std::string_view key, const std::function<core_status(data_access&)>& fn)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto st = fn(m_store);
    if (!st)
        return st;
    return commit_locked(key);
}

core_status browser_session::delete_key(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    bool removed = false;
    auto st = m_store.remove(key, removed);
    if (!st)
        return st;

    m_virtual.erase(key);
    m_cache.forget(key);
    if (m_loaded)
        rebuild_locked();
    return core_status::success();
}

core_status browser_session::inspect_key(std::string_view key, key_details& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    key_details d;
    d.key.assign(key);

    auto st = m_store.type_of(key, d.type);
    if (!st)
        return st;

    if (d.type == key_none)
    {
        if (auto declared = m_virtual.declared_type(key))
        {
            d.type = *declared;
            d.is_virtual = true;
        }
    }

    st = m_store.ttl(key, d.ttl);
    if (!st)
        return st;

    if (!d.is_virtual)
    {
        d.encoding = m_store.encoding(key);
        d.memory_bytes = m_store.memory_usage(key);

        st = m_store.read_value(key, d.type, d.value);
        if (!st)
            return st;
    }
    else
    {
        d.value.type = d.type;
    }

    out = std::move(d);
    return core_status::success();
}

core_status browser_session::execute(std::string_view line, std::string& out)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto args = split_whitespace(line);

    // SELECT moves the connection to another keyspace; it goes through the
    // db switch so the cache never mixes databases
    int index = 0;
    if (args.size() == 2 && fnv1a_lower(args[0]) == fnv1a("select") && parse_db_index(args[1], index))
    {
        auto st = switch_db_locked(index);
        if (st)
        {
            out = "OK";
            return st;
        }
        out = "(error) " + st.message;
        // A rejected index is a server reply, not a failure of the session
        if (st.code == status_invalid)
            return core_status::success();
        return st;
    }

    auto st = m_store.execute(line, out);
    if (!st)
        return st;

    if (!args.empty() && is_write_command(args[0]) && m_loaded)
        return load_first_page_locked(m_settings.pattern, m_settings.page_size);
    return core_status::success();
}

std::map<int, int64_t> browser_session::keyspace_info()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_store.keyspace_info();
}

void browser_session::cancel() noexcept
{
    m_generation.fetch_add(1, std::memory_order_acq_rel);
}

// ─── Observers ───

namespace_tree browser_session::current_tree() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree;
}

browser_state browser_session::state() const
{
    return m_state.load();
}

std::string browser_session::filter() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filter;
}

std::string browser_session::pattern() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.pattern();
}

uint64_t browser_session::cursor() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.cursor();
}

size_t browser_session::cached_key_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

size_t browser_session::virtual_key_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_virtual.size();
}

session_settings browser_session::settings() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

int browser_session::current_db() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_store.current_db();
}

} // namespace keyscope
