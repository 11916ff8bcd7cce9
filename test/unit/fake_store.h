#pragma once
#include <algorithm>
#include <cstdlib>
#include <deque>
#include <fnmatch.h>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../../keyscope/client/data_access.h"
#include "../../keyscope/shared/string_util.h"

// In-process data_access for the browsing core.
//
// Keys are held sorted per database. SCAN walks them by position: the cursor
// is the index of the next entry to examine, and each call examines at most
// `batch_size` entries regardless of the COUNT hint, so a filtered scan can
// legitimately return an empty page with a live cursor.
class fake_store : public keyscope::data_access
{
public:
    // Collections keep their members in insertion order: list and set use
    // `first` only, hash holds field/value and zset member/score
    struct entry
    {
        keyscope::key_type type{keyscope::key_string};
        std::vector<std::pair<std::string, std::string>> items;
        std::string text{"value"};
        int64_t ttl{-1};
    };

    using key_map = std::map<std::string, entry, std::less<>>;

    std::map<int, key_map> dbs;
    int db{0};
    size_t batch_size{3};

    // When non-empty, scan() pops its answers from here instead
    std::deque<keyscope::scan_page> scripted;

    // Failure injection
    int scan_failures_after{-1};        // successful scans before a transport failure
    bool fail_types{false};
    bool drop_one_type{false};          // answer a type batch with one key missing
    bool fail_reconnect{false};
    std::function<void(size_t)> on_scan;    // called with the scan call index

    // Call counters
    size_t scan_calls{0};
    size_t type_calls{0};
    size_t type_batch_calls{0};
    size_t command_calls{0};
    size_t reconnects{0};
    std::vector<size_t> count_hints;
    std::vector<std::string> last_command;

    key_map& keys() { return dbs[db]; }

    // Collections get `members` generated members: m0, m1, ... (hash values
    // v0, v1, ...; zset scores 0, 1, ...)
    void add(const std::string& key, keyscope::key_type type = keyscope::key_string, size_t members = 1)
    {
        entry e;
        e.type = type;
        if (type != keyscope::key_string)
        {
            for (size_t i = 0; i < members; ++i)
            {
                std::string n = std::to_string(i);
                if (type == keyscope::key_hash)
                    e.items.emplace_back("f" + n, "v" + n);
                else if (type == keyscope::key_zset)
                    e.items.emplace_back("m" + n, n);
                else
                    e.items.emplace_back("m" + n, "");
            }
        }
        keys()[key] = std::move(e);
    }

    void add_many(const std::string& prefix, size_t n, keyscope::key_type type = keyscope::key_string)
    {
        for (size_t i = 0; i < n; ++i)
            add(prefix + std::to_string(i), type);
    }

    // ─── data_access ───

    keyscope::core_status scan(uint64_t cursor, std::string_view pattern,
                               size_t count, keyscope::scan_page& out) override
    {
        size_t call = scan_calls++;
        count_hints.push_back(count);
        if (on_scan)
            on_scan(call);

        if (scan_failures_after >= 0 && call >= static_cast<size_t>(scan_failures_after))
            return keyscope::core_status::fail(keyscope::status_transport, "connection reset");

        if (!scripted.empty())
        {
            out = scripted.front();
            scripted.pop_front();
            return keyscope::core_status::success();
        }

        out.keys.clear();
        std::string pat(pattern);
        bool match_all = pat.empty() || pat == "*";

        const key_map& km = keys();
        auto it = km.begin();
        std::advance(it, std::min<size_t>(cursor, km.size()));

        uint64_t pos = cursor;
        size_t examined = 0;
        for (; it != km.end() && examined < batch_size; ++it, ++examined, ++pos)
        {
            if (match_all || fnmatch(pat.c_str(), it->first.c_str(), 0) == 0)
                out.keys.push_back(it->first);
        }
        out.cursor = (it == km.end()) ? 0 : pos;
        return keyscope::core_status::success();
    }

    keyscope::core_status type_of(std::string_view key, keyscope::key_type& out) override
    {
        ++type_calls;
        if (fail_types)
            return keyscope::core_status::fail(keyscope::status_transport, "connection reset");
        auto it = keys().find(key);
        out = it == keys().end() ? keyscope::key_none : it->second.type;
        return keyscope::core_status::success();
    }

    keyscope::core_status type_of_many(const std::vector<std::string>& batch, keyscope::type_map& out) override
    {
        ++type_batch_calls;
        if (fail_types)
            return keyscope::core_status::fail(keyscope::status_resolution, "TYPE failed");

        keyscope::type_map resolved;
        for (const auto& k : batch)
        {
            auto it = keys().find(k);
            resolved[k] = it == keys().end() ? keyscope::key_none : it->second.type;
        }
        if (drop_one_type && !resolved.empty())
            resolved.erase(resolved.begin());

        for (auto& [k, t] : resolved)
            out[k] = t;
        return keyscope::core_status::success();
    }

    keyscope::core_status ttl(std::string_view key, int64_t& out) override
    {
        auto it = keys().find(key);
        out = it == keys().end() ? -2 : it->second.ttl;
        return keyscope::core_status::success();
    }

    std::string encoding(std::string_view key) override
    {
        return keys().count(key) ? "listpack" : "unknown";
    }

    std::optional<int64_t> memory_usage(std::string_view key) override
    {
        if (!keys().count(key))
            return std::nullopt;
        return 64;
    }

    std::map<int, int64_t> keyspace_info() override
    {
        std::map<int, int64_t> info;
        for (const auto& [idx, km] : dbs)
        {
            if (!km.empty())
                info[idx] = static_cast<int64_t>(km.size());
        }
        return info;
    }

    keyscope::core_status remove(std::string_view key, bool& removed) override
    {
        auto it = keys().find(key);
        removed = it != keys().end();
        if (removed)
            keys().erase(it);
        return keyscope::core_status::success();
    }

    keyscope::core_status select_db(int index) override
    {
        if (index < 0 || index > 15)
            return keyscope::core_status::fail(keyscope::status_invalid, "ERR DB index is out of range");
        db = index;
        return keyscope::core_status::success();
    }

    int current_db() const override { return db; }

    keyscope::core_status command(const std::vector<std::string>& args, keyscope::resp::reply& out) override
    {
        using namespace keyscope;
        ++command_calls;
        last_command = args;
        out = resp::reply{};

        if (args.empty())
            return error_reply("ERR empty command", out);

        uint32_t verb = fnv1a_lower(args[0]);
        switch (verb)
        {
            case fnv1a("ping"):
                out.kind = resp::reply_kind::simple;
                out.str = "PONG";
                return core_status::success();

            case fnv1a("set"):
            {
                if (args.size() < 3)
                    return error_reply("ERR wrong number of arguments for 'set' command", out);
                entry e;
                e.text = args[2];
                keys()[args[1]] = std::move(e);
                return ok(out);
            }

            case fnv1a("get"):
            {
                if (args.size() < 2)
                    return error_reply("ERR wrong number of arguments for 'get' command", out);
                auto it = keys().find(args[1]);
                if (it == keys().end())
                    return core_status::success();
                if (it->second.type != key_string)
                    return wrongtype(out);
                out.kind = resp::reply_kind::bulk;
                out.str = it->second.text;
                return core_status::success();
            }

            case fnv1a("rpush"):
            case fnv1a("lpush"):
            {
                entry* e = nullptr;
                if (args.size() < 3)
                    return error_reply("ERR wrong number of arguments", out);
                if (!collection(args[1], key_list, true, e, out))
                    return core_status::success();
                for (size_t i = 2; i < args.size(); ++i)
                {
                    if (verb == fnv1a("rpush"))
                        e->items.emplace_back(args[i], "");
                    else
                        e->items.insert(e->items.begin(), {args[i], ""});
                }
                return integer(out, static_cast<int64_t>(e->items.size()));
            }

            case fnv1a("lset"):
            {
                entry* e = nullptr;
                if (args.size() != 4)
                    return error_reply("ERR wrong number of arguments for 'lset' command", out);
                if (!collection(args[1], key_list, false, e, out))
                    return core_status::success();
                if (!e)
                    return error_reply("ERR no such key", out);
                int64_t idx = std::stoll(args[2]);
                int64_t n = static_cast<int64_t>(e->items.size());
                if (idx < 0)
                    idx += n;
                if (idx < 0 || idx >= n)
                    return error_reply("ERR index out of range", out);
                e->items[static_cast<size_t>(idx)].first = args[3];
                return ok(out);
            }

            case fnv1a("lrem"):
            {
                entry* e = nullptr;
                if (args.size() != 4)
                    return error_reply("ERR wrong number of arguments for 'lrem' command", out);
                if (!collection(args[1], key_list, false, e, out))
                    return core_status::success();
                if (!e)
                    return integer(out, 0);
                int64_t limit = std::stoll(args[2]);
                int64_t removed = 0;
                for (auto it = e->items.begin(); it != e->items.end();)
                {
                    if (it->first == args[3] && (limit == 0 || removed < std::llabs(limit)))
                    {
                        it = e->items.erase(it);
                        ++removed;
                    }
                    else
                        ++it;
                }
                drop_if_empty(args[1]);
                return integer(out, removed);
            }

            case fnv1a("lrange"):
            {
                entry* e = nullptr;
                if (args.size() != 4)
                    return error_reply("ERR wrong number of arguments for 'lrange' command", out);
                if (!collection(args[1], key_list, false, e, out))
                    return core_status::success();
                out.kind = resp::reply_kind::array;
                if (!e)
                    return core_status::success();
                int64_t n = static_cast<int64_t>(e->items.size());
                int64_t start = std::stoll(args[2]);
                int64_t stop = std::stoll(args[3]);
                if (start < 0)
                    start = std::max<int64_t>(0, start + n);
                if (stop < 0)
                    stop += n;
                for (int64_t i = start; i <= stop && i < n; ++i)
                    out.elements.push_back(bulk(e->items[static_cast<size_t>(i)].first));
                return core_status::success();
            }

            case fnv1a("hset"):
            case fnv1a("zadd"):
            {
                entry* e = nullptr;
                if (args.size() < 4 || args.size() % 2 != 0)
                    return error_reply("ERR wrong number of arguments", out);
                key_type type = verb == fnv1a("hset") ? key_hash : key_zset;
                if (!collection(args[1], type, true, e, out))
                    return core_status::success();
                int64_t added = 0;
                for (size_t i = 2; i + 1 < args.size(); i += 2)
                {
                    // HSET field value, ZADD score member
                    const std::string& name = type == key_hash ? args[i] : args[i + 1];
                    const std::string& val = type == key_hash ? args[i + 1] : args[i];
                    auto it = find_item(*e, name);
                    if (it == e->items.end())
                    {
                        e->items.emplace_back(name, val);
                        ++added;
                    }
                    else
                        it->second = val;
                }
                return integer(out, added);
            }

            case fnv1a("sadd"):
            {
                entry* e = nullptr;
                if (args.size() < 3)
                    return error_reply("ERR wrong number of arguments", out);
                if (!collection(args[1], key_set, true, e, out))
                    return core_status::success();
                int64_t added = 0;
                for (size_t i = 2; i < args.size(); ++i)
                {
                    if (find_item(*e, args[i]) == e->items.end())
                    {
                        e->items.emplace_back(args[i], "");
                        ++added;
                    }
                }
                return integer(out, added);
            }

            case fnv1a("hdel"):
            case fnv1a("srem"):
            case fnv1a("zrem"):
            {
                entry* e = nullptr;
                if (args.size() < 3)
                    return error_reply("ERR wrong number of arguments", out);
                key_type type = verb == fnv1a("hdel") ? key_hash : verb == fnv1a("srem") ? key_set : key_zset;
                if (!collection(args[1], type, false, e, out))
                    return core_status::success();
                if (!e)
                    return integer(out, 0);
                int64_t removed = 0;
                for (size_t i = 2; i < args.size(); ++i)
                {
                    auto it = find_item(*e, args[i]);
                    if (it != e->items.end())
                    {
                        e->items.erase(it);
                        ++removed;
                    }
                }
                drop_if_empty(args[1]);
                return integer(out, removed);
            }

            case fnv1a("hgetall"):
            case fnv1a("smembers"):
            {
                entry* e = nullptr;
                if (args.size() != 2)
                    return error_reply("ERR wrong number of arguments", out);
                key_type type = verb == fnv1a("hgetall") ? key_hash : key_set;
                if (!collection(args[1], type, false, e, out))
                    return core_status::success();
                out.kind = resp::reply_kind::array;
                if (!e)
                    return core_status::success();
                for (const auto& [name, val] : e->items)
                {
                    out.elements.push_back(bulk(name));
                    if (type == key_hash)
                        out.elements.push_back(bulk(val));
                }
                return core_status::success();
            }

            case fnv1a("zrange"):
            {
                entry* e = nullptr;
                if (args.size() < 4)
                    return error_reply("ERR wrong number of arguments for 'zrange' command", out);
                if (!collection(args[1], key_zset, false, e, out))
                    return core_status::success();
                out.kind = resp::reply_kind::array;
                if (!e)
                    return core_status::success();
                auto sorted = e->items;
                std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
                    double sa = std::stod(a.second), sb = std::stod(b.second);
                    return sa != sb ? sa < sb : a.first < b.first;
                });
                bool scores = args.size() >= 5 && fnv1a_lower(args[4]) == fnv1a("withscores");
                for (const auto& [member, score] : sorted)
                {
                    out.elements.push_back(bulk(member));
                    if (scores)
                        out.elements.push_back(bulk(score));
                }
                return core_status::success();
            }

            case fnv1a("del"):
            {
                int64_t n = 0;
                for (size_t i = 1; i < args.size(); ++i)
                    n += static_cast<int64_t>(keys().erase(args[i]));
                return integer(out, n);
            }

            case fnv1a("rename"):
            {
                if (args.size() < 3)
                    return error_reply("ERR wrong number of arguments for 'rename' command", out);
                auto it = keys().find(args[1]);
                if (it == keys().end())
                    return error_reply("ERR no such key", out);
                entry e = it->second;
                keys().erase(it);
                keys()[args[2]] = e;
                return ok(out);
            }

            case fnv1a("expire"):
            case fnv1a("persist"):
            {
                auto it = args.size() >= 2 ? keys().find(args[1]) : keys().end();
                if (it == keys().end())
                    return integer(out, 0);
                it->second.ttl = args.size() >= 3 ? std::stoll(args[2]) : -1;
                return integer(out, 1);
            }

            default:
                return error_reply("ERR unknown command '" + args[0] + "'", out);
        }
    }

    keyscope::core_status reconnect() override
    {
        ++reconnects;
        if (fail_reconnect)
            return keyscope::core_status::fail(keyscope::status_transport, "connection refused");
        return keyscope::core_status::success();
    }

    bool is_connected() const override { return true; }

private:
    using item_list = std::vector<std::pair<std::string, std::string>>;

    static keyscope::core_status error_reply(std::string msg, keyscope::resp::reply& out)
    {
        out.kind = keyscope::resp::reply_kind::error;
        out.str = std::move(msg);
        return keyscope::core_status::success();
    }

    static keyscope::core_status wrongtype(keyscope::resp::reply& out)
    {
        return error_reply("WRONGTYPE Operation against a key holding the wrong kind of value", out);
    }

    static keyscope::core_status ok(keyscope::resp::reply& out)
    {
        out.kind = keyscope::resp::reply_kind::simple;
        out.str = "OK";
        return keyscope::core_status::success();
    }

    static keyscope::core_status integer(keyscope::resp::reply& out, int64_t v)
    {
        out.kind = keyscope::resp::reply_kind::integer;
        out.integer = v;
        return keyscope::core_status::success();
    }

    static keyscope::resp::reply bulk(const std::string& s)
    {
        keyscope::resp::reply r;
        r.kind = keyscope::resp::reply_kind::bulk;
        r.str = s;
        return r;
    }

    static item_list::iterator find_item(entry& e, const std::string& name)
    {
        return std::find_if(e.items.begin(), e.items.end(),
            [&name](const auto& item) { return item.first == name; });
    }

    // Looks up `key` as a collection of `type`. Returns false (with a
    // WRONGTYPE reply in `out`) on a type clash; `e` stays null for a missing
    // key unless `create` is set.
    bool collection(const std::string& key, keyscope::key_type type, bool create, entry*& e,
                    keyscope::resp::reply& out)
    {
        auto it = keys().find(key);
        if (it != keys().end())
        {
            if (it->second.type != type)
            {
                wrongtype(out);
                return false;
            }
            e = &it->second;
            return true;
        }
        if (create)
        {
            entry fresh;
            fresh.type = type;
            fresh.text.clear();
            e = &(keys()[key] = std::move(fresh));
        }
        return true;
    }

    // The store drops a collection once its last member is gone
    void drop_if_empty(const std::string& key)
    {
        auto it = keys().find(key);
        if (it != keys().end() && it->second.type != keyscope::key_string && it->second.items.empty())
            keys().erase(it);
    }
};
