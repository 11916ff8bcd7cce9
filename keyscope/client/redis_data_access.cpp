#include "redis_data_access.h"
#include "../shared/logging.h"

#include <charconv>

namespace keyscope {

std::map<int, int64_t> parse_keyspace_info(std::string_view info)
{
    std::map<int, int64_t> result;

    size_t pos = 0;
    while (pos < info.size())
    {
        size_t eol = info.find('\n', pos);
        std::string_view line = info.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? info.size() : eol + 1;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!line.starts_with("db"))
            continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;

        int db = 0;
        auto [p, ec] = std::from_chars(line.data() + 2, line.data() + colon, db);
        if (ec != std::errc{} || p != line.data() + colon)
            continue;

        std::string_view fields = line.substr(colon + 1);
        size_t k = fields.find("keys=");
        if (k != 0 && (k == std::string_view::npos || fields[k - 1] != ','))
            continue;

        int64_t keys = 0;
        const char* begin = fields.data() + k + 5;
        auto [p2, ec2] = std::from_chars(begin, fields.data() + fields.size(), keys);
        if (ec2 != std::errc{})
            continue;

        result[db] = keys;
    }

    return result;
}

core_status redis_data_access::connect()
{
    return m_conn.connect(m_opts);
}

core_status redis_data_access::connect(const connection_options& opts)
{
    m_opts = opts;
    return m_conn.connect(m_opts);
}

void redis_data_access::disconnect()
{
    m_conn.close();
}

core_status redis_data_access::reconnect()
{
    // Keep whatever db the session switched to
    m_opts.db = m_conn.current_db();
    return m_conn.connect(m_opts);
}

core_status redis_data_access::command(const std::vector<std::string>& args, resp::reply& out)
{
    return m_conn.command(args, out);
}

core_status redis_data_access::scan(uint64_t cursor, std::string_view pattern,
                                    size_t count, scan_page& out)
{
    std::vector<std::string> args{"SCAN", std::to_string(cursor)};
    if (!pattern.empty() && pattern != "*")
    {
        args.emplace_back("MATCH");
        args.emplace_back(pattern);
    }
    args.emplace_back("COUNT");
    args.emplace_back(std::to_string(count));

    resp::reply r;
    auto st = m_conn.command(args, r);
    if (!st)
        return st;
    if (r.is_error())
        return core_status::fail(status_invalid, r.str);

    // Reply: [ cursor, [ key, key, ... ] ]
    if (!r.is_array() || r.elements.size() != 2 || !r.elements[0].is_string() || !r.elements[1].is_array())
        return core_status::fail(status_transport, "malformed SCAN reply");

    const std::string& cur = r.elements[0].str;
    uint64_t next = 0;
    auto [p, ec] = std::from_chars(cur.data(), cur.data() + cur.size(), next);
    if (ec != std::errc{} || p != cur.data() + cur.size())
        return core_status::fail(status_transport, "malformed SCAN cursor: " + cur);

    out.cursor = next;
    out.keys.clear();
    out.keys.reserve(r.elements[1].elements.size());
    for (auto& el : r.elements[1].elements)
        out.keys.push_back(std::move(el.str));

    return core_status::success();
}

core_status redis_data_access::type_of(std::string_view key, key_type& out)
{
    resp::reply r;
    auto st = m_conn.command({"TYPE", std::string(key)}, r);
    if (!st)
        return st;
    if (r.is_error() || !r.is_string())
        return core_status::fail(status_resolution, r.is_error() ? r.str : "malformed TYPE reply");
    out = parse_key_type(r.str);
    return core_status::success();
}

core_status redis_data_access::type_of_many(const std::vector<std::string>& keys, type_map& out)
{
    if (keys.empty())
        return core_status::success();

    std::vector<std::vector<std::string>> cmds;
    cmds.reserve(keys.size());
    for (const auto& k : keys)
        cmds.push_back({"TYPE", k});

    std::vector<resp::reply> replies;
    auto st = m_conn.pipeline(cmds, replies);
    if (!st)
        return st;

    type_map resolved;
    for (size_t i = 0; i < keys.size(); ++i)
    {
        const auto& r = replies[i];
        if (r.is_error() || !r.is_string())
        {
            return core_status::fail(status_resolution,
                "TYPE " + keys[i] + ": " + (r.is_error() ? r.str : std::string("malformed reply")));
        }
        resolved[keys[i]] = parse_key_type(r.str);
    }

    for (auto& [k, t] : resolved)
        out[k] = t;
    return core_status::success();
}

core_status redis_data_access::ttl(std::string_view key, int64_t& out)
{
    resp::reply r;
    auto st = m_conn.command({"TTL", std::string(key)}, r);
    if (!st)
        return st;
    if (r.kind != resp::reply_kind::integer)
        return core_status::fail(status_invalid, r.is_error() ? r.str : "malformed TTL reply");
    out = r.integer;
    return core_status::success();
}

std::string redis_data_access::encoding(std::string_view key)
{
    resp::reply r;
    auto st = m_conn.command({"OBJECT", "ENCODING", std::string(key)}, r);
    if (!st || !r.is_string() || r.str.empty())
        return "unknown";
    return r.str;
}

std::optional<int64_t> redis_data_access::memory_usage(std::string_view key)
{
    resp::reply r;
    auto st = m_conn.command({"MEMORY", "USAGE", std::string(key)}, r);
    if (!st || r.kind != resp::reply_kind::integer)
    {
        LOG_DEBUG("memory usage unavailable");
        return std::nullopt;
    }
    return r.integer;
}

std::map<int, int64_t> redis_data_access::keyspace_info()
{
    resp::reply r;
    auto st = m_conn.command({"INFO", "keyspace"}, r);
    if (!st || !r.is_string())
        return {};
    return parse_keyspace_info(r.str);
}

core_status redis_data_access::remove(std::string_view key, bool& removed)
{
    resp::reply r;
    auto st = m_conn.command({"DEL", std::string(key)}, r);
    if (!st)
        return st;
    if (r.kind != resp::reply_kind::integer)
        return core_status::fail(status_invalid, r.is_error() ? r.str : "malformed DEL reply");
    removed = r.integer > 0;
    return core_status::success();
}

core_status redis_data_access::select_db(int index)
{
    auto st = m_conn.select(index);
    if (st)
        m_opts.db = index;
    return st;
}

} // namespace keyscope
