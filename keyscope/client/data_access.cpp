#include "data_access.h"
#include "reply_format.h"
#include "../shared/logging.h"
#include "../shared/string_util.h"

#include <algorithm>
#include <cstdio>

namespace keyscope {

namespace {

std::string to_arg(std::string_view sv)
{
    return std::string(sv);
}

// Flat array of strings into consecutive pairs
void collect_pairs(const resp::reply& r, std::vector<std::pair<std::string, std::string>>& out)
{
    out.clear();
    out.reserve(r.elements.size() / 2);
    for (size_t i = 0; i + 1 < r.elements.size(); i += 2)
        out.emplace_back(r.elements[i].str, r.elements[i + 1].str);
}

void collect_strings(const resp::reply& r, std::vector<std::string>& out)
{
    out.clear();
    out.reserve(r.elements.size());
    for (const auto& e : r.elements)
        out.push_back(e.str);
}

std::string format_score(double score)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", score);
    return buf;
}

} // namespace

bool is_write_command(std::string_view name)
{
    switch (fnv1a_lower(name))
    {
        case fnv1a("set"):
        case fnv1a("del"):
        case fnv1a("hset"):
        case fnv1a("hdel"):
        case fnv1a("lpush"):
        case fnv1a("rpush"):
        case fnv1a("sadd"):
        case fnv1a("zadd"):
        case fnv1a("srem"):
        case fnv1a("zrem"):
        case fnv1a("rename"):
        case fnv1a("expire"):
        case fnv1a("persist"):
        case fnv1a("lset"):
        case fnv1a("lrem"):
        case fnv1a("unlink"):
        case fnv1a("flushdb"):
        case fnv1a("flushall"):
        case fnv1a("swapdb"):
            return true;
        default:
            return false;
    }
}

core_status data_access::query(const std::vector<std::string>& args, resp::reply& out)
{
    auto st = command(args, out);
    if (!st)
        return st;
    if (out.is_error())
    {
        LOG_DEBUGF("%s rejected: %s", args.empty() ? "?" : args[0].c_str(), out.str.c_str());
        return core_status::fail(status_invalid, out.str);
    }
    return core_status::success();
}

core_status data_access::write(const std::vector<std::string>& args)
{
    resp::reply r;
    return query(args, r);
}

core_status data_access::set_string(std::string_view key, std::string_view value, int64_t ttl_seconds)
{
    if (ttl_seconds > 0)
        return write({"SET", to_arg(key), to_arg(value), "EX", std::to_string(ttl_seconds)});
    return write({"SET", to_arg(key), to_arg(value)});
}

core_status data_access::list_push(std::string_view key, std::string_view value)
{
    return write({"RPUSH", to_arg(key), to_arg(value)});
}

core_status data_access::list_set(std::string_view key, int64_t index, std::string_view value)
{
    return write({"LSET", to_arg(key), std::to_string(index), to_arg(value)});
}

core_status data_access::list_remove(std::string_view key, std::string_view value, int64_t count)
{
    return write({"LREM", to_arg(key), std::to_string(count), to_arg(value)});
}

core_status data_access::hash_set(std::string_view key, std::string_view field, std::string_view value)
{
    return write({"HSET", to_arg(key), to_arg(field), to_arg(value)});
}

core_status data_access::hash_delete(std::string_view key, std::string_view field)
{
    return write({"HDEL", to_arg(key), to_arg(field)});
}

core_status data_access::set_add(std::string_view key, std::string_view member)
{
    return write({"SADD", to_arg(key), to_arg(member)});
}

core_status data_access::set_remove(std::string_view key, std::string_view member)
{
    return write({"SREM", to_arg(key), to_arg(member)});
}

core_status data_access::zset_add(std::string_view key, std::string_view member, double score)
{
    return write({"ZADD", to_arg(key), format_score(score), to_arg(member)});
}

core_status data_access::zset_remove(std::string_view key, std::string_view member)
{
    return write({"ZREM", to_arg(key), to_arg(member)});
}

core_status data_access::rename(std::string_view from, std::string_view to)
{
    return write({"RENAME", to_arg(from), to_arg(to)});
}

core_status data_access::set_ttl(std::string_view key, int64_t ttl)
{
    if (ttl < 0)
        return write({"PERSIST", to_arg(key)});
    return write({"EXPIRE", to_arg(key), std::to_string(ttl)});
}

// ─── Value reads ───

core_status data_access::get_string(std::string_view key, std::optional<std::string>& out)
{
    resp::reply r;
    auto st = query({"GET", to_arg(key)}, r);
    if (!st)
        return st;
    if (r.is_string())
        out = std::move(r.str);
    else
        out.reset();
    return core_status::success();
}

core_status data_access::get_list(std::string_view key, std::vector<std::string>& out,
                                  int64_t start, int64_t stop)
{
    resp::reply r;
    auto st = query({"LRANGE", to_arg(key), std::to_string(start), std::to_string(stop)}, r);
    if (!st)
        return st;
    collect_strings(r, out);
    return core_status::success();
}

core_status data_access::get_hash(std::string_view key, std::vector<std::pair<std::string, std::string>>& out)
{
    resp::reply r;
    auto st = query({"HGETALL", to_arg(key)}, r);
    if (!st)
        return st;
    collect_pairs(r, out);
    return core_status::success();
}

core_status data_access::get_set(std::string_view key, std::vector<std::string>& out)
{
    resp::reply r;
    auto st = query({"SMEMBERS", to_arg(key)}, r);
    if (!st)
        return st;
    collect_strings(r, out);
    // Sets are unordered on the server
    std::sort(out.begin(), out.end());
    return core_status::success();
}

core_status data_access::get_zset(std::string_view key, std::vector<std::pair<std::string, std::string>>& out,
                                  int64_t start, int64_t stop)
{
    resp::reply r;
    auto st = query({"ZRANGE", to_arg(key), std::to_string(start), std::to_string(stop), "WITHSCORES"}, r);
    if (!st)
        return st;
    collect_pairs(r, out);
    return core_status::success();
}

core_status data_access::read_value(std::string_view key, key_type type, key_value& out)
{
    key_value v;
    v.type = type;

    core_status st;
    switch (type)
    {
        case key_string: st = get_string(key, v.text); break;
        case key_list:   st = get_list(key, v.members); break;
        case key_hash:   st = get_hash(key, v.fields); break;
        case key_set:    st = get_set(key, v.members); break;
        case key_zset:   st = get_zset(key, v.fields); break;
        default: break;
    }
    if (!st)
        return st;

    out = std::move(v);
    return core_status::success();
}

core_status data_access::execute(std::string_view line, std::string& out)
{
    out.clear();
    auto args = split_whitespace(line);
    if (args.empty())
        return core_status::success();

    resp::reply r;
    auto st = command(args, r);
    if (!st)
    {
        out = "(error) " + st.message;
        return st;
    }
    out = format_reply(r);
    return core_status::success();
}

} // namespace keyscope
