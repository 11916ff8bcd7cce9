#include "cli.h"
#include "command_line.h"
#include "tree_printer.h"
#include "../client/redis_data_access.h"
#include "../config/app_config.h"
#include "../shared/logging.h"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <charconv>
#include <climits>
#include <iostream>
#include <unistd.h>

namespace keyscope {

namespace {

browser_session* g_session = nullptr;

void sigint_handler(int)
{
    // Only flips an atomic; safe from a signal handler
    if (g_session)
        g_session->cancel();
}

bool parse_i64(std::string_view sv, int64_t& out)
{
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool parse_double(std::string_view sv, double& out)
{
    std::string tmp(sv);
    char* end = nullptr;
    out = std::strtod(tmp.c_str(), &end);
    return !tmp.empty() && end == tmp.c_str() + tmp.size();
}

void report(const core_status& st, std::string& out)
{
    if (st)
        return;
    out += "error (";
    out += status_name(st.code);
    out += "): ";
    out += st.message;
    out += '\n';
}

void print_status_line(browser_session& session, std::string& out)
{
    out += "db";
    out += std::to_string(session.current_db());
    out += "  state=";
    out += browser_state_name(session.state());
    out += "  pattern=";
    out += session.pattern();
    out += "  keys=";
    out += std::to_string(session.cached_key_count());
    if (size_t v = session.virtual_key_count())
    {
        out += "  virtual=";
        out += std::to_string(v);
    }
    std::string f = session.filter();
    if (!f.empty())
    {
        out += "  filter=\"";
        out += f;
        out += '"';
    }
    uint64_t c = session.cursor();
    out += c ? "  cursor=" + std::to_string(c) : std::string("  (complete)");
    out += '\n';
}

constexpr size_t VALUE_PREVIEW_LIMIT = 50;

void print_details(const key_details& d, std::string& out)
{
    out += d.key;
    out += "\n  type:     ";
    out += key_type_name(d.type);
    if (d.is_virtual)
        out += " (not yet written)";
    out += "\n  ttl:      ";
    if (d.ttl == -1)
        out += "none";
    else if (d.ttl == -2)
        out += "missing";
    else
        out += std::to_string(d.ttl) + "s";
    out += "\n  encoding: ";
    out += d.encoding;
    out += "\n  memory:   ";
    out += d.memory_bytes ? std::to_string(*d.memory_bytes) + " bytes" : std::string("unknown");
    out += '\n';

    if (d.is_virtual || d.type == key_none || d.type == key_unknown)
        return;

    const key_value& v = d.value;
    out += "  value:    ";
    if (v.type == key_string)
    {
        out += v.text ? *v.text : std::string("(nil)");
        out += '\n';
        return;
    }

    size_t total = v.size();
    out += "(" + std::to_string(total) + (total == 1 ? " item)\n" : " items)\n");

    size_t shown = 0;
    for (const auto& m : v.members)
    {
        if (shown == VALUE_PREVIEW_LIMIT)
            break;
        out += "    ";
        out += v.type == key_list ? std::to_string(shown) + ") " : std::string("- ");
        out += m;
        out += '\n';
        ++shown;
    }
    for (const auto& [name, val] : v.fields)
    {
        if (shown == VALUE_PREVIEW_LIMIT)
            break;
        out += "    ";
        out += name;
        out += v.type == key_hash ? " = " : " (score ";
        out += val;
        if (v.type == key_zset)
            out += ')';
        out += '\n';
        ++shown;
    }
    if (total > shown)
        out += "    ... " + std::to_string(total - shown) + " more\n";
}

constexpr const char* HELP_TEXT =
    "  ls [path] [depth]        show the namespace tree (depth 0 = all)\n"
    "  more [n]                 fetch at least n more keys\n"
    "  filter [text]            narrow the loaded keys; no text clears\n"
    "  search <text>            rescan with pattern *text*\n"
    "  pattern <glob>           rescan with a server-side pattern\n"
    "  refresh                  rescan from the start\n"
    "  new <type> <key>         declare a key before its first write\n"
    "  inspect <key>            type, ttl, encoding, memory and value of a key\n"
    "  set <key> <value>        string write\n"
    "  rpush <key> <value>      list append\n"
    "  lset <key> <idx> <v>     list element write\n"
    "  lrem <key> <value>       remove the first matching list element\n"
    "  hset <key> <field> <v>   hash field write\n"
    "  hdel <key> <field>       hash field delete\n"
    "  sadd <key> <member>      set add\n"
    "  srem <key> <member>      set remove\n"
    "  zadd <key> <score> <m>   sorted set add\n"
    "  zrem <key> <member>      sorted set remove\n"
    "  expire <key> <secs>      set ttl; negative removes it\n"
    "  rename <from> <to>\n"
    "  del <key>\n"
    "  exec <command...>        run a raw command\n"
    "  db <index>               switch database\n"
    "  info                     keys per database\n"
    "  sep <separator>          change the namespace separator\n"
    "  page <n>                 keys per page\n"
    "  reconnect\n"
    "  status\n"
    "  quit\n";

bool need_args(const command_line& cmd, size_t n, const char* usage, std::string& out)
{
    if (cmd.count() >= n)
        return true;
    out += "usage: ";
    out += usage;
    out += '\n';
    return false;
}

} // namespace

repl_result cli_execute(browser_session& session, std::string_view line, std::string& out)
{
    command_line cmd;
    cmd.parse(line);
    if (cmd.count() == 0)
        return repl_continue;

    switch (cmd.verb)
    {
        case fnv1a("ls"):
        case fnv1a("tree"):
        {
            print_options opts;
            if (cmd.count() >= 2)
                opts.root_path = cmd.args[1];

            int64_t depth = 0;
            if (cmd.count() >= 3)
            {
                if (!parse_i64(cmd.args[2], depth) || depth < 0)
                {
                    out += "depth must be a non-negative number\n";
                    break;
                }
                opts.max_depth = static_cast<size_t>(depth);
            }
            namespace_tree tree = session.current_tree();
            out += render_tree(tree, opts);
            break;
        }

        case fnv1a("more"):
        {
            int64_t n = 0;
            if (cmd.count() >= 2)
            {
                if (!parse_i64(cmd.args[1], n) || n <= 0)
                {
                    out += "count must be a positive number\n";
                    break;
                }
            }
            size_t before = session.cached_key_count();
            auto st = n ? session.load_more(clamp_page_size(n)) : session.load_more();
            report(st, out);
            if (st)
            {
                out += "+" + std::to_string(session.cached_key_count() - before) + " keys\n";
                print_status_line(session, out);
            }
            break;
        }

        case fnv1a("filter"):
            session.apply_filter(cmd.rest_from(1));
            print_status_line(session, out);
            break;

        case fnv1a("search"):
        {
            if (!need_args(cmd, 2, "search <text>", out))
                break;
            std::string pat = "*" + std::string(cmd.rest_from(1)) + "*";
            auto st = session.load_first_page(pat, session.settings().page_size);
            report(st, out);
            if (st)
                print_status_line(session, out);
            break;
        }

        case fnv1a("pattern"):
        {
            if (!need_args(cmd, 2, "pattern <glob>", out))
                break;
            auto st = session.load_first_page(cmd.args[1], session.settings().page_size);
            report(st, out);
            if (st)
                print_status_line(session, out);
            break;
        }

        case fnv1a("refresh"):
        {
            auto st = session.refresh();
            report(st, out);
            if (st)
                print_status_line(session, out);
            break;
        }

        case fnv1a("new"):
        {
            if (!need_args(cmd, 3, "new <string|list|hash|set|zset> <key>", out))
                break;
            key_type t;
            if (!parse_declarable_type(cmd.args[1], t))
            {
                out += "unknown type: " + std::string(cmd.args[1]) + "\n";
                break;
            }
            session.declare_virtual_key(cmd.rest_from(2), t);
            out += "declared " + std::string(cmd.rest_from(2)) + " [" + key_type_name(t) + "]\n";
            break;
        }

        case fnv1a("inspect"):
        case fnv1a("select"):
        {
            if (!need_args(cmd, 2, "inspect <key>", out))
                break;
            key_details d;
            auto st = session.inspect_key(cmd.rest_from(1), d);
            report(st, out);
            if (st)
                print_details(d, out);
            break;
        }

        case fnv1a("set"):
        {
            if (!need_args(cmd, 3, "set <key> <value>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view value = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.set_string(key, value); }), out);
            break;
        }

        case fnv1a("rpush"):
        {
            if (!need_args(cmd, 3, "rpush <key> <value>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view value = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.list_push(key, value); }), out);
            break;
        }

        case fnv1a("lset"):
        {
            if (!need_args(cmd, 4, "lset <key> <index> <value>", out))
                break;
            int64_t index = 0;
            if (!parse_i64(cmd.args[2], index))
            {
                out += "index must be a number\n";
                break;
            }
            std::string_view key = cmd.args[1];
            std::string_view value = cmd.rest_from(3);
            report(session.mutate(key, [&](data_access& s) { return s.list_set(key, index, value); }), out);
            break;
        }

        case fnv1a("lrem"):
        {
            if (!need_args(cmd, 3, "lrem <key> <value>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view value = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.list_remove(key, value); }), out);
            break;
        }

        case fnv1a("hset"):
        {
            if (!need_args(cmd, 4, "hset <key> <field> <value>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view field = cmd.args[2];
            std::string_view value = cmd.rest_from(3);
            report(session.mutate(key, [&](data_access& s) { return s.hash_set(key, field, value); }), out);
            break;
        }

        case fnv1a("hdel"):
        {
            if (!need_args(cmd, 3, "hdel <key> <field>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view field = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.hash_delete(key, field); }), out);
            break;
        }

        case fnv1a("sadd"):
        {
            if (!need_args(cmd, 3, "sadd <key> <member>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view member = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.set_add(key, member); }), out);
            break;
        }

        case fnv1a("srem"):
        {
            if (!need_args(cmd, 3, "srem <key> <member>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view member = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.set_remove(key, member); }), out);
            break;
        }

        case fnv1a("zrem"):
        {
            if (!need_args(cmd, 3, "zrem <key> <member>", out))
                break;
            std::string_view key = cmd.args[1];
            std::string_view member = cmd.rest_from(2);
            report(session.mutate(key, [&](data_access& s) { return s.zset_remove(key, member); }), out);
            break;
        }

        case fnv1a("zadd"):
        {
            if (!need_args(cmd, 4, "zadd <key> <score> <member>", out))
                break;
            double score = 0;
            if (!parse_double(cmd.args[2], score))
            {
                out += "score must be a number\n";
                break;
            }
            std::string_view key = cmd.args[1];
            std::string_view member = cmd.rest_from(3);
            report(session.mutate(key, [&](data_access& s) { return s.zset_add(key, member, score); }), out);
            break;
        }

        case fnv1a("expire"):
        {
            if (!need_args(cmd, 3, "expire <key> <seconds>", out))
                break;
            int64_t secs = 0;
            if (!parse_i64(cmd.args[2], secs))
            {
                out += "seconds must be a number\n";
                break;
            }
            std::string_view key = cmd.args[1];
            report(session.mutate(key, [&](data_access& s) { return s.set_ttl(key, secs); }), out);
            break;
        }

        case fnv1a("rename"):
        {
            if (!need_args(cmd, 3, "rename <from> <to>", out))
                break;
            std::string_view from = cmd.args[1];
            std::string_view to = cmd.args[2];
            auto st = session.mutate(to, [&](data_access& s) { return s.rename(from, to); });
            if (st)
                st = session.on_key_committed(from);
            report(st, out);
            break;
        }

        case fnv1a("del"):
        {
            if (!need_args(cmd, 2, "del <key>", out))
                break;
            report(session.delete_key(cmd.rest_from(1)), out);
            break;
        }

        case fnv1a("exec"):
        {
            if (!need_args(cmd, 2, "exec <command...>", out))
                break;
            std::string reply;
            auto st = session.execute(cmd.rest_from(1), reply);
            out += reply;
            if (!reply.empty() && reply.back() != '\n')
                out += '\n';
            report(st, out);
            break;
        }

        case fnv1a("db"):
        {
            int64_t idx = 0;
            if (!need_args(cmd, 2, "db <index>", out))
                break;
            if (!parse_i64(cmd.args[1], idx) || idx < 0 || idx > INT_MAX)
            {
                out += "database index must be a non-negative number\n";
                break;
            }
            auto st = session.switch_db(static_cast<int>(idx));
            report(st, out);
            if (st)
                print_status_line(session, out);
            break;
        }

        case fnv1a("info"):
        {
            auto info = session.keyspace_info();
            if (info.empty())
                out += "(no keyspace info)\n";
            for (const auto& [db, keys] : info)
                out += "db" + std::to_string(db) + ": " + std::to_string(keys) + " keys\n";
            break;
        }

        case fnv1a("sep"):
            if (!need_args(cmd, 2, "sep <separator>", out))
                break;
            session.set_separator(cmd.args[1]);
            break;

        case fnv1a("page"):
        {
            int64_t n = 0;
            if (!need_args(cmd, 2, "page <n>", out))
                break;
            if (!parse_i64(cmd.args[1], n))
            {
                out += "page size must be a number\n";
                break;
            }
            session.set_page_size(clamp_page_size(n));
            out += "page size " + std::to_string(session.settings().page_size) + "\n";
            break;
        }

        case fnv1a("reconnect"):
        {
            auto st = session.reconnect();
            report(st, out);
            if (st)
                print_status_line(session, out);
            break;
        }

        case fnv1a("status"):
            print_status_line(session, out);
            break;

        case fnv1a("help"):
        case fnv1a("?"):
            out += HELP_TEXT;
            break;

        case fnv1a("quit"):
        case fnv1a("exit"):
            return repl_quit;

        default:
            out += "unknown command: " + std::string(cmd.args[0]) + " (try help)\n";
            break;
    }
    return repl_continue;
}

int cli_main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "--help")
        {
            std::cout << usage_text();
            return 0;
        }
        if (a == "--version")
        {
            std::cout << "keyscope " << KEYSCOPE_VERSION << "\n";
            return 0;
        }
    }

    app_config cfg;
    std::string error;

    std::string config_path = find_config_path(argc, argv);
    if (config_path.empty())
    {
        const char* env = std::getenv("KEYSCOPE_CONFIG");
        if (env && env[0])
            config_path = env;
    }
    if (!config_path.empty() && !load_config_file(config_path, cfg, error))
    {
        std::cerr << error << "\n";
        return 1;
    }
    if (!apply_cli_args(argc, argv, cfg, error))
    {
        std::cerr << error << "\n" << usage_text();
        return 1;
    }
    logger::g_level = cfg.level;

    redis_data_access store(cfg.connection);
    auto st = store.connect();
    if (!st)
    {
        std::cerr << "failed to connect to " << cfg.connection.label() << ": " << st.message << "\n";
        return 2;
    }

    browser_session session(store, cfg.browser);
    g_session = &session;

    // No SA_RESTART: the handler only raises the cancel generation, and the
    // paginator notices it before its next round trip
    struct sigaction sa{};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    bool tty = isatty(STDIN_FILENO);
    if (tty)
        std::cout << "keyscope " << KEYSCOPE_VERSION << " connected to " << store.label() << "\n";

    std::string out;
    st = session.load_first_page();
    report(st, out);
    if (tty)
    {
        print_status_line(session, out);
        out += render_tree(session.current_tree(), print_options{});
    }
    std::cout << out << std::flush;

    std::string line;
    while (true)
    {
        if (tty)
            std::cout << "keyscope:" << session.current_db() << "> " << std::flush;
        if (!std::getline(std::cin, line))
        {
            if (std::cin.eof())
                break;
            // Interrupted read; keep going
            std::cin.clear();
            std::cout << "\n";
            continue;
        }

        out.clear();
        repl_result r = cli_execute(session, line, out);
        std::cout << out << std::flush;
        if (r == repl_quit)
            break;
    }

    g_session = nullptr;
    store.disconnect();
    return 0;
}

} // namespace keyscope
