#include "app_config.h"
#include "../shared/string_util.h"

#include <charconv>
#include <sol/sol.hpp>

namespace keyscope {

size_t clamp_page_size(int64_t requested)
{
    if (requested < static_cast<int64_t>(MIN_PAGE_SIZE))
        return MIN_PAGE_SIZE;
    if (requested > static_cast<int64_t>(MAX_PAGE_SIZE))
        return MAX_PAGE_SIZE;
    return static_cast<size_t>(requested);
}

namespace {

bool read_tables(sol::state& lua, app_config& cfg, std::string& error)
{
    sol::optional<sol::table> conn = lua["connection"];
    if (conn)
    {
        sol::table t = *conn;

        sol::optional<std::string> host = t["host"];
        if (host)
            cfg.connection.host = *host;

        sol::optional<int> port = t["port"];
        if (port)
        {
            if (*port <= 0 || *port > 65535)
            {
                error = "connection.port out of range: " + std::to_string(*port);
                return false;
            }
            cfg.connection.port = static_cast<uint16_t>(*port);
        }

        sol::optional<int> db = t["db"];
        if (db)
        {
            if (*db < 0)
            {
                error = "connection.db must not be negative";
                return false;
            }
            cfg.connection.db = *db;
        }

        sol::optional<std::string> user = t["username"];
        if (user)
            cfg.connection.username = *user;

        sol::optional<std::string> password = t["password"];
        if (password)
            cfg.connection.password = *password;

        cfg.connection.tls = t["tls"].get_or(cfg.connection.tls);
        cfg.connection.tls_verify = t["tls_verify"].get_or(cfg.connection.tls_verify);

        sol::optional<std::string> ca = t["ca"];
        if (ca)
            cfg.connection.ca_path = *ca;

        sol::optional<std::string> cert = t["cert"];
        if (cert)
            cfg.connection.cert_path = *cert;

        sol::optional<std::string> key = t["key"];
        if (key)
            cfg.connection.key_path = *key;

        sol::optional<int> timeout = t["timeout_ms"];
        if (timeout && *timeout >= 0)
            cfg.connection.connect_timeout_ms = static_cast<uint32_t>(*timeout);

        sol::optional<int> io_timeout = t["io_timeout_ms"];
        if (io_timeout && *io_timeout >= 0)
            cfg.connection.io_timeout_ms = static_cast<uint32_t>(*io_timeout);
    }

    sol::optional<sol::table> browser = lua["browser"];
    if (browser)
    {
        sol::table t = *browser;

        sol::optional<int64_t> page = t["page_size"];
        if (page)
            cfg.browser.page_size = clamp_page_size(*page);

        sol::optional<std::string> sep = t["separator"];
        if (sep)
            cfg.browser.separator = *sep;

        sol::optional<std::string> pattern = t["pattern"];
        if (pattern)
            cfg.browser.pattern = pattern->empty() ? std::string("*") : *pattern;

        sol::optional<std::string> level = t["log_level"];
        if (level && !parse_log_level(*level, cfg.level))
        {
            error = "unknown log level: " + *level;
            return false;
        }
    }

    return true;
}

bool run_config(sol::state& lua, sol::load_result& script, app_config& cfg, std::string& error)
{
    if (!script.valid())
    {
        sol::error err = script;
        error = std::string("failed to load config: ") + err.what();
        return false;
    }

    sol::protected_function_result result = script();
    if (!result.valid())
    {
        sol::error err = result;
        error = std::string("error executing config: ") + err.what();
        return false;
    }

    // Work on a copy so a half-applied config never escapes
    app_config next = cfg;
    try
    {
        if (!read_tables(lua, next, error))
            return false;
    }
    catch (const sol::error& e)
    {
        error = std::string("invalid config value: ") + e.what();
        return false;
    }

    cfg = std::move(next);
    return true;
}

bool parse_int(std::string_view sv, int64_t& out)
{
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

} // namespace

bool load_config_file(const std::string& path, app_config& cfg, std::string& error)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::os);

    sol::load_result script = lua.load_file(path);
    return run_config(lua, script, cfg, error);
}

bool load_config_string(std::string_view source, app_config& cfg, std::string& error)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table);

    sol::load_result script = lua.load(source);
    return run_config(lua, script, cfg, error);
}

std::string find_config_path(int argc, char** argv)
{
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string_view(argv[i]) == "--config")
            return argv[i + 1];
    }
    return {};
}

bool apply_cli_args(int argc, char** argv, app_config& cfg, std::string& error)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        auto next = [&](std::string_view& out) -> bool {
            if (i + 1 >= argc)
            {
                error = std::string(arg) + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string_view val;
        int64_t n = 0;

        switch (fnv1a(arg))
        {
            case fnv1a("-h"):
            case fnv1a("--host"):
                if (!next(val)) return false;
                cfg.connection.host.assign(val);
                break;

            case fnv1a("-p"):
            case fnv1a("--port"):
                if (!next(val)) return false;
                if (!parse_int(val, n) || n <= 0 || n > 65535)
                {
                    error = "invalid port: " + std::string(val);
                    return false;
                }
                cfg.connection.port = static_cast<uint16_t>(n);
                break;

            case fnv1a("-n"):
            case fnv1a("--db"):
                if (!next(val)) return false;
                if (!parse_int(val, n) || n < 0)
                {
                    error = "invalid db index: " + std::string(val);
                    return false;
                }
                cfg.connection.db = static_cast<int>(n);
                break;

            case fnv1a("-a"):
            case fnv1a("--password"):
                if (!next(val)) return false;
                cfg.connection.password.assign(val);
                break;

            case fnv1a("--user"):
                if (!next(val)) return false;
                cfg.connection.username.assign(val);
                break;

            case fnv1a("--tls"):
                cfg.connection.tls = true;
                break;

            case fnv1a("--insecure"):
                cfg.connection.tls_verify = false;
                break;

            case fnv1a("--ca"):
                if (!next(val)) return false;
                cfg.connection.ca_path.assign(val);
                break;

            case fnv1a("--cert"):
                if (!next(val)) return false;
                cfg.connection.cert_path.assign(val);
                break;

            case fnv1a("--key"):
                if (!next(val)) return false;
                cfg.connection.key_path.assign(val);
                break;

            case fnv1a("--timeout"):
                if (!next(val)) return false;
                if (!parse_int(val, n) || n < 0)
                {
                    error = "invalid timeout: " + std::string(val);
                    return false;
                }
                cfg.connection.connect_timeout_ms = static_cast<uint32_t>(n);
                break;

            case fnv1a("--page"):
                if (!next(val)) return false;
                if (!parse_int(val, n))
                {
                    error = "invalid page size: " + std::string(val);
                    return false;
                }
                cfg.browser.page_size = clamp_page_size(n);
                break;

            case fnv1a("--sep"):
                if (!next(val)) return false;
                cfg.browser.separator.assign(val);
                break;

            case fnv1a("--pattern"):
                if (!next(val)) return false;
                cfg.browser.pattern = val.empty() ? std::string("*") : std::string(val);
                break;

            case fnv1a("--log-level"):
                if (!next(val)) return false;
                if (!parse_log_level(val, cfg.level))
                {
                    error = "unknown log level: " + std::string(val);
                    return false;
                }
                break;

            case fnv1a("--config"):
                // consumed by find_config_path
                ++i;
                break;

            default:
                error = "unknown option: " + std::string(arg);
                return false;
        }
    }
    return true;
}

const char* usage_text()
{
    return
        "usage: keyscope [options]\n"
        "  -h, --host <host>       server host (default 127.0.0.1)\n"
        "  -p, --port <port>       server port (default 6379)\n"
        "  -n, --db <index>        database index (default 0)\n"
        "  -a, --password <pw>     AUTH password\n"
        "      --user <name>       ACL user name\n"
        "      --tls               connect over TLS\n"
        "      --ca <path>         CA bundle for TLS verification\n"
        "      --cert <path>       client certificate (mTLS)\n"
        "      --key <path>        client private key (mTLS)\n"
        "      --insecure          skip TLS peer verification\n"
        "      --timeout <ms>      connect timeout (default 5000)\n"
        "      --page <n>          keys per page, 10..1000000 (default 2000)\n"
        "      --sep <s>           namespace separator (default ':')\n"
        "      --pattern <glob>    server-side SCAN pattern (default '*')\n"
        "      --config <file>     Lua config file\n"
        "      --log-level <lvl>   debug|info|warn|error|off\n";
}

} // namespace keyscope
