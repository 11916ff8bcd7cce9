#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "../client/redis_connection.h"
#include "../core/browser_session.h"
#include "../shared/logging.h"

namespace keyscope {

constexpr size_t MIN_PAGE_SIZE = 10;
constexpr size_t MAX_PAGE_SIZE = 1000000;
constexpr size_t DEFAULT_PAGE_SIZE = 2000;

struct app_config
{
    connection_options connection;
    session_settings browser{":", "*", DEFAULT_PAGE_SIZE};
    log_level level{log_warn};
};

// Page sizes outside [MIN_PAGE_SIZE, MAX_PAGE_SIZE] are pulled to the bound
size_t clamp_page_size(int64_t requested);

// Lua config:
//
//   connection = { host = "10.0.0.5", port = 6380, db = 2, password = "...",
//                  tls = true, ca = "/etc/ssl/redis-ca.pem", timeout_ms = 3000 }
//   browser    = { page_size = 500, separator = ":", pattern = "user:*",
//                  log_level = "info" }
//
// Missing fields keep their current values.
bool load_config_file(const std::string& path, app_config& cfg, std::string& error);
bool load_config_string(std::string_view script, app_config& cfg, std::string& error);

// Returns the value of --config if present, empty otherwise
std::string find_config_path(int argc, char** argv);

// Command-line flags, applied after the config file so they take precedence
bool apply_cli_args(int argc, char** argv, app_config& cfg, std::string& error);

const char* usage_text();

} // namespace keyscope
