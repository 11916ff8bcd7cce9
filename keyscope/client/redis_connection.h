#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/core_status.h"
#include "../protocol/resp_codec.h"
#include "../shared/tls_context.h"

namespace keyscope {

struct connection_options
{
    std::string host{"127.0.0.1"};
    uint16_t port{6379};
    int db{0};
    std::string username;           // ACL user; empty = legacy AUTH <password>
    std::string password;

    bool tls{false};
    bool tls_verify{true};
    std::string ca_path;
    std::string cert_path;
    std::string key_path;

    uint32_t connect_timeout_ms{5000};
    uint32_t io_timeout_ms{0};      // 0 = block until the server answers

    // "host:port/dbN", with a lock marker when a password is set
    std::string label() const;
};

// One blocking RESP connection. Not safe for concurrent use: the owning
// session serializes every command on it.
class redis_connection
{
public:
    redis_connection() = default;
    ~redis_connection();

    redis_connection(const redis_connection&) = delete;
    redis_connection& operator=(const redis_connection&) = delete;

    // Connects, negotiates TLS, authenticates, selects the db and pings.
    core_status connect(const connection_options& opts);
    core_status reconnect();
    void close();

    bool is_connected() const { return m_fd >= 0; }
    const connection_options& options() const { return m_opts; }
    int current_db() const { return m_opts.db; }

    // Single round trip. Server error replies are returned as reply_kind::error
    // with an ok status; only transport failures produce a failed status.
    core_status command(const std::vector<std::string>& args, resp::reply& out);

    // All commands are written in one send, then the replies are read in order.
    core_status pipeline(const std::vector<std::vector<std::string>>& commands,
                         std::vector<resp::reply>& out);

    // Issues SELECT and records the new index for reconnects
    core_status select(int db);

private:
    core_status open_socket();
    core_status handshake();
    core_status send_all(std::string_view data);
    core_status read_reply(resp::reply& out);
    core_status fail_transport(std::string msg);

    int m_fd{-1};
    SSL* m_ssl{nullptr};
    std::unique_ptr<tls_context> m_tls;
    connection_options m_opts;
    std::string m_buf;
    bool m_configured{false};
};

} // namespace keyscope
