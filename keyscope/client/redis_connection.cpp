#include "redis_connection.h"
#include "../shared/logging.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace keyscope {

std::string connection_options::label() const
{
    std::string out;
    if (!password.empty())
        out += "[auth] ";
    out += host;
    out += ':';
    out += std::to_string(port);
    out += "/db";
    out += std::to_string(db);
    return out;
}

redis_connection::~redis_connection()
{
    close();
}

void redis_connection::close()
{
    if (m_ssl)
    {
        tls_context::free_ssl(m_ssl);
        m_ssl = nullptr;
    }
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
    m_buf.clear();
}

core_status redis_connection::fail_transport(std::string msg)
{
    LOG_WARNF("connection %s: %s", m_opts.label().c_str(), msg.c_str());
    close();
    return core_status::fail(status_transport, std::move(msg));
}

core_status redis_connection::connect(const connection_options& opts)
{
    close();
    m_opts = opts;
    m_configured = true;

    if (m_opts.tls)
    {
        m_tls = std::make_unique<tls_context>();
        if (!m_tls->init_client(m_opts.ca_path, m_opts.cert_path, m_opts.key_path, m_opts.tls_verify))
            return core_status::fail(status_transport, m_tls->last_error());
    }
    else
    {
        m_tls.reset();
    }

    auto st = open_socket();
    if (!st)
        return st;

    st = handshake();
    if (!st)
        return st;

    LOG_INFOF("connected to %s", m_opts.label().c_str());
    return core_status::success();
}

core_status redis_connection::reconnect()
{
    if (!m_configured)
        return core_status::fail(status_not_connected, "no connection configured");
    connection_options opts = m_opts;
    return connect(opts);
}

core_status redis_connection::open_socket()
{
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    char port_str[8];
    std::snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(m_opts.port));

    int gai = getaddrinfo(m_opts.host.c_str(), port_str, &hints, &res);
    if (gai != 0 || !res)
        return fail_transport(std::string("resolve failed: ") + gai_strerror(gai));

    std::string last_error = "connect failed";
    int fd = -1;
    for (auto* rp = res; rp; rp = rp->ai_next)
    {
        fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, rp->ai_protocol);
        if (fd < 0)
            continue;

        int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS)
        {
            struct pollfd pfd{fd, POLLOUT, 0};
            int timeout = m_opts.connect_timeout_ms ? static_cast<int>(m_opts.connect_timeout_ms) : -1;
            rc = ::poll(&pfd, 1, timeout);
            if (rc == 0)
            {
                last_error = "connect timed out";
                rc = -1;
            }
            else if (rc > 0)
            {
                int so_err = 0;
                socklen_t len = sizeof(so_err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len);
                if (so_err != 0)
                {
                    last_error = std::strerror(so_err);
                    rc = -1;
                }
                else
                {
                    rc = 0;
                }
            }
            else
            {
                last_error = std::strerror(errno);
            }
        }
        else if (rc < 0)
        {
            last_error = std::strerror(errno);
        }

        if (rc == 0)
            break;

        ::close(fd);
        fd = -1;
    }

    freeaddrinfo(res);

    if (fd < 0)
        return fail_transport(last_error);

    // Back to blocking mode; timeouts are enforced with SO_RCVTIMEO/SO_SNDTIMEO
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);

    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    if (m_opts.io_timeout_ms > 0)
    {
        struct timeval tv{};
        tv.tv_sec = static_cast<long>(m_opts.io_timeout_ms / 1000);
        tv.tv_usec = static_cast<long>((m_opts.io_timeout_ms % 1000) * 1000);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    m_fd = fd;

    if (m_tls)
    {
        std::string err;
        m_ssl = m_tls->connect(m_fd, m_opts.host, err);
        if (!m_ssl)
            return fail_transport("TLS handshake failed: " + err);
    }

    return core_status::success();
}

core_status redis_connection::handshake()
{
    resp::reply r;
    core_status st;

    if (!m_opts.password.empty())
    {
        if (m_opts.username.empty())
            st = command({"AUTH", m_opts.password}, r);
        else
            st = command({"AUTH", m_opts.username, m_opts.password}, r);
        if (!st)
            return st;
        if (r.is_error())
        {
            close();
            return core_status::fail(status_invalid, r.str);
        }
    }

    if (m_opts.db != 0)
    {
        st = command({"SELECT", std::to_string(m_opts.db)}, r);
        if (!st)
            return st;
        if (r.is_error())
        {
            close();
            return core_status::fail(status_invalid, r.str);
        }
    }

    st = command({"PING"}, r);
    if (!st)
        return st;
    if (r.is_error())
    {
        close();
        return core_status::fail(status_invalid, r.str);
    }
    return core_status::success();
}

core_status redis_connection::select(int db)
{
    resp::reply r;
    auto st = command({"SELECT", std::to_string(db)}, r);
    if (!st)
        return st;
    if (r.is_error())
        return core_status::fail(status_invalid, r.str);
    m_opts.db = db;
    return core_status::success();
}

core_status redis_connection::send_all(std::string_view data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        int chunk = static_cast<int>(std::min<size_t>(data.size() - sent, 1 << 20));
        int n;
        if (m_ssl)
            n = tls_context::ssl_write(m_ssl, data.data() + sent, chunk);
        else
            n = static_cast<int>(::send(m_fd, data.data() + sent, static_cast<size_t>(chunk), MSG_NOSIGNAL));

        if (n < 0 && !m_ssl && errno == EINTR)
            continue;
        if (n <= 0)
            return fail_transport(std::string("send failed: ") + std::strerror(errno));
        sent += static_cast<size_t>(n);
    }
    return core_status::success();
}

core_status redis_connection::read_reply(resp::reply& out)
{
    for (;;)
    {
        if (!m_buf.empty())
        {
            size_t consumed = 0;
            auto r = resp::parse_reply(m_buf, out, consumed);
            if (r == resp::parse_result::ok)
            {
                m_buf.erase(0, consumed);
                return core_status::success();
            }
            if (r == resp::parse_result::error)
                return fail_transport("protocol error in server reply");
        }

        char tmp[16384];
        int n;
        if (m_ssl)
            n = tls_context::ssl_read(m_ssl, tmp, sizeof(tmp));
        else
            n = static_cast<int>(::recv(m_fd, tmp, sizeof(tmp), 0));

        if (n < 0 && !m_ssl && errno == EINTR)
            continue;
        if (n == 0)
            return fail_transport("connection closed by server");
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return fail_transport("read timed out");
            return fail_transport(std::string("recv failed: ") + std::strerror(errno));
        }
        m_buf.append(tmp, static_cast<size_t>(n));
    }
}

core_status redis_connection::command(const std::vector<std::string>& args, resp::reply& out)
{
    if (m_fd < 0)
        return core_status::fail(status_not_connected, "not connected");

    auto st = send_all(resp::encode_command(args));
    if (!st)
        return st;
    return read_reply(out);
}

core_status redis_connection::pipeline(const std::vector<std::vector<std::string>>& commands,
                                       std::vector<resp::reply>& out)
{
    out.clear();
    if (commands.empty())
        return core_status::success();
    if (m_fd < 0)
        return core_status::fail(status_not_connected, "not connected");

    std::string buf;
    for (const auto& cmd : commands)
        resp::encode_command_into(buf, cmd);

    auto st = send_all(buf);
    if (!st)
        return st;

    out.resize(commands.size());
    for (auto& r : out)
    {
        st = read_reply(r);
        if (!st)
        {
            out.clear();
            return st;
        }
    }
    return core_status::success();
}

} // namespace keyscope
