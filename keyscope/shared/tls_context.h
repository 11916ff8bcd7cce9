#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace keyscope {

// Client-side TLS context for store connections.
// Sockets stay blocking; SSL objects are bound directly to the fd.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // Empty ca_path uses the system trust store.
    // If client_cert/client_key are non-empty, presents a client certificate (for mTLS).
    bool init_client(std::string_view ca_path = {},
                     std::string_view client_cert = {},
                     std::string_view client_key = {},
                     bool verify_peer = true);

    // Creates an SSL bound to `fd` and runs the handshake to completion.
    // Returns nullptr on failure; `error` receives the OpenSSL reason.
    SSL* connect(int fd, std::string_view server_name, std::string& error) const;

    // Return bytes transferred, or -1 on error/close
    static int ssl_read(SSL* ssl, char* buf, int len);
    static int ssl_write(SSL* ssl, const char* buf, int len);

    static void free_ssl(SSL* ssl);

    bool is_initialized() const { return m_ctx != nullptr; }
    const std::string& last_error() const { return m_error; }

private:
    SSL_CTX* m_ctx = nullptr;
    std::string m_error;
};

} // namespace keyscope
