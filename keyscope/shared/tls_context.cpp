#include "tls_context.h"
#include "logging.h"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace keyscope {

static std::string openssl_error_string()
{
    unsigned long e = ERR_get_error();
    if (e == 0)
        return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

bool tls_context::init_client(std::string_view ca_path, std::string_view client_cert,
                              std::string_view client_key, bool verify_peer)
{
    if (m_ctx)
    {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
    {
        m_error = "failed to create SSL context";
        LOG_ERROR("[tls] failed to create SSL context");
        return false;
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);

    // Retry internal reads/writes on renegotiation so blocking callers see whole records
    SSL_CTX_set_mode(m_ctx, SSL_MODE_AUTO_RETRY);

    if (!ca_path.empty())
    {
        if (SSL_CTX_load_verify_locations(m_ctx, std::string(ca_path).c_str(), nullptr) <= 0)
        {
            m_error = "failed to load CA: " + std::string(ca_path);
            LOG_ERROR(m_error.c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }
    else
    {
        SSL_CTX_set_default_verify_paths(m_ctx);
    }

    if (!client_cert.empty() && !client_key.empty())
    {
        if (SSL_CTX_use_certificate_file(m_ctx, std::string(client_cert).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            m_error = "failed to load client certificate: " + std::string(client_cert);
            LOG_ERROR(m_error.c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (SSL_CTX_use_PrivateKey_file(m_ctx, std::string(client_key).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            m_error = "failed to load client key: " + std::string(client_key);
            LOG_ERROR(m_error.c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (!SSL_CTX_check_private_key(m_ctx))
        {
            m_error = "client key does not match certificate";
            LOG_ERROR(m_error.c_str());
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }

    SSL_CTX_set_verify(m_ctx, verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    m_error.clear();
    return true;
}

SSL* tls_context::connect(int fd, std::string_view server_name, std::string& error) const
{
    if (!m_ctx)
    {
        error = "TLS context not initialized";
        return nullptr;
    }

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
    {
        error = openssl_error_string();
        return nullptr;
    }

    std::string host(server_name);
    if (!host.empty())
    {
        SSL_set_tlsext_host_name(ssl, host.c_str());
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl);
        X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        X509_VERIFY_PARAM_set1_host(param, host.c_str(), 0);
    }

    if (SSL_set_fd(ssl, fd) != 1 || SSL_connect(ssl) != 1)
    {
        error = openssl_error_string();
        SSL_free(ssl);
        return nullptr;
    }

    return ssl;
}

int tls_context::ssl_read(SSL* ssl, char* buf, int len)
{
    int n = SSL_read(ssl, buf, len);
    if (n > 0)
        return n;
    ERR_clear_error();
    return -1;
}

int tls_context::ssl_write(SSL* ssl, const char* buf, int len)
{
    int n = SSL_write(ssl, buf, len);
    if (n > 0)
        return n;
    ERR_clear_error();
    return -1;
}

void tls_context::free_ssl(SSL* ssl)
{
    if (ssl)
    {
        SSL_shutdown(ssl);
        SSL_free(ssl);
    }
}

} // namespace keyscope
