#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace keyscope {

enum status_code : uint8_t
{
    status_ok            = 0,
    status_transport     = 1,   // connection lost, timeout, protocol desync
    status_resolution    = 2,   // a type lookup in a batch failed; batch rejected
    status_cancelled     = 3,   // caller abandoned the request mid-loop
    status_not_connected = 4,
    status_invalid       = 5    // bad argument from the caller, or a server error reply
};

struct core_status
{
    status_code code{status_ok};
    std::string message;

    bool ok() const { return code == status_ok; }
    explicit operator bool() const { return ok(); }

    static core_status success() { return {}; }
    static core_status fail(status_code c, std::string msg)
    {
        core_status s;
        s.code = c;
        s.message = std::move(msg);
        return s;
    }
};

inline const char* status_name(status_code c)
{
    switch (c)
    {
        case status_ok:            return "ok";
        case status_transport:     return "transport error";
        case status_resolution:    return "resolution error";
        case status_cancelled:     return "cancelled";
        case status_not_connected: return "not connected";
        case status_invalid:       return "invalid";
        default:                   return "?";
    }
}

} // namespace keyscope
