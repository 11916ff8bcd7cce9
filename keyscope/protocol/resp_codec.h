#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <cstring>
#include <charconv>

// RESP2 client codec: commands go out as arrays of bulk strings,
// replies come back as any of the five RESP2 types.

namespace keyscope::resp {

// Safety limits to prevent resource exhaustion from a misbehaving server
constexpr int64_t RESP_MAX_ARRAY_SIZE = 1024 * 1024;
constexpr int64_t RESP_MAX_BULK_LEN = 512 * 1024 * 1024; // 512 MB, the server's own limit
constexpr int RESP_MAX_DEPTH = 16;

// ─── Fast \r\n scanner ───
inline const char* find_crlf(const char* data, size_t len) noexcept
{
    const char* end = data + len;
    while (true)
    {
        const char* p = static_cast<const char*>(std::memchr(data, '\r', static_cast<size_t>(end - data)));
        if (__builtin_expect(!p || p + 1 >= end, 0))
            return nullptr;
        if (__builtin_expect(p[1] == '\n', 1))
            return p;
        data = p + 1;
    }
}

// ─── Command encoding ───

inline void encode_bulk_into(std::string& buf, std::string_view str)
{
    size_t sz = str.size();
    if (__builtin_expect(sz <= 9, 1))
    {
        char hdr[4] = { '$', static_cast<char>('0' + sz), '\r', '\n' };
        buf.append(hdr, 4);
        buf.append(str.data(), sz);
        buf.append("\r\n", 2);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), sz);
    buf += '$';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
    buf.append(str.data(), sz);
    buf.append("\r\n", 2);
}

inline void encode_array_header_into(std::string& buf, size_t n)
{
    if (__builtin_expect(n <= 9, 1))
    {
        char hdr[4] = { '*', static_cast<char>('0' + n), '\r', '\n' };
        buf.append(hdr, 4);
        return;
    }
    char tmp[24];
    auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), n);
    buf += '*';
    buf.append(tmp, static_cast<size_t>(end - tmp));
    buf.append("\r\n", 2);
}

// Appends one command to `buf`; several calls in a row form a pipeline.
inline void encode_command_into(std::string& buf, const std::vector<std::string>& args)
{
    encode_array_header_into(buf, args.size());
    for (const auto& a : args)
        encode_bulk_into(buf, a);
}

inline std::string encode_command(const std::vector<std::string>& args)
{
    std::string out;
    encode_command_into(out, args);
    return out;
}

// ─── Reply decoding ───

enum class reply_kind : uint8_t
{
    simple,
    error,
    integer,
    bulk,
    array,
    nil
};

struct reply
{
    reply_kind kind{reply_kind::nil};
    std::string str;            // simple, error, bulk
    int64_t integer{0};
    std::vector<reply> elements;

    bool is_error() const { return kind == reply_kind::error; }
    bool is_nil() const { return kind == reply_kind::nil; }
    bool is_array() const { return kind == reply_kind::array; }
    bool is_string() const { return kind == reply_kind::simple || kind == reply_kind::bulk; }
};

enum class parse_result { ok, incomplete, error };

namespace detail {

inline parse_result parse_length(const char* data, size_t sz, size_t& offset, int64_t& out)
{
    const char* crlf = find_crlf(data + offset + 1, sz - offset - 1);
    if (!crlf)
        return parse_result::incomplete;

    auto [ptr, ec] = std::from_chars(data + offset + 1, crlf, out);
    if (ec != std::errc{} || ptr != crlf)
        return parse_result::error;

    offset = static_cast<size_t>(crlf - data) + 2;
    return parse_result::ok;
}

inline parse_result parse_reply_at(const char* data, size_t sz, size_t& offset, reply& out, int depth)
{
    if (depth > RESP_MAX_DEPTH)
        return parse_result::error;
    if (offset >= sz)
        return parse_result::incomplete;

    char tag = data[offset];
    switch (tag)
    {
        case '+':
        case '-':
        {
            const char* crlf = find_crlf(data + offset + 1, sz - offset - 1);
            if (!crlf)
                return parse_result::incomplete;
            out.kind = (tag == '+') ? reply_kind::simple : reply_kind::error;
            out.str.assign(data + offset + 1, static_cast<size_t>(crlf - (data + offset + 1)));
            offset = static_cast<size_t>(crlf - data) + 2;
            return parse_result::ok;
        }
        case ':':
        {
            int64_t n = 0;
            auto r = parse_length(data, sz, offset, n);
            if (r != parse_result::ok)
                return r;
            out.kind = reply_kind::integer;
            out.integer = n;
            return parse_result::ok;
        }
        case '$':
        {
            size_t start = offset;
            int64_t len = 0;
            auto r = parse_length(data, sz, offset, len);
            if (r != parse_result::ok)
                return r;
            if (len == -1)
            {
                out.kind = reply_kind::nil;
                return parse_result::ok;
            }
            if (len < 0 || len > RESP_MAX_BULK_LEN)
                return parse_result::error;

            size_t ulen = static_cast<size_t>(len);
            if (offset + ulen + 2 > sz)
            {
                offset = start;
                return parse_result::incomplete;
            }
            if (data[offset + ulen] != '\r' || data[offset + ulen + 1] != '\n')
                return parse_result::error;

            out.kind = reply_kind::bulk;
            out.str.assign(data + offset, ulen);
            offset += ulen + 2;
            return parse_result::ok;
        }
        case '*':
        {
            size_t start = offset;
            int64_t count = 0;
            auto r = parse_length(data, sz, offset, count);
            if (r != parse_result::ok)
                return r;
            if (count == -1)
            {
                out.kind = reply_kind::nil;
                return parse_result::ok;
            }
            if (count < 0 || count > RESP_MAX_ARRAY_SIZE)
                return parse_result::error;

            out.kind = reply_kind::array;
            out.elements.clear();
            out.elements.resize(static_cast<size_t>(count));
            for (auto& el : out.elements)
            {
                r = parse_reply_at(data, sz, offset, el, depth + 1);
                if (r != parse_result::ok)
                {
                    if (r == parse_result::incomplete)
                        offset = start;
                    return r;
                }
            }
            return parse_result::ok;
        }
        default:
            return parse_result::error;
    }
}

} // namespace detail

// Parse a single reply from the front of a partial buffer.
// On ok, `consumed` is the number of bytes the reply occupied.
inline parse_result parse_reply(std::string_view buf, reply& out, size_t& consumed)
{
    consumed = 0;
    out = reply{};
    if (__builtin_expect(buf.empty(), 0))
        return parse_result::incomplete;

    size_t offset = 0;
    auto r = detail::parse_reply_at(buf.data(), buf.size(), offset, out, 0);
    if (r == parse_result::ok)
        consumed = offset;
    return r;
}

} // namespace keyscope::resp
