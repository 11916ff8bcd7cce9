#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <unordered_set>
#include <vector>

namespace keyscope {

// Transparent hash for heterogeneous lookup (avoids string copies on find)
struct string_hash
{
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }

    size_t operator()(const std::string& s) const noexcept
    {
        return std::hash<std::string_view>{}(s);
    }
};

struct string_equal
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return lhs == rhs;
    }
};

using string_set = std::unordered_set<std::string, string_hash, string_equal>;

// FNV-1a, usable in switch labels for string dispatch
constexpr uint32_t fnv1a(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
    return hash;
}

// Case-insensitive hash: "TYPE" and "type" dispatch to the same label
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
    {
        char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
        hash = (hash ^ static_cast<uint8_t>(lower)) * 16777619u;
    }
    return hash;
}

constexpr char ascii_lower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline std::string to_lower_copy(std::string_view s)
{
    std::string out(s);
    for (auto& c : out)
        c = ascii_lower(c);
    return out;
}

// ASCII case-insensitive substring test. `needle_lower` must already be lowercase.
inline bool contains_lower(std::string_view haystack, std::string_view needle_lower) noexcept
{
    if (needle_lower.empty())
        return true;
    if (needle_lower.size() > haystack.size())
        return false;

    size_t last = haystack.size() - needle_lower.size();
    for (size_t i = 0; i <= last; ++i)
    {
        size_t j = 0;
        while (j < needle_lower.size() && ascii_lower(haystack[i + j]) == needle_lower[j])
            ++j;
        if (j == needle_lower.size())
            return true;
    }
    return false;
}

inline std::vector<std::string> split_whitespace(std::string_view line)
{
    std::vector<std::string> out;
    size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        if (i >= line.size())
            break;

        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t')
            ++i;
        out.emplace_back(line.substr(start, i - start));
    }
    return out;
}

} // namespace keyscope
