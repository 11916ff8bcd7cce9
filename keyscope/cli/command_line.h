#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "../shared/string_util.h"

namespace keyscope {

// Tokenized REPL line. Tokens are views into the original line, so
// rest_from() can hand back values that contain spaces untouched.
struct command_line
{
    std::string_view line;
    std::vector<std::string_view> args;
    uint32_t verb{0};                   // fnv1a_lower of args[0]

    void parse(std::string_view text)
    {
        line = text;
        args.clear();
        verb = 0;

        size_t i = 0;
        while (i < text.size())
        {
            while (i < text.size() && (text[i] == ' ' || text[i] == '\t'))
                ++i;
            if (i >= text.size()) break;

            size_t start = i;
            while (i < text.size() && text[i] != ' ' && text[i] != '\t')
                ++i;
            args.push_back(text.substr(start, i - start));
        }

        if (!args.empty())
            verb = fnv1a_lower(args[0]);
    }

    size_t count() const { return args.size(); }

    std::string_view rest_from(size_t idx) const
    {
        if (idx >= args.size()) return {};
        const char* start = args[idx].data();
        const char* end = args.back().data() + args.back().size();
        return std::string_view(start, static_cast<size_t>(end - start));
    }
};

} // namespace keyscope
