#include "reply_format.h"

namespace keyscope {

static void format_into(const resp::reply& r, std::string& out, size_t indent)
{
    switch (r.kind)
    {
        case resp::reply_kind::nil:
            out += "(nil)";
            return;
        case resp::reply_kind::integer:
            out += "(integer) ";
            out += std::to_string(r.integer);
            return;
        case resp::reply_kind::error:
            out += "(error) ";
            out += r.str;
            return;
        case resp::reply_kind::simple:
        case resp::reply_kind::bulk:
            out += r.str;
            return;
        case resp::reply_kind::array:
            break;
    }

    if (r.elements.empty())
    {
        out += "(empty list)";
        return;
    }

    for (size_t i = 0; i < r.elements.size(); ++i)
    {
        if (i > 0)
        {
            out += '\n';
            out.append(indent, ' ');
        }
        std::string prefix = std::to_string(i + 1) + ") ";
        out += prefix;
        format_into(r.elements[i], out, indent + prefix.size());
    }
}

std::string format_reply(const resp::reply& r)
{
    std::string out;
    format_into(r, out, 0);
    return out;
}

} // namespace keyscope
