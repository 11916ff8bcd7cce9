#include "tree_printer.h"

namespace keyscope {

namespace {

void render_node(const namespace_tree& tree, uint32_t idx, uint32_t base_depth,
                 const print_options& opts, std::string& out)
{
    std::vector<uint32_t> pending{idx};
    while (!pending.empty())
    {
        const tree_node& n = tree.node(pending.back());
        pending.pop_back();
        uint32_t rel = n.depth - base_depth;

        out.append(static_cast<size_t>(rel - 1) * 2, ' ');
        out += n.name.empty() ? std::string_view("\"\"") : std::string_view(n.name);

        if (n.kind == node_branch)
        {
            out += tree.separator();
            out += " (";
            out += std::to_string(n.leaf_count);
            out += ')';
            if (n.is_key && opts.show_types)
            {
                out += " [";
                out += key_type_name(n.type);
                out += ']';
            }
        }
        else if (opts.show_types)
        {
            out += " [";
            out += key_type_name(n.type);
            out += ']';
        }

        bool collapsed = opts.max_depth != 0 && rel >= opts.max_depth && !n.children.empty();
        if (collapsed)
            out += " +";
        out += '\n';

        if (!collapsed)
            pending.insert(pending.end(), n.children.rbegin(), n.children.rend());
    }
}

} // namespace

std::string render_tree(const namespace_tree& tree, const print_options& opts)
{
    std::string out;

    uint32_t start = namespace_tree::root_index;
    if (!opts.root_path.empty())
    {
        auto idx = tree.find(opts.root_path);
        if (!idx)
            return "no such path: " + std::string(opts.root_path) + "\n";
        start = *idx;
    }

    const tree_node& base = tree.node(start);
    if (start != namespace_tree::root_index)
    {
        out += tree.path(start);
        out += " (";
        out += std::to_string(base.leaf_count);
        out += ")\n";
    }

    if (base.children.empty() && start == namespace_tree::root_index)
        out += "(no keys)\n";

    for (uint32_t child : base.children)
        render_node(tree, child, base.depth, opts, out);

    if (tree.more_available())
    {
        out += "... load more (cursor ";
        out += std::to_string(tree.cursor());
        out += ")\n";
    }
    return out;
}

} // namespace keyscope
