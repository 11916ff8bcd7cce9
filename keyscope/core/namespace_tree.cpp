#include "namespace_tree.h"

#include <algorithm>
#include <functional>
#include <map>

namespace keyscope {

std::vector<std::string_view> split_key(std::string_view key, std::string_view separator)
{
    std::vector<std::string_view> parts;
    if (separator.empty())
    {
        parts.push_back(key);
        return parts;
    }

    size_t start = 0;
    for (;;)
    {
        size_t pos = key.find(separator, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

namespace {

// Scratch trie used while inserting; renumbered into the arena afterwards.
// Nodes hold no path so memory stays linear in the number of segments.
struct build_node
{
    bool is_key{false};
    key_type type{key_unknown};
    std::string_view key;
    std::map<std::string, uint32_t, std::less<>> children;
};

struct emit_frame
{
    const std::string* name;
    uint32_t src;
    uint32_t parent;
};

} // namespace

namespace_tree::namespace_tree()
{
    tree_node root;
    root.kind = node_branch;
    m_nodes.push_back(std::move(root));
}

namespace_tree namespace_tree::build(const std::vector<std::string>& keys, const type_map& types,
                                     std::string_view separator)
{
    std::vector<build_node> scratch(1);

    for (const auto& key : keys)
    {
        uint32_t cur = 0;
        for (std::string_view seg : split_key(key, separator))
        {
            auto& kids = scratch[cur].children;
            auto it = kids.find(seg);
            if (it != kids.end())
            {
                cur = it->second;
                continue;
            }

            uint32_t idx = static_cast<uint32_t>(scratch.size());
            kids.emplace(std::string(seg), idx);
            scratch.emplace_back();     // may invalidate `kids`
            cur = idx;
        }

        scratch[cur].is_key = true;
        scratch[cur].key = key;
        scratch[cur].type = lookup_type(types, key);
    }

    namespace_tree tree;
    tree.m_separator.assign(separator);
    tree.m_nodes.reserve(scratch.size());

    // Emit in pre-order so indices depend only on the key set. Siblings are
    // pushed in reverse so the smallest name is popped first.
    std::vector<emit_frame> pending;
    auto push_children = [&](uint32_t src, uint32_t parent)
    {
        const auto& kids = scratch[src].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it)
            pending.push_back(emit_frame{&it->first, it->second, parent});
    };
    push_children(0, root_index);

    while (!pending.empty())
    {
        emit_frame f = pending.back();
        pending.pop_back();
        const build_node& b = scratch[f.src];

        tree_node n;
        n.name = *f.name;
        n.is_key = b.is_key;
        if (b.is_key)
        {
            n.key.assign(b.key);
            n.type = b.type;
            ++tree.m_key_count;
        }
        n.kind = b.children.empty() ? node_leaf : node_branch;
        n.leaf_count = b.children.empty() ? 1 : 0;
        n.parent = f.parent;
        n.depth = tree.m_nodes[f.parent].depth + 1;

        uint32_t idx = static_cast<uint32_t>(tree.m_nodes.size());
        tree.m_nodes.push_back(std::move(n));
        tree.m_nodes[f.parent].children.push_back(idx);

        push_children(f.src, idx);
    }

    // Pre-order puts every child after its parent, so one backward pass
    // accumulates the leaf counts
    for (size_t i = tree.m_nodes.size(); i-- > 1;)
        tree.m_nodes[tree.m_nodes[i].parent].leaf_count += tree.m_nodes[i].leaf_count;

    return tree;
}

std::optional<uint32_t> namespace_tree::find(std::string_view path) const
{
    uint32_t cur = root_index;
    for (std::string_view seg : split_key(path, m_separator))
    {
        const auto& kids = m_nodes[cur].children;
        auto it = std::lower_bound(kids.begin(), kids.end(), seg,
            [this](uint32_t idx, std::string_view s) { return m_nodes[idx].name < s; });
        if (it == kids.end() || m_nodes[*it].name != seg)
            return std::nullopt;
        cur = *it;
    }
    return cur;
}

std::string namespace_tree::path(uint32_t idx) const
{
    if (idx >= m_nodes.size() || idx == root_index)
        return {};
    if (m_nodes[idx].is_key)
        return m_nodes[idx].key;

    std::vector<uint32_t> chain;
    for (uint32_t cur = idx; cur != root_index; cur = m_nodes[cur].parent)
        chain.push_back(cur);

    std::string out;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        if (it != chain.rbegin())
            out += m_separator;
        out += m_nodes[*it].name;
    }
    return out;
}

std::optional<std::string> namespace_tree::selected_key(uint32_t idx) const
{
    if (idx >= m_nodes.size() || !m_nodes[idx].is_key)
        return std::nullopt;
    return m_nodes[idx].key;
}

} // namespace keyscope
