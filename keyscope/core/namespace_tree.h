#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "key_type.h"

namespace keyscope {

enum node_kind : uint8_t
{
    node_branch = 0,
    node_leaf   = 1
};

struct tree_node
{
    std::string name;           // one path segment; may be empty
    node_kind kind{node_leaf};

    // A branch can also be a real key ("a" alongside "a:b"); leaves always are
    bool is_key{false};
    std::string key;            // the full key; empty unless is_key
    key_type type{key_unknown};

    // Childless descendants; 1 for a leaf itself
    size_t leaf_count{0};

    uint32_t parent{UINT32_MAX};
    uint32_t depth{0};
    std::vector<uint32_t> children;     // ascending by name, byte-wise
};

// Hierarchical view of a flat key list, split on a separator.
//
// Nodes live in one arena indexed in depth-first pre-order, so for a given
// key set and separator the arena is identical no matter what order the keys
// arrived in.
class namespace_tree
{
public:
    static constexpr uint32_t root_index = 0;

    namespace_tree();

    // An empty separator puts every key directly under the root
    static namespace_tree build(const std::vector<std::string>& keys, const type_map& types,
                                std::string_view separator);

    const tree_node& root() const { return m_nodes[root_index]; }
    const tree_node& node(uint32_t idx) const { return m_nodes[idx]; }
    const std::vector<tree_node>& nodes() const { return m_nodes; }
    size_t node_count() const { return m_nodes.size(); }

    // Index of the node at `path`, if present
    std::optional<uint32_t> find(std::string_view path) const;

    // Segments from the root down to `idx`, joined by the separator
    std::string path(uint32_t idx) const;

    // The key a selection of this node yields: branches only yield one when
    // they are keys themselves
    std::optional<std::string> selected_key(uint32_t idx) const;

    size_t key_count() const { return m_key_count; }
    size_t leaf_count() const { return root().leaf_count; }
    const std::string& separator() const { return m_separator; }

    // "Load more" marker: set when the scan behind this tree has not finished
    void annotate(uint64_t cursor) { m_cursor = cursor; }
    bool more_available() const { return m_cursor != 0; }
    uint64_t cursor() const { return m_cursor; }

    // Depth-first pre-order walk; return false from fn to skip a node's children
    template<typename Fn>
    void visit(Fn&& fn) const
    {
        visit_from(root_index, fn);
    }

private:
    template<typename Fn>
    void visit_from(uint32_t idx, Fn& fn) const
    {
        // Explicit stack: a key made of many separators nests arbitrarily deep
        std::vector<uint32_t> pending(m_nodes[idx].children.rbegin(), m_nodes[idx].children.rend());
        while (!pending.empty())
        {
            uint32_t cur = pending.back();
            pending.pop_back();
            const tree_node& n = m_nodes[cur];
            if (fn(n))
                pending.insert(pending.end(), n.children.rbegin(), n.children.rend());
        }
    }

    std::vector<tree_node> m_nodes;
    std::string m_separator;
    size_t m_key_count{0};
    uint64_t m_cursor{0};
};

// Splits on every occurrence of `separator`, keeping empty segments
std::vector<std::string_view> split_key(std::string_view key, std::string_view separator);

} // namespace keyscope
