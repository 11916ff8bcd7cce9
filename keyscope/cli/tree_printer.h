#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "../core/namespace_tree.h"

namespace keyscope {

struct print_options
{
    std::string_view root_path;     // empty = whole tree
    size_t max_depth{2};            // levels below root_path; 0 = unlimited
    bool show_types{true};
};

// Indented outline:
//
//   user: (3)
//     1 [hash]
//     2 [hash]
//   ... load more (cursor 1234)
//
// Branches show their leaf count; collapsed branches end with "+".
std::string render_tree(const namespace_tree& tree, const print_options& opts);

} // namespace keyscope
