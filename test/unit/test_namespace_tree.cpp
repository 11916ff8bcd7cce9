#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../keyscope/core/namespace_tree.h"

#include <algorithm>

using namespace keyscope;

static type_map all_strings(const std::vector<std::string>& keys)
{
    type_map t;
    for (const auto& k : keys)
        t[k] = key_string;
    return t;
}

TEST_CASE("split_key")
{
    CHECK(split_key("a:b:c", ":") == std::vector<std::string_view>{"a", "b", "c"});
    CHECK(split_key("plain", ":") == std::vector<std::string_view>{"plain"});
    CHECK(split_key("a::b", ":") == std::vector<std::string_view>{"a", "", "b"});
    CHECK(split_key(":a:", ":") == std::vector<std::string_view>{"", "a", ""});
    CHECK(split_key("a::b", "::") == std::vector<std::string_view>{"a", "b"});
    CHECK(split_key("a:b", "") == std::vector<std::string_view>{"a:b"});
}

TEST_CASE("namespace_tree structure")
{
    std::vector<std::string> keys{"user:1:name", "user:1:email", "user:2:name", "config"};
    auto tree = namespace_tree::build(keys, all_strings(keys), ":");

    SUBCASE("root children are sorted")
    {
        const auto& root = tree.root();
        REQUIRE(root.children.size() == 2);
        CHECK(tree.node(root.children[0]).name == "config");
        CHECK(tree.node(root.children[1]).name == "user");
    }

    SUBCASE("paths and kinds")
    {
        auto user = tree.find("user");
        REQUIRE(user);
        CHECK(tree.node(*user).kind == node_branch);
        CHECK_FALSE(tree.node(*user).is_key);
        CHECK(tree.path(*user) == "user");
        CHECK(tree.node(*user).key.empty());

        auto email = tree.find("user:1:email");
        REQUIRE(email);
        CHECK(tree.node(*email).kind == node_leaf);
        CHECK(tree.path(*email) == "user:1:email");
        CHECK(tree.node(*email).key == "user:1:email");
        CHECK(tree.node(*email).depth == 3);

        CHECK_FALSE(tree.find("user:3").has_value());
    }

    SUBCASE("leaf counts")
    {
        CHECK(tree.node(*tree.find("user")).leaf_count == 3);
        CHECK(tree.node(*tree.find("user:1")).leaf_count == 2);
        CHECK(tree.node(*tree.find("config")).leaf_count == 1);
        CHECK(tree.leaf_count() == 4);
        CHECK(tree.key_count() == 4);
    }

    SUBCASE("parent links")
    {
        auto name = *tree.find("user:2:name");
        auto two = tree.node(name).parent;
        CHECK(tree.path(two) == "user:2");
        CHECK(tree.path(tree.node(two).parent) == "user");
        CHECK(tree.node(tree.node(tree.node(two).parent).parent).parent == UINT32_MAX);
    }
}

TEST_CASE("namespace_tree is independent of input order")
{
    std::vector<std::string> keys{"b:2", "a:1", "b:1", "a", "c", "a:2:x"};
    auto types = all_strings(keys);
    auto first = namespace_tree::build(keys, types, ":");

    std::sort(keys.begin(), keys.end());
    do
    {
        auto again = namespace_tree::build(keys, types, ":");
        REQUIRE(again.node_count() == first.node_count());
        for (size_t i = 0; i < first.node_count(); ++i)
        {
            const auto& a = first.node(static_cast<uint32_t>(i));
            const auto& b = again.node(static_cast<uint32_t>(i));
            CHECK(a.name == b.name);
            CHECK(first.path(static_cast<uint32_t>(i)) == again.path(static_cast<uint32_t>(i)));
            CHECK(a.kind == b.kind);
            CHECK(a.is_key == b.is_key);
            CHECK(a.leaf_count == b.leaf_count);
            CHECK(a.children == b.children);
        }
    }
    while (std::next_permutation(keys.begin(), keys.end()) && keys.front() == "a");
}

TEST_CASE("namespace_tree key that is also a namespace")
{
    std::vector<std::string> keys{"a", "a:b"};
    type_map types{{"a", key_hash}, {"a:b", key_string}};
    auto tree = namespace_tree::build(keys, types, ":");

    auto a = tree.find("a");
    REQUIRE(a);
    const auto& node = tree.node(*a);
    CHECK(node.kind == node_branch);
    CHECK(node.is_key);
    CHECK(node.type == key_hash);
    CHECK(node.leaf_count == 1);
    CHECK(tree.selected_key(*a) == std::optional<std::string>("a"));

    auto ab = tree.find("a:b");
    REQUIRE(ab);
    CHECK(tree.selected_key(*ab) == std::optional<std::string>("a:b"));
    CHECK(tree.key_count() == 2);
}

TEST_CASE("namespace_tree branches that are not keys select nothing")
{
    std::vector<std::string> keys{"x:y"};
    auto tree = namespace_tree::build(keys, all_strings(keys), ":");
    CHECK_FALSE(tree.selected_key(*tree.find("x")).has_value());
    CHECK_FALSE(tree.selected_key(9999).has_value());
}

TEST_CASE("namespace_tree separators")
{
    SUBCASE("empty segments are kept")
    {
        std::vector<std::string> keys{"a::b", ":lead"};
        auto tree = namespace_tree::build(keys, all_strings(keys), ":");
        const auto& root = tree.root();
        REQUIRE(root.children.size() == 2);
        CHECK(tree.node(root.children[0]).name.empty());
        auto b = tree.find("a::b");
        REQUIRE(b);
        CHECK(tree.node(*b).depth == 3);
        CHECK(tree.node(tree.node(*b).parent).name.empty());
    }

    SUBCASE("multi-character separator")
    {
        std::vector<std::string> keys{"app::cfg::port", "app::cfg::host"};
        auto tree = namespace_tree::build(keys, all_strings(keys), "::");
        auto cfg = tree.find("app::cfg");
        REQUIRE(cfg);
        CHECK(tree.node(*cfg).leaf_count == 2);
    }

    SUBCASE("empty separator keeps keys flat")
    {
        std::vector<std::string> keys{"a:b", "a:c"};
        auto tree = namespace_tree::build(keys, all_strings(keys), "");
        CHECK(tree.root().children.size() == 2);
        CHECK(tree.node_count() == 3);
    }

    SUBCASE("keys without the separator are root leaves")
    {
        std::vector<std::string> keys{"one", "two"};
        auto tree = namespace_tree::build(keys, all_strings(keys), "/");
        CHECK(tree.root().children.size() == 2);
        CHECK(tree.leaf_count() == 2);
    }
}

TEST_CASE("namespace_tree types and ordering")
{
    std::vector<std::string> keys{"B", "a", "_", "Z"};
    type_map types{{"a", key_list}};
    auto tree = namespace_tree::build(keys, types, ":");

    std::vector<std::string> names;
    for (uint32_t c : tree.root().children)
        names.push_back(tree.node(c).name);
    CHECK(names == std::vector<std::string>{"B", "Z", "_", "a"});

    CHECK(tree.node(*tree.find("a")).type == key_list);
    CHECK(tree.node(*tree.find("B")).type == key_unknown);
}

TEST_CASE("namespace_tree visit and annotate")
{
    std::vector<std::string> keys{"a:1", "a:2", "b"};
    auto tree = namespace_tree::build(keys, all_strings(keys), ":");

    std::vector<std::string> seen;
    tree.visit([&](const tree_node& n) {
        seen.push_back(n.name);
        return true;
    });
    CHECK(seen == std::vector<std::string>{"a", "1", "2", "b"});

    seen.clear();
    tree.visit([&](const tree_node& n) {
        seen.push_back(n.name);
        return false;
    });
    CHECK(seen == std::vector<std::string>{"a", "b"});

    CHECK_FALSE(tree.more_available());
    tree.annotate(55);
    CHECK(tree.more_available());
    CHECK(tree.cursor() == 55);
}

TEST_CASE("namespace_tree empty")
{
    auto tree = namespace_tree::build({}, {}, ":");
    CHECK(tree.node_count() == 1);
    CHECK(tree.leaf_count() == 0);
    CHECK(tree.key_count() == 0);
    CHECK(tree.root().kind == node_branch);
}

TEST_CASE("namespace_tree handles a key made only of separators")
{
    const size_t n = 100000;
    std::vector<std::string> keys{std::string(n, ':'), "x"};
    auto tree = namespace_tree::build(keys, all_strings(keys), ":");

    // n separators give n + 1 empty segments, plus "x" and the root
    CHECK(tree.node_count() == n + 3);
    CHECK(tree.key_count() == 2);
    CHECK(tree.leaf_count() == 2);

    const tree_node& top = tree.node(tree.root().children[0]);
    CHECK(top.name.empty());
    CHECK(top.leaf_count == 1);

    uint32_t deepest = static_cast<uint32_t>(tree.node_count() - 1);
    uint32_t leaf = 0;
    for (uint32_t i = 0; i < tree.node_count(); ++i)
    {
        if (tree.node(i).depth == n + 1)
            leaf = i;
    }
    REQUIRE(leaf != 0);
    CHECK(tree.node(leaf).kind == node_leaf);
    CHECK(tree.selected_key(leaf) == std::string(n, ':'));
    CHECK(tree.path(leaf).size() == n);
    CHECK(tree.node(deepest).name == "x");

    size_t visited = 0;
    tree.visit([&](const tree_node&) {
        ++visited;
        return true;
    });
    CHECK(visited == n + 2);

    auto found = tree.find(std::string(n, ':'));
    REQUIRE(found);
    CHECK(*found == leaf);
}
