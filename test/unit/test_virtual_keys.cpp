#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "../../keyscope/core/virtual_keys.h"

using namespace keyscope;

TEST_CASE("glob_match")
{
    CHECK(glob_match("*", "anything"));
    CHECK(glob_match("", "anything"));
    CHECK(glob_match("user:*", "user:1"));
    CHECK_FALSE(glob_match("user:*", "order:1"));
    CHECK(glob_match("h?llo", "hello"));
    CHECK(glob_match("h[ae]llo", "hallo"));
    CHECK_FALSE(glob_match("h[ae]llo", "hillo"));
    CHECK(glob_match("h[^e]llo", "hallo"));
    CHECK(glob_match("h[a-c]llo", "hbllo"));

    // Embedded NUL bytes are never truncated into a false match
    std::string_view with_nul("a\0b", 3);
    CHECK_FALSE(glob_match("a", with_nul));
    CHECK_FALSE(glob_match("a*", with_nul));
    CHECK(glob_match("*", with_nul));
    CHECK_FALSE(glob_match(std::string_view("a\0*", 3), "a"));
    CHECK(glob_match("a\\*b", "a*b"));
    CHECK_FALSE(glob_match("a\\*b", "axb"));
}

TEST_CASE("virtual_keys lifecycle")
{
    virtual_keys vk;

    SUBCASE("declare and redeclare")
    {
        vk.declare("cart:1", key_hash);
        CHECK(vk.contains("cart:1"));
        CHECK(vk.declared_type("cart:1") == key_hash);
        vk.declare("cart:1", key_list);
        CHECK(vk.size() == 1);
        CHECK(vk.declared_type("cart:1") == key_list);
    }

    SUBCASE("confirm only on a real type")
    {
        vk.declare("cart:1", key_hash);
        CHECK_FALSE(vk.confirm("cart:1", key_none));
        CHECK_FALSE(vk.confirm("cart:1", key_unknown));
        CHECK(vk.contains("cart:1"));
        CHECK(vk.confirm("cart:1", key_hash));
        CHECK(vk.empty());
    }

    SUBCASE("confirm of an undeclared key is a no-op")
    {
        CHECK_FALSE(vk.confirm("other", key_string));
    }

    SUBCASE("erase")
    {
        vk.declare("a", key_set);
        CHECK(vk.erase("a"));
        CHECK_FALSE(vk.erase("a"));
        CHECK_FALSE(vk.declared_type("a").has_value());
    }
}

TEST_CASE("virtual_keys merge")
{
    virtual_keys vk;
    std::vector<std::string> keys{"user:1", "user:2"};
    type_map types{{"user:1", key_hash}, {"user:2", key_hash}};

    std::vector<std::string> out_keys;
    type_map out_types;

    SUBCASE("absent matching keys are appended with their declared type")
    {
        vk.declare("user:9", key_set);
        vk.merge("user:*", keys, types, out_keys, out_types);
        CHECK(out_keys == std::vector<std::string>{"user:1", "user:2", "user:9"});
        CHECK(out_types["user:9"] == key_set);
    }

    SUBCASE("keys outside the pattern stay hidden")
    {
        vk.declare("order:1", key_list);
        vk.merge("user:*", keys, types, out_keys, out_types);
        CHECK(out_keys == keys);
        CHECK(out_types.count("order:1") == 0);
    }

    SUBCASE("present keys keep the store's type")
    {
        vk.declare("user:1", key_list);
        vk.merge("*", keys, types, out_keys, out_types);
        CHECK(out_keys.size() == 2);
        CHECK(out_types["user:1"] == key_hash);
    }

    SUBCASE("present keys with no real type take the declared one")
    {
        types["user:2"] = key_none;
        vk.declare("user:2", key_zset);
        vk.merge("*", keys, types, out_keys, out_types);
        CHECK(out_keys.size() == 2);
        CHECK(out_types["user:2"] == key_zset);
    }

    SUBCASE("no virtual keys passes the input through")
    {
        vk.merge("*", keys, types, out_keys, out_types);
        CHECK(out_keys == keys);
        CHECK(out_types == types);
    }
}
