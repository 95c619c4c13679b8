#include <catch2/catch_test_macros.hpp>
#include "fairos/client/session_store.hpp"

using namespace fairos::client;

TEST_CASE("MemorySessionStore读写", "[session]") {
    MemorySessionStore store;

    SECTION("未设置时为空") {
        REQUIRE_FALSE(store.Cookie("alice").has_value());
        REQUIRE(store.Usernames().empty());
    }

    SECTION("设置后可读取") {
        store.SetCookie("alice", "t1");
        REQUIRE(store.Cookie("alice") == std::optional<std::string>("t1"));
    }

    SECTION("重复设置覆盖") {
        store.SetCookie("alice", "t1");
        store.SetCookie("alice", "t2");
        REQUIRE(*store.Cookie("alice") == "t2");
        REQUIRE(store.Usernames().size() == 1);
    }

    SECTION("删除") {
        store.SetCookie("alice", "t1");
        store.SetCookie("bob", "t2");
        store.RemoveCookie("alice");
        REQUIRE_FALSE(store.Cookie("alice").has_value());
        REQUIRE(*store.Cookie("bob") == "t2");

        // 删除不存在的用户不报错
        store.RemoveCookie("carol");
        REQUIRE(store.Usernames() == std::vector<std::string>{"bob"});
    }
}
