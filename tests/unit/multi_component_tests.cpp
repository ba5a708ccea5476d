#include <doctest/doctest.h>
#include <ratchet/multi_component.hpp>
#include <ratchet/single_component.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

using ratchet::MultiComponentPath;
using ratchet::MultiComponentPathBuf;
using ratchet::Platform;

TEST_CASE("multi accepts nested relative paths") {
    auto p = MultiComponentPathBuf::create("a/b/c", Platform::Linux);
    REQUIRE(p);
    CHECK(p->path() == fs::path("a/b/c"));
    CHECK(p->segments() == std::vector<std::string>{"a", "b", "c"});
    CHECK_FALSE(p->empty());
}

TEST_CASE("multi stores the path without current directory markers") {
    auto p = MultiComponentPathBuf::create("./a/./b/.", Platform::Linux);
    REQUIRE(p);
    CHECK(p->path() == fs::path("a/b"));
}

TEST_CASE("multi rejects a leading parent reference") {
    CHECK_FALSE(MultiComponentPathBuf::create("../folder/file", Platform::Linux));
    fs::path input = "../folder/file";
    CHECK_FALSE(MultiComponentPath::create(input, Platform::Linux));
}

TEST_CASE("multi rejects inner parent references and anchors") {
    for (const char* text : {"..", "a/../b", "a/b/..", "/a", "/"}) {
        CAPTURE(text);
        CHECK_FALSE(MultiComponentPathBuf::create(text, Platform::Linux));
    }
    for (const char* text : {"C:\\a", "C:a", "\\a", "\\\\server\\share", "a\\..\\b"}) {
        CAPTURE(text);
        CHECK_FALSE(MultiComponentPathBuf::create(text, Platform::Windows));
    }
}

TEST_CASE("multi borrowed view rejects windows prefixes") {
    for (const char* text : {"C:\\x", "C:x", "\\\\server\\share", "\\\\server\\share\\dir", "\\x"}) {
        CAPTURE(text);
        fs::path input = text;
        CHECK_FALSE(MultiComponentPath::create(input, Platform::Windows));
    }
}

TEST_CASE("multi keeps non-ASCII names intact") {
    const std::string dir = "\xc3\xa9t\xc3\xa9";
    const std::string file = "\xe5\x90\x8d\xe5\x89\x8d.txt";
    auto p = MultiComponentPathBuf::create(fs::u8path("./" + dir + "/./" + file));
    REQUIRE(p);
    CHECK(p->segments() == std::vector<std::string>{dir, file});
    CHECK(p->path() == fs::u8path(dir + "/" + file));
}

TEST_CASE("multi views print their effective path") {
    fs::path input = "./a/./b";
    auto view = MultiComponentPath::create(input, Platform::Linux);
    REQUIRE(view);
    std::ostringstream ss;
    ss << *view;
    CHECK(ss.str() == "a/b");
}

TEST_CASE("multi accepts the empty path") {
    auto p = MultiComponentPathBuf::create("", Platform::Linux);
    REQUIRE(p);
    CHECK(p->empty());
    CHECK(p->segments().empty());

    auto dots = MultiComponentPathBuf::create("./.", Platform::Linux);
    REQUIRE(dots);
    CHECK(dots->empty());
    CHECK(*dots == *p);
}

TEST_CASE("multi accepts anything single accepts") {
    for (const char* text : {"foo", "./bar.txt", "./bar/.", "foo/"}) {
        CAPTURE(text);
        REQUIRE(ratchet::SingleComponentPathBuf::create(text, Platform::Linux));
        CHECK(MultiComponentPathBuf::create(text, Platform::Linux));
    }
}

TEST_CASE("multi uses the target grammar for separators") {
    auto p = MultiComponentPathBuf::create("a\\b", Platform::Windows);
    REQUIRE(p);
    CHECK(p->segments() == std::vector<std::string>{"a", "b"});

    auto posix = MultiComponentPathBuf::create("a\\b", Platform::Linux);
    REQUIRE(posix);
    CHECK(posix->segments() == std::vector<std::string>{"a\\b"});
}

TEST_CASE("multi borrowed view") {
    fs::path input = "./x/./y";
    auto view = MultiComponentPath::create(input, Platform::Linux);
    REQUIRE(view);
    CHECK(&view->path() == &input);
    CHECK(view->effective_path() == fs::path("x/y"));
    CHECK(view->segments() == std::vector<std::string>{"x", "y"});

    auto owned = view->to_owned();
    CHECK(owned.path() == fs::path("x/y"));
    CHECK(owned == *view);
    CHECK(owned.view().to_owned() == owned);
}

TEST_CASE("multi hashing is consistent between views and owned values") {
    fs::path input = "a/./b";
    auto view = MultiComponentPath::create(input, Platform::Linux);
    auto owned = MultiComponentPathBuf::create("a/b", Platform::Linux);
    REQUIRE(view);
    REQUIRE(owned);
    CHECK(std::hash<MultiComponentPath>{}(*view) == std::hash<MultiComponentPathBuf>{}(*owned));

    std::unordered_set<MultiComponentPathBuf> set = {*owned, view->to_owned()};
    CHECK(set.size() == 1);
}

TEST_CASE("multi ordering") {
    auto a = MultiComponentPathBuf::create("a/b", Platform::Linux);
    auto b = MultiComponentPathBuf::create("a/c", Platform::Linux);
    REQUIRE(a);
    REQUIRE(b);
    CHECK(*a < *b);
    CHECK(*a != *b);
    CHECK(*b >= *a);
}
