#include <doctest/doctest.h>
#include <ratchet/components.hpp>

#include <vector>

using ratchet::Component;
using ratchet::ComponentKind;
using ratchet::Platform;
using ratchet::decompose;
using ratchet::decompose_lexically;

namespace {

std::vector<ComponentKind> kinds(const std::vector<Component>& components) {
    std::vector<ComponentKind> out;
    for (const auto& c : components) {
        out.push_back(c.kind);
    }
    return out;
}

} // namespace

// ============================================================================
// POSIX grammar
// ============================================================================

TEST_CASE("posix splits on slashes") {
    auto parts = decompose("a/b/c", Platform::Linux);
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == Component{ComponentKind::Normal, "a"});
    CHECK(parts[1] == Component{ComponentKind::Normal, "b"});
    CHECK(parts[2] == Component{ComponentKind::Normal, "c"});
}

TEST_CASE("posix classifies markers and root") {
    CHECK(kinds(decompose("/etc/shadow", Platform::Linux)) ==
          std::vector<ComponentKind>{ComponentKind::RootDir, ComponentKind::Normal, ComponentKind::Normal});
    CHECK(kinds(decompose("./a/../b", Platform::Linux)) ==
          std::vector<ComponentKind>{ComponentKind::CurDir, ComponentKind::Normal,
                                     ComponentKind::ParentDir, ComponentKind::Normal});
}

TEST_CASE("posix drops empty segments") {
    CHECK(kinds(decompose("foo/", Platform::Linux)) == std::vector<ComponentKind>{ComponentKind::Normal});
    CHECK(kinds(decompose("a//b", Platform::Linux)) ==
          std::vector<ComponentKind>{ComponentKind::Normal, ComponentKind::Normal});
    CHECK(decompose("", Platform::Linux).empty());
}

TEST_CASE("posix treats backslash and drive letters as name characters") {
    auto parts = decompose_lexically("C:\\x", Platform::Linux);
    REQUIRE(parts.size() == 1);
    CHECK(parts[0] == Component{ComponentKind::Normal, "C:\\x"});
}

TEST_CASE("lexical posix grammar agrees with the host on posix hosts") {
#ifndef _WIN32
    for (const char* text : {"", "foo", "./bar.txt", "/etc/shadow", "a/../b", "foo/", "./.", "a//b/./c"}) {
        CAPTURE(text);
        CHECK(kinds(decompose(text, Platform::Linux)) == kinds(decompose_lexically(text, Platform::Linux)));
    }
#endif
}

// ============================================================================
// Windows grammar
// ============================================================================

TEST_CASE("windows splits on both separators") {
    auto parts = decompose("a\\b/c", Platform::Windows);
    REQUIRE(parts.size() == 3);
    CHECK(parts[1] == Component{ComponentKind::Normal, "b"});
}

TEST_CASE("windows drive prefixes") {
    SUBCASE("absolute drive path") {
        auto parts = decompose("C:\\x", Platform::Windows);
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == Component{ComponentKind::Prefix, "C:"});
        CHECK(parts[1].kind == ComponentKind::RootDir);
        CHECK(parts[2] == Component{ComponentKind::Normal, "x"});
    }

    SUBCASE("drive relative path") {
        CHECK(kinds(decompose("d:foo", Platform::Windows)) ==
              std::vector<ComponentKind>{ComponentKind::Prefix, ComponentKind::Normal});
    }

    SUBCASE("colon later in the name is not a prefix") {
        CHECK(kinds(decompose("ab:c", Platform::Windows)) == std::vector<ComponentKind>{ComponentKind::Normal});
    }
}

TEST_CASE("windows UNC, verbatim and device prefixes") {
    SUBCASE("UNC share") {
        auto parts = decompose_lexically("\\\\server\\share\\dir", Platform::Windows);
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == Component{ComponentKind::Prefix, "\\\\server\\share"});
        CHECK(parts[1].kind == ComponentKind::RootDir);
        CHECK(parts[2] == Component{ComponentKind::Normal, "dir"});
    }

    SUBCASE("verbatim drive") {
        auto parts = decompose_lexically("\\\\?\\C:\\dir", Platform::Windows);
        REQUIRE_FALSE(parts.empty());
        CHECK(parts[0] == Component{ComponentKind::Prefix, "\\\\?\\C:"});
    }

    SUBCASE("verbatim UNC") {
        auto parts = decompose_lexically("\\\\?\\UNC\\server\\share\\x", Platform::Windows);
        REQUIRE_FALSE(parts.empty());
        CHECK(parts[0] == Component{ComponentKind::Prefix, "\\\\?\\UNC\\server\\share"});
        CHECK(parts.back() == Component{ComponentKind::Normal, "x"});
    }

    SUBCASE("device namespace") {
        auto parts = decompose_lexically("\\\\.\\COM1", Platform::Windows);
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].kind == ComponentKind::Prefix);
    }

    SUBCASE("forward slashes also start a UNC prefix") {
        auto parts = decompose_lexically("//server/share", Platform::Windows);
        REQUIRE(parts.size() == 1);
        CHECK(parts[0].kind == ComponentKind::Prefix);
    }
}

TEST_CASE("windows root without prefix") {
    CHECK(kinds(decompose("\\Windows\\System32", Platform::Windows)) ==
          std::vector<ComponentKind>{ComponentKind::RootDir, ComponentKind::Normal, ComponentKind::Normal});
}

TEST_CASE("component_kind_name") {
    CHECK(ratchet::component_kind_name(ComponentKind::Prefix) == "prefix");
    CHECK(ratchet::component_kind_name(ComponentKind::RootDir) == "root");
    CHECK(ratchet::component_kind_name(ComponentKind::CurDir) == "cur_dir");
    CHECK(ratchet::component_kind_name(ComponentKind::ParentDir) == "parent_dir");
    CHECK(ratchet::component_kind_name(ComponentKind::Normal) == "normal");
}
