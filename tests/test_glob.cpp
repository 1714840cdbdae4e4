#include <catch2/catch_test_macros.hpp>

#include "internal.h"

#include <string>

using ferry::glob::fnmatch;

// ---------------------------------------------------------------------------
// Wildcards
// ---------------------------------------------------------------------------

TEST_CASE("Glob: star matches any run of characters", "[glob]") {
    CHECK(fnmatch("*.txt", "a.txt"));
    CHECK(fnmatch("*.txt", ".txt"));
    CHECK(fnmatch("a*", "a"));
    CHECK(fnmatch("a*c", "abbbc"));
    CHECK(fnmatch("*", ""));
    CHECK_FALSE(fnmatch("*.txt", "a.jpg"));
    CHECK_FALSE(fnmatch("*.txt", "a.txt.bak"));
}

TEST_CASE("Glob: star backtracks", "[glob]") {
    CHECK(fnmatch("*a*b", "xaxaxb"));
    CHECK(fnmatch("*.tar.gz", "backup.2024.tar.gz"));
    CHECK_FALSE(fnmatch("*a*b", "xaxax"));
}

TEST_CASE("Glob: question mark matches one character", "[glob]") {
    CHECK(fnmatch("?.txt", "a.txt"));
    CHECK_FALSE(fnmatch("?.txt", "ab.txt"));
    CHECK_FALSE(fnmatch("?", ""));
}

TEST_CASE("Glob: leading dot is not special", "[glob]") {
    CHECK(fnmatch("*", ".hidden"));
    CHECK(fnmatch("?hidden", ".hidden"));
}

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

TEST_CASE("Glob: bracket sets and ranges", "[glob]") {
    CHECK(fnmatch("file[12].txt", "file1.txt"));
    CHECK(fnmatch("file[12].txt", "file2.txt"));
    CHECK_FALSE(fnmatch("file[12].txt", "file3.txt"));
    CHECK(fnmatch("[a-c]x", "bx"));
    CHECK_FALSE(fnmatch("[a-c]x", "dx"));
}

TEST_CASE("Glob: negated classes", "[glob]") {
    CHECK(fnmatch("[!a]x", "bx"));
    CHECK_FALSE(fnmatch("[!a]x", "ax"));
    CHECK(fnmatch("[^a]x", "bx"));
    CHECK_FALSE(fnmatch("[^a]x", "ax"));
}

TEST_CASE("Glob: closing bracket first is literal", "[glob]") {
    CHECK(fnmatch("[]a]", "]"));
    CHECK(fnmatch("[]a]", "a"));
    CHECK_FALSE(fnmatch("[]a]", "b"));
}

TEST_CASE("Glob: unterminated bracket matches itself", "[glob]") {
    CHECK(fnmatch("[abc", "[abc"));
    CHECK_FALSE(fnmatch("[abc", "a"));
}

TEST_CASE("Glob: star crosses directory separators", "[glob]") {
    CHECK(fnmatch("docs/*.md", "docs/guide.md"));
    CHECK(fnmatch("*.md", "docs/guide.md"));
}
