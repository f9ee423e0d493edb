#include "../../src/report/unit_id.hpp"

#include <gtest/gtest.h>

using namespace tally::report;

// ============================================================
// 識別子の分解
// ============================================================
TEST(UnitIdTest, ParsesSchemeAndPath) {
    auto id = UnitId::parse("package:foo/bar.dart");
    EXPECT_EQ(id.text, "package:foo/bar.dart");
    EXPECT_EQ(id.scheme, "package");
    EXPECT_EQ(id.path, "foo/bar.dart");
}

TEST(UnitIdTest, SchemeIsLowerCased) {
    auto id = UnitId::parse("DART:core");
    EXPECT_EQ(id.scheme, "dart");
    EXPECT_EQ(id.text, "DART:core");
}

TEST(UnitIdTest, MissingSchemeKeepsWholeTextAsPath) {
    auto id = UnitId::parse("lib/main.dart");
    EXPECT_FALSE(id.has_scheme());
    EXPECT_EQ(id.path, "lib/main.dart");
}

TEST(UnitIdTest, InvalidSchemeCharactersAreRejected) {
    EXPECT_FALSE(UnitId::parse("1abc:path").has_scheme());
    EXPECT_FALSE(UnitId::parse("a b:path").has_scheme());
    EXPECT_FALSE(UnitId::parse(":path").has_scheme());
    EXPECT_TRUE(UnitId::parse("svn+ssh:host/x").has_scheme());
}

// ============================================================
// スコープ判定
// ============================================================
TEST(ResolveScopeTest, PackageNameIsFirstSegment) {
    auto r = resolve_scope("package:foo/bar.dart");
    EXPECT_EQ(r.scope, Scope::Package);
    EXPECT_EQ(r.package, "foo");
}

TEST(ResolveScopeTest, PackageWithoutSubpath) {
    auto r = resolve_scope("package:foo");
    EXPECT_EQ(r.scope, Scope::Package);
    EXPECT_EQ(r.package, "foo");
}

TEST(ResolveScopeTest, SystemSchemes) {
    EXPECT_EQ(resolve_scope("dart:core").scope, Scope::System);
    EXPECT_EQ(resolve_scope("platform:io").scope, Scope::System);
}

TEST(ResolveScopeTest, FileUriIsLoose) {
    auto r = resolve_scope("file:///a.dart");
    EXPECT_EQ(r.scope, Scope::Loose);
    EXPECT_TRUE(r.package.empty());
}

TEST(ResolveScopeTest, MalformedInputIsLooseAndNeverThrows) {
    EXPECT_NO_THROW(resolve_scope(""));
    EXPECT_EQ(resolve_scope("").scope, Scope::Loose);
    EXPECT_EQ(resolve_scope("garbage").scope, Scope::Loose);
    EXPECT_EQ(resolve_scope("dart:").scope, Scope::Loose);      // 空のパス
    EXPECT_EQ(resolve_scope("package:").scope, Scope::Loose);   // 空のパス
    EXPECT_EQ(resolve_scope("package:/x").scope, Scope::Loose); // 空のパッケージ名
    EXPECT_EQ(resolve_scope("::::").scope, Scope::Loose);
}

TEST(ResolveScopeTest, CustomRules) {
    ScopeRules rules;
    rules.system_schemes = {"std"};
    rules.package_scheme = "pkg";

    EXPECT_EQ(resolve_scope("std:vector", rules).scope, Scope::System);
    EXPECT_EQ(resolve_scope("dart:core", rules).scope, Scope::Loose);

    auto r = resolve_scope("pkg:net/socket.h", rules);
    EXPECT_EQ(r.scope, Scope::Package);
    EXPECT_EQ(r.package, "net");
    EXPECT_EQ(resolve_scope("package:foo/bar.dart", rules).scope, Scope::Loose);
}

// ============================================================
// scheme の正規化
// ============================================================
TEST(NormalizeSchemeTest, LowerCasesValidSchemes) {
    EXPECT_EQ(normalize_scheme("Dart").value_or(""), "dart");
    EXPECT_EQ(normalize_scheme("svn+SSH").value_or(""), "svn+ssh");
}

TEST(NormalizeSchemeTest, RejectsInvalidSchemes) {
    EXPECT_FALSE(normalize_scheme("").has_value());
    EXPECT_FALSE(normalize_scheme("9pkg").has_value());
    EXPECT_FALSE(normalize_scheme("a b").has_value());
}
