// tests/unit/analysis/test_import_resolver_languages.cpp - ImportResolver on JS, TS, Java and C++

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codemap/test_support/analyze_helpers.hpp"

using namespace codemap;
using codemap::test_support::analyze;
using codemap::test_support::import_kinds_of;

// ============================================================================
// JavaScript
// ============================================================================

TEST(ImportResolverJavaScript, StatementForms)
{
  const FileMap map = analyze(
    R"(import React from "react";
import { a, b as c } from "./lib";
import * as path from "path";
import "../styles/site.css";
import def, { named } from "pkg";
)",
    "app.js");

  const std::vector<ImportKind> expected = {
    ImportKind::Direct, ImportKind::Relative, ImportKind::Aliased, ImportKind::Relative,
    ImportKind::SelectiveMultiple,
  };
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"React", "", false, ""}}));

  EXPECT_EQ(map.imports[1].resolved_module, "./lib");
  EXPECT_EQ(map.imports[1].relative_depth, 0U);
  EXPECT_EQ(
    map.imports[1].targets,
    (std::vector<ImportTarget>{{"a", "", false, ""}, {"b", "c", false, ""}}));

  EXPECT_EQ(map.imports[2].targets, (std::vector<ImportTarget>{{"*", "path", false, ""}}));

  // Side-effect import names the module itself
  EXPECT_EQ(map.imports[3].relative_depth, 1U);
  EXPECT_EQ(
    map.imports[3].targets, (std::vector<ImportTarget>{{"../styles/site.css", "", false, ""}}));
}

TEST(ImportResolverJavaScript, ReExports)
{
  const FileMap map = analyze(
    R"(export * from "./all";
export { x as y } from "dep";
export * as ns from "./ns";
export const local = 1;
)",
    "index.js");

  const std::vector<ImportKind> expected = {
    ImportKind::Wildcard, ImportKind::Aliased, ImportKind::Relative};
  ASSERT_EQ(import_kinds_of(map), expected);

  const auto & star = map.imports[0];
  ASSERT_EQ(star.targets.size(), 1U);
  EXPECT_TRUE(star.targets[0].is_wildcard);
  EXPECT_EQ(star.resolved_module, "./all");

  EXPECT_EQ(map.imports[2].targets, (std::vector<ImportTarget>{{"*", "ns", false, ""}}));
}

TEST(ImportResolverJavaScript, BrokenExportedFunctionKeepsNestedRequire)
{
  const FileMap map = analyze(
    "export function f() { const x = require(\"./x\"); let = ; }\n", "broken.js");

  EXPECT_FALSE(map.diagnostics.contains(DiagnosticKind::MalformedImport));
  ASSERT_EQ(map.imports.size(), 1U);
  EXPECT_EQ(map.imports[0].kind, ImportKind::Relative);
  EXPECT_EQ(map.imports[0].resolved_module, "./x");
  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"x", "", false, ""}}));
}

TEST(ImportResolverJavaScript, RequireBindings)
{
  const FileMap map = analyze(
    R"(const fs = require("fs");
const { join, resolve: res } = require("path");
require("./polyfill");
)",
    "server.js");

  const std::vector<ImportKind> expected = {
    ImportKind::Direct, ImportKind::SelectiveMultiple, ImportKind::Relative};
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"fs", "", false, ""}}));
  EXPECT_EQ(
    map.imports[1].targets,
    (std::vector<ImportTarget>{{"join", "", false, ""}, {"resolve", "res", false, ""}}));
  EXPECT_EQ(map.imports[2].resolved_module, "./polyfill");
}

TEST(ImportResolverJavaScript, DynamicImport)
{
  const FileMap map = analyze(
    R"(async function load(name) {
  const mod = await import("./plugins/base");
  const other = await import(`./plugins/${name}`);
  return require("./" + "util");
}
)",
    "loader.mjs");

  const std::vector<ImportKind> expected = {
    ImportKind::Relative, ImportKind::Dynamic, ImportKind::Relative};
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"mod", "", false, ""}}));
  EXPECT_TRUE(map.imports[1].is_unresolved());
  EXPECT_TRUE(map.imports[1].targets.empty());
  EXPECT_EQ(map.imports[2].resolved_module, "./util");

  for (const auto & record : map.imports) {
    ASSERT_TRUE(record.scope.has_value());
    EXPECT_EQ(map.symbols[record.scope->value].name, "load");
  }
}

TEST(ImportResolverJavaScript, PlainTemplateLiteralIsStatic)
{
  const FileMap map = analyze("const x = require(`lodash`);\n", "a.js");

  ASSERT_EQ(map.imports.size(), 1U);
  EXPECT_EQ(map.imports[0].kind, ImportKind::Direct);
  EXPECT_EQ(map.imports[0].resolved_module, "lodash");
}

TEST(ImportResolverJavaScript, GuardedRequire)
{
  const FileMap map = analyze(
    R"(let native;
try {
  native = require("native-ext");
} catch (e) {
  native = null;
}
const impl = process.env.FAST ? require("fast") : require("slow");
)",
    "opt.js");

  ASSERT_EQ(map.imports.size(), 3U);
  for (const auto & record : map.imports) {
    EXPECT_TRUE(record.guarded) << record.raw_statement;
    EXPECT_EQ(record.kind, ImportKind::Conditional) << record.raw_statement;
  }
  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"native", "", false, ""}}));
}

// ============================================================================
// TypeScript
// ============================================================================

TEST(ImportResolverTypeScript, ImportRequireAndTypes)
{
  const FileMap map = analyze(
    R"(import fs = require("fs");
import type { Config } from "../config";
import { Component } from "@angular/core";
)",
    "main.ts");

  const std::vector<ImportKind> expected = {
    ImportKind::Direct, ImportKind::Relative, ImportKind::Direct};
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].resolved_module, "fs");
  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"fs", "", false, ""}}));
  EXPECT_EQ(map.imports[1].relative_depth, 1U);
  EXPECT_EQ(map.imports[2].resolved_module, "@angular/core");
}

// ============================================================================
// Java
// ============================================================================

TEST(ImportResolverJava, ImportDeclarations)
{
  const FileMap map = analyze(
    R"(package app;

import java.util.List;
import java.util.*;
import static org.junit.Assert.assertEquals;

class A {}
)",
    "A.java");

  const std::vector<ImportKind> expected = {
    ImportKind::Direct, ImportKind::Wildcard, ImportKind::Direct};
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].resolved_module, "java.util.List");
  EXPECT_EQ(map.imports[0].targets, (std::vector<ImportTarget>{{"List", "", false, ""}}));

  EXPECT_EQ(map.imports[1].resolved_module, "java.util");
  ASSERT_EQ(map.imports[1].targets.size(), 1U);
  EXPECT_TRUE(map.imports[1].targets[0].is_wildcard);

  EXPECT_EQ(map.imports[2].resolved_module, "org.junit.Assert");
  EXPECT_EQ(
    map.imports[2].targets, (std::vector<ImportTarget>{{"assertEquals", "", false, ""}}));
}

// ============================================================================
// C++
// ============================================================================

TEST(ImportResolverCpp, Includes)
{
  const FileMap map = analyze(
    R"(#include <vector>
#include "util/io.h"
#include "../common.h"
#include PLATFORM_HEADER
)",
    "main.cpp");

  const std::vector<ImportKind> expected = {
    ImportKind::Direct, ImportKind::Direct, ImportKind::Relative, ImportKind::Dynamic};
  ASSERT_EQ(import_kinds_of(map), expected);

  EXPECT_EQ(map.imports[0].resolved_module, "vector");
  EXPECT_EQ(map.imports[1].resolved_module, "util/io.h");
  EXPECT_EQ(map.imports[2].relative_depth, 1U);
  EXPECT_TRUE(map.imports[3].is_unresolved());
}

TEST(ImportResolverCpp, IncludeGuardIsNotAConditional)
{
  const FileMap map = analyze(
    R"(#ifndef WIDGET_H
#define WIDGET_H

#include <string>

#ifdef USE_SIMD
#include "simd.h"
#endif

#endif
)",
    "widget.h");

  ASSERT_EQ(map.imports.size(), 2U);
  EXPECT_FALSE(map.imports[0].guarded);
  EXPECT_EQ(map.imports[0].kind, ImportKind::Direct);
  EXPECT_TRUE(map.imports[1].guarded);
  EXPECT_EQ(map.imports[1].kind, ImportKind::Conditional);
}

TEST(ImportResolverCpp, PlainIfdefGuards)
{
  const FileMap map = analyze(
    R"(#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif
)",
    "platform.cpp");

  ASSERT_EQ(map.imports.size(), 2U);
  EXPECT_TRUE(map.imports[0].guarded);
  EXPECT_TRUE(map.imports[1].guarded);
}
