// tests/unit/analysis/test_symbol_extractor_languages.cpp - SymbolExtractor on JS, TS, Java and C++

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codemap/test_support/analyze_helpers.hpp"

using namespace codemap;
using codemap::test_support::analyze;
using codemap::test_support::find_symbol;
using codemap::test_support::kinds_of;

// ============================================================================
// JavaScript
// ============================================================================

TEST(SymbolExtractorJavaScript, ClassMembers)
{
  const FileMap map = analyze(
    R"(export class Service {
  constructor() {}
  static create() { return new Service(); }
  async *stream() { yield 1; }
  get value() { return 1; }
}
)",
    "service.js");

  const std::vector<SymbolKind> expected = {
    SymbolKind::Class, SymbolKind::Constructor, SymbolKind::StaticMethod, SymbolKind::Method,
    SymbolKind::Method,
  };
  EXPECT_EQ(kinds_of(map), expected);

  const auto * create = find_symbol(map, "create");
  ASSERT_NE(create, nullptr);
  EXPECT_TRUE(create->has(Modifier::Static));

  const auto * stream = find_symbol(map, "stream");
  ASSERT_NE(stream, nullptr);
  EXPECT_TRUE(stream->has(Modifier::Async));
  EXPECT_TRUE(stream->has(Modifier::Generator));
}

TEST(SymbolExtractorJavaScript, FunctionsAndLambdas)
{
  const FileMap map = analyze(
    R"(function* ids() { yield 1; }
const handler = async () => { await run(); };
const Anon = class {};
)",
    "funcs.js");

  ASSERT_EQ(map.symbols.size(), 3U);

  EXPECT_EQ(map.symbols[0].name, "ids");
  EXPECT_EQ(map.symbols[0].kind, SymbolKind::Function);
  EXPECT_TRUE(map.symbols[0].has(Modifier::Generator));

  EXPECT_EQ(map.symbols[1].kind, SymbolKind::Lambda);
  EXPECT_EQ(map.symbols[1].name, "<lambda>@2:17");
  EXPECT_TRUE(map.symbols[1].has(Modifier::Async));
  EXPECT_FALSE(map.symbols[1].enclosing_scope.has_value());

  EXPECT_EQ(map.symbols[2].kind, SymbolKind::Class);
  EXPECT_EQ(map.symbols[2].name, "<class>@3:14");
}

TEST(SymbolExtractorJavaScript, ExtendsClause)
{
  const FileMap map = analyze(
    "class Animal {}\nclass Dog extends Animal {}\nconst Cat = class extends Animal {};\n",
    "pets.js");

  ASSERT_EQ(map.symbols.size(), 3U);
  EXPECT_TRUE(map.symbols[0].bases.empty());
  EXPECT_EQ(map.symbols[1].bases, std::vector<std::string>{"Animal"});
  EXPECT_EQ(map.symbols[2].bases, std::vector<std::string>{"Animal"});
}

TEST(SymbolExtractorJavaScript, LeadingJsDoc)
{
  const FileMap map = analyze(
    R"(/**
 * Adds two numbers.
 */
function add(a, b) { return a + b; }
)",
    "math.js");

  const auto * add = find_symbol(map, "add");
  ASSERT_NE(add, nullptr);
  ASSERT_TRUE(add->doc_comment.has_value());
  EXPECT_EQ(*add->doc_comment, "Adds two numbers.");
}

// ============================================================================
// TypeScript
// ============================================================================

TEST(SymbolExtractorTypeScript, DecoratedClassAndMembers)
{
  const FileMap map = analyze(
    R"(@Component({ selector: "app-view" })
export class View {
  constructor(private readonly svc: Service) {}

  @HostListener("click")
  onClick(): void {}
}
)",
    "view.ts");

  const auto * view = find_symbol(map, "View");
  ASSERT_NE(view, nullptr);
  EXPECT_EQ(view->kind, SymbolKind::Class);
  EXPECT_TRUE(view->has(Modifier::Decorated));
  ASSERT_EQ(view->decorators.size(), 1U);
  EXPECT_EQ(view->decorators[0], "@Component({ selector: \"app-view\" })");

  const auto * ctor = find_symbol(map, "constructor");
  ASSERT_NE(ctor, nullptr);
  EXPECT_EQ(ctor->kind, SymbolKind::Constructor);

  const auto * on_click = find_symbol(map, "onClick");
  ASSERT_NE(on_click, nullptr);
  EXPECT_EQ(on_click->kind, SymbolKind::Method);
  EXPECT_TRUE(on_click->has(Modifier::Decorated));
  EXPECT_EQ(on_click->decorators, std::vector<std::string>{"@HostListener(\"click\")"});
}

TEST(SymbolExtractorTypeScript, AbstractClass)
{
  const FileMap map = analyze(
    R"(export abstract class Shape {
  static unit(): Shape { return null; }
  area(): number { return 0; }
}
)",
    "shape.ts");

  const std::vector<SymbolKind> expected = {
    SymbolKind::Class, SymbolKind::StaticMethod, SymbolKind::Method};
  EXPECT_EQ(kinds_of(map), expected);
}

TEST(SymbolExtractorTypeScript, ExtendsAndImplements)
{
  const FileMap map = analyze(
    "export class Repo extends Base implements Store, Disposable {}\n", "repo.ts");

  const auto * repo = find_symbol(map, "Repo");
  ASSERT_NE(repo, nullptr);
  EXPECT_EQ(repo->bases, (std::vector<std::string>{"Base", "Store", "Disposable"}));
}

TEST(SymbolExtractorTsx, ComponentWithJsx)
{
  const FileMap map = analyze(
    R"(import React from "react";
import { Button } from "./Button";

export default function App() { return <div><Button label="ok" /></div>; }
)",
    "web/App.tsx");

  EXPECT_EQ(map.language, LanguageId::Tsx);
  EXPECT_TRUE(map.diagnostics.empty());

  const auto * app = find_symbol(map, "App");
  ASSERT_NE(app, nullptr);
  EXPECT_EQ(app->kind, SymbolKind::Function);

  ASSERT_EQ(map.imports.size(), 2U);
  EXPECT_EQ(map.imports[0].resolved_module, "react");
  EXPECT_EQ(map.imports[1].resolved_module, "./Button");
}

// ============================================================================
// Java
// ============================================================================

TEST(SymbolExtractorJava, ClassMembers)
{
  const FileMap map = analyze(
    R"(package app;

/** Entry point. */
public class Main {
  public Main() {}

  public static void main(String[] args) {
    Runnable r = () -> {};
  }

  @Override
  public String toString() { return ""; }

  interface Listener {
    void fire();
  }
}
)",
    "Main.java");

  const std::vector<SymbolKind> expected = {
    SymbolKind::Class,  SymbolKind::Constructor, SymbolKind::StaticMethod, SymbolKind::Lambda,
    SymbolKind::Method, SymbolKind::Class,       SymbolKind::Method,
  };
  EXPECT_EQ(kinds_of(map), expected);

  const auto & main_class = map.symbols[0];
  ASSERT_TRUE(main_class.doc_comment.has_value());
  EXPECT_EQ(*main_class.doc_comment, "Entry point.");

  const auto & lambda = map.symbols[3];
  ASSERT_TRUE(lambda.enclosing_scope.has_value());
  EXPECT_EQ(map.symbols[lambda.enclosing_scope->value].name, "main");

  const auto * to_string_method = find_symbol(map, "toString");
  ASSERT_NE(to_string_method, nullptr);
  EXPECT_TRUE(to_string_method->has(Modifier::Decorated));
  EXPECT_EQ(to_string_method->decorators, std::vector<std::string>{"@Override"});

  const auto * fire = find_symbol(map, "fire");
  ASSERT_NE(fire, nullptr);
  EXPECT_EQ(map.scope_of(*fire)->name, "Listener");
}

TEST(SymbolExtractorJava, EnumAndRecord)
{
  const FileMap map = analyze(
    R"(enum Color { RED, GREEN }
record Pair(int a, int b) {
  Pair {}
}
)",
    "Types.java");

  const auto * color = find_symbol(map, "Color");
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(color->kind, SymbolKind::Class);

  const auto * pair = find_symbol(map, "Pair");
  ASSERT_NE(pair, nullptr);
  EXPECT_EQ(pair->kind, SymbolKind::Class);

  ASSERT_EQ(map.symbols.size(), 3U);
  EXPECT_EQ(map.symbols[2].kind, SymbolKind::Constructor);
}

TEST(SymbolExtractorJava, SuperclassAndInterfaces)
{
  const FileMap map = analyze(
    R"(class Dog extends Animal implements Runnable, Comparable<Dog> {}
interface Pet extends Named {}
)",
    "Dog.java");

  const auto * dog = find_symbol(map, "Dog");
  ASSERT_NE(dog, nullptr);
  EXPECT_EQ(dog->bases, (std::vector<std::string>{"Animal", "Runnable", "Comparable<Dog>"}));

  const auto * pet = find_symbol(map, "Pet");
  ASSERT_NE(pet, nullptr);
  EXPECT_EQ(pet->bases, std::vector<std::string>{"Named"});
}

// ============================================================================
// C++
// ============================================================================

TEST(SymbolExtractorCpp, ClassesAndFunctions)
{
  const FileMap map = analyze(
    R"(#include <vector>

namespace app {

/// A widget.
class Widget {
public:
  Widget() {}
  static Widget make() { return Widget(); }
  void draw() const {
    auto f = [] { return 1; };
  }
};

int helper(int x) { return x; }

}  // namespace app

struct Forward;
)",
    "widget.cpp");

  const std::vector<SymbolKind> expected = {
    SymbolKind::Class,  SymbolKind::Constructor, SymbolKind::StaticMethod,
    SymbolKind::Method, SymbolKind::Lambda,      SymbolKind::Function,
  };
  EXPECT_EQ(kinds_of(map), expected);

  const auto & widget = map.symbols[0];
  EXPECT_EQ(widget.name, "Widget");
  ASSERT_TRUE(widget.doc_comment.has_value());
  EXPECT_EQ(*widget.doc_comment, "A widget.");

  EXPECT_EQ(map.symbols[2].name, "make");
  EXPECT_TRUE(map.symbols[2].has(Modifier::Static));

  const auto & lambda = map.symbols[4];
  ASSERT_TRUE(lambda.enclosing_scope.has_value());
  EXPECT_EQ(map.symbols[lambda.enclosing_scope->value].name, "draw");

  // Forward declarations are not definitions
  EXPECT_EQ(find_symbol(map, "Forward"), nullptr);
}

TEST(SymbolExtractorCpp, QualifiedOutOfLineDefinition)
{
  const FileMap map = analyze("void app::Widget::draw() const {}\n", "widget.cc");

  ASSERT_EQ(map.symbols.size(), 1U);
  EXPECT_EQ(map.symbols[0].name, "app::Widget::draw");
  EXPECT_EQ(map.symbols[0].kind, SymbolKind::Function);
}

TEST(SymbolExtractorCpp, Coroutine)
{
  const FileMap map = analyze(
    R"(Task fetch() {
  co_await next();
}
Gen numbers() {
  co_yield 1;
}
)",
    "co.cpp");

  const auto * fetch = find_symbol(map, "fetch");
  const auto * numbers = find_symbol(map, "numbers");
  ASSERT_NE(fetch, nullptr);
  ASSERT_NE(numbers, nullptr);
  EXPECT_TRUE(fetch->has(Modifier::Async));
  EXPECT_FALSE(fetch->has(Modifier::Generator));
  EXPECT_TRUE(numbers->has(Modifier::Generator));
}

TEST(SymbolExtractorCpp, AnonymousStruct)
{
  const FileMap map = analyze("struct { int x; } origin;\n", "anon.h");

  ASSERT_EQ(map.symbols.size(), 1U);
  EXPECT_EQ(map.symbols[0].kind, SymbolKind::Class);
  EXPECT_EQ(map.symbols[0].name, "<class>@1:1");
}

TEST(SymbolExtractorCpp, BaseClassClause)
{
  const FileMap map = analyze(
    "class Widget : public Base, protected detail::Mixin {};\nstruct Point {};\n", "widget.hpp");

  const auto * widget = find_symbol(map, "Widget");
  ASSERT_NE(widget, nullptr);
  EXPECT_EQ(widget->bases, (std::vector<std::string>{"Base", "detail::Mixin"}));

  const auto * point = find_symbol(map, "Point");
  ASSERT_NE(point, nullptr);
  EXPECT_TRUE(point->bases.empty());
}
