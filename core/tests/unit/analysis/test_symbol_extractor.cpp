// tests/unit/analysis/test_symbol_extractor.cpp - Unit tests for SymbolExtractor (Python)
//
// Covers kind classification, modifiers, scopes, synthetic names and the
// failure policy for unrecoverable declarations.
//

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "codemap/analysis/symbol_extractor.hpp"
#include "codemap/report/json_export.hpp"
#include "codemap/test_support/analyze_helpers.hpp"

using namespace codemap;
using codemap::test_support::analyze_python;
using codemap::test_support::find_symbol;
using codemap::test_support::kinds_of;

namespace
{

const char * const k_widget_source = R"(def plain():
    pass

@decorator
def decorated():
    pass

class Widget:
    def __init__(self):
        pass

    def method(self):
        pass

    @classmethod
    def build(cls):
        pass

    @staticmethod
    def helper():
        pass
)";

}  // namespace

// ============================================================================
// Classification
// ============================================================================

TEST(SymbolExtractor, ClassifiesPythonDeclarations)
{
  const FileMap map = analyze_python(k_widget_source);

  const std::vector<SymbolKind> expected = {
    SymbolKind::Function,    SymbolKind::Function,    SymbolKind::Class,
    SymbolKind::Constructor, SymbolKind::Method,      SymbolKind::ClassMethod,
    SymbolKind::StaticMethod,
  };
  EXPECT_EQ(kinds_of(map), expected);
  EXPECT_TRUE(map.diagnostics.empty());

  const auto * plain = find_symbol(map, "plain");
  ASSERT_NE(plain, nullptr);
  EXPECT_TRUE(plain->modifiers.empty());
  EXPECT_FALSE(plain->enclosing_scope.has_value());

  const auto * decorated = find_symbol(map, "decorated");
  ASSERT_NE(decorated, nullptr);
  EXPECT_TRUE(decorated->has(Modifier::Decorated));
  ASSERT_EQ(decorated->decorators.size(), 1U);
  EXPECT_EQ(decorated->decorators[0], "@decorator");

  const auto * build = find_symbol(map, "build");
  ASSERT_NE(build, nullptr);
  EXPECT_TRUE(build->has(Modifier::ClassBound));
  EXPECT_FALSE(build->has(Modifier::Decorated));
  EXPECT_EQ(build->decorators, std::vector<std::string>{"@classmethod"});

  const auto * helper = find_symbol(map, "helper");
  ASSERT_NE(helper, nullptr);
  EXPECT_TRUE(helper->has(Modifier::Static));
  EXPECT_FALSE(helper->has(Modifier::Decorated));
}

TEST(SymbolExtractor, MembersShareClassScope)
{
  const FileMap map = analyze_python(k_widget_source);
  ASSERT_EQ(map.symbols.size(), 7U);

  const SymbolId widget{2};
  EXPECT_EQ(map.symbols[2].name, "Widget");
  EXPECT_FALSE(map.symbols[2].enclosing_scope.has_value());

  for (uint32_t i = 3; i < 7; ++i) {
    const auto & member = map.symbols[i];
    ASSERT_TRUE(member.enclosing_scope.has_value()) << member.name;
    EXPECT_EQ(*member.enclosing_scope, widget) << member.name;
  }

  const auto children = map.children_of(widget);
  EXPECT_EQ(children.size(), 4U);
}

TEST(SymbolExtractor, MethodFamilyAlwaysInsideClass)
{
  const FileMap map = analyze_python(R"(class Outer:
    class Inner:
        def run(self):
            def local():
                pass
            return local

    @staticmethod
    def make():
        pass
)");

  for (const auto & s : map.symbols) {
    if (!is_member_kind(s.kind)) {
      continue;
    }
    const auto * scope = map.scope_of(s);
    ASSERT_NE(scope, nullptr) << s.name;
    EXPECT_EQ(scope->kind, SymbolKind::Class) << s.name;
  }

  // A function nested in a method is a plain function
  const auto * local = find_symbol(map, "local");
  ASSERT_NE(local, nullptr);
  EXPECT_EQ(local->kind, SymbolKind::Function);
  EXPECT_EQ(map.scope_of(*local)->name, "run");

  const auto * inner = find_symbol(map, "Inner");
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(map.scope_of(*inner)->name, "Outer");
}

TEST(SymbolExtractor, DecoratorOrderDoesNotChangeKind)
{
  const FileMap first = analyze_python(R"(class C:
    @staticmethod
    @cached
    def f():
        pass
)");
  const FileMap second = analyze_python(R"(class C:
    @cached
    @staticmethod
    def f():
        pass
)");

  const auto * a = find_symbol(first, "f");
  const auto * b = find_symbol(second, "f");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);

  EXPECT_EQ(a->kind, SymbolKind::StaticMethod);
  EXPECT_EQ(b->kind, SymbolKind::StaticMethod);
  EXPECT_TRUE(a->has(Modifier::Decorated));
  EXPECT_TRUE(b->has(Modifier::Decorated));

  EXPECT_EQ(a->decorators, (std::vector<std::string>{"@staticmethod", "@cached"}));
  EXPECT_EQ(b->decorators, (std::vector<std::string>{"@cached", "@staticmethod"}));
}

TEST(SymbolExtractor, DottedMarkerIsRecognized)
{
  const FileMap map = analyze_python(R"(class C:
    @builtins.classmethod
    def f(cls):
        pass
)");

  const auto * f = find_symbol(map, "f");
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->kind, SymbolKind::ClassMethod);
}

TEST(SymbolExtractor, MarkerOutsideClassIsDecoration)
{
  const FileMap map = analyze_python(R"(@staticmethod
def loose():
    pass
)");

  const auto * loose = find_symbol(map, "loose");
  ASSERT_NE(loose, nullptr);
  EXPECT_EQ(loose->kind, SymbolKind::Function);
  EXPECT_TRUE(loose->has(Modifier::Decorated));
}

TEST(SymbolExtractor, DecoratedClass)
{
  const FileMap map = analyze_python(R"(@dataclass(frozen=True)
class Point:
    x: int
)");

  const auto * point = find_symbol(map, "Point");
  ASSERT_NE(point, nullptr);
  EXPECT_EQ(point->kind, SymbolKind::Class);
  EXPECT_TRUE(point->has(Modifier::Decorated));
  EXPECT_EQ(point->decorators, std::vector<std::string>{"@dataclass(frozen=True)"});
}

TEST(SymbolExtractor, ClassBases)
{
  const FileMap map = analyze_python(R"(class Plain:
    pass

class Handler(base.Handler, Mixin, metaclass=Registry):
    pass
)");

  const auto * plain = find_symbol(map, "Plain");
  ASSERT_NE(plain, nullptr);
  EXPECT_TRUE(plain->bases.empty());

  const auto * handler = find_symbol(map, "Handler");
  ASSERT_NE(handler, nullptr);
  EXPECT_EQ(handler->bases, (std::vector<std::string>{"base.Handler", "Mixin"}));
}

// ============================================================================
// Modifiers
// ============================================================================

TEST(SymbolExtractor, AsyncGenerator)
{
  const FileMap map = analyze_python(R"(async def stream():
    yield 1
)");

  const auto * stream = find_symbol(map, "stream");
  ASSERT_NE(stream, nullptr);
  EXPECT_TRUE(stream->has(Modifier::Async));
  EXPECT_TRUE(stream->has(Modifier::Generator));
}

TEST(SymbolExtractor, NestedYieldBelongsToInnerFunction)
{
  const FileMap map = analyze_python(R"(def outer():
    def inner():
        yield 1
    return inner
)");

  const auto * outer = find_symbol(map, "outer");
  const auto * inner = find_symbol(map, "inner");
  ASSERT_NE(outer, nullptr);
  ASSERT_NE(inner, nullptr);
  EXPECT_FALSE(outer->has(Modifier::Generator));
  EXPECT_TRUE(inner->has(Modifier::Generator));
  EXPECT_FALSE(inner->has(Modifier::Async));
}

// ============================================================================
// Lambdas
// ============================================================================

TEST(SymbolExtractor, LambdaGetsSyntheticName)
{
  const FileMap map = analyze_python("square = lambda x: x * x\n");

  ASSERT_EQ(map.symbols.size(), 1U);
  const auto & lambda = map.symbols[0];
  EXPECT_EQ(lambda.kind, SymbolKind::Lambda);
  EXPECT_EQ(lambda.name, "<lambda>@1:10");
  EXPECT_FALSE(lambda.enclosing_scope.has_value());
}

TEST(SymbolExtractor, LambdaScopeIsNearestNamedDeclaration)
{
  const FileMap map = analyze_python(R"(class Table:
    def sort(self, rows):
        return sorted(rows, key=lambda r: (lambda: r)())
)");

  ASSERT_EQ(map.symbols.size(), 4U);
  const SymbolId sort_id{1};
  EXPECT_EQ(map.symbols[1].name, "sort");

  for (size_t i = 2; i < map.symbols.size(); ++i) {
    const auto & lambda = map.symbols[i];
    EXPECT_EQ(lambda.kind, SymbolKind::Lambda);
    ASSERT_TRUE(lambda.enclosing_scope.has_value());
    EXPECT_EQ(*lambda.enclosing_scope, sort_id);
  }
}

TEST(SymbolExtractor, SpansAreUnique)
{
  const FileMap map = analyze_python(k_widget_source);

  std::set<std::pair<uint32_t, uint32_t>> seen;
  for (const auto & s : map.symbols) {
    EXPECT_TRUE(s.span.is_valid());
    EXPECT_TRUE(seen.emplace(s.span.start_byte, s.span.end_byte).second) << s.name;
  }
}

// ============================================================================
// Documentation
// ============================================================================

TEST(SymbolExtractor, DocstringAndLeadingComment)
{
  const FileMap map = analyze_python(R"(def documented():
    """Return the answer.

    Computed once.
    """
    return 42

# Helper used by tests.
# Keeps state.
def commented():
    pass

x = 1  # trailing note
def undocumented():
    pass
)");

  const auto * documented = find_symbol(map, "documented");
  ASSERT_NE(documented, nullptr);
  ASSERT_TRUE(documented->doc_comment.has_value());
  EXPECT_EQ(*documented->doc_comment, "Return the answer.\n\nComputed once.");

  const auto * commented = find_symbol(map, "commented");
  ASSERT_NE(commented, nullptr);
  ASSERT_TRUE(commented->doc_comment.has_value());
  EXPECT_EQ(*commented->doc_comment, "Helper used by tests.\nKeeps state.");

  const auto * undocumented = find_symbol(map, "undocumented");
  ASSERT_NE(undocumented, nullptr);
  EXPECT_FALSE(undocumented->doc_comment.has_value());
}

TEST(SymbolExtractor, CleanCommentText)
{
  EXPECT_EQ(clean_comment_text("/**\n * Widget factory.\n * Thread safe.\n */"),
            "Widget factory.\nThread safe.");
  EXPECT_EQ(clean_comment_text("/// Line one\n/// Line two"), "Line one\nLine two");
  EXPECT_EQ(clean_comment_text("# note"), "note");
  EXPECT_EQ(clean_comment_text("//"), "");
}

// ============================================================================
// Determinism and failure policy
// ============================================================================

TEST(SymbolExtractor, RepeatedExtractionIsIdentical)
{
  const FileMap first = analyze_python(k_widget_source);
  const FileMap second = analyze_python(k_widget_source);

  EXPECT_EQ(first.symbols, second.symbols);
  EXPECT_EQ(to_json(first).dump(), to_json(second).dump());
}

TEST(SymbolExtractor, MalformedDeclarationDoesNotStopExtraction)
{
  const FileMap map = analyze_python(R"(class Good:
    def method(self):
        pass

def broken(:
    pass

def after():
    pass
)");

  EXPECT_FALSE(map.is_unparseable());
  EXPECT_NE(find_symbol(map, "Good"), nullptr);
  EXPECT_NE(find_symbol(map, "method"), nullptr);
  EXPECT_TRUE(map.diagnostics.has_warnings());
  EXPECT_FALSE(map.diagnostics.has_errors());
}

TEST(SymbolExtractor, NullTreeThrows)
{
  const auto adapter = make_python_adapter();
  const SourceFile source("a.py", "");
  DiagnosticBag diags;
  SymbolExtractor extractor(*adapter, source, diags);

  EXPECT_THROW((void)extractor.extract(ts_ll::Node()), std::invalid_argument);
}
