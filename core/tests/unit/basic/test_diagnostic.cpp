// tests/unit/basic/test_diagnostic.cpp - DiagnosticBag, builder and paths

#include <gtest/gtest.h>

#include <string>

#include "itl/basic/diagnostic.hpp"
#include "itl/basic/document_path.hpp"
#include "itl/basic/source_manager.hpp"

using namespace itl;

TEST(BasicDiagnostic, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder =
      bag.report_error(Stage::Validation, "label-overlap", "types[1].fields[1]", "overlap on 1");
    builder.with_secondary_label("types[1].fields[0]", "other field").with_help("split the labels");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.stage, Stage::Validation);
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.rule, "label-overlap");
  EXPECT_EQ(d.path(), "types[1].fields[1]");
  ASSERT_EQ(d.labels.size(), 2u);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].path, "types[1].fields[0]");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "split the labels");
}

TEST(BasicDiagnostic, MovedBuilderRegistersOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_warning(Stage::Parse, "duplicate-key", "types[0].kind", "dup");
    auto second = std::move(first);
    second.with_help("the last value is used");
  }
  EXPECT_EQ(bag.size(), 1u);
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
}

TEST(BasicDiagnostic, CountsBySeverityStageAndRule)
{
  DiagnosticBag bag;
  bag.report_error(Stage::Structure, "missing-key", "types[0]", "missing required key 'kind'");
  bag.report_error(Stage::Structure, "missing-key", "types[1]", "missing required key 'kind'");
  bag.report_warning(Stage::Structure, "unexpected-key", "types[1].extra", "unexpected key");

  EXPECT_EQ(bag.size(), 3u);
  EXPECT_EQ(bag.error_count(), 2u);
  EXPECT_EQ(bag.errors().size(), 2u);
  EXPECT_EQ(bag.warnings().size(), 1u);
  EXPECT_EQ(bag.from_stage(Stage::Structure).size(), 3u);
  EXPECT_TRUE(bag.from_stage(Stage::Validation).empty());
  EXPECT_EQ(bag.count_rule("missing-key"), 2u);
  EXPECT_EQ(bag.count_rule("unexpected-key"), 1u);
  EXPECT_EQ(bag.count_rule("json-syntax"), 0u);
}

TEST(BasicDiagnostic, MergeAppends)
{
  DiagnosticBag a;
  a.report_error(Stage::Validation, "empty-union", "types[0].fields", "empty");
  DiagnosticBag b;
  b.report_error(Stage::Validation, "int-bits", "types[1].bits", "bad width");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a.all()[1].rule, "int-bits");
}

TEST(BasicDiagnostic, RangeOnlyDiagnosticHasEmptyPath)
{
  DiagnosticBag bag;
  bag.report_error(Stage::Parse, "json-syntax", std::string(), "unexpected end of input")
    .with_range(SourceRange(4, 5));
  ASSERT_EQ(bag.size(), 1u);
  EXPECT_TRUE(bag.all()[0].path().empty());
  EXPECT_TRUE(bag.all()[0].primary_range().is_valid());
  EXPECT_EQ(bag.all()[0].primary_range().get_begin().offset(), 4u);
}

TEST(BasicDiagnostic, StageAndSeverityNames)
{
  EXPECT_EQ(to_string(Stage::Parse), "parse");
  EXPECT_EQ(to_string(Stage::Structure), "structure");
  EXPECT_EQ(to_string(Stage::Validation), "validation");
  EXPECT_EQ(to_string(Severity::Error), "error");
  EXPECT_EQ(to_string(Severity::Warning), "warning");
}

TEST(BasicDocumentPath, JoinAndIndex)
{
  EXPECT_EQ(join_path("", "types"), "types");
  EXPECT_EQ(join_path("types[3]", "fields"), "types[3].fields");
  EXPECT_EQ(index_path("types", 3), "types[3]");
  EXPECT_EQ(join_path(index_path(join_path(index_path("types", 3), "fields"), 1), "type"),
            "types[3].fields[1].type");
  EXPECT_EQ(display_path(""), "<root>");
  EXPECT_EQ(display_path("types[0]"), "types[0]");
}

TEST(BasicSourceFile, LineColumnAndLines)
{
  const SourceFile file("doc.json", "{\n  \"types\": [\n  ]\n}\n");

  const LineColumn start = file.get_line_column(0);
  EXPECT_EQ(start.line, 1u);
  EXPECT_EQ(start.column, 1u);

  const LineColumn second = file.get_line_column(4);
  EXPECT_EQ(second.line, 2u);
  EXPECT_EQ(second.column, 3u);

  EXPECT_EQ(file.get_line(1), "  \"types\": [");
  EXPECT_EQ(file.get_slice(SourceRange(4, 11)), "\"types\"");
}

TEST(BasicSourceFile, CrLfLineEndingsAreStripped)
{
  const SourceFile file("doc.json", "{\r\n\"types\": []\r\n}");
  EXPECT_EQ(file.get_line(1), "\"types\": []");
  EXPECT_EQ(file.get_line_column(3).line, 2u);
}
