// tests/unit/basic/test_diagnostic_printer.cpp - Rendering of diagnostics

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "itl/basic/diagnostic.hpp"
#include "itl/basic/diagnostic_printer.hpp"
#include "itl/basic/source_manager.hpp"

using namespace itl;

TEST(BasicDiagnosticPrinter, PathDiagnosticShowsFileAndPath)
{
  const SourceFile file("feed.json", "{\"types\": []}");
  DiagnosticBag bag;
  bag
    .report_error(
      Stage::Validation, "label-overlap", "types[1].fields[1]",
      "labels of field 'pong' overlap with field 'ping': 1")
    .with_secondary_label("types[1].fields[0]", "overlapping field declared here")
    .with_help("give every field its own labels");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, &file);

  const std::string text = out.str();
  EXPECT_NE(
    text.find("error[label-overlap]: labels of field 'pong' overlap with field 'ping': 1"),
    std::string::npos)
    << text;
  EXPECT_NE(text.find("  --> feed.json:types[1].fields[1]"), std::string::npos) << text;
  EXPECT_NE(
    text.find("   = note: types[1].fields[0]: overlapping field declared here"), std::string::npos)
    << text;
  EXPECT_NE(text.find("   = help: give every field its own labels"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, RangeDiagnosticShowsSourceLine)
{
  const SourceFile file("feed.json", "{\n  \"types\" []\n}\n");
  DiagnosticBag bag;
  // Offset 12 is the '[' on line 2
  bag.report_error(Stage::Parse, "json-syntax", std::string(), "syntax error")
    .with_range(SourceRange(12, 13));

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, &file);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[json-syntax]: syntax error"), std::string::npos) << text;
  EXPECT_NE(text.find("  --> feed.json:2:11"), std::string::npos) << text;
  EXPECT_NE(text.find("    2 |   \"types\" []"), std::string::npos) << text;
  EXPECT_NE(text.find("^"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, EmptyPathRendersAsRoot)
{
  DiagnosticBag bag;
  bag.report_error(Stage::Structure, "invalid-root", std::string(), "document must be an object");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, nullptr);

  EXPECT_NE(out.str().find("  --> <input>:<root>"), std::string::npos) << out.str();
}

TEST(BasicDiagnosticPrinter, OrdersByStage)
{
  DiagnosticBag bag;
  bag.report_warning(Stage::Structure, "unexpected-key", "types[0].extra", "unexpected key");
  bag.report_warning(Stage::Parse, "duplicate-key", "types[0].kind", "duplicate key");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, nullptr);

  const std::string text = out.str();
  const auto parse_pos = text.find("warning[duplicate-key]");
  const auto structure_pos = text.find("warning[unexpected-key]");
  ASSERT_NE(parse_pos, std::string::npos);
  ASSERT_NE(structure_pos, std::string::npos);
  EXPECT_LT(parse_pos, structure_pos);
}
