// tests/unit/sema/test_semantic_validator.cpp - Aggregation across rules

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "itl/sema/semantic_validator.hpp"
#include "itl/sema/type_graph_builder.hpp"
#include "itl/test_support/schema_helpers.hpp"

using namespace itl;

TEST(SemaValidator, TwoIndependentViolationsYieldExactlyTwoErrors)
{
  const auto result = test_support::load(R"({"types": [
    {"name": "A", "kind": "record", "fields": [
      {"name": "x", "type": {"kind": "byte"}},
      {"name": "x", "type": {"kind": "byte"}}
    ]},
    {"name": "B", "kind": "record", "fields": [
      {"name": "y", "type": {"kind": "bool"}},
      {"name": "y", "type": {"kind": "bool"}}
    ]}
  ]})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.schema, nullptr);
  ASSERT_EQ(result.diagnostics.error_count(), 2u) << test_support::rules_of(result.diagnostics);
  for (const auto & d : result.diagnostics) {
    EXPECT_EQ(d.stage, Stage::Validation);
    EXPECT_EQ(d.rule, "duplicate-field-name");
  }
  EXPECT_EQ(result.diagnostics.all()[0].path(), "types[0].fields[1]");
  EXPECT_EQ(result.diagnostics.all()[1].path(), "types[1].fields[1]");
}

TEST(SemaValidator, RulesOfDifferentCheckersAreAllReported)
{
  const auto result = test_support::load(R"({"types": [
    {"kind": "string", "size": 10, "capacity": 5},
    {"kind": "fixed", "base": 10, "digits": 5, "scale": 6},
    {"kind": "union", "discriminator": {"kind": "byte"}, "fields": [
      {"name": "a", "type": {"kind": "bool"}, "labels": []},
      {"name": "b", "type": {"kind": "bool"}, "labels": []}
    ]},
    {"name": "L", "kind": "record", "fields": [{"name": "l", "type": "L"}]}
  ]})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count_rule("size-exceeds-capacity"), 1u);
  EXPECT_EQ(result.diagnostics.count_rule("fixed-scale"), 1u);
  EXPECT_EQ(result.diagnostics.count_rule("ambiguous-default"), 1u);
  EXPECT_EQ(result.diagnostics.count_rule("infinite-type"), 1u);
  EXPECT_EQ(result.diagnostics.error_count(), 4u);
}

TEST(SemaValidator, StructuralErrorsStopBeforeValidation)
{
  const auto result = test_support::load(R"({"types": [
    {"kind": "string", "size": 10, "capacity": 5},
    {"kind": "record", "fields": [{"name": "x", "type": "Missing"}]}
  ]})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count_rule("unknown-type-reference"), 1u);
  EXPECT_TRUE(result.diagnostics.from_stage(Stage::Validation).empty());
}

TEST(SemaValidator, ValidatorCountsAcrossCheckers)
{
  DiagnosticBag build_diags;
  TypeGraphBuilder builder(&build_diags);
  const auto schema = builder.build(nlohmann::json::parse(R"({"types": [
    {"kind": "int", "bits": -3},
    {"kind": "union", "discriminator": {"kind": "byte"}, "fields": []}
  ]})"));
  ASSERT_NE(schema, nullptr);

  DiagnosticBag diags;
  SemanticValidator validator(&diags);
  EXPECT_FALSE(validator.validate(*schema));
  EXPECT_TRUE(validator.has_errors());
  EXPECT_EQ(validator.error_count(), 2u);
  EXPECT_EQ(diags.error_count(), 2u);

  // Silent mode gives the same verdict
  SemanticValidator silent(nullptr);
  EXPECT_FALSE(silent.validate(*schema));
  EXPECT_EQ(silent.error_count(), 2u);
}
