// tests/unit/sema/test_union_checker.cpp - Union discriminators, labels and defaults

#include <gtest/gtest.h>

#include <string>

#include "itl/sema/analysis/union_checker.hpp"
#include "itl/test_support/schema_helpers.hpp"

using namespace itl;

namespace
{

/// A union over `disc` whose fields carry the given label arrays
std::string union_doc(const std::string & disc, const std::string & fields)
{
  return R"({"types": [{"name": "U", "kind": "union", "discriminator": )" + disc +
         R"(, "fields": [)" + fields + "]}]}";
}

}  // namespace

// ============================================================================
// Disjointness / defaults
// ============================================================================

TEST(SemaUnion, DisjointLabelsAccepted)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": [1, 2]},
       {"name": "b", "type": {"kind": "bool"}, "labels": [3]})"));
  EXPECT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
}

TEST(SemaUnion, OverlapCitesBothFields)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "ping", "type": {"kind": "bool"}, "labels": [1, 2]},
       {"name": "pong", "type": {"kind": "bool"}, "labels": [2, 3]})"));
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.count_rule("label-overlap"), 1u);

  const auto * d = test_support::find_rule(result.diagnostics, "label-overlap");
  EXPECT_EQ(d->stage, Stage::Validation);
  EXPECT_EQ(d->path(), "types[0].fields[1]");
  ASSERT_EQ(d->labels.size(), 2u);
  EXPECT_EQ(d->labels[1].path, "types[0].fields[0]");
  EXPECT_NE(d->message.find("'pong'"), std::string::npos);
  EXPECT_NE(d->message.find("'ping'"), std::string::npos);
  EXPECT_NE(d->message.find(": 2"), std::string::npos) << d->message;
}

TEST(SemaUnion, OverlapReportedOncePerPair)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": [1]},
       {"name": "b", "type": {"kind": "bool"}, "labels": [1]},
       {"name": "c", "type": {"kind": "bool"}, "labels": [1]})"));
  // (a,b), (a,c), (b,c)
  EXPECT_EQ(result.diagnostics.count_rule("label-overlap"), 3u);
}

TEST(SemaUnion, SingleDefaultAccepted)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": [1]},
       {"name": "rest", "type": {"kind": "bool"}, "labels": []})"));
  ASSERT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
  const auto * u = cast<UnionType>(result.schema->lookup("U"));
  ASSERT_NE(u->default_field(), nullptr);
  EXPECT_EQ(u->default_field()->name, "rest");
}

TEST(SemaUnion, NoDefaultIsLegal)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "bool"})", R"({"name": "yes", "type": {"kind": "byte"}, "labels": [true]})"));
  ASSERT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
  EXPECT_EQ(cast<UnionType>(result.schema->lookup("U"))->default_field(), nullptr);
}

TEST(SemaUnion, TwoDefaultsAreAmbiguous)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": []},
       {"name": "b", "type": {"kind": "bool"}, "labels": []})"));
  EXPECT_FALSE(result.success);
  const auto * d = test_support::find_rule(result.diagnostics, "ambiguous-default");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->path(), "types[0].fields[1]");
  ASSERT_EQ(d->labels.size(), 2u);
  EXPECT_EQ(d->labels[1].path, "types[0].fields[0]");
}

TEST(SemaUnion, EmptyUnionRejected)
{
  const auto result = test_support::load(union_doc(R"({"kind": "byte"})", ""));
  const auto * d = test_support::find_rule(result.diagnostics, "empty-union");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->path(), "types[0].fields");
}

TEST(SemaUnion, RepeatedLabelIsWarning)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})", R"({"name": "a", "type": {"kind": "bool"}, "labels": [4, 4]})"));
  EXPECT_TRUE(result.success);
  const auto * d = test_support::find_rule(result.diagnostics, "duplicate-label");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->severity, Severity::Warning);
  EXPECT_EQ(d->path(), "types[0].fields[0].labels[1]");
}

// ============================================================================
// Label legality
// ============================================================================

TEST(SemaUnion, LabelsMustFitIntDiscriminator)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "int", "bits": 8, "unsigned": true})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": [-1, 0, 255, 300]})"));
  EXPECT_FALSE(result.success);
  const auto labels = test_support::all_with_rule(result.diagnostics, "label-type");
  ASSERT_EQ(labels.size(), 2u);
  EXPECT_EQ(labels[0].path(), "types[0].fields[0].labels[0]");
  EXPECT_EQ(labels[1].path(), "types[0].fields[0].labels[3]");
  EXPECT_NE(labels[0].message.find("uint8"), std::string::npos) << labels[0].message;
}

TEST(SemaUnion, UnboundedIntAcceptsAnyIntegerOfItsSign)
{
  EXPECT_TRUE(test_support::load(union_doc(R"({"kind": "int"})",
                                           R"({"name": "a", "type": {"kind": "bool"},
                                               "labels": [-9223372036854775808, 18446744073709551615]})"))
                .success);
  const auto neg = test_support::load(union_doc(
    R"({"kind": "int", "unsigned": true})", R"({"name": "a", "type": {"kind": "bool"}, "labels": [-1]})"));
  EXPECT_EQ(neg.diagnostics.count_rule("label-type"), 1u);
}

TEST(SemaUnion, LabelKindMustMatchDiscriminator)
{
  const auto result = test_support::load(union_doc(
    R"({"kind": "byte"})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": [true, "x", 7]})"));
  EXPECT_EQ(result.diagnostics.count_rule("label-type"), 2u);

  const auto bools = test_support::load(union_doc(
    R"({"kind": "bool"})", R"({"name": "a", "type": {"kind": "byte"}, "labels": [1]})"));
  EXPECT_EQ(bools.diagnostics.count_rule("label-type"), 1u);
}

TEST(SemaUnion, StringLabelsLimitedBySizeThenCapacity)
{
  EXPECT_TRUE(test_support::load(union_doc(R"({"kind": "string", "capacity": 3})",
                                           R"({"name": "a", "type": {"kind": "bool"}, "labels": ["abc", "é€"]})"))
                .success);

  const auto longer = test_support::load(union_doc(
    R"({"kind": "string", "size": 2, "capacity": 8})",
    R"({"name": "a", "type": {"kind": "bool"}, "labels": ["abc"]})"));
  EXPECT_EQ(longer.diagnostics.count_rule("label-type"), 1u);
}

TEST(SemaUnion, DiscriminatorByNameAndBadKinds)
{
  const auto named = test_support::load(R"({"types": [
    {"name": "Flag", "kind": "int", "bits": 8, "unsigned": true},
    {"kind": "union", "discriminator": "Flag", "fields": [{"name": "a", "type": {"kind": "bool"}, "labels": [1]}]}
  ]})");
  EXPECT_TRUE(named.success) << test_support::rules_of(named.diagnostics);

  const auto bad = test_support::load(union_doc(
    R"({"kind": "float"})", R"({"name": "a", "type": {"kind": "bool"}, "labels": [1]})"));
  const auto * d = test_support::find_rule(bad.diagnostics, "discriminator-type");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->path(), "types[0].discriminator");
  // Labels are not checked against an unusable discriminator
  EXPECT_EQ(bad.diagnostics.count_rule("label-type"), 0u);
}

TEST(SemaUnion, EnumDiscriminatorNormalizesNamesAndValues)
{
  const auto result = test_support::load_legacy(R"({"types": [
    {"name": "Color", "kind": "enum", "values": [{"name": "red", "value": 1}, {"name": "green", "value": 2}]},
    {"kind": "union", "discriminator": "Color", "fields": [
      {"name": "r", "type": {"kind": "bool"}, "labels": ["red"]},
      {"name": "also_r", "type": {"kind": "bool"}, "labels": [1]},
      {"name": "g", "type": {"kind": "bool"}, "labels": ["blue", 3]}
    ]}
  ]})");
  EXPECT_EQ(result.diagnostics.count_rule("label-overlap"), 1u)
    << test_support::rules_of(result.diagnostics);
  EXPECT_EQ(result.diagnostics.count_rule("label-type"), 2u);
}

TEST(SemaUnion, RuneDiscriminatorNormalizesCharacters)
{
  const auto result = test_support::load_legacy(R"({"types": [
    {"kind": "union", "discriminator": {"kind": "rune"}, "fields": [
      {"name": "a", "type": {"kind": "bool"}, "labels": ["A"]},
      {"name": "b", "type": {"kind": "bool"}, "labels": [65]},
      {"name": "c", "type": {"kind": "bool"}, "labels": ["xy", 55296, 1114112]}
    ]}
  ]})");
  EXPECT_EQ(result.diagnostics.count_rule("label-overlap"), 1u);
  EXPECT_EQ(result.diagnostics.count_rule("label-type"), 3u);
}

TEST(SemaUnion, NormalizeLabelDirectly)
{
  SchemaContext ctx;
  auto * byte = ctx.create<ByteType>(ctx.intern("d"));
  std::string reason;

  const auto ok = UnionChecker::normalize_label(
    LabelValue::make_integer(IntValue::from_signed(200)), *byte, reason);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->as_integer().magnitude(), 200u);

  const auto bad = UnionChecker::normalize_label(
    LabelValue::make_integer(IntValue::from_signed(256)), *byte, reason);
  EXPECT_FALSE(bad.has_value());
  EXPECT_FALSE(reason.empty());

  EXPECT_TRUE(UnionChecker::is_discriminator_kind(TypeKind::String));
  EXPECT_FALSE(UnionChecker::is_discriminator_kind(TypeKind::Record));
}
