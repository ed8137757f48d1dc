// tests/unit/driver/test_schema_loader.cpp - Pipeline driver end to end

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "itl/driver/schema_loader.hpp"
#include "itl/schema/json_writer.hpp"
#include "itl/test_support/schema_helpers.hpp"

using namespace itl;
namespace fs = std::filesystem;

namespace
{

constexpr const char * k_flag_msg = R"({"types":[{"name":"Flag","kind":"int","bits":8,"unsigned":true},{"name":"Msg","kind":"union","discriminator":"Flag","fields":[{"name":"ping","type":{"kind":"byte"},"labels":[1]},{"name":"other","type":{"kind":"byte"},"labels":[]}]}]})";

struct TempDir
{
  fs::path path;
  explicit TempDir(fs::path p) : path(std::move(p)) { fs::create_directories(path); }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  fs::path write(const std::string & name, const std::string & content) const
  {
    const fs::path file = path / name;
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }
};

}  // namespace

TEST(DriverSchemaLoader, FlagAndMessageDocument)
{
  const LoadResult result = parse_and_validate(k_flag_msg);
  ASSERT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
  ASSERT_NE(result.schema, nullptr);
  EXPECT_TRUE(result.diagnostics.empty());

  const Schema & schema = *result.schema;
  const auto named = schema.named_types();
  ASSERT_EQ(named.size(), 2u);
  EXPECT_EQ(named[0]->get_name(), "Flag");
  EXPECT_EQ(named[1]->get_name(), "Msg");

  const auto * msg = dyn_cast<UnionType>(schema.lookup("Msg"));
  ASSERT_NE(msg, nullptr);
  EXPECT_EQ(msg->discriminator.get(), schema.lookup("Flag"));

  const UnionField * def = msg->default_field();
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->name, "other");
  EXPECT_FALSE(msg->find_field("ping")->is_default());
}

TEST(DriverSchemaLoader, ParseErrorsStopThePipeline)
{
  const LoadResult result = parse_and_validate(R"({"types": [{"kind": "bool",}]})");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.schema, nullptr);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all()[0].stage, Stage::Parse);
  EXPECT_EQ(result.diagnostics.all()[0].rule, "json-syntax");
}

TEST(DriverSchemaLoader, WarningsDoNotFailTheDocument)
{
  LoadOptions options;
  options.grammar.strict_keys = false;
  const LoadResult result = parse_and_validate(
    R"({"types": [{"kind": "bool", "kind": "byte", "comment": "x"}]})", options);
  ASSERT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
  EXPECT_EQ(result.diagnostics.count_rule("duplicate-key"), 1u);
  EXPECT_EQ(result.diagnostics.count_rule("unexpected-key"), 1u);
  EXPECT_EQ(result.schema->types()[0]->get_kind(), TypeKind::Byte);
}

TEST(DriverSchemaLoader, LegacyKindsNeedTheOption)
{
  const char * doc = R"({"types": [{"kind": "rune", "encoding": "utf-8"}]})";

  const LoadResult strict = parse_and_validate(doc);
  EXPECT_FALSE(strict.success);
  EXPECT_EQ(strict.diagnostics.count_rule("legacy-kind"), 1u);

  LoadOptions options;
  options.grammar.legacy_kinds = true;
  const LoadResult legacy = parse_and_validate(doc, options);
  EXPECT_TRUE(legacy.success) << test_support::rules_of(legacy.diagnostics);
}

TEST(DriverSchemaLoader, EncodingKeyNeedsTheOption)
{
  const LoadResult result = parse_and_validate(R"({"types": [{"kind": "int", "encoding": "uint8"}]})");
  EXPECT_FALSE(result.success);
  const auto * d = test_support::find_rule(result.diagnostics, "unexpected-key");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->path(), "types[0].encoding");
  EXPECT_TRUE(d->help_message.has_value());
}

TEST(DriverSchemaLoader, LoadFileReadsFromDisk)
{
  const TempDir dir(fs::temp_directory_path() / "itl_loader_read");
  const fs::path file = dir.write("feed.json", k_flag_msg);

  const LoadResult result = SchemaLoader::load_file(file);
  ASSERT_TRUE(result.success) << test_support::rules_of(result.diagnostics);
  EXPECT_EQ(result.source.path(), file);
  EXPECT_EQ(result.schema->size(), 2u);
}

TEST(DriverSchemaLoader, MissingFileIsIoError)
{
  const TempDir dir(fs::temp_directory_path() / "itl_loader_missing");
  const LoadResult result = SchemaLoader::load_file(dir.path / "absent.json");
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics.all()[0].rule, "io-error");
  EXPECT_EQ(result.diagnostics.all()[0].stage, Stage::Parse);
}

TEST(DriverSchemaLoader, SchemaOutlivesTheResultThatLoadedIt)
{
  std::unique_ptr<Schema> schema;
  {
    LoadResult result = parse_and_validate(k_flag_msg);
    ASSERT_TRUE(result.success);
    schema = std::move(result.schema);
  }
  const auto * msg = cast<UnionType>(schema->lookup("Msg"));
  EXPECT_EQ(msg->fields[0].name, "ping");
  EXPECT_EQ(msg->discriminator.get()->get_name(), "Flag");
}

TEST(DriverSchemaLoader, IndependentLoadsRunConcurrently)
{
  constexpr int k_threads = 8;
  std::atomic<int> successes{0};
  std::vector<std::thread> threads;
  threads.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    threads.emplace_back([&successes, i]() {
      const std::string doc = (i % 2 == 0)
                                ? std::string(k_flag_msg)
                                : std::string(R"({"types": [{"kind": "int", "bits": 0}]})");
      const LoadResult result = parse_and_validate(doc);
      if (result.success == (i % 2 == 0)) {
        ++successes;
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }
  EXPECT_EQ(successes.load(), k_threads);
}

TEST(DriverSchemaLoader, ValidatedSchemaIsReadableFromManyThreads)
{
  const LoadResult result = parse_and_validate(k_flag_msg);
  ASSERT_TRUE(result.success);
  const Schema & schema = *result.schema;
  const nlohmann::json expected = to_json(schema);

  std::atomic<int> matches{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&]() {
      if (to_json(schema) == expected && schema.lookup("Flag") != nullptr) {
        ++matches;
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }
  EXPECT_EQ(matches.load(), 4);
}
