/**
 * @file test_config.cpp
 * @brief Configuration loading, validation and per-branch resolution tests
 */

#include "verso/config.hpp"

#include "../support/memory_repository.hpp"

#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace verso::config::test {

namespace {

ConfigDocument parse_ok(std::string_view yaml)
{
    auto loaded = parse_config_document(yaml, "test.yml");
    EXPECT_TRUE(loaded) << (loaded ? "" : loaded.error().message);
    return loaded ? loaded->document : ConfigDocument{};
}

EffectiveConfig resolve_ok(const ConfigDocument& document,
                           std::string_view branch,
                           const std::optional<ConfigDocument>& override_document = std::nullopt)
{
    auto resolved = resolve_effective_config(document, override_document, branch);
    EXPECT_TRUE(resolved) << (resolved ? "" : resolved.error().message);
    return resolved.value_or(EffectiveConfig{});
}

void expect_config_error(std::string_view yaml)
{
    auto loaded = parse_config_document(yaml, "test.yml");
    ASSERT_FALSE(loaded) << yaml;
    EXPECT_EQ(loaded.error().code, "ConfigError");
}

}  // namespace

TEST(BranchName, Normalization)
{
    EXPECT_EQ(normalize_branch_name("refs/heads/feature/login"), "feature/login");
    EXPECT_EQ(normalize_branch_name("refs/remotes/upstream/develop"), "develop");
    EXPECT_EQ(normalize_branch_name("origin/release/1.2"), "release/1.2");
    EXPECT_EQ(normalize_branch_name("main"), "main");
}

TEST(ConfigResolve, DefaultsOnMain)
{
    auto config = resolve_ok(ConfigDocument{}, "main");
    EXPECT_EQ(config.matched_rules, std::vector<std::string>{"main"});
    EXPECT_EQ(config.label, "");
    EXPECT_EQ(config.increment, IncrementMode::kPatch);
    EXPECT_TRUE(config.prevent_increment_of_merged_branch_version);
    EXPECT_EQ(config.tag_prefix, "[vV]");
    EXPECT_EQ(config.mode, VersioningMode::kContinuousDelivery);
    EXPECT_EQ(config.commit_date_format, "%Y-%m-%d");
    EXPECT_EQ(config.assembly_versioning_scheme, AssemblyVersioningScheme::kMajorMinorPatch);
    EXPECT_FALSE(config.next_version);
    EXPECT_FALSE(config.no_cache);
}

TEST(ConfigResolve, BuiltInRules)
{
    auto develop = resolve_ok(ConfigDocument{}, "develop");
    EXPECT_EQ(develop.label, "alpha");
    EXPECT_EQ(develop.increment, IncrementMode::kMinor);
    EXPECT_EQ(develop.mode, VersioningMode::kContinuousDeployment);

    auto release = resolve_ok(ConfigDocument{}, "release/2.0");
    EXPECT_EQ(release.label, "beta");
    EXPECT_EQ(release.increment, IncrementMode::kNone);
    EXPECT_TRUE(release.is_release_branch);

    auto hotfix = resolve_ok(ConfigDocument{}, "hotfix-1.0.1");
    EXPECT_EQ(hotfix.matched_rules, std::vector<std::string>{"hotfix"});
    EXPECT_EQ(hotfix.label, "beta");

    auto pr = resolve_ok(ConfigDocument{}, "pull/17/merge");
    EXPECT_EQ(pr.label, "PullRequest");

    auto unmatched = resolve_ok(ConfigDocument{}, "experiment");
    EXPECT_TRUE(unmatched.matched_rules.empty());
    EXPECT_EQ(unmatched.label, "{BranchName}");
}

TEST(ConfigResolve, InheritResolvesToGlobalIncrement)
{
    auto patch = resolve_ok(ConfigDocument{}, "feature/login");
    EXPECT_EQ(patch.increment, IncrementMode::kPatch);

    auto minor = resolve_ok(parse_ok("increment: Minor\n"), "feature/login");
    EXPECT_EQ(minor.increment, IncrementMode::kMinor);

    auto inherit = resolve_ok(parse_ok("increment: Inherit\n"), "feature/login");
    EXPECT_EQ(inherit.increment, IncrementMode::kPatch);
}

TEST(ConfigResolve, ReleaseBranchPatterns)
{
    auto config = resolve_ok(ConfigDocument{}, "main");
    EXPECT_EQ(config.release_branch_patterns,
              (std::vector<std::string>{"^releases?[/-]", "^hotfix(es)?[/-]"}));
}

TEST(ConfigDocumentParse, BranchesKeepDeclarationOrder)
{
    auto loaded = parse_config_document(R"(
branches:
  zeta:
    regex: ^zeta/
  alpha:
    regex: ^alpha/
)",
                                        "test.yml");
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_EQ(loaded->document.branches.size(), 2U);
    EXPECT_EQ(loaded->document.branches[0].name, "zeta");
    EXPECT_EQ(loaded->document.branches[1].name, "alpha");
    EXPECT_EQ(loaded->raw["branches"][0]["name"], "zeta");
}

TEST(ConfigResolve, SameNamedRuleMergesIntoBuiltIn)
{
    auto document = parse_ok(R"(
branches:
  main:
    tag: rc
)");
    auto config = resolve_ok(document, "master");
    EXPECT_EQ(config.label, "rc");
    // Fields the rule does not set keep the built-in values
    EXPECT_EQ(config.increment, IncrementMode::kPatch);
    EXPECT_TRUE(config.prevent_increment_of_merged_branch_version);
}

TEST(ConfigResolve, CustomRuleAppended)
{
    auto document = parse_ok(R"(
branches:
  custom:
    regex: ^custom/
    tag: custom
    increment: Minor
)");
    auto config = resolve_ok(document, "custom/thing");
    EXPECT_EQ(config.matched_rules, std::vector<std::string>{"custom"});
    EXPECT_EQ(config.label, "custom");
    EXPECT_EQ(config.increment, IncrementMode::kMinor);
}

TEST(ConfigResolve, AbsentFieldNeverClearsButEmptyStringIsAValue)
{
    auto document = parse_ok(R"(
tag-prefix: 'rel-'
tag: ''
branches:
  custom:
    regex: ^custom/
    increment: Major
)");
    auto config = resolve_ok(document, "custom/x");
    EXPECT_EQ(config.tag_prefix, "rel-");
    EXPECT_EQ(config.label, "");
    EXPECT_EQ(config.increment, IncrementMode::kMajor);
}

TEST(ConfigResolve, NullValueMeansUnset)
{
    auto document = parse_ok("tag-prefix:\nincrement: Minor\n");
    EXPECT_FALSE(document.global.tag_prefix);
    auto config = resolve_ok(document, "experiment");
    EXPECT_EQ(config.tag_prefix, "[vV]");
}

TEST(ConfigResolve, OverrideLayersOnTopOfDocument)
{
    auto document = parse_ok("tag-prefix: 'doc-'\nnext-version: 2.0\n");
    ConfigDocument override_document;
    ASSERT_TRUE(apply_override(override_document, "tag-prefix=prefix"));
    auto config = resolve_ok(document, "main", override_document);
    EXPECT_EQ(config.tag_prefix, "prefix");
    ASSERT_TRUE(config.next_version);
    EXPECT_EQ(config.next_version->to_string(), "2.0.0");
}

TEST(ConfigResolve, NextVersionForms)
{
    auto from_float_text = resolve_ok(parse_ok("next-version: 5.0\n"), "main");
    ASSERT_TRUE(from_float_text.next_version);
    EXPECT_EQ(from_float_text.next_version->to_string(), "5.0.0");

    auto from_integer = resolve_ok(parse_ok("next-version: 3\n"), "main");
    ASSERT_TRUE(from_integer.next_version);
    EXPECT_EQ(from_integer.next_version->to_string(), "3.0.0");
}

TEST(ConfigErrors, RejectedDocuments)
{
    expect_config_error("increment: Sideways\n");
    expect_config_error("unknown-key: 1\n");
    expect_config_error("legacy-semver-padding: many\n");
    expect_config_error("mode: Continuous\n");
    expect_config_error("- just\n- a list\n");
    expect_config_error("tag: [unterminated\n");
    expect_config_error("branches:\n  main:\n    colour: blue\n");
}

TEST(ConfigErrors, RejectedAtResolution)
{
    auto no_regex = resolve_effective_config(parse_ok("branches:\n  custom:\n    tag: x\n"), std::nullopt, "main");
    ASSERT_FALSE(no_regex);
    EXPECT_EQ(no_regex.error().code, "ConfigError");

    auto bad_regex =
        resolve_effective_config(parse_ok("branches:\n  custom:\n    regex: '(unclosed'\n"), std::nullopt, "main");
    ASSERT_FALSE(bad_regex);
    EXPECT_EQ(bad_regex.error().code, "ConfigError");

    auto bad_version = resolve_effective_config(parse_ok("next-version: soon\n"), std::nullopt, "main");
    ASSERT_FALSE(bad_version);
    EXPECT_EQ(bad_version.error().code, "ConfigError");

    auto bad_date = resolve_effective_config(parse_ok("commit-date-format: '%K'\n"), std::nullopt, "main");
    ASSERT_FALSE(bad_date);
    EXPECT_EQ(bad_date.error().code, "ConfigError");
}

TEST(ConfigOverride, Assignments)
{
    ConfigDocument document;
    ASSERT_TRUE(apply_override(document, "increment=Minor"));
    ASSERT_TRUE(apply_override(document, "tag = nightly"));
    ASSERT_TRUE(apply_override(document, "no-cache=true"));
    EXPECT_EQ(document.global.increment, IncrementMode::kMinor);
    EXPECT_EQ(document.global.label, "nightly");
    EXPECT_EQ(document.no_cache, true);

    auto missing_equals = apply_override(document, "increment");
    ASSERT_FALSE(missing_equals);
    EXPECT_EQ(missing_equals.error().code, "ConfigError");

    EXPECT_FALSE(apply_override(document, "increment=Sideways"));
    EXPECT_FALSE(apply_override(document, "branches=main"));
}

TEST(ConfigLoad, MissingDefaultFileUsesDefaults)
{
    verso::test::TempDir temp_dir("verso_config_missing");
    std::optional<std::filesystem::path> missing;
    auto loaded = load_config(LoadOptions{.project_root = temp_dir.path(),
                                          .working_directory = temp_dir.path(),
                                          .config_file = std::nullopt},
                              &missing);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_FALSE(loaded->source_path);
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->filename(), "verso.yml");
    EXPECT_TRUE(loaded->raw.empty());
}

TEST(ConfigLoad, ExplicitMissingFileIsAnError)
{
    verso::test::TempDir temp_dir("verso_config_explicit_missing");
    auto loaded = load_config(LoadOptions{.project_root = temp_dir.path(),
                                          .working_directory = temp_dir.path(),
                                          .config_file = std::filesystem::path("custom.yml")});
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, "ConfigError");
}

TEST(ConfigLoad, ReadsFileAtProjectRoot)
{
    verso::test::TempDir temp_dir("verso_config_present");
    {
        std::ofstream out(temp_dir.path() / "verso.yml");
        out << "next-version: 1.0\ntag-prefix: 'v'\n";
    }
    auto loaded = load_config(LoadOptions{.project_root = temp_dir.path(),
                                          .working_directory = temp_dir.path() / "sub",
                                          .config_file = std::nullopt});
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_TRUE(loaded->source_path);
    EXPECT_EQ(loaded->document.next_version, "1.0");
    EXPECT_EQ(loaded->document.global.tag_prefix, "v");
}

}  // namespace verso::config::test
