/**
 * @file test_version_source.cpp
 * @brief Version source strategy and selection tests
 */

#include "verso/version_source.hpp"

#include "../support/memory_repository.hpp"

#include <gtest/gtest.h>

namespace verso::version::test {

using verso::test::MemoryRepository;

namespace {

config::EffectiveConfig config_for(std::string_view branch, config::ConfigDocument document = {})
{
    auto resolved = config::resolve_effective_config(document, std::nullopt, branch);
    EXPECT_TRUE(resolved) << (resolved ? "" : resolved.error().message);
    return resolved.value_or(config::EffectiveConfig{});
}

repository::RepositoryView view_of(const MemoryRepository& repo)
{
    auto view = repository::make_repository_view(repo);
    EXPECT_TRUE(view) << (view ? "" : view.error().message);
    return view.value_or(repository::RepositoryView{});
}

SemVer version(std::string_view text)
{
    return parse_semver(text).value_or(SemVer{});
}

}  // namespace

TEST(TagStrategy, HighestReachableTagWins)
{
    MemoryRepository repo;
    auto first = repo.commit("initial");
    repo.tag("v1.0.0", first);
    auto second = repo.commit("second");
    repo.tag("1.1.0", second);
    repo.commit("third");

    repo.checkout("feature/other");
    auto unreachable = repo.commit("elsewhere");
    repo.tag("v9.0.0", unreachable);
    repo.checkout("main");

    auto found = tag_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(found);
    ASSERT_TRUE(*found);
    EXPECT_EQ((*found)->base_version.to_string(), "1.1.0");
    EXPECT_EQ((*found)->source_commit, second);
    EXPECT_EQ((*found)->kind, SourceKind::kTag);
    EXPECT_TRUE((*found)->should_increment);
}

TEST(TagStrategy, TagOnHeadDoesNotIncrement)
{
    MemoryRepository repo;
    repo.commit("initial");
    auto head = repo.commit("release");
    repo.tag("v2.0.0-rc.1", head);

    auto found = tag_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(found && *found);
    EXPECT_FALSE((*found)->should_increment);
    EXPECT_EQ((*found)->base_version.to_string(), "2.0.0-rc.1");
}

TEST(TagStrategy, PrefixMustMatchForNonVersionTags)
{
    MemoryRepository repo;
    auto head = repo.commit("initial");
    repo.tag("release-3.1.0", head);
    repo.tag("latest", head);

    auto with_default = tag_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(with_default);
    EXPECT_FALSE(*with_default);

    config::ConfigDocument document;
    document.global.tag_prefix = "release-";
    auto with_prefix = tag_version_source(view_of(repo), config_for("main", document));
    ASSERT_TRUE(with_prefix && *with_prefix);
    EXPECT_EQ((*with_prefix)->base_version.to_string(), "3.1.0");
}

TEST(MergeMessage, RecognizedFormats)
{
    auto branch = parse_merge_message("Merge branch 'release/1.2.0' into main");
    ASSERT_TRUE(branch);
    EXPECT_EQ(branch->source, "release/1.2.0");
    EXPECT_EQ(branch->target, "main");

    auto pull = parse_merge_message("Merge pull request #42 from acme/release-2.0.0\n\nRelease notes");
    ASSERT_TRUE(pull);
    EXPECT_EQ(pull->source, "acme/release-2.0.0");
    EXPECT_FALSE(pull->target);

    auto remote = parse_merge_message("Merge remote-tracking branch 'origin/release/3.0.0'");
    ASSERT_TRUE(remote);
    EXPECT_EQ(remote->source, "origin/release/3.0.0");

    auto finish = parse_merge_message("Finish hotfix-1.0.1");
    ASSERT_TRUE(finish);
    EXPECT_EQ(finish->source, "hotfix-1.0.1");

    EXPECT_FALSE(parse_merge_message("Add merge support"));
}

TEST(MergeMessageStrategy, ReleaseBranchMergeOnMain)
{
    MemoryRepository repo;
    repo.commit("initial");
    repo.checkout("release/2.0.0");
    repo.commit("stabilize");
    repo.checkout("main");
    auto merge = repo.merge("release/2.0.0", "Merge branch 'release/2.0.0' into main");
    repo.commit("after merge");

    auto found = merge_message_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(found && *found);
    EXPECT_EQ((*found)->base_version.to_string(), "2.0.0");
    EXPECT_EQ((*found)->source_commit, merge);
    EXPECT_EQ((*found)->kind, SourceKind::kMergeMessage);
    // main prevents incrementing merged release versions
    EXPECT_FALSE((*found)->should_increment);
}

TEST(MergeMessageStrategy, IgnoresNonReleaseBranches)
{
    MemoryRepository repo;
    repo.commit("initial");
    repo.checkout("feature/3.0.0");
    repo.commit("work");
    repo.checkout("main");
    repo.merge("feature/3.0.0", "Merge branch 'feature/3.0.0'");

    auto found = merge_message_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(found);
    EXPECT_FALSE(*found);
}

TEST(ConfigDefaultStrategy, AnchoredAtFirstCommit)
{
    MemoryRepository repo;
    auto first = repo.commit("initial");
    repo.commit("second");

    auto found = config_default_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(found && *found);
    EXPECT_EQ((*found)->base_version.to_string(), "0.1.0");
    EXPECT_EQ((*found)->source_commit, first);
    EXPECT_FALSE((*found)->should_increment);
}

TEST(Selection, TieBreaks)
{
    VersionSource tag{.base_version = version("1.0.0"),
                      .source_commit = "b",
                      .source_date = 10,
                      .kind = SourceKind::kTag,
                      .should_increment = true,
                      .description = {}};
    VersionSource merge = tag;
    merge.kind = SourceKind::kMergeMessage;
    merge.source_date = 20;
    EXPECT_TRUE(is_preferred(tag, merge));
    EXPECT_FALSE(is_preferred(merge, tag));

    VersionSource newer = tag;
    newer.source_date = 30;
    EXPECT_TRUE(is_preferred(newer, tag));

    VersionSource same_date = tag;
    same_date.source_commit = "a";
    EXPECT_TRUE(is_preferred(same_date, tag));

    VersionSource higher = merge;
    higher.base_version = version("1.0.1");
    EXPECT_TRUE(is_preferred(higher, tag));
}

TEST(Locator, FallsBackToDefault)
{
    MemoryRepository repo;
    repo.commit("initial");

    auto source = locate_version_source(view_of(repo), config_for("main"));
    ASSERT_TRUE(source) << source.error().message;
    EXPECT_EQ(source->kind, SourceKind::kConfigDefault);
    EXPECT_EQ(source->base_version.to_string(), "0.1.0");
}

TEST(Locator, NextVersionRaisesFloor)
{
    MemoryRepository repo;
    auto first = repo.commit("initial");
    repo.tag("v1.0.0", first);
    repo.commit("second");

    config::ConfigDocument document;
    document.next_version = "5.0";
    auto source = locate_version_source(view_of(repo), config_for("main", document));
    ASSERT_TRUE(source) << source.error().message;
    EXPECT_EQ(source->kind, SourceKind::kNextVersionOverride);
    EXPECT_EQ(to_string(source->kind), "NextVersionOverride");
    EXPECT_EQ(source->base_version.to_string(), "5.0.0");
    EXPECT_EQ(source->source_commit, first);
    EXPECT_FALSE(source->should_increment);
}

TEST(Locator, LowerNextVersionIsIgnored)
{
    MemoryRepository repo;
    auto first = repo.commit("initial");
    repo.tag("v3.0.0", first);
    repo.commit("second");

    config::ConfigDocument document;
    document.next_version = "2.0";
    auto source = locate_version_source(view_of(repo), config_for("main", document));
    ASSERT_TRUE(source);
    EXPECT_EQ(source->kind, SourceKind::kTag);
    EXPECT_EQ(source->base_version.to_string(), "3.0.0");
}

}  // namespace verso::version::test
