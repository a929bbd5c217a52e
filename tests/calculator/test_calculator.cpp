/**
 * @file test_calculator.cpp
 * @brief Version computation orchestration tests (configuration, cache, fresh computation)
 */

#include "verso/calculator.hpp"

#include "verso/log.hpp"

#include "../support/memory_repository.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

namespace verso::calculator::test {

using verso::test::MemoryRepository;
using verso::test::TempDir;

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kCachedEntry = R"(Major: 4
Minor: 10
Patch: 3
PreReleaseTag: test.19
PreReleaseTagWithDash: -test.19
PreReleaseLabel: test
PreReleaseNumber: 19
MajorMinorPatch: 4.10.3
SemVer: 4.10.3-test.19
AssemblySemVer: 4.10.3.0
FullSemVer: 4.10.3-test.19
BranchName: feature/test
Sha: dd2a29aff0c948e1bdf3dabbe13e1576e70d5f9f
CommitDate: 2015-11-10
)";

void write_file(const fs::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/// Project directory with a .git directory and an in-memory history.
class CalculatorTest : public ::testing::Test
{
protected:
    CalculatorTest()
        : m_temp_dir("verso_calculator_" + std::string(
                         ::testing::UnitTest::GetInstance()->current_test_info()->name()))
        , m_repository(std::make_shared<MemoryRepository>())
        , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_log))
    {
        fs::create_directories(project_root() / ".git");
        m_repository->commit("initial commit");
    }

    [[nodiscard]] fs::path project_root() const { return m_temp_dir.path() / "project"; }

    [[nodiscard]] ComputeOptions options() const
    {
        ComputeOptions opts;
        opts.working_directory = project_root();
        opts.logger = log::make_logger("calculator-test", {m_sink}, spdlog::level::debug);
        return opts;
    }

    [[nodiscard]] VersionCalculator calculator(const ComputeOptions& opts) const
    {
        auto location = repository::locate_repository(opts.working_directory);
        EXPECT_TRUE(location) << (location ? "" : location.error().message);
        return VersionCalculator(opts, location.value_or(repository::RepositoryLocation{}), m_repository);
    }

    [[nodiscard]] version::VersionVariables compute_ok(const ComputeOptions& opts) const
    {
        auto result = calculator(opts).compute();
        EXPECT_TRUE(result) << (result ? "" : result.error().message);
        return result.value_or(version::VersionVariables{});
    }

    [[nodiscard]] std::string log_text() const { return m_log.str(); }

    TempDir m_temp_dir;
    std::shared_ptr<MemoryRepository> m_repository;
    std::ostringstream m_log;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
};

}  // namespace

TEST_F(CalculatorTest, FreshComputationWritesCacheEntry)
{
    const auto vars = compute_ok(options());
    EXPECT_EQ(vars.sem_ver, "0.1.0");
    EXPECT_EQ(vars.assembly_sem_ver, "0.1.0.0");
    EXPECT_EQ(vars.branch_name, "main");

    ASSERT_FALSE(vars.file_name.empty());
    const fs::path entry = vars.file_name;
    EXPECT_TRUE(fs::is_regular_file(entry));
    EXPECT_EQ(entry.parent_path(), calculator(options()).cache_directory());
    EXPECT_EQ(calculator(options()).cache_directory(), project_root() / ".git" / "verso_cache");
    EXPECT_NE(log_text().find("verso.yml not found"), std::string::npos);
}

TEST_F(CalculatorTest, CachedEntryIsServedWithoutRecomputation)
{
    const auto first = compute_ok(options());
    write_file(first.file_name, kCachedEntry);

    const int walks = m_repository->walk_count();
    const auto cached = compute_ok(options());
    EXPECT_EQ(cached.assembly_sem_ver, "4.10.3.0");
    EXPECT_EQ(cached.sem_ver, "4.10.3-test.19");
    EXPECT_EQ(cached.file_name, first.file_name);
    EXPECT_EQ(m_repository->walk_count(), walks);
    EXPECT_NE(log_text().find("Deserializing version variables from cache file"), std::string::npos);
}

TEST_F(CalculatorTest, RepeatedComputationIsIdempotent)
{
    const auto first = compute_ok(options());
    const auto second = compute_ok(options());
    EXPECT_EQ(first, second);
}

TEST_F(CalculatorTest, NewCommitChangesKey)
{
    const auto first = compute_ok(options());
    m_repository->commit("fix: something");
    const auto second = compute_ok(options());
    EXPECT_NE(first.file_name, second.file_name);
    EXPECT_NE(first.sha, second.sha);
}

TEST_F(CalculatorTest, ConfigurationChangeProducesNewVersion)
{
    const auto first = compute_ok(options());
    write_file(first.file_name, kCachedEntry);
    EXPECT_EQ(compute_ok(options()).assembly_sem_ver, "4.10.3.0");

    write_file(project_root() / "verso.yml", "next-version: 5.0\n");
    const auto updated = compute_ok(options());
    EXPECT_EQ(updated.assembly_sem_ver, "5.0.0.0");
    EXPECT_EQ(updated.sem_ver, "5.0.0");
}

TEST_F(CalculatorTest, TouchedConfigurationInvalidatesEntry)
{
    const fs::path config_file = project_root() / "verso.yml";
    write_file(config_file, "next-version: 5.0\n");
    const auto first = compute_ok(options());
    ASSERT_EQ(first.assembly_sem_ver, "5.0.0.0");
    write_file(first.file_name, kCachedEntry);

    // Same content, so the key is unchanged; only the timestamps move.
    const auto now = fs::file_time_type::clock::now();
    const fs::path cache_dir = calculator(options()).cache_directory();
    fs::last_write_time(cache_dir, now - std::chrono::hours(1));
    fs::last_write_time(config_file, now - std::chrono::minutes(30));

    const auto refreshed = compute_ok(options());
    EXPECT_EQ(refreshed.assembly_sem_ver, "5.0.0.0");
    EXPECT_EQ(refreshed.file_name, first.file_name);
    EXPECT_NE(log_text().find("Configuration changed since cache entry was written"), std::string::npos);

    // The rewritten entry is valid again.
    const int walks = m_repository->walk_count();
    EXPECT_EQ(compute_ok(options()).assembly_sem_ver, "5.0.0.0");
    EXPECT_EQ(m_repository->walk_count(), walks);
}

TEST_F(CalculatorTest, OverrideConfigBypassesCache)
{
    const auto first = compute_ok(options());
    const fs::path cache_dir = calculator(options()).cache_directory();
    write_file(first.file_name, kCachedEntry);
    const auto before = fs::last_write_time(cache_dir);

    m_repository->tag("prefix1.2.0", m_repository->head());
    auto opts = options();
    config::ConfigDocument override_document;
    ASSERT_TRUE(config::apply_override(override_document, "tag-prefix=prefix"));
    opts.override_config = override_document;

    const auto vars = compute_ok(opts);
    EXPECT_EQ(vars.sem_ver, "1.2.0");
    EXPECT_TRUE(vars.file_name.empty());
    EXPECT_EQ(fs::last_write_time(cache_dir), before);
    std::size_t entries = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(cache_dir)) {
        ++entries;
    }
    EXPECT_EQ(entries, 1U);
    EXPECT_NE(log_text().find("bypassing cache"), std::string::npos);
}

TEST_F(CalculatorTest, NoCacheIgnoresStaleEntry)
{
    const auto first = compute_ok(options());
    write_file(first.file_name, kCachedEntry);

    auto opts = options();
    opts.no_cache = true;
    const auto vars = compute_ok(opts);
    EXPECT_EQ(vars.assembly_sem_ver, "0.1.0.0");
    EXPECT_TRUE(vars.file_name.empty());
}

TEST_F(CalculatorTest, NoCacheFromConfigurationFile)
{
    write_file(project_root() / "verso.yml", "no-cache: true\n");
    const auto vars = compute_ok(options());
    EXPECT_EQ(vars.assembly_sem_ver, "0.1.0.0");
    EXPECT_FALSE(fs::exists(calculator(options()).cache_directory()));
}

TEST_F(CalculatorTest, CorruptEntryIsRecomputed)
{
    const auto first = compute_ok(options());
    write_file(first.file_name, "Major: [1, 2\n");

    const auto vars = compute_ok(options());
    EXPECT_EQ(vars.assembly_sem_ver, "0.1.0.0");
    EXPECT_NE(log_text().find("Ignoring unreadable cache file"), std::string::npos);

    std::ifstream in(first.file_name);
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    EXPECT_NE(content.find("AssemblySemVer: 0.1.0.0"), std::string::npos);
}

TEST_F(CalculatorTest, DetachedHeadUsesTargetBranch)
{
    m_repository->checkout("feature/login");
    m_repository->commit("work");
    m_repository->detach();

    auto opts = options();
    opts.repository_info.target_branch = "refs/heads/main";
    const auto vars = compute_ok(opts);
    EXPECT_EQ(vars.branch_name, "main");
    EXPECT_TRUE(vars.pre_release_label.empty());
}

TEST_F(CalculatorTest, InvalidConfigurationPropagates)
{
    write_file(project_root() / "verso.yml", "tag-prefix: '[unclosed'\n");
    auto result = calculator(options()).compute();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "ConfigError");
}

TEST_F(CalculatorTest, ExplicitConfigFileMustExist)
{
    auto opts = options();
    opts.config_file = "missing.yml";
    auto result = calculator(opts).compute();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "ConfigError");
}

TEST_F(CalculatorTest, WorktreeSharesMainCacheDirectory)
{
    const fs::path git_dir = project_root() / ".git";
    const fs::path worktree_admin = git_dir / "worktrees" / "wt";
    fs::create_directories(worktree_admin);
    write_file(worktree_admin / "commondir", "../..\n");

    const fs::path worktree = m_temp_dir.path() / "wt";
    fs::create_directories(worktree / "src");
    write_file(worktree / ".git", "gitdir: " + worktree_admin.string() + "\n");

    auto location = repository::locate_repository(worktree / "src");
    ASSERT_TRUE(location) << location.error().message;
    EXPECT_EQ(location->project_root, fs::weakly_canonical(worktree));
    EXPECT_EQ(location->git_dir, fs::weakly_canonical(git_dir));

    auto opts = options();
    opts.working_directory = worktree / "src";
    VersionCalculator calc(opts, *location, m_repository);
    EXPECT_EQ(calc.cache_directory(), fs::weakly_canonical(git_dir) / "verso_cache");
    auto vars = calc.compute();
    ASSERT_TRUE(vars) << vars.error().message;
    EXPECT_TRUE(fs::is_regular_file(vars->file_name));
}

TEST(ComputeVersion, MissingRepositoryIsReported)
{
    TempDir temp_dir("verso_calculator_no_repository");
    ComputeOptions opts;
    opts.working_directory = temp_dir.path();
    auto result = compute_version(opts);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "RepositoryNotFound");
    EXPECT_TRUE(result.error().message.starts_with("Can't find the .git directory in"));
}

}  // namespace verso::calculator::test
