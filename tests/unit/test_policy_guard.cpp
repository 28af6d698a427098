#include <algorithm>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "temp_workspace.hpp"

namespace {

using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::policy::PathPolicy;
using warden::policy::PolicyGuard;
using warden::testing::TempWorkspace;

PolicyGuard guard_rooted_at(const std::filesystem::path& root) {
    PathPolicy path_policy;
    path_policy.allowed_roots = {root};
    return PolicyGuard({}, path_policy);
}

TEST(PolicyGuardTest, AllowsPathInsideAllowedRoot) {
    TempWorkspace workspace("policy");
    workspace.write("sub/sample.txt", "ok");

    auto guard = guard_rooted_at(workspace.root());
    auto result = guard.validate_path((workspace.root() / "sub/sample.txt").string());
    ASSERT_FALSE(is_error(result));

    const auto& validated = get_value(result);
    EXPECT_TRUE(validated.resolved().is_absolute());
    EXPECT_EQ(validated.resolved().filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AllowsMissingFileInsideAllowedRoot) {
    TempWorkspace workspace("policy");
    auto guard = guard_rooted_at(workspace.root());
    auto result = guard.validate_path((workspace.root() / "new/file.txt").string());
    EXPECT_FALSE(is_error(result));
}

TEST(PolicyGuardTest, RejectsPathOutsideAllowedRoot) {
    TempWorkspace workspace("policy");
    auto guard = guard_rooted_at(workspace.root() / "inner");
    std::filesystem::create_directories(workspace.root() / "inner");

    auto result = guard.validate_path((workspace.root() / "outside.txt").string());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(result).code, "path_outside_allowed_dirs");
}

TEST(PolicyGuardTest, RejectsSiblingWithSharedPrefix) {
    TempWorkspace workspace("policy");
    std::filesystem::create_directories(workspace.root() / "data");
    std::filesystem::create_directories(workspace.root() / "data-other");
    auto guard = guard_rooted_at(workspace.root() / "data");

    auto result = guard.validate_path((workspace.root() / "data-other/x.txt").string());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_allowed_dirs");
}

TEST(PolicyGuardTest, RejectsParentSegments) {
    PolicyGuard guard;
    for (const std::string path : {"/tmp/../etc/passwd", "/tmp/a/..", "..", "/tmp/x\\..\\y"}) {
        auto result = guard.validate_path(path);
        ASSERT_TRUE(is_error(result)) << path;
        EXPECT_EQ(get_error(result).code, "path_traversal") << path;
    }
}

TEST(PolicyGuardTest, AllowsDotsInsideNames) {
    TempWorkspace workspace("policy");
    auto guard = guard_rooted_at(workspace.root());
    auto result = guard.validate_path((workspace.root() / "archive..old.txt").string());
    EXPECT_FALSE(is_error(result));
}

TEST(PolicyGuardTest, RejectsRelativePaths) {
    PolicyGuard guard;
    auto result = guard.validate_path("notes/todo.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "relative_path");
}

TEST(PolicyGuardTest, RejectsEmptyPath) {
    PolicyGuard guard;
    auto result = guard.validate_path("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "empty_path");
}

TEST(PolicyGuardTest, RejectsDangerousCharacters) {
    PolicyGuard guard;
    const std::string cases[] = {"/tmp/a<b", "/tmp/a>b", "/tmp/a|b", "/tmp/a\"b",
                                 "/tmp/a'b", std::string("/tmp/a\0b", 8), "/tmp/a\nb"};
    for (const auto& path : cases) {
        auto result = guard.validate_path(path);
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "dangerous_character");
    }
}

TEST(PolicyGuardTest, DefaultRootsIncludeWorkingDirectoryAndTmp) {
    PolicyGuard guard;
    const auto roots = guard.allowed_roots();
    EXPECT_NE(std::find(roots.begin(), roots.end(), std::filesystem::current_path()),
              roots.end());
    EXPECT_NE(std::find(roots.begin(), roots.end(), std::filesystem::path("/tmp")),
              roots.end());
}

TEST(PolicyGuardTest, AcceptsOrdinaryCommands) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.validate_command("ls -la")));
    EXPECT_FALSE(is_error(guard.validate_command("git status")));
    EXPECT_FALSE(is_error(guard.validate_command("cat a.txt | grep x | wc -l")));
}

TEST(PolicyGuardTest, RejectsBlockedCommandsCaseInsensitively) {
    PolicyGuard guard;
    for (const std::string command :
         {"rm -rf /", "SUDO RM file", "Shutdown now", "echo hi && reboot", "mkfs.ext4 /dev/sda",
          "dd if=/dev/zero of=x", ":(){ :|:& };:"}) {
        auto result = guard.validate_command(command);
        ASSERT_TRUE(is_error(result)) << command;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Policy);
        EXPECT_EQ(get_error(result).code, "blocked_command") << command;
    }
}

TEST(PolicyGuardTest, RejectsTooManyPipesAndRedirects) {
    PolicyGuard guard;
    auto pipes = guard.validate_command("a | b | c | d");
    ASSERT_TRUE(is_error(pipes));
    EXPECT_EQ(get_error(pipes).code, "too_many_pipes");

    auto redirects = guard.validate_command("a > b < c > d");
    ASSERT_TRUE(is_error(redirects));
    EXPECT_EQ(get_error(redirects).code, "too_many_redirects");
}

TEST(PolicyGuardTest, RejectsLongAndEmptyCommands) {
    PolicyGuard guard;
    auto long_command = guard.validate_command("echo " + std::string(1000, 'x'));
    ASSERT_TRUE(is_error(long_command));
    EXPECT_EQ(get_error(long_command).code, "command_too_long");

    EXPECT_FALSE(is_error(guard.validate_command(std::string(1000, 'x'))));

    auto empty = guard.validate_command("");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_command");
}

TEST(PolicyGuardTest, GlobPatterns) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.validate_glob_pattern("*.rs")));
    EXPECT_FALSE(is_error(guard.validate_glob_pattern("src/**/*.rs")));
    EXPECT_FALSE(is_error(guard.validate_glob_pattern(std::string(10, '*'))));

    auto complex = guard.validate_glob_pattern(std::string(11, '*'));
    ASSERT_TRUE(is_error(complex));
    EXPECT_EQ(get_error(complex).code, "pattern_too_complex");

    auto traversal = guard.validate_glob_pattern("../*.rs");
    ASSERT_TRUE(is_error(traversal));
    EXPECT_EQ(get_error(traversal).code, "path_traversal");

    auto nul = guard.validate_glob_pattern(std::string("a\0b", 3));
    ASSERT_TRUE(is_error(nul));
    EXPECT_EQ(get_error(nul).code, "dangerous_character");

    EXPECT_TRUE(is_error(guard.validate_glob_pattern("")));
}

TEST(PolicyGuardTest, ApiKeyFormat) {
    PolicyGuard guard;
    const std::string valid = "sk-ant-" + std::string(40, 'a');
    auto ok = guard.validate_api_key(valid);
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).value(), valid);

    EXPECT_EQ(get_error(guard.validate_api_key("")).code, "empty_api_key");
    EXPECT_EQ(get_error(guard.validate_api_key("sk-xyz-" + std::string(40, 'a'))).code,
              "invalid_api_key");
    EXPECT_EQ(get_error(guard.validate_api_key("sk-ant-short")).code, "invalid_api_key");
    EXPECT_EQ(get_error(guard.validate_api_key("sk-ant-" + std::string(100, 'a'))).code,
              "invalid_api_key");
}

TEST(PolicyGuardTest, RejectsSymlinksAndOversizedFiles) {
    TempWorkspace workspace("policy");
    const auto target = workspace.write("target.txt", "0123456789");
    std::filesystem::create_symlink(target, workspace.root() / "link.txt");

    PathPolicy path_policy;
    path_policy.allowed_roots = {workspace.root()};
    path_policy.max_file_bytes = 5;
    PolicyGuard guard({}, path_policy);

    auto link = guard.validate_path((workspace.root() / "link.txt").string());
    ASSERT_FALSE(is_error(link));
    auto link_status = guard.check_file_permissions(get_value(link));
    ASSERT_TRUE(link_status.has_value());
    EXPECT_EQ(link_status->code, "symlink_not_allowed");

    auto big = guard.validate_path(target.string());
    ASSERT_FALSE(is_error(big));
    auto big_status = guard.check_file_permissions(get_value(big));
    ASSERT_TRUE(big_status.has_value());
    EXPECT_EQ(big_status->code, "file_too_large");

    auto missing = guard.validate_path((workspace.root() / "missing.txt").string());
    ASSERT_FALSE(is_error(missing));
    EXPECT_FALSE(guard.check_file_permissions(get_value(missing)).has_value());
}

TEST(PolicyGuardTest, RejectsDirectoryLinkLeavingAllowedRoot) {
    TempWorkspace workspace("policy");
    const auto inner = workspace.root() / "inner";
    std::filesystem::create_directories(inner);
    workspace.write("outside/secret.txt", "hidden");
    std::filesystem::create_directory_symlink(workspace.root() / "outside", inner / "out");

    auto guard = guard_rooted_at(inner);
    for (const auto* leaf : {"secret.txt", "new.txt"}) {
        auto result = guard.validate_path((inner / "out" / leaf).string());
        ASSERT_TRUE(is_error(result)) << leaf;
        EXPECT_EQ(get_error(result).code, "path_outside_allowed_dirs");
    }
}

TEST(PolicyGuardTest, RejectsDanglingLinks) {
    TempWorkspace workspace("policy");
    const auto inner = workspace.root() / "inner";
    std::filesystem::create_directories(inner);
    std::filesystem::create_directories(workspace.root() / "outside");
    std::filesystem::create_symlink(workspace.root() / "outside" / "missing.txt", inner / "link");
    std::filesystem::create_directory_symlink(workspace.root() / "gone", inner / "dir");

    auto guard = guard_rooted_at(inner);
    auto leaf = guard.validate_path((inner / "link").string());
    ASSERT_TRUE(is_error(leaf));
    EXPECT_EQ(get_error(leaf).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(leaf).code, "dangling_symlink");

    auto through = guard.validate_path((inner / "dir" / "file.txt").string());
    ASSERT_TRUE(is_error(through));
    EXPECT_EQ(get_error(through).code, "dangling_symlink");
}

}  // namespace
