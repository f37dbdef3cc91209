#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/episode_id.hpp"
#include "core/errors/gym_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using compgym::core::errors::get_error;
using compgym::core::errors::get_value;
using compgym::core::errors::is_error;
using compgym::policy::ShellPolicy;
using compgym::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + compgym::core::config::generate_episode_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, ResolvesPathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result = guard.resolve_in_root(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AbsolutePathsAreRelativeToRoot) {
    TempWorkspace workspace;

    PolicyGuard guard;
    auto absolute = guard.resolve_in_root(workspace.root(), "/sub/new.txt");
    auto relative = guard.resolve_in_root(workspace.root(), "sub/new.txt");
    ASSERT_FALSE(is_error(absolute));
    ASSERT_FALSE(is_error(relative));
    EXPECT_EQ(get_value(absolute), get_value(relative));
}

TEST(PolicyGuardTest, RejectsPathEscapingRoot) {
    TempWorkspace workspace;

    PolicyGuard guard;
    auto result = guard.resolve_in_root(workspace.root(), "../outside.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsEmptyPath) {
    TempWorkspace workspace;

    PolicyGuard guard;
    auto result = guard.resolve_in_root(workspace.root(), "");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(PolicyGuardTest, RejectsMissingRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_channel_root__" + compgym::core::config::generate_episode_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.resolve_in_root(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_channel_root");
}

TEST(PolicyGuardTest, ScreensShellExecutable) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.screen_executable("/bin/sh")));

    auto blocked = guard.screen_executable("sudo /bin/sh");
    ASSERT_TRUE(is_error(blocked));
    EXPECT_EQ(get_error(blocked).code, "blocked_command");

    auto empty = guard.screen_executable("");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_command");
}

TEST(PolicyGuardTest, ShellInputIsScreenedLineByLine) {
    PolicyGuard guard;
    EXPECT_FALSE(is_error(guard.screen_shell_input("")));
    EXPECT_FALSE(is_error(guard.screen_shell_input("ls -la\ncd /tmp\n")));

    auto hidden = guard.screen_shell_input("echo ok\n  ReBoOt\n");
    ASSERT_TRUE(is_error(hidden));
    EXPECT_EQ(get_error(hidden).code, "blocked_command");
    EXPECT_NE(get_error(hidden).message.find("ReBoOt"), std::string::npos);
}

TEST(PolicyGuardTest, CustomShellPolicyReplacesDefaults) {
    ShellPolicy policy;
    policy.blocked_substrings = {"curl", ""};
    PolicyGuard guard(policy);

    EXPECT_TRUE(is_error(guard.screen_shell_input("curl example.com\n")));
    EXPECT_FALSE(is_error(guard.screen_shell_input("sudo true\n")));
    EXPECT_FALSE(is_error(guard.screen_executable("/bin/bash")));
}

}  // namespace
