#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "computer/local_channel.hpp"
#include "core/config/episode_id.hpp"
#include "core/errors/gym_errors.hpp"
#include "resource/remote_process.hpp"

namespace {

using compgym::computer::LocalChannel;
using compgym::core::errors::get_error;
using compgym::core::errors::get_value;
using compgym::core::errors::is_error;
using compgym::resource::RemoteProcess;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_remote_process_" + compgym::core::config::generate_episode_id());
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

std::string read_until(RemoteProcess& process, const std::string& needle) {
    std::string collected;
    for (int attempt = 0; attempt < 20 && collected.find(needle) == std::string::npos;
         ++attempt) {
        auto chunk = process.read_output(std::chrono::milliseconds(100));
        if (is_error(chunk)) {
            break;
        }
        collected += get_value(chunk);
    }
    return collected;
}

TEST(RemoteProcessTest, StartSendReadStop) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);

    ASSERT_TRUE(shell.start());
    EXPECT_TRUE(shell.running());
    EXPECT_TRUE(shell.send_input("echo $((6 * 7))\n"));
    EXPECT_NE(read_until(shell, "42").find("42"), std::string::npos);

    EXPECT_TRUE(shell.stop());
    EXPECT_FALSE(shell.running());
    EXPECT_TRUE(shell.stop());
}

TEST(RemoteProcessTest, ReadTimeoutReturnsEmpty) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    auto output = shell.read_output(std::chrono::milliseconds(30));
    ASSERT_FALSE(is_error(output));
    EXPECT_TRUE(get_value(output).empty());
}

TEST(RemoteProcessTest, CwdIsQueriedEachTime) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    ASSERT_TRUE(shell.send_input("cd sub && echo moved\n"));
    ASSERT_NE(read_until(shell, "moved").find("moved"), std::string::npos);

    auto cwd = shell.cwd();
    ASSERT_FALSE(is_error(cwd));
    EXPECT_EQ(get_value(cwd), std::filesystem::canonical(workspace.root() / "sub"));
    EXPECT_EQ(shell.handle().last_known_cwd, get_value(cwd));

    ASSERT_TRUE(shell.send_input("cd .. && echo back\n"));
    ASSERT_NE(read_until(shell, "back").find("back"), std::string::npos);
    auto again = shell.cwd();
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(get_value(again), std::filesystem::canonical(workspace.root()));
}

TEST(RemoteProcessTest, EnvironmentReflectsLiveExports) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    ASSERT_TRUE(shell.send_input("export GYM_MARK=set_in_shell; echo $GYM_MARK\n"));
    ASSERT_NE(read_until(shell, "set_in_shell").find("set_in_shell"), std::string::npos);

    auto env = shell.env();
    ASSERT_FALSE(is_error(env));
    ASSERT_EQ(get_value(env).count("GYM_MARK"), 1u);
    EXPECT_EQ(get_value(env).at("GYM_MARK"), "set_in_shell");
    EXPECT_EQ(shell.handle().last_known_env.at("GYM_MARK"), "set_in_shell");

    ASSERT_TRUE(shell.send_input("unset GYM_MARK\n"));
    auto after = shell.env();
    ASSERT_FALSE(is_error(after));
    EXPECT_EQ(get_value(after).count("GYM_MARK"), 0u);
}

TEST(RemoteProcessTest, ExecuteReturnsOutputAndExitCode) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    auto listed = shell.execute("printf 'a\\nb\\n'");
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed).output, "a\nb\n");
    EXPECT_EQ(get_value(listed).exit_code, 0);

    auto failed = shell.execute("echo oops; false");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed).output, "oops\n");
    EXPECT_EQ(get_value(failed).exit_code, 1);

    auto partial = shell.execute("printf partial");
    ASSERT_FALSE(is_error(partial));
    EXPECT_EQ(get_value(partial).output, "partial");
}

TEST(RemoteProcessTest, ExecuteKeepsEarlierOutputForReaders) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    ASSERT_TRUE(shell.send_input("echo before\n"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto executed = shell.execute("echo during");
    ASSERT_FALSE(is_error(executed));
    EXPECT_EQ(get_value(executed).output, "during\n");

    EXPECT_NE(read_until(shell, "before").find("before"), std::string::npos);
}

TEST(RemoteProcessTest, ExecuteTimesOut) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    auto slow = shell.execute("sleep 2", std::chrono::milliseconds(50));
    ASSERT_TRUE(is_error(slow));
    EXPECT_EQ(get_error(slow).code, "command_timeout");
}

TEST(RemoteProcessTest, ChangeDirectoryMovesTheSession) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    ASSERT_FALSE(is_error(shell.change_directory("sub")));
    EXPECT_EQ(shell.handle().last_known_cwd, std::filesystem::canonical(workspace.root() / "sub"));

    auto missing = shell.change_directory("no such dir");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "change_directory_failed");
}

TEST(RemoteProcessTest, SetAndGetEnvironmentVariables) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());
    RemoteProcess shell(channel);
    ASSERT_TRUE(shell.start());

    ASSERT_FALSE(is_error(shell.set_envvar("GYM_GREETING", "it's a \"test\" $HOME")));
    auto value = shell.get_envvar("GYM_GREETING");
    ASSERT_FALSE(is_error(value));
    ASSERT_TRUE(get_value(value).has_value());
    EXPECT_EQ(get_value(value).value(), "it's a \"test\" $HOME");

    auto unset = shell.get_envvar("GYM_NEVER_SET");
    ASSERT_FALSE(is_error(unset));
    EXPECT_FALSE(get_value(unset).has_value());

    auto bad = shell.set_envvar("1BAD;rm", "x");
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "invalid_envvar_name");
}

TEST(RemoteProcessTest, FailuresReportFalse) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.root());

    RemoteProcess blocked(channel, "sudo sh");
    EXPECT_FALSE(blocked.start());
    EXPECT_FALSE(blocked.running());
    EXPECT_FALSE(blocked.send_input("echo hi\n"));

    auto output = blocked.read_output(std::chrono::milliseconds(10));
    ASSERT_TRUE(is_error(output));
    EXPECT_EQ(get_error(output).code, "handle_closed");

    auto executed = blocked.execute("true");
    ASSERT_TRUE(is_error(executed));
    EXPECT_EQ(get_error(executed).code, "handle_closed");
}

}  // namespace
