#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "computer/local_channel.hpp"
#include "core/config/episode_id.hpp"
#include "core/errors/gym_errors.hpp"

namespace {

using compgym::computer::LocalChannel;
using compgym::core::errors::get_error;
using compgym::core::errors::get_value;
using compgym::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_local_channel_" + compgym::core::config::generate_episode_id());
        std::filesystem::create_directories(root_ / "remote");
        std::filesystem::create_directories(root_ / "local");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path remote() const { return root_ / "remote"; }
    std::filesystem::path local() const { return root_ / "local"; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Reads until `needle` shows up or about two seconds pass.
std::string read_until(LocalChannel& channel, int pid, const std::string& needle) {
    std::string collected;
    for (int attempt = 0; attempt < 20 && collected.find(needle) == std::string::npos;
         ++attempt) {
        auto chunk = channel.read_process_output(pid, std::chrono::milliseconds(100));
        if (is_error(chunk)) {
            break;
        }
        collected += get_value(chunk);
    }
    return collected;
}

TEST(LocalChannelTest, CopiesFilesBothWays) {
    TempWorkspace workspace;
    write_file(workspace.remote() / "docs/a.txt", "remote text");
    LocalChannel channel(workspace.remote(), workspace.local() / "cache");

    auto exists = channel.remote_exists("/docs/a.txt");
    ASSERT_FALSE(is_error(exists));
    EXPECT_TRUE(get_value(exists));

    const auto local_copy = workspace.local() / "a.txt";
    ASSERT_FALSE(is_error(channel.copy_from_remote("docs/a.txt", local_copy)));
    EXPECT_EQ(read_file(local_copy), "remote text");

    write_file(local_copy, "changed");
    ASSERT_FALSE(is_error(channel.make_remote_dirs("out/nested")));
    ASSERT_FALSE(is_error(channel.copy_to_remote(local_copy, "out/nested/a.txt")));
    EXPECT_EQ(read_file(workspace.remote() / "out/nested/a.txt"), "changed");
}

TEST(LocalChannelTest, MissingRemoteFileFailsCopy) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto exists = channel.remote_exists("missing.txt");
    ASSERT_FALSE(is_error(exists));
    EXPECT_FALSE(get_value(exists));

    auto copied = channel.copy_from_remote("missing.txt", workspace.local() / "x.txt");
    ASSERT_TRUE(is_error(copied));
    EXPECT_EQ(get_error(copied).code, "copy_failed");
}

TEST(LocalChannelTest, RejectsPathsOutsideRoot) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto copied = channel.copy_to_remote(workspace.local() / "x.txt", "../escape.txt");
    ASSERT_TRUE(is_error(copied));
    EXPECT_EQ(get_error(copied).code, "path_outside_root");
}

TEST(LocalChannelTest, OfflineChannelFailsEveryOperation) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());
    channel.set_online(false);

    auto exists = channel.remote_exists("a.txt");
    ASSERT_TRUE(is_error(exists));
    EXPECT_EQ(get_error(exists).code, "channel_offline");

    auto launched = channel.launch_process("/bin/sh");
    ASSERT_TRUE(is_error(launched));
    EXPECT_EQ(get_error(launched).code, "channel_offline");

    channel.set_online(true);
    EXPECT_FALSE(is_error(channel.remote_exists("a.txt")));
}

TEST(LocalChannelTest, CreatesPrivateCacheDirectory) {
    TempWorkspace workspace;
    std::filesystem::path cache;
    {
        LocalChannel channel(workspace.remote());
        auto dir = channel.local_cache_dir();
        ASSERT_FALSE(is_error(dir));
        cache = get_value(dir);
        EXPECT_TRUE(std::filesystem::is_directory(cache));
    }
    EXPECT_FALSE(std::filesystem::exists(cache));
}

TEST(LocalChannelTest, ShellSessionEchoesInput) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto launched = channel.launch_process("/bin/sh");
    ASSERT_FALSE(is_error(launched));
    const int pid = get_value(launched);

    ASSERT_FALSE(is_error(channel.write_process_input(pid, "echo shell_ok\n")));
    EXPECT_NE(read_until(channel, pid, "shell_ok").find("shell_ok"), std::string::npos);

    EXPECT_FALSE(is_error(channel.terminate_process(pid)));
    auto after = channel.write_process_input(pid, "echo again\n");
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "not_found");
}

TEST(LocalChannelTest, ReadTimesOutWithEmptyOutput) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto launched = channel.launch_process("/bin/sh");
    ASSERT_FALSE(is_error(launched));

    auto output =
        channel.read_process_output(get_value(launched), std::chrono::milliseconds(50));
    ASSERT_FALSE(is_error(output));
    EXPECT_TRUE(get_value(output).empty());
}

TEST(LocalChannelTest, ReportsWorkingDirectory) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.remote() / "work");
    LocalChannel channel(workspace.remote());

    auto launched = channel.launch_process("/bin/sh");
    ASSERT_FALSE(is_error(launched));
    const int pid = get_value(launched);

    ASSERT_FALSE(is_error(channel.write_process_input(pid, "echo ready\n")));
    ASSERT_NE(read_until(channel, pid, "ready").find("ready"), std::string::npos);
    auto info = channel.query_process_info(pid);
    ASSERT_FALSE(is_error(info));
    EXPECT_EQ(get_value(info).cwd, std::filesystem::canonical(workspace.remote()));

    ASSERT_FALSE(is_error(channel.write_process_input(pid, "cd work && echo moved\n")));
    ASSERT_NE(read_until(channel, pid, "moved").find("moved"), std::string::npos);
    auto moved = channel.query_process_info(pid);
    ASSERT_FALSE(is_error(moved));
    EXPECT_EQ(get_value(moved).cwd, std::filesystem::canonical(workspace.remote() / "work"));
}

TEST(LocalChannelTest, RejectsBlockedCommands) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto launched = channel.launch_process("sudo sh");
    ASSERT_TRUE(is_error(launched));
    EXPECT_EQ(get_error(launched).code, "blocked_command");
}

TEST(LocalChannelTest, ScreensEveryLineOfShellInput) {
    TempWorkspace workspace;
    LocalChannel channel(workspace.remote());

    auto launched = channel.launch_process("/bin/sh");
    ASSERT_FALSE(is_error(launched));
    const int pid = get_value(launched);

    auto refused = channel.write_process_input(pid, "echo fine\nSUDO rm -f x\n");
    ASSERT_TRUE(is_error(refused));
    EXPECT_EQ(get_error(refused).code, "blocked_command");

    ASSERT_FALSE(is_error(channel.write_process_input(pid, "echo after\n")));
    const auto output = read_until(channel, pid, "after");
    EXPECT_NE(output.find("after"), std::string::npos);
    EXPECT_EQ(output.find("fine"), std::string::npos);
}

}  // namespace
