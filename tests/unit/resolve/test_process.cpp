//
// Created by gregorian-rayne on 2/14/26.
//

#include "pinch/resolve/process.hpp"
#include "pinch/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <utility>
#include <vector>

namespace pinch::process
{
#ifndef _WIN32
    TEST(RunCommandTest, CapturesBothStreamsAndExitCode) {
        const auto result = run_command("echo out; echo err 1>&2; exit 3", fs::temp_directory_path());

        ASSERT_TRUE(result.is_ok()) << result.error();
        EXPECT_EQ(result.value().exit_code, 3);
        EXPECT_EQ(result.value().stdout_output, "out\n");
        EXPECT_EQ(result.value().stderr_output, "err\n");
    }

    TEST(RunCommandTest, RunsInWorkingDirectory) {
        const auto dir = fs::canonical(fs::temp_directory_path());
        const auto result = run_command("pwd -P", dir);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().stdout_output, dir.string() + "\n");
    }

    TEST(RunCommandTest, MissingWorkingDirectoryExits127) {
        const auto result = run_command("true", fs::temp_directory_path() / "pinch_no_such_dir");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().exit_code, 127);
    }

    TEST(RunCommandTest, ConcurrentCommandsDoNotWaitOnEachOther) {
        // Slow and fast commands interleaved on one pool: a fast command
        // sees end of output as soon as its own child exits.
        std::vector<std::string> commands;
        for (int i = 0; i < 8; ++i) {
            commands.emplace_back(i % 2 == 0 ? "sleep 3" : "echo fast");
        }

        parallel::ThreadPool pool(8);
        const auto timings = parallel::map(commands, [](const std::string& command) {
            const auto started = std::chrono::steady_clock::now();
            const auto result = run_command(command, fs::temp_directory_path());
            const auto elapsed = std::chrono::steady_clock::now() - started;
            return std::make_pair(result.is_ok(), elapsed);
        }, pool);

        for (std::size_t i = 1; i < timings.size(); i += 2) {
            EXPECT_TRUE(timings[i].first);
            EXPECT_LT(timings[i].second, std::chrono::milliseconds(2000)) << "command " << i;
        }
    }
#endif

}  // namespace pinch::process
