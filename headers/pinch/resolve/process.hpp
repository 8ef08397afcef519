//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef PINCH_PROCESS_HPP
#define PINCH_PROCESS_HPP

/**
 * @file process.hpp
 * @brief Blocking subprocess execution.
 *
 * Runs a shell command in a working directory and captures its output.
 * No timeout is enforced here; callers that need one wrap the whole run.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"

#include <string>

namespace pinch::process {

    struct CommandResult {
        int exit_code = 0;           // Negative: terminated by that signal
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();
    };

    /**
     * Executes command through /bin/sh in working_dir.
     *
     * A non-zero exit status is reported in CommandResult, not as an
     * error. Errors are reserved for failing to start the process at all.
     */
    [[nodiscard]] Result<CommandResult, Error> run_command(
        const std::string& command,
        const fs::path& working_dir
    );

}  // namespace pinch::process

#endif //PINCH_PROCESS_HPP
