#pragma once

#include <string>
#include <vector>

/// @brief How to start the worker executable for one pipeline stage
/// The full command line is:
///   <command> <args...> --run-id <id> <input_flag> <path> [--feedback <text>]
struct StageCommand {
    std::string command;
    std::vector<std::string> args;
    std::string input_flag = "--input-path";

    bool configured() const { return !command.empty(); }
};
