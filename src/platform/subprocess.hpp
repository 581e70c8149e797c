#pragma once

#include <expected>
#include <string>
#include <vector>

namespace process {

struct Result {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

// Runs argv[0] (PATH lookup) with stdin closed and collects stdout/stderr.
// The error side is only used when the child could not be started or
// waited for; a non-zero exit is reported through Result::exit_code.
std::expected<Result, std::string> run(const std::vector<std::string>& argv);

// Absolute path of an executable, resolved through PATH unless `name`
// already contains a slash. Empty when not found.
std::string find_executable(const std::string& name);

} // namespace process
