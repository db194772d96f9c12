#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ProcessUtils {

struct ProcessResult {
    int exit_code = -1;          // exit status, or 128 + signal number when killed
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return exit_code == 0; }
};

using OutputCallback = std::function<void(const std::string& chunk)>;

// Runs argv[0] (looked up in PATH) with the given arguments and collects its output.
// The child runs in its own process group so terminal interrupts only reach us.
// Throws std::system_error when the process cannot be spawned.
ProcessResult run(const std::vector<std::string>& args);

// Same as run() but hands output to the callbacks as it arrives instead of
// collecting it. A null callback discards that stream.
int run_streaming(const std::vector<std::string>& args,
                  const OutputCallback& on_stdout,
                  const OutputCallback& on_stderr);

// Renders argv for log messages, quoting arguments that contain whitespace
std::string describe(const std::vector<std::string>& args);

}
