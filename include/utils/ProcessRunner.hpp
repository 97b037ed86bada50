#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <atomic>

namespace MediaBot {

/**
 * External tool invocation
 */
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{60000};
};

/**
 * Outcome of an external tool invocation
 */
struct CommandResult {
    bool success = false;
    int exitCode = -1;
    bool timedOut = false;
    bool cancelled = false;
    std::string output;         // captured stdout
    std::string errorOutput;    // captured stderr
    std::string error;          // "<program> failed: <reason>" when !success
};

/**
 * Runs external programs. Stages depend on this interface so tests can
 * script tool behaviour.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const CommandSpec& spec) = 0;
};

/**
 * fork/exec runner with a wall-clock timeout
 * The child runs in its own process group; on timeout or cancellation the
 * whole group is killed.
 */
class PosixCommandRunner : public CommandRunner {
public:
    explicit PosixCommandRunner(std::shared_ptr<std::atomic<bool>> cancelFlag = nullptr,
                                size_t maxOutputBytes = 10 * 1024 * 1024);

    CommandResult run(const CommandSpec& spec) override;

private:
    std::shared_ptr<std::atomic<bool>> cancelFlag;
    size_t maxOutputBytes;

    bool isCancelled() const;
};

/**
 * Render a command line for logs
 */
std::string describeCommand(const CommandSpec& spec);

} // namespace MediaBot
