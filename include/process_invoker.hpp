#ifndef PROCESS_INVOKER_HPP
#define PROCESS_INVOKER_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

enum class ProcessError {
    None,
    NonZeroExit,
    TimedOut,
    LaunchFailed
};

struct ProcessResult {
    ProcessError error = ProcessError::None;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return error == ProcessError::None; }
    std::string describe() const;
};

const char* toString(ProcessError error);

// Blocks the calling thread. Injected so tests can skip real delays.
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

SleepFunction realSleep();

class ProcessInvoker {
public:
    virtual ~ProcessInvoker() = default;

    // Runs argv[0] with the given arguments (no shell). Never throws for
    // failures of the child itself; those are reported through the result.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;
};

class PosixProcessInvoker : public ProcessInvoker {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;
};

std::string joinCommand(const std::vector<std::string>& argv);

#endif
