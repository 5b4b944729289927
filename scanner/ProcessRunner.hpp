#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lanwatch::scanner
{
    struct ProcessResult
    {
        bool launched = false;
        bool timed_out = false;
        int exit_code = -1;
        std::string output;

        bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
    };

    class ProcessRunner
    {
    public:
        virtual ~ProcessRunner() = default;

        // Runs argv[0] (looked up in PATH) and captures its stdout. Never
        // blocks longer than the timeout; an overrunning child is killed.
        virtual ProcessResult Run(const std::vector<std::string> &argv,
                                  std::chrono::milliseconds timeout) = 0;
    };

    class PosixProcessRunner : public ProcessRunner
    {
    public:
        static constexpr size_t MAX_OUTPUT_BYTES = 1024 * 1024;

        ProcessResult Run(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout) override;
    };
}
