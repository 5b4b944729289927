#include "ProcessRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace lanwatch::scanner
{
    namespace
    {
        using SteadyClock = std::chrono::steady_clock;

        int RemainingMs(SteadyClock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
            return left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        int DecodeStatus(int status)
        {
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            if (WIFSIGNALED(status))
                return 128 + WTERMSIG(status);
            return -1;
        }

        void KillAndReap(pid_t pid)
        {
            kill(pid, SIGKILL);
            int status = 0;
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
            {
            }
        }
    }

    ProcessResult PosixProcessRunner::Run(const std::vector<std::string> &argv,
                                          std::chrono::milliseconds timeout)
    {
        ProcessResult result;
        if (argv.empty())
            return result;

        // Close-on-exec so children spawned concurrently by other probe
        // workers never hold a copy of this pipe's write end.
        int pipefd[2];
        if (pipe2(pipefd, O_CLOEXEC) == -1)
        {
            std::cerr << "[Process] pipe2 failed: " << std::strerror(errno) << "\n";
            return result;
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = -1;
        int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        close(pipefd[1]);

        if (rc != 0)
        {
            close(pipefd[0]);
            return result;
        }
        result.launched = true;

        const auto deadline = SteadyClock::now() + timeout;
        char buffer[4096];
        bool eof = false;

        while (!eof)
        {
            int remaining = RemainingMs(deadline);
            if (remaining == 0)
            {
                result.timed_out = true;
                break;
            }

            struct pollfd pfd;
            pfd.fd = pipefd[0];
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ready = poll(&pfd, 1, remaining);
            if (ready == -1)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (ready == 0)
                continue;

            ssize_t count = read(pipefd[0], buffer, sizeof(buffer));
            if (count > 0)
            {
                size_t room = MAX_OUTPUT_BYTES - std::min(MAX_OUTPUT_BYTES, result.output.size());
                result.output.append(buffer, std::min(room, static_cast<size_t>(count)));
            }
            else if (count == 0)
            {
                eof = true;
            }
            else if (errno != EINTR && errno != EAGAIN)
            {
                break;
            }
        }
        close(pipefd[0]);

        if (result.timed_out)
        {
            KillAndReap(pid);
            return result;
        }

        // stdout is closed; give the child the rest of the deadline to exit.
        while (true)
        {
            int status = 0;
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid)
            {
                result.exit_code = DecodeStatus(status);
                return result;
            }
            if (waited == -1 && errno != EINTR)
            {
                std::cerr << "[Process] waitpid failed: " << std::strerror(errno) << "\n";
                return result;
            }
            if (RemainingMs(deadline) == 0)
            {
                result.timed_out = true;
                KillAndReap(pid);
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
}
