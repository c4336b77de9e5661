#include "Subprocess.hpp"
#include "Log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace net_scan::common
{
    namespace
    {
        constexpr std::size_t MAX_OUTPUT = 1 << 20;
        constexpr int EXEC_FAILED = 127;

        // The parent's environment with LC_ALL forced to C. Built before fork.
        std::vector<std::string> ChildEnvironment()
        {
            std::vector<std::string> env;
            for (char **entry = environ; entry && *entry; ++entry)
            {
                if (std::strncmp(*entry, "LC_ALL=", 7) != 0)
                    env.emplace_back(*entry);
            }
            env.emplace_back("LC_ALL=C");
            return env;
        }

        void ReapChild(pid_t pid, int &status)
        {
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
        }
    }

    CommandResult SystemCommandRunner::Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
    {
        CommandResult result;
        if (argv.empty())
            return result;

        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0)
        {
            Log(LogLevel::Debug, "Subprocess") << "pipe failed: " << std::strerror(errno);
            return result;
        }

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &a : argv)
            args.push_back(const_cast<char *>(a.c_str()));
        args.push_back(nullptr);

        const auto env_strings = ChildEnvironment();
        std::vector<char *> env;
        env.reserve(env_strings.size() + 1);
        for (const auto &e : env_strings)
            env.push_back(const_cast<char *>(e.c_str()));
        env.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            close(fds[0]);
            close(fds[1]);
            Log(LogLevel::Debug, "Subprocess") << "fork failed: " << std::strerror(errno);
            return result;
        }

        if (pid == 0)
        {
            dup2(fds[1], STDOUT_FILENO);
            dup2(fds[1], STDERR_FILENO);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
                dup2(devnull, STDIN_FILENO);
            execvpe(args[0], args.data(), env.data());
            _exit(EXEC_FAILED);
        }

        close(fds[1]);

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        char buffer[4096];
        bool eof = false;

        while (!eof)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                result.timed_out = true;
                break;
            }

            pollfd pfd{};
            pfd.fd = fds[0];
            pfd.events = POLLIN;
            int r = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (r == 0)
                continue;

            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0)
            {
                if (result.output.size() < MAX_OUTPUT)
                    result.output.append(buffer, static_cast<std::size_t>(n));
            }
            else if (n == 0 || errno != EINTR)
            {
                eof = true;
            }
        }

        close(fds[0]);

        int status = 0;
        if (result.timed_out)
        {
            kill(pid, SIGKILL);
            ReapChild(pid, status);
            result.launched = true;
            return result;
        }

        ReapChild(pid, status);
        if (WIFEXITED(status))
        {
            result.exit_code = WEXITSTATUS(status);
            result.launched = result.exit_code != EXEC_FAILED;
        }
        else
        {
            result.launched = true;
            result.exit_code = -1;
        }
        return result;
    }

    std::shared_ptr<CommandRunner> DefaultCommandRunner()
    {
        static std::shared_ptr<CommandRunner> runner = std::make_shared<SystemCommandRunner>();
        return runner;
    }
}
