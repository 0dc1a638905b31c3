#include "tool_runner.hpp"

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#    include <process.h>
#else
#    include <spawn.h>
#    include <sys/wait.h>
#    include <unistd.h>

extern char** environ;
#endif

namespace linkpack
{
    std::string quoteIfNeeded(const std::string& value)
    {
        if (!value.empty() && value.find_first_of(" \"\t") == std::string::npos)
        {
            return value;
        }

        std::string quoted{"\""};
        for (char ch : value)
        {
            if (ch == '\\' || ch == '"')
            {
                quoted.push_back('\\');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('"');
        return quoted;
    }

    std::string formatInvocation(const ToolInvocation& invocation)
    {
        std::string line = quoteIfNeeded(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            line.push_back(' ');
            line += quoteIfNeeded(argument);
        }
        return line;
    }

    void printInvocation(std::ostream& stream, const ToolInvocation& invocation)
    {
        stream << "[linkpack] tool: " << quoteIfNeeded(invocation.executable.string()) << "\n";
        for (const auto& argument : invocation.arguments)
        {
            stream << "[linkpack]   " << quoteIfNeeded(argument) << "\n";
        }
    }

    ToolRunResult SpawnToolRunner::run(const ToolInvocation& invocation)
    {
        ToolRunResult result;

        std::vector<std::string> argumentStorage;
        argumentStorage.reserve(invocation.arguments.size() + 1);
        argumentStorage.push_back(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            argumentStorage.push_back(argument);
        }

        std::vector<char*> argv;
        argv.reserve(argumentStorage.size() + 1);
        for (auto& entry : argumentStorage)
        {
            argv.push_back(entry.data());
        }
        argv.push_back(nullptr);

#if defined(_WIN32)
        int exitCode = _spawnvp(_P_WAIT, argv[0], argv.data());
        if (exitCode == -1)
        {
            result.errorMessage = "failed to launch '" + invocation.executable.string() + "': " + std::strerror(errno);
            return result;
        }
        result.launched = true;
        result.exitCode = exitCode;
        return result;
#else
        pid_t pid = 0;
        int spawnResult = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
        if (spawnResult != 0)
        {
            result.errorMessage = "failed to launch '" + invocation.executable.string() + "': " + std::strerror(spawnResult);
            return result;
        }
        result.launched = true;

        int status = 0;
        while (waitpid(pid, &status, 0) == -1)
        {
            if (errno != EINTR)
            {
                result.exitCode = 1;
                result.errorMessage = "failed to wait for '" + invocation.executable.string() + "': " + std::strerror(errno);
                return result;
            }
        }

        if (WIFEXITED(status))
        {
            result.exitCode = WEXITSTATUS(status);
            return result;
        }

        if (WIFSIGNALED(status))
        {
            result.terminatingSignal = WTERMSIG(status);
            result.exitCode = 128 + result.terminatingSignal;
            result.errorMessage = "'" + invocation.executable.string() + "' terminated by signal "
                + std::to_string(result.terminatingSignal) + ".";
            return result;
        }

        result.exitCode = status;
        return result;
#endif
    }
} // namespace linkpack
