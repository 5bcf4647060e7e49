#include "ProcessRunner.hpp"
#include <plog/Log.h>
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char **environ;

namespace CapBridge {

bool runProcess(const std::string &program, const std::vector<std::string> &args, int &outExitCode, std::string *outError)
{
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &a : args) argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    PLOGD << "spawning " << program << " with " << args.size() << " argument(s)";

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
    {
        if (outError) *outError = "failed to spawn " + program + ": " + std::strerror(rc);
        return false;
    }

    int status = 0;
    pid_t w;
    do
    {
        w = waitpid(pid, &status, 0);
    } while (w == -1 && errno == EINTR);

    if (w == -1)
    {
        if (outError) *outError = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }
    if (!WIFEXITED(status))
    {
        if (outError) *outError = "process didn't return exit code";
        return false;
    }
    outExitCode = WEXITSTATUS(status);
    return true;
}

} // namespace CapBridge
