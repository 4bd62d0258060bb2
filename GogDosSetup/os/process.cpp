#include "process.h"
#include <os/logger.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static volatile sig_atomic_t g_interrupted = 0;
static volatile sig_atomic_t g_activeChild = 0;

static void HandleInterrupt(int signal)
{
    g_interrupted = 1;

    pid_t child = g_activeChild;
    if (child > 0)
        kill(child, signal);
}

static bool IsExecutableFile(const std::filesystem::path& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;

    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> os::process::FindExecutable(std::string_view name)
{
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos)
    {
        std::filesystem::path path(name);
        if (IsExecutableFile(path))
            return path;

        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string_view searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= searchPath.size())
    {
        size_t end = searchPath.find(':', start);
        if (end == std::string_view::npos)
            end = searchPath.size();

        std::string_view directory = searchPath.substr(start, end - start);
        std::filesystem::path candidate = directory.empty() ? std::filesystem::path(".") : std::filesystem::path(directory);
        candidate /= name;

        if (IsExecutableFile(candidate))
            return candidate;

        start = end + 1;
    }

    return std::nullopt;
}

os::process::RunResult os::process::Run(const std::string& program, const std::vector<std::string>& args)
{
    RunResult result;

    int pipeFds[2];
    if (pipe(pipeFds) != 0)
    {
        result.exitCode = ExecFailedStatus;
        result.output = fmt::format("Unable to create pipe: {}\n", std::strerror(errno));
        return result;
    }

    LOGF_UTILITY("Running {} with {} argument(s)", program, args.size());

    pid_t pid = fork();
    if (pid < 0)
    {
        close(pipeFds[0]);
        close(pipeFds[1]);
        result.exitCode = ExecFailedStatus;
        result.output = fmt::format("Unable to start {}: {}\n", program, std::strerror(errno));
        return result;
    }

    if (pid == 0)
    {
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0)
        {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }

        dup2(pipeFds[1], STDOUT_FILENO);
        dup2(pipeFds[1], STDERR_FILENO);
        close(pipeFds[0]);
        close(pipeFds[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const std::string& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));

        argv.push_back(nullptr);

        execvp(program.c_str(), argv.data());

        // Only async-signal-safe calls past this point.
        const char message[] = "exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        _exit(ExecFailedStatus);
    }

    g_activeChild = pid;
    close(pipeFds[1]);

    char buffer[4096];
    while (true)
    {
        ssize_t count = read(pipeFds[0], buffer, sizeof(buffer));
        if (count > 0)
        {
            result.output.append(buffer, size_t(count));
        }
        else if (count == 0)
        {
            break;
        }
        else if (errno != EINTR)
        {
            break;
        }
    }

    close(pipeFds[0]);

    int status = 0;
    pid_t waited;
    do
    {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    g_activeChild = 0;

    if (waited < 0)
        result.exitCode = ExecFailedStatus;
    else if (WIFEXITED(status))
        result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exitCode = 128 + WTERMSIG(status);

    result.interrupted = IsInterrupted();

    LOGF_UTILITY("{} exited with status {}", program, result.exitCode);

    return result;
}

void os::process::InstallInterruptHandler()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = HandleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

bool os::process::IsInterrupted()
{
    return g_interrupted != 0;
}
