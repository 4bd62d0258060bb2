#include "extractor.h"

#include <os/logger.h>
#include <os/process.h>

namespace Extractor
{
    std::vector<std::string> BuildCommand(InstallerKind kind, const std::filesystem::path& installerPath, const std::filesystem::path& targetDir, const Tools& tools)
    {
        if (kind == InstallerKind::LinuxArchive)
        {
            // The ZIP payload is appended to a shell stub; unzip skips the stub.
            return { tools.zipTool, "-o", installerPath.string(), "-d", targetDir.string() };
        }

        return { tools.packageTool, "-e", "-s", "-d", targetDir.string(), installerPath.string() };
    }

    bool IsAcceptedStatus(InstallerKind kind, int exitCode)
    {
        if (kind == InstallerKind::LinuxArchive)
        {
            return exitCode == 0 || exitCode == 1;
        }

        return exitCode == 0;
    }

    ExtractionResult Extract(InstallerKind kind, const std::filesystem::path& installerPath, const std::filesystem::path& targetDir, const Tools& tools)
    {
        ExtractionResult result;

        std::vector<std::string> command = BuildCommand(kind, installerPath, targetDir, tools);
        result.toolName = command.front();

        std::error_code ec;
        std::filesystem::create_directories(targetDir, ec);
        if (ec)
        {
            result.output = fmt::format("Failed to create extraction directory {}: {}\n", targetDir.string(), ec.message());
            return result;
        }

        std::vector<std::string> args(command.begin() + 1, command.end());
        os::process::RunResult runResult = os::process::Run(command.front(), args);

        result.exitCode = runResult.exitCode;
        result.output = std::move(runResult.output);
        result.interrupted = runResult.interrupted;
        result.success = !result.interrupted && IsAcceptedStatus(kind, result.exitCode);

        if (result.success && result.exitCode != 0)
        {
            LOGF_UTILITY("{} finished with warnings (status {})", result.toolName, result.exitCode);
        }

        return result;
    }
}
