#include "materializer.h"
#include "config_resolver.h"
#include "dosbox_config.h"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <fmt/ranges.h>
#include <os/logger.h>

namespace Materializer
{
    static const std::string GogMetadataPrefix = "goggame-";
    static const std::string InstallerBlobSuffix = ".bin";
    static const std::string DosboxConfigPrefix = "dosbox";
    static const std::vector<std::string> DefaultEmulators = { "dosbox-staging", "dosbox" };

    const std::string_view DisplayConfigContent =
        "# Display settings - loaded after game config to override display options\n"
        "# Edit this file to change window size, scaling, fullscreen, etc.\n"
        "\n"
        "[sdl]\n"
        "fullscreen=false\n"
        "windowresolution=1280x960\n"
        "# openglnb = OpenGL with no bilinear filtering = sharp pixels\n"
        "output=openglnb\n"
        "\n"
        "[render]\n"
        "# normal2x = simple pixel doubling (sharp, no effects)\n"
        "# Other options: normal3x, hq2x, hq3x, none\n"
        "scaler=normal2x\n"
        "aspect=true\n";

    static std::string fromPath(const std::filesystem::path &path)
    {
        return path.string();
    }

    static bool isSafeCommandName(const std::string &name)
    {
        if (name.empty())
        {
            return false;
        }

        return std::all_of(name.begin(), name.end(), [](char c)
        {
            return std::isalnum((unsigned char)(c)) || c == '.' || c == '_' || c == '-' || c == '+' || c == '/';
        });
    }

    static bool writeTextFile(const std::filesystem::path &path, std::string_view content, Journal &journal)
    {
        std::ofstream outStream(path, std::ios::binary | std::ios::trunc);
        if (!outStream.is_open())
        {
            journal.lastResult = Journal::Result::FileWriteFailed;
            journal.lastErrorMessage = fmt::format("Failed to create file at {}.", fromPath(path));
            return false;
        }

        outStream.write(content.data(), content.size());
        outStream.close();
        if (outStream.fail())
        {
            journal.lastResult = Journal::Result::FileWriteFailed;
            journal.lastErrorMessage = fmt::format("Failed to write file at {}.", fromPath(path));
            return false;
        }

        return true;
    }

    static bool copyEntry(const std::filesystem::path &source, const std::filesystem::path &target, Journal &journal, const std::function<bool()> &progressCallback)
    {
        std::error_code ec;
        std::filesystem::file_status status = std::filesystem::symlink_status(source, ec);
        if (ec)
        {
            journal.lastResult = Journal::Result::FileReadFailed;
            journal.lastErrorMessage = fmt::format("Failed to read {}: {}", fromPath(source), ec.message());
            return false;
        }

        if (std::filesystem::is_symlink(status))
        {
            // A previous run may have left the link behind; replace it.
            std::error_code removeEc;
            if (std::filesystem::is_symlink(std::filesystem::symlink_status(target, removeEc)))
            {
                std::filesystem::remove(target, removeEc);
            }

            std::filesystem::copy_symlink(source, target, ec);
        }
        else if (std::filesystem::is_directory(status))
        {
            std::error_code targetEc;
            if (!std::filesystem::is_directory(target, targetEc) && !std::filesystem::create_directories(target, ec))
            {
                journal.lastResult = Journal::Result::DirectoryCreationFailed;
                journal.lastErrorMessage = fmt::format("Unable to create directory at {}: {}", fromPath(target), ec.message());
                return false;
            }

            std::filesystem::directory_iterator it(source, ec);
            for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec))
            {
                if (!copyEntry(it->path(), target / it->path().filename(), journal, progressCallback))
                {
                    return false;
                }
            }

            if (ec)
            {
                journal.lastResult = Journal::Result::FileReadFailed;
                journal.lastErrorMessage = fmt::format("Failed to list {}: {}", fromPath(source), ec.message());
                return false;
            }

            return true;
        }
        else if (std::filesystem::is_regular_file(status))
        {
            std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec);
            if (!ec)
            {
                std::error_code sizeEc;
                uintmax_t fileSize = std::filesystem::file_size(target, sizeEc);
                journal.progressCounter += sizeEc ? 0 : fileSize;
                journal.filesCopied++;
            }
        }
        else
        {
            LOGF_UTILITY("Skipping special file {}", fromPath(source));
        }

        if (ec)
        {
            journal.lastResult = Journal::Result::FileCopyFailed;
            journal.lastErrorMessage = fmt::format("Failed to copy {} to {}: {}", fromPath(source), fromPath(target), ec.message());
            return false;
        }

        if (!progressCallback())
        {
            journal.lastResult = Journal::Result::Cancelled;
            journal.lastErrorMessage = "Installation was cancelled.";
            return false;
        }

        return true;
    }

    bool IsExcludedEntry(const std::string &name)
    {
        for (const char *excluded : WindowsExcludedNames)
        {
            if (name == excluded)
            {
                return true;
            }
        }

        return name.starts_with(GogMetadataPrefix) || name.ends_with(InstallerBlobSuffix);
    }

    bool CopyGameData(InstallerKind kind, const std::filesystem::path &gameData, const std::filesystem::path &outputDirectory, Journal &journal, const std::function<bool()> &progressCallback)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(outputDirectory, ec) && !std::filesystem::create_directories(outputDirectory, ec))
        {
            journal.lastResult = Journal::Result::DirectoryCreationFailed;
            journal.lastErrorMessage = "Unable to create directory at " + fromPath(outputDirectory);
            return false;
        }

        std::vector<std::filesystem::path> entries;
        for (std::filesystem::directory_iterator it(gameData, ec), end; !ec && it != end; it.increment(ec))
        {
            entries.push_back(it->path());
        }

        if (ec)
        {
            journal.lastResult = Journal::Result::FileReadFailed;
            journal.lastErrorMessage = fmt::format("Failed to list {}: {}", fromPath(gameData), ec.message());
            return false;
        }

        std::sort(entries.begin(), entries.end());

        for (const std::filesystem::path &entry : entries)
        {
            const std::string name = entry.filename().string();
            if (kind == InstallerKind::WindowsPackage && IsExcludedEntry(name))
            {
                LOGF_UTILITY("Skipping installer entry {}", name);
                continue;
            }

            if (!copyEntry(entry, outputDirectory / name, journal, progressCallback))
            {
                return false;
            }
        }

        return true;
    }

    bool InstallSettingsConfig(const std::filesystem::path &source, const std::filesystem::path &outputDirectory, Journal &journal, bool &sharpOutputApplied)
    {
        std::vector<std::string> lines;
        if (!DosboxConfig::ReadLines(source, lines))
        {
            journal.lastResult = Journal::Result::FileReadFailed;
            journal.lastErrorMessage = fmt::format("Failed to read file {}.", fromPath(source));
            return false;
        }

        sharpOutputApplied = DosboxConfig::ApplySharpOutput(lines);

        return writeTextFile(outputDirectory / SettingsConfigName, DosboxConfig::JoinLines(lines), journal);
    }

    bool InstallAutoexecConfig(const std::filesystem::path &source, const std::filesystem::path &outputDirectory, Journal &journal, AutoexecPatches &patches)
    {
        std::vector<std::string> lines;
        if (!DosboxConfig::ReadLines(source, lines))
        {
            journal.lastResult = Journal::Result::FileReadFailed;
            journal.lastErrorMessage = fmt::format("Failed to read file {}.", fromPath(source));
            return false;
        }

        patches = AutoexecPatches();

        std::error_code ec;
        if (DosboxConfig::Contains(lines, "game.gog") && std::filesystem::exists(outputDirectory / CdAudioImageName, ec))
        {
            patches.cdAudioImage = DosboxConfig::ApplyCdAudioImage(lines);
        }

        patches.flatMountPaths = DosboxConfig::ApplyFlatMountPaths(lines);

        return writeTextFile(outputDirectory / AutoexecConfigName, DosboxConfig::JoinLines(lines), journal);
    }

    bool CopyGameConfigs(const std::filesystem::path &configRoot, const std::filesystem::path &outputDirectory, Journal &journal, std::vector<std::string> &copiedNames)
    {
        for (const char *pattern : GameConfigPatterns)
        {
            for (const std::filesystem::path &path : ConfigResolver::FindMatching(configRoot, pattern))
            {
                const std::string name = path.filename().string();
                if (name.starts_with(DosboxConfigPrefix))
                {
                    continue;
                }

                std::error_code ec;
                std::filesystem::copy_file(path, outputDirectory / name, std::filesystem::copy_options::overwrite_existing, ec);
                if (ec)
                {
                    journal.lastResult = Journal::Result::FileCopyFailed;
                    journal.lastErrorMessage = fmt::format("Failed to copy {}: {}", fromPath(path), ec.message());
                    return false;
                }

                copiedNames.push_back(name);
            }
        }

        return true;
    }

    bool WriteDisplayConfig(const std::filesystem::path &outputDirectory, Journal &journal)
    {
        return writeTextFile(outputDirectory / DisplayConfigName, DisplayConfigContent, journal);
    }

    std::string BuildLauncherScript(bool hasSettingsConfig, const std::vector<std::string> &emulatorCandidates)
    {
        std::vector<std::string> emulators;
        for (const std::string &candidate : emulatorCandidates)
        {
            if (isSafeCommandName(candidate))
            {
                emulators.push_back(candidate);
            }
            else
            {
                LOGFN_WARNING("Ignoring emulator name that is unsafe in a shell script: {}", candidate);
            }
        }

        if (emulators.empty())
        {
            emulators = DefaultEmulators;
        }

        std::string script =
            "#!/bin/bash\n"
            "SCRIPT_DIR=\"$(cd \"$(dirname \"$0\")\" && pwd)\"\n"
            "cd \"$SCRIPT_DIR\"\n"
            "\n";

        for (size_t i = 0; i < emulators.size(); i++)
        {
            script += fmt::format("{} command -v {} &> /dev/null; then\n", i == 0 ? "if" : "elif", emulators[i]);
            script += fmt::format("    DOSBOX=\"{}\"\n", emulators[i]);
        }

        // The install suggestion names the candidates from last to first.
        std::vector<std::string> suggested(emulators.rbegin(), emulators.rend());

        script += fmt::format(
            "else\n"
            "    echo \"Error: DOSBox not found. Install {}.\"\n"
            "    exit 1\n"
            "fi\n"
            "\n"
            "echo \"Starting game with $DOSBOX...\"\n",
            fmt::join(suggested, " or "));

        if (hasSettingsConfig)
        {
            script += fmt::format(
                "# Load configs in order: settings, autoexec, then display overrides\n"
                "exec $DOSBOX -conf \"$SCRIPT_DIR/{}\" \\\n"
                "             -conf \"$SCRIPT_DIR/{}\" \\\n"
                "             -conf \"$SCRIPT_DIR/{}\"\n",
                SettingsConfigName, AutoexecConfigName, DisplayConfigName);
        }
        else
        {
            script += fmt::format(
                "# Load autoexec config, then display settings\n"
                "exec $DOSBOX -conf \"$SCRIPT_DIR/{}\" \\\n"
                "             -conf \"$SCRIPT_DIR/{}\"\n",
                AutoexecConfigName, DisplayConfigName);
        }

        return script;
    }

    bool WriteLauncher(const std::filesystem::path &outputDirectory, bool hasSettingsConfig, const std::vector<std::string> &emulatorCandidates, Journal &journal)
    {
        const std::filesystem::path launcherPath = outputDirectory / LauncherName;
        if (!writeTextFile(launcherPath, BuildLauncherScript(hasSettingsConfig, emulatorCandidates), journal))
        {
            return false;
        }

        using std::filesystem::perms;

        std::error_code ec;
        std::filesystem::permissions(launcherPath,
            perms::owner_all | perms::group_read | perms::group_exec | perms::others_read | perms::others_exec,
            std::filesystem::perm_options::replace, ec);

        if (ec)
        {
            journal.lastResult = Journal::Result::FileWriteFailed;
            journal.lastErrorMessage = fmt::format("Failed to mark {} executable: {}", fromPath(launcherPath), ec.message());
            return false;
        }

        return true;
    }
}
