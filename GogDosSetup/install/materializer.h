#pragma once

#include <array>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "installer_classifier.h"
#include "journal.h"

namespace Materializer
{
    constexpr const char* SettingsConfigName = "dosbox_settings.conf";
    constexpr const char* AutoexecConfigName = "dosbox_autoexec.conf";
    constexpr const char* DisplayConfigName = "display.conf";
    constexpr const char* LauncherName = "play.sh";
    constexpr const char* CdAudioImageName = "game.ins";

    // Top-level installer internals never copied from a Windows package.
    constexpr std::array<const char*, 6> WindowsExcludedNames =
    {
        "__support",
        "__redist",
        "DOSBOX",
        "app",
        "commonappdata",
        "tmp"
    };

    constexpr std::array<const char*, 2> GameConfigPatterns = { "*.CFG", "*.cfg" };

    extern const std::string_view DisplayConfigContent;

    struct AutoexecPatches
    {
        bool cdAudioImage = false;
        bool flatMountPaths = false;
    };

    bool IsExcludedEntry(const std::string& name);

    /**
     * Copy everything under gameData into outputDirectory, creating it.
     * Existing files are overwritten, symlinks are copied as symlinks.
     * progressCallback is polled after every entry; returning false cancels.
     */
    bool CopyGameData(InstallerKind kind, const std::filesystem::path& gameData, const std::filesystem::path& outputDirectory, Journal& journal, const std::function<bool()>& progressCallback);

    bool InstallSettingsConfig(const std::filesystem::path& source, const std::filesystem::path& outputDirectory, Journal& journal, bool& sharpOutputApplied);

    bool InstallAutoexecConfig(const std::filesystem::path& source, const std::filesystem::path& outputDirectory, Journal& journal, AutoexecPatches& patches);

    /**
     * Copy game-specific *.CFG / *.cfg files (sound card setup and the like)
     * that live next to the DOSBox configs in Windows packages.
     */
    bool CopyGameConfigs(const std::filesystem::path& configRoot, const std::filesystem::path& outputDirectory, Journal& journal, std::vector<std::string>& copiedNames);

    bool WriteDisplayConfig(const std::filesystem::path& outputDirectory, Journal& journal);

    std::string BuildLauncherScript(bool hasSettingsConfig, const std::vector<std::string>& emulatorCandidates);

    bool WriteLauncher(const std::filesystem::path& outputDirectory, bool hasSettingsConfig, const std::vector<std::string>& emulatorCandidates, Journal& journal);
}
