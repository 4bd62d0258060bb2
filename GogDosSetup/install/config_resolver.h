#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "journal.h"

namespace ConfigResolver
{
    // Scanned in this order; a file matching both patterns is visited twice.
    constexpr std::array<const char*, 2> ConfigPatterns = { "dosbox*.conf", "*.conf" };

    // Substring marking a config meant for launching the game directly.
    constexpr const char* SingleLaunchMarker = "single";

    struct CandidateConfig
    {
        std::filesystem::path path;
        bool hasDisplaySection = false;
        bool hasStartupSection = false;
        bool hasNonEmptyStartupSection = false;
    };

    struct ResolvedConfigs
    {
        std::optional<std::filesystem::path> settingsConfig;
        std::filesystem::path autoexecConfig;
    };

    /**
     * Regular files directly inside configRoot matching the given glob,
     * sorted by name. Hidden files are not matched, as in a shell glob.
     */
    std::vector<std::filesystem::path> FindMatching(const std::filesystem::path& configRoot, const char* pattern);

    /**
     * All candidates in scan order: dosbox*.conf then *.conf.
     * Files that cannot be read are skipped with a warning.
     */
    std::vector<CandidateConfig> ScanCandidates(const std::filesystem::path& configRoot);

    bool InspectCandidate(const std::filesystem::path& path, CandidateConfig& candidate);

    /**
     * Pick the settings and autoexec configs out of scanned candidates.
     * Settings: the last candidate with an [sdl] section.
     * Autoexec: the first candidate with startup commands, overridden by a
     * later one whose name contains "single"; failing that the first one
     * with an [autoexec] header at all.
     */
    std::optional<ResolvedConfigs> Choose(const std::vector<CandidateConfig>& candidates);

    bool Resolve(const std::filesystem::path& configRoot, ResolvedConfigs& configs, Journal& journal);
}
