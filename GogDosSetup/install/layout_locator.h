#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>

#include "installer_classifier.h"
#include "journal.h"

namespace LayoutLocator
{
    // Linux installers use varying layouts; first existing directory wins.
    constexpr std::array<const char*, 5> LinuxGameDataCandidates =
    {
        "data/noarch/game/data",
        "data/noarch/data",
        "data/noarch/game",
        "game/data",
        "game"
    };

    constexpr const char* LinuxConfigRoot = "data/noarch";
    constexpr const char* WindowsConfigRoot = "__support/app";

    struct Layout
    {
        std::filesystem::path extractionRoot;
        std::filesystem::path gameData;
        std::filesystem::path configRoot;
    };

    /**
     * Find the game data directory and the directory holding the DOSBox
     * configs inside an extracted installer.
     * @param extractionRoot Directory the extraction tool wrote to
     * @param listingRoot Directory listed in the error details on failure
     */
    bool Locate(InstallerKind kind, const std::filesystem::path& extractionRoot, const std::filesystem::path& listingRoot, Layout& layout, Journal& journal);

    /**
     * Sorted directory listing used for diagnostics, root included.
     * Depth 1 means the immediate children of root.
     */
    std::vector<std::string> ListDirectories(const std::filesystem::path& root, int maxDepth, size_t maxEntries);
}
