#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace Cleanup
{
    // Leftovers of the DOS installers and the GOG batch launchers.
    constexpr std::array<const char*, 4> JunkFilePatterns = { "TEMP*.$$$", "XMMHAND.DAT", "*.BAT", "*.bat" };

    constexpr std::array<const char*, 6> ArtifactDirectories =
    {
        "__support",
        "__redist",
        "DOSBOX",
        "app",
        "commonappdata",
        "tmp"
    };

    constexpr const char* GogMetadataPattern = "goggame-*";

    /**
     * Remove junk files and installer artifacts from the top level of
     * outputDirectory. Best-effort: failures are logged as warnings and
     * never stop the run.
     * @return Names that were removed, directories suffixed with '/'.
     */
    std::vector<std::string> Run(const std::filesystem::path& outputDirectory);
}
