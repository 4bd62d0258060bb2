#pragma once

#include <filesystem>
#include <string>

#define USER_DIRECTORY "GogDosSetup"
#define CONFIG_FILE_NAME "config.json"
#define CONFIG_PATH_ENV "GOG_DOS_SETUP_CONFIG"

/**
 * Path resolution for GogDosSetup's own files.
 *
 * Platform-specific config directories:
 * - Linux:   $XDG_CONFIG_HOME/GogDosSetup/ or ~/.config/GogDosSetup/
 * - macOS:   ~/Library/Application Support/GogDosSetup/
 */
namespace PlatformPaths
{
    /**
     * Get the directory holding the user configuration.
     * The directory is not created.
     */
    std::filesystem::path GetConfigDirectory();

    /**
     * Get the configuration file path.
     * The GOG_DOS_SETUP_CONFIG environment variable takes precedence.
     */
    std::filesystem::path GetConfigPath();

    /**
     * Get the directory scratch trees are created in.
     * Returns: override if non-empty, otherwise $TMPDIR or the system default.
     */
    std::filesystem::path GetTempDirectory(const std::filesystem::path& overrideDirectory);

    /**
     * Get platform name as string ("Linux", "macOS").
     */
    std::string GetPlatformName();
}
