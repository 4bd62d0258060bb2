#include "platform_paths.h"

#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

namespace PlatformPaths
{
    static std::filesystem::path GetHomeDirectory()
    {
        const char* home = std::getenv("HOME");
        if (home && home[0] != '\0')
            return std::filesystem::path(home);

        struct passwd* pw = getpwuid(getuid());
        if (pw)
            return std::filesystem::path(pw->pw_dir);

        return std::filesystem::path(".");
    }

    std::filesystem::path GetConfigDirectory()
    {
#if defined(__APPLE__)
        // macOS: ~/Library/Application Support/GogDosSetup/
        return GetHomeDirectory() / "Library" / "Application Support" / USER_DIRECTORY;
#else
        // Check XDG_CONFIG_HOME first (XDG Base Directory Specification)
        const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
        if (xdgConfig && xdgConfig[0] != '\0')
        {
            return std::filesystem::path(xdgConfig) / USER_DIRECTORY;
        }

        // Fall back to ~/.config
        return GetHomeDirectory() / ".config" / USER_DIRECTORY;
#endif
    }

    std::filesystem::path GetConfigPath()
    {
        const char* configOverride = std::getenv(CONFIG_PATH_ENV);
        if (configOverride && configOverride[0] != '\0')
        {
            return std::filesystem::path(configOverride);
        }

        return GetConfigDirectory() / CONFIG_FILE_NAME;
    }

    std::filesystem::path GetTempDirectory(const std::filesystem::path& overrideDirectory)
    {
        if (!overrideDirectory.empty())
        {
            return overrideDirectory;
        }

        std::error_code ec;
        std::filesystem::path tempDirectory = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            return std::filesystem::path("/tmp");
        }

        return tempDirectory;
    }

    std::string GetPlatformName()
    {
#if defined(__APPLE__)
        return "macOS";
#else
        return "Linux";
#endif
    }
}
