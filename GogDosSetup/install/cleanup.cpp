#include "cleanup.h"

#include <algorithm>

#include <fnmatch.h>
#include <os/logger.h>

namespace Cleanup
{
    static std::vector<std::filesystem::path> findRegularFiles(const std::filesystem::path& directory, const char* pattern)
    {
        std::vector<std::filesystem::path> matches;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entryEc;
            if (!it->is_regular_file(entryEc))
            {
                continue;
            }

            if (fnmatch(pattern, it->path().filename().c_str(), FNM_PERIOD) == 0)
            {
                matches.push_back(it->path());
            }
        }

        std::sort(matches.begin(), matches.end());
        return matches;
    }

    static void removeFiles(const std::filesystem::path& outputDirectory, const char* pattern, std::vector<std::string>& removed)
    {
        for (const std::filesystem::path& path : findRegularFiles(outputDirectory, pattern))
        {
            std::error_code ec;
            if (std::filesystem::remove(path, ec))
            {
                removed.push_back(path.filename().string());
            }
            else if (ec)
            {
                LOGFN_WARNING("  - Could not remove {}: {}", path.filename().string(), ec.message());
            }
        }
    }

    std::vector<std::string> Run(const std::filesystem::path& outputDirectory)
    {
        std::vector<std::string> removed;

        for (const char* pattern : JunkFilePatterns)
        {
            removeFiles(outputDirectory, pattern, removed);
        }

        for (const char* directory : ArtifactDirectories)
        {
            std::filesystem::path path = outputDirectory / directory;

            std::error_code ec;
            if (std::filesystem::symlink_status(path, ec).type() != std::filesystem::file_type::directory)
            {
                continue;
            }

            std::filesystem::remove_all(path, ec);
            if (ec)
            {
                LOGFN_WARNING("  - Could not remove {}/: {}", directory, ec.message());
                continue;
            }

            removed.push_back(std::string(directory) + "/");
        }

        removeFiles(outputDirectory, GogMetadataPattern, removed);

        return removed;
    }
}
