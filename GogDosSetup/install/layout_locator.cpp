#include "layout_locator.h"

#include <algorithm>

#include <os/logger.h>

namespace LayoutLocator
{
    constexpr int LinuxListingDepth = 5;
    constexpr int WindowsListingDepth = 3;
    constexpr size_t ListingLimit = 30;

    static bool isDirectory(const std::filesystem::path& path)
    {
        std::error_code ec;
        return std::filesystem::is_directory(path, ec);
    }

    static void collectDirectories(const std::filesystem::path& directory, int depth, int maxDepth, size_t maxEntries, std::vector<std::string>& entries)
    {
        if (entries.size() >= maxEntries)
        {
            return;
        }

        entries.push_back(directory.string());

        if (depth >= maxDepth)
        {
            return;
        }

        std::vector<std::filesystem::path> children;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code statusEc;
            if (it->symlink_status(statusEc).type() == std::filesystem::file_type::directory)
            {
                children.push_back(it->path());
            }
        }

        std::sort(children.begin(), children.end());

        for (const std::filesystem::path& child : children)
        {
            collectDirectories(child, depth + 1, maxDepth, maxEntries, entries);
        }
    }

    std::vector<std::string> ListDirectories(const std::filesystem::path& root, int maxDepth, size_t maxEntries)
    {
        std::vector<std::string> entries;
        if (isDirectory(root))
        {
            collectDirectories(root, 0, maxDepth, maxEntries, entries);
        }

        return entries;
    }

    static bool locateLinux(const std::filesystem::path& extractionRoot, const std::filesystem::path& listingRoot, Layout& layout, Journal& journal)
    {
        for (const char* candidate : LinuxGameDataCandidates)
        {
            std::filesystem::path path = extractionRoot / candidate;
            if (!isDirectory(path))
            {
                continue;
            }

            layout.gameData = path;

            std::filesystem::path configRoot = extractionRoot / LinuxConfigRoot;
            layout.configRoot = isDirectory(configRoot) ? configRoot : path.parent_path();
            return true;
        }

        journal.lastResult = Journal::Result::GameDataMissing;
        journal.lastErrorMessage = "Could not find game data";
        journal.lastErrorDetails = { "Extracted contents:" };

        std::vector<std::string> listing = ListDirectories(listingRoot, LinuxListingDepth, ListingLimit);
        journal.lastErrorDetails.insert(journal.lastErrorDetails.end(), listing.begin(), listing.end());
        return false;
    }

    static bool locateWindows(const std::filesystem::path& extractionRoot, Layout& layout, Journal& journal)
    {
        // innoextract lays the game out flat; the GOG launcher files live in __support.
        layout.gameData = extractionRoot;
        layout.configRoot = extractionRoot / WindowsConfigRoot;

        if (!isDirectory(layout.configRoot))
        {
            journal.lastResult = Journal::Result::ConfigRootMissing;
            journal.lastErrorMessage = fmt::format("Expected {}/ not found", WindowsConfigRoot);
            journal.lastErrorDetails = { "Extracted contents:" };

            std::vector<std::string> listing = ListDirectories(extractionRoot, WindowsListingDepth, ListingLimit);
            journal.lastErrorDetails.insert(journal.lastErrorDetails.end(), listing.begin(), listing.end());
            return false;
        }

        return true;
    }

    bool Locate(InstallerKind kind, const std::filesystem::path& extractionRoot, const std::filesystem::path& listingRoot, Layout& layout, Journal& journal)
    {
        layout = Layout();
        layout.extractionRoot = extractionRoot;

        bool located = kind == InstallerKind::WindowsPackage
            ? locateWindows(extractionRoot, layout, journal)
            : locateLinux(extractionRoot, listingRoot, layout, journal);

        if (located)
        {
            LOGF_UTILITY("Game data {} config root {}", layout.gameData.string(), layout.configRoot.string());
        }

        return located;
    }
}
