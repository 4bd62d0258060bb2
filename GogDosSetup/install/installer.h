#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config_resolver.h"
#include "extractor.h"
#include "journal.h"
#include "layout_locator.h"

struct Installer
{
    struct Options
    {
        std::filesystem::path installerPath;
        std::filesystem::path outputDirectory;   // Empty: derived from the installer name
        Extractor::Tools tools;
        std::vector<std::string> emulatorCandidates;
        std::filesystem::path scratchParent;     // Empty: system temp directory
    };

    // Converts the installer into a playable directory in seven steps, then cleans up.
    // Returns false with the failure recorded in the journal; nothing is printed for it.
    static bool install(const Options &options, Journal &journal, const std::function<bool()> &progressCallback);

    static bool extract(InstallerKind kind, const std::filesystem::path &installerPath, const std::filesystem::path &targetDirectory, const Extractor::Tools &tools, Journal &journal);
    static bool materialize(InstallerKind kind, const Options &options, const LayoutLocator::Layout &layout, const ConfigResolver::ResolvedConfigs &configs, Journal &journal, const std::function<bool()> &progressCallback);
};
