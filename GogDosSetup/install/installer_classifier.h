#pragma once

#include <filesystem>
#include <string>

#include "journal.h"

enum class InstallerKind
{
    Unknown,
    LinuxArchive,   // .sh stub with an appended ZIP payload
    WindowsPackage  // .exe Inno Setup package
};

namespace InstallerClassifier
{
    /**
     * Resolve the installer to an absolute path and pick the extraction
     * strategy from its suffix. Fails with a usage error when the file is
     * missing or the suffix is neither ".sh" nor ".exe".
     */
    bool Classify(const std::filesystem::path& input, std::filesystem::path& installerPath, InstallerKind& kind, Journal& journal);

    /**
     * Windows packages need the package extraction tool on this system.
     * Linux archives have no precondition here.
     */
    bool CheckEnvironment(InstallerKind kind, const std::string& packageTool, Journal& journal);

    /**
     * Turn an installer file name into a PascalCase folder name, e.g.
     * "setup_ultima_underworld_en_1.0_(22308).exe" -> "UltimaUnderworld".
     * Never returns an empty string.
     */
    std::string DeriveOutputName(const std::filesystem::path& installerPath);

    /**
     * Output directory for the run: the caller's choice made absolute,
     * or the derived name next to the installer.
     */
    std::filesystem::path ResolveOutputDirectory(const std::filesystem::path& requested, const std::filesystem::path& installerPath);

    const char* GetKindName(InstallerKind kind);
}
