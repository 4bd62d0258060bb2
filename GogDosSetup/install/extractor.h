#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "installer_classifier.h"

namespace Extractor
{
    struct Tools
    {
        std::string zipTool = "unzip";
        std::string packageTool = "innoextract";
    };

    struct ExtractionResult
    {
        bool success = false;
        bool interrupted = false;
        int exitCode = -1;
        std::string toolName;
        std::string output;
    };

    /**
     * Program and arguments used to unpack the installer into targetDir.
     */
    std::vector<std::string> BuildCommand(InstallerKind kind, const std::filesystem::path& installerPath, const std::filesystem::path& targetDir, const Tools& tools);

    /**
     * unzip reports 1 for archives with leading stub bytes, which is the
     * normal case for the self-extracting Linux installers.
     */
    bool IsAcceptedStatus(InstallerKind kind, int exitCode);

    ExtractionResult Extract(InstallerKind kind, const std::filesystem::path& installerPath, const std::filesystem::path& targetDir, const Tools& tools);
}
