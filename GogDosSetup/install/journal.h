#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Journal
{
    enum class Result
    {
        Success,
        Cancelled,
        InstallerMissing,
        UnsupportedInstaller,
        ToolMissing,
        ScratchCreationFailed,
        ExtractionFailed,
        GameDataMissing,
        ConfigRootMissing,
        AutoexecMissing,
        DirectoryCreationFailed,
        FileReadFailed,
        FileCopyFailed,
        FileWriteFailed
    };

    enum class Category
    {
        None,
        Usage,
        Environment,
        Extraction,
        Structural,
        Content,
        FileSystem,
        Interrupted
    };

    uint64_t progressCounter = 0;
    uint64_t filesCopied = 0;
    std::filesystem::path outputDirectory;
    Result lastResult = Result::Success;
    std::string lastErrorMessage;

    // Extra lines printed below the error message: captured tool output,
    // directory listings, install hints.
    std::vector<std::string> lastErrorDetails;

    static Category GetCategory(Result result)
    {
        switch (result)
        {
        case Result::Success:
            return Category::None;
        case Result::Cancelled:
            return Category::Interrupted;
        case Result::InstallerMissing:
        case Result::UnsupportedInstaller:
            return Category::Usage;
        case Result::ToolMissing:
            return Category::Environment;
        case Result::ScratchCreationFailed:
        case Result::ExtractionFailed:
            return Category::Extraction;
        case Result::GameDataMissing:
        case Result::ConfigRootMissing:
            return Category::Structural;
        case Result::AutoexecMissing:
            return Category::Content;
        default:
            return Category::FileSystem;
        }
    }
};
