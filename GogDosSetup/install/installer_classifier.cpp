#include "installer_classifier.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/format.h>
#include <os/logger.h>
#include <os/process.h>

static const std::string LinuxArchiveSuffix = ".sh";
static const std::string WindowsPackageSuffix = ".exe";

static std::filesystem::path makeAbsolute(const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::path absolutePath = std::filesystem::absolute(path, ec);
    if (ec)
    {
        absolutePath = path;
    }

    std::filesystem::path resolvedPath = std::filesystem::weakly_canonical(absolutePath, ec);
    if (ec)
    {
        return absolutePath.lexically_normal();
    }

    return resolvedPath;
}

static bool isWordCharacter(char c)
{
    return std::isalnum((unsigned char)(c)) || c == '_';
}

static std::string capitalizeWords(const std::string &str)
{
    std::string result = str;
    for (size_t i = 0; i < result.size(); i++)
    {
        bool wordStart = isWordCharacter(result[i]) && (i == 0 || !isWordCharacter(result[i - 1]));
        if (wordStart && result[i] >= 'a' && result[i] <= 'z')
        {
            result[i] = char(result[i] - 'a' + 'A');
        }
    }

    return result;
}

static std::string removeCharacter(std::string str, char c)
{
    str.erase(std::remove(str.begin(), str.end(), c), str.end());
    return str;
}

bool InstallerClassifier::Classify(const std::filesystem::path &input, std::filesystem::path &installerPath, InstallerKind &kind, Journal &journal)
{
    kind = InstallerKind::Unknown;
    installerPath = makeAbsolute(input);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(installerPath, ec))
    {
        journal.lastResult = Journal::Result::InstallerMissing;
        journal.lastErrorMessage = fmt::format("File not found: {}", input.string());
        return false;
    }

    const std::string fileName = installerPath.filename().string();
    if (fileName.ends_with(LinuxArchiveSuffix))
    {
        kind = InstallerKind::LinuxArchive;
    }
    else if (fileName.ends_with(WindowsPackageSuffix))
    {
        kind = InstallerKind::WindowsPackage;
    }
    else
    {
        journal.lastResult = Journal::Result::UnsupportedInstaller;
        journal.lastErrorMessage = "Unsupported installer type. Use .sh or .exe";
        return false;
    }

    LOGF_UTILITY("{} classified as {}", installerPath.string(), GetKindName(kind));

    return true;
}

bool InstallerClassifier::CheckEnvironment(InstallerKind kind, const std::string &packageTool, Journal &journal)
{
    if (kind != InstallerKind::WindowsPackage)
    {
        return true;
    }

    if (!os::process::FindExecutable(packageTool))
    {
        journal.lastResult = Journal::Result::ToolMissing;
        journal.lastErrorMessage = fmt::format("{} is required for Windows installers", packageTool);
        journal.lastErrorDetails = { "Install with: sudo apt install innoextract" };
        return false;
    }

    return true;
}

std::string InstallerClassifier::DeriveOutputName(const std::filesystem::path &installerPath)
{
    const std::string stem = installerPath.stem().string();
    const std::string fallback = stem.empty() ? installerPath.filename().string() : stem;

    std::string name = stem;
    try
    {
        static const std::regex prefixPattern("^(gog_|setup_)", std::regex::icase);
        static const std::regex dottedVersionPattern("_[0-9]+\\.[0-9]+\\.[0-9]+\\.[0-9]+$");
        static const std::regex underscoreVersionPattern("_[0-9]+_[0-9]+_[0-9]+.*");
        static const std::regex buildVersionPattern("_[0-9]+\\.[0-9]+_\\([0-9]+\\)$");
        static const std::regex languagePattern("_(en|de|fr|es|it|pl|ru|pt|br|jp|ko|cn|zh)(_|$)", std::regex::icase);
        static const std::regex trailingUnderscorePattern("_+$");

        name = std::regex_replace(name, prefixPattern, "", std::regex_constants::format_first_only);
        name = std::regex_replace(name, dottedVersionPattern, "");
        name = std::regex_replace(name, underscoreVersionPattern, "", std::regex_constants::format_first_only);
        name = std::regex_replace(name, buildVersionPattern, "");
        name = std::regex_replace(name, languagePattern, "_");
        name = std::regex_replace(name, trailingUnderscorePattern, "");
    }
    catch (const std::regex_error &e)
    {
        LOGF_UTILITY("Name cleanup failed for {}: {}", stem, e.what());
        return fallback;
    }

    std::replace(name.begin(), name.end(), '_', ' ');
    name = removeCharacter(capitalizeWords(name), ' ');

    if (name.empty())
    {
        return fallback;
    }

    return name;
}

std::filesystem::path InstallerClassifier::ResolveOutputDirectory(const std::filesystem::path &requested, const std::filesystem::path &installerPath)
{
    if (!requested.empty())
    {
        return makeAbsolute(requested);
    }

    return installerPath.parent_path() / DeriveOutputName(installerPath);
}

const char *InstallerClassifier::GetKindName(InstallerKind kind)
{
    switch (kind)
    {
    case InstallerKind::LinuxArchive:
        return "Linux archive";
    case InstallerKind::WindowsPackage:
        return "Windows package";
    default:
        return "unknown";
    }
}
