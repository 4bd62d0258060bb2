#include "installer.h"
#include "cleanup.h"
#include "installer_classifier.h"
#include "materializer.h"
#include "platform_paths.h"
#include "reporter.h"
#include "scratch_tree.h"

#include <os/logger.h>

static const std::string ExtractedDirectory = "extracted";

static std::string fromPath(const std::filesystem::path &path)
{
    return path.string();
}

static std::vector<std::string> splitOutput(const std::string &output)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < output.size())
    {
        size_t end = output.find('\n', start);
        if (end == std::string::npos)
        {
            lines.push_back(output.substr(start));
            break;
        }

        lines.push_back(output.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}

static bool checkCancelled(Journal &journal, const std::function<bool()> &progressCallback)
{
    if (progressCallback())
    {
        return false;
    }

    journal.lastResult = Journal::Result::Cancelled;
    journal.lastErrorMessage = "Installation was cancelled.";
    journal.lastErrorDetails.clear();
    return true;
}

bool Installer::extract(InstallerKind kind, const std::filesystem::path &installerPath, const std::filesystem::path &targetDirectory, const Extractor::Tools &tools, Journal &journal)
{
    Extractor::ExtractionResult result = Extractor::Extract(kind, installerPath, targetDirectory, tools);
    if (result.interrupted)
    {
        journal.lastResult = Journal::Result::Cancelled;
        journal.lastErrorMessage = fmt::format("{} was interrupted.", result.toolName);
        return false;
    }

    if (!result.success)
    {
        journal.lastResult = Journal::Result::ExtractionFailed;
        journal.lastErrorMessage = fmt::format("{} failed with status {}", result.toolName, result.exitCode);
        journal.lastErrorDetails = splitOutput(result.output);
        return false;
    }

    LOGFN("  Extracted game data via {}", result.toolName);
    return true;
}

bool Installer::materialize(InstallerKind kind, const Options &options, const LayoutLocator::Layout &layout, const ConfigResolver::ResolvedConfigs &configs, Journal &journal, const std::function<bool()> &progressCallback)
{
    const std::filesystem::path &outputDirectory = journal.outputDirectory;

    Reporter::Step(3, "Copying game files...");
    if (!Materializer::CopyGameData(kind, layout.gameData, outputDirectory, journal, progressCallback))
    {
        return false;
    }

    LOGF_UTILITY("Copied {} files ({} bytes)", journal.filesCopied, journal.progressCounter);

    Reporter::Step(4, "Copying DOSBox configs...");
    if (configs.settingsConfig)
    {
        bool sharpOutputApplied = false;
        if (!Materializer::InstallSettingsConfig(*configs.settingsConfig, outputDirectory, journal, sharpOutputApplied))
        {
            return false;
        }

        Reporter::Item(fmt::format("Copied settings config: {}", Materializer::SettingsConfigName));
        if (sharpOutputApplied)
        {
            Reporter::Item("Changed output=opengl to output=openglnb (sharp pixels)");
        }
    }

    Materializer::AutoexecPatches patches;
    if (!Materializer::InstallAutoexecConfig(configs.autoexecConfig, outputDirectory, journal, patches))
    {
        return false;
    }

    Reporter::Item(fmt::format("Copied autoexec config: {}", Materializer::AutoexecConfigName));
    if (patches.cdAudioImage)
    {
        Reporter::Item("Changed game.gog to game.ins (CD audio fix)");
    }

    if (patches.flatMountPaths)
    {
        Reporter::Item("Fixed mount paths for flattened directory");
    }

    if (kind == InstallerKind::WindowsPackage)
    {
        Reporter::Step(5, "Copying game config files...");

        std::vector<std::string> copiedNames;
        if (!Materializer::CopyGameConfigs(layout.configRoot, outputDirectory, journal, copiedNames))
        {
            return false;
        }

        for (const std::string &name : copiedNames)
        {
            Reporter::Item(fmt::format("Copied {}", name));
        }

        if (copiedNames.empty())
        {
            Reporter::Item("No game-specific config files found");
        }
    }
    else
    {
        Reporter::Step(5, "Checking for game config files...");
        Reporter::Item("(Linux installers include configs in game data)");
    }

    Reporter::Step(6, "Creating display config...");
    if (!Materializer::WriteDisplayConfig(outputDirectory, journal))
    {
        return false;
    }

    Reporter::Item(fmt::format("Created {} (window size, sharp scaling)", Materializer::DisplayConfigName));

    Reporter::Step(7, "Creating launcher...");
    if (!Materializer::WriteLauncher(outputDirectory, configs.settingsConfig.has_value(), options.emulatorCandidates, journal))
    {
        return false;
    }

    Reporter::Item(fmt::format("Created {}", Materializer::LauncherName));
    return true;
}

bool Installer::install(const Options &options, Journal &journal, const std::function<bool()> &progressCallback)
{
    std::filesystem::path installerPath;
    InstallerKind kind = InstallerKind::Unknown;
    if (!InstallerClassifier::Classify(options.installerPath, installerPath, kind, journal))
    {
        return false;
    }

    if (!InstallerClassifier::CheckEnvironment(kind, options.tools.packageTool, journal))
    {
        return false;
    }

    journal.outputDirectory = InstallerClassifier::ResolveOutputDirectory(options.outputDirectory, installerPath);

    Reporter::Banner(installerPath, journal.outputDirectory);

    Install::ScratchTree scratchTree;
    std::string scratchError;
    if (!scratchTree.Create(PlatformPaths::GetTempDirectory(options.scratchParent), scratchError))
    {
        journal.lastResult = Journal::Result::ScratchCreationFailed;
        journal.lastErrorMessage = scratchError;
        return false;
    }

    Reporter::Step(1, "Extracting game files...");
    const std::filesystem::path extractionRoot = scratchTree.GetPath() / ExtractedDirectory;
    if (!extract(kind, installerPath, extractionRoot, options.tools, journal))
    {
        return false;
    }

    if (checkCancelled(journal, progressCallback))
    {
        return false;
    }

    LayoutLocator::Layout layout;
    if (!LayoutLocator::Locate(kind, extractionRoot, scratchTree.GetPath(), layout, journal))
    {
        return false;
    }

    Reporter::Info(fmt::format("Found game data: {}", fromPath(layout.gameData)));
    Reporter::Info(fmt::format("Config root: {}", fromPath(layout.configRoot)));
    Reporter::Info("");

    // The autoexec config must be known before the output directory is touched.
    Reporter::Step(2, "Locating DOSBox configs...");
    ConfigResolver::ResolvedConfigs configs;
    if (!ConfigResolver::Resolve(layout.configRoot, configs, journal))
    {
        return false;
    }

    Reporter::Info("Found configs:");
    if (configs.settingsConfig)
    {
        Reporter::Item(fmt::format("Full settings: {}", fromPath(configs.settingsConfig->filename())));
    }
    else
    {
        LOGN_WARNING("  - No config with an [sdl] section, the emulator defaults apply");
    }

    Reporter::Item(fmt::format("Autoexec: {}", fromPath(configs.autoexecConfig.filename())));

    if (!materialize(kind, options, layout, configs, journal, progressCallback))
    {
        return false;
    }

    Reporter::Info("");
    Reporter::Info("Cleaning up...");
    std::vector<std::string> removed = Cleanup::Run(journal.outputDirectory);
    for (const std::string &name : removed)
    {
        Reporter::Item(fmt::format("Removed {}", name));
    }

    if (removed.empty())
    {
        Reporter::Item("No cleanup needed");
    }

    scratchTree.Release();

    Reporter::Summary(journal.outputDirectory);

    journal.lastResult = Journal::Result::Success;
    return true;
}
