#include <cstdio>
#include <cstring>

#include <install/installer.h>
#include <install/platform_paths.h>
#include <install/reporter.h>
#include <os/logger.h>
#include <os/process.h>
#include <user/config.h>

#ifndef GOG_DOS_SETUP_VERSION
#define GOG_DOS_SETUP_VERSION "0.0.0"
#endif

static void PrintUsage(FILE *stream, const char *program)
{
    fmt::print(stream,
        "Usage: {0} [options] <gog_installer.sh|.exe> [output_directory]\n"
        "\n"
        "Extracts a GOG DOS game and creates a minimal directory.\n"
        "Copies the original GOG DOSBox config and patches it for:\n"
        "  - Sharp pixels (output=openglnb)\n"
        "  - Working CD audio (mounts game.ins, not game.gog)\n"
        "\n"
        "Supported installer types:\n"
        "  - Linux (.sh) - uses unzip\n"
        "  - Windows (.exe) - uses innoextract\n"
        "\n"
        "Options:\n"
        "  -h, --help          Show this help and exit\n"
        "  -V, --version       Print the version and exit\n"
        "  -v, --verbose       Print trace output\n"
        "      --no-color      Disable colored output\n"
        "  -c, --config PATH   Read settings from PATH\n"
        "\n"
        "Examples:\n"
        "  {0} fantasy_general_1_0_20211006_50653.sh\n"
        "  {0} setup_ultima_vii_1.0.exe ~/Games/Ultima7\n",
        program);
}

int main(int argc, char *argv[])
{
    const char *program = argc > 0 ? argv[0] : "gog-dosbox-setup";

    bool verbose = false;
    bool noColor = false;
    bool optionsEnded = false;
    std::filesystem::path configPath;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        if (optionsEnded || argv[i][0] != '-' || strcmp(argv[i], "-") == 0)
        {
            positional.emplace_back(argv[i]);
            continue;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0)
        {
            PrintUsage(stdout, program);
            return 0;
        }

        if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0)
        {
            fmt::print("gog-dosbox-setup {}\n", GOG_DOS_SETUP_VERSION);
            return 0;
        }

        verbose = verbose || (strcmp(argv[i], "-v") == 0) || (strcmp(argv[i], "--verbose") == 0);
        noColor = noColor || (strcmp(argv[i], "--no-color") == 0);
        optionsEnded = optionsEnded || (strcmp(argv[i], "--") == 0);

        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0)
        {
            if ((i + 1) < argc)
            {
                configPath = argv[++i];
            }
            else
            {
                os::logger::Init(!noColor, verbose);
                LOGFN_ERROR("Error: No argument was specified for {}.", argv[i]);
                return 1;
            }
        }
        else if (strcmp(argv[i], "-v") != 0 && strcmp(argv[i], "--verbose") != 0 &&
            strcmp(argv[i], "--no-color") != 0 && strcmp(argv[i], "--") != 0)
        {
            os::logger::Init(!noColor, verbose);
            LOGFN_ERROR("Error: Unknown option {}", argv[i]);
            PrintUsage(stderr, program);
            return 1;
        }
    }

    // Config warnings are printed with the command line settings; the
    // configured ones take over once the file is read.
    os::logger::Init(!noColor, verbose);

    if (configPath.empty())
    {
        configPath = PlatformPaths::GetConfigPath();
    }

    if (!Config::Load(configPath))
    {
        LOGN_WARNING("Continuing with default settings.");
        Config::MakeDefaults();
    }

    os::logger::Init(!noColor && Config::ColorOutput, verbose || Config::Verbose);

    if (positional.empty() || positional.size() > 2)
    {
        PrintUsage(stderr, program);
        return 1;
    }

    os::process::InstallInterruptHandler();

    Installer::Options options;
    options.installerPath = positional[0];
    if (positional.size() > 1)
    {
        options.outputDirectory = positional[1];
    }

    options.tools.zipTool = Config::ZipTool;
    options.tools.packageTool = Config::PackageTool;
    options.emulatorCandidates = Config::EmulatorCandidates;
    options.scratchParent = Config::TempDirectory.Value;

    LOGF_UTILITY("{} on {}, configuration {}", GOG_DOS_SETUP_VERSION, PlatformPaths::GetPlatformName(), configPath.string());

    Journal journal;
    bool installed = Installer::install(options, journal, []()
    {
        return !os::process::IsInterrupted();
    });

    if (!installed)
    {
        Reporter::Error(journal);
        return 1;
    }

    return 0;
}
