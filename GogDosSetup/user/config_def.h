// This file gets included in config.h, where CONFIG_DEFINE turns every line
// into a static member of Config that registers itself for loading.

CONFIG_DEFINE("Tools", std::string, ZipTool, "unzip");
CONFIG_DEFINE("Tools", std::string, PackageTool, "innoextract");

// Probed in order by the generated play.sh.
CONFIG_DEFINE("Emulator", std::vector<std::string>, EmulatorCandidates, { "dosbox-staging", "dosbox" });

CONFIG_DEFINE("System", std::string, TempDirectory, "");
CONFIG_DEFINE("System", bool, ColorOutput, true);
CONFIG_DEFINE("System", bool, Verbose, false);
