#include <install/materializer.h>

#include <sys/stat.h>

#include "test_utils.h"

static const std::function<bool()> AlwaysContinue = []() { return true; };

TEST(MaterializerTest, ExcludesWindowsInstallerEntries)
{
    EXPECT_TRUE(Materializer::IsExcludedEntry("__support"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("__redist"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("DOSBOX"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("app"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("commonappdata"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("tmp"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("goggame-1207658746.info"));
    EXPECT_TRUE(Materializer::IsExcludedEntry("setup_game-1.bin"));

    EXPECT_FALSE(Materializer::IsExcludedEntry("dosbox"));
    EXPECT_FALSE(Materializer::IsExcludedEntry("GAME.EXE"));
    EXPECT_FALSE(Materializer::IsExcludedEntry("SOUND"));
    EXPECT_FALSE(Materializer::IsExcludedEntry("game.ins"));
}

TEST(MaterializerTest, CopiesLinuxGameDataRecursively)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path gameData = tempDir / "data";
    const std::filesystem::path output = tempDir / "out/Game";
    TestUtils::WriteFile(gameData / "GAME.EXE", "MZ");
    TestUtils::WriteFile(gameData / "SOUND/SB.DRV", "driver");
    TestUtils::WriteFile(gameData / "tmp/keep.txt", "kept for Linux archives");
    std::filesystem::create_symlink("GAME.EXE", gameData / "START.EXE");

    Journal journal;
    ASSERT_TRUE(Materializer::CopyGameData(InstallerKind::LinuxArchive, gameData, output, journal, AlwaysContinue));

    EXPECT_EQ(TestUtils::ReadFile(output / "GAME.EXE"), "MZ");
    EXPECT_EQ(TestUtils::ReadFile(output / "SOUND/SB.DRV"), "driver");
    EXPECT_TRUE(std::filesystem::exists(output / "tmp/keep.txt"));
    EXPECT_TRUE(std::filesystem::is_symlink(output / "START.EXE"));
    EXPECT_EQ(std::filesystem::read_symlink(output / "START.EXE"), "GAME.EXE");
    EXPECT_EQ(journal.filesCopied, 3u);
    EXPECT_EQ(journal.progressCounter, 2u + 6u + 23u);
}

TEST(MaterializerTest, CopyOverwritesPreviousRun)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path gameData = tempDir / "data";
    const std::filesystem::path output = tempDir / "out";
    TestUtils::WriteFile(gameData / "GAME.EXE", "new");
    TestUtils::WriteFile(output / "GAME.EXE", "old contents");
    TestUtils::WriteFile(output / "SAVEGAME.1", "progress");
    std::filesystem::create_symlink("GAME.EXE", gameData / "START.EXE");

    Journal journal;
    ASSERT_TRUE(Materializer::CopyGameData(InstallerKind::LinuxArchive, gameData, output, journal, AlwaysContinue));
    ASSERT_TRUE(Materializer::CopyGameData(InstallerKind::LinuxArchive, gameData, output, journal, AlwaysContinue));

    EXPECT_EQ(TestUtils::ReadFile(output / "GAME.EXE"), "new");
    EXPECT_EQ(TestUtils::ReadFile(output / "SAVEGAME.1"), "progress");
    EXPECT_TRUE(std::filesystem::is_symlink(output / "START.EXE"));
}

TEST(MaterializerTest, SkipsWindowsArtifactsAtTopLevelOnly)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path gameData = tempDir / "extracted";
    const std::filesystem::path output = tempDir / "out";
    TestUtils::WriteFile(gameData / "U7.CFG", "cfg");
    TestUtils::WriteFile(gameData / "__support/app/dosbox.conf", "[autoexec]\n");
    TestUtils::WriteFile(gameData / "goggame-1207658746.info", "{}");
    TestUtils::WriteFile(gameData / "setup_game-1.bin", "blob");
    TestUtils::WriteFile(gameData / "STATIC/tmp/FILE.DAT", "nested");

    Journal journal;
    ASSERT_TRUE(Materializer::CopyGameData(InstallerKind::WindowsPackage, gameData, output, journal, AlwaysContinue));

    EXPECT_TRUE(std::filesystem::exists(output / "U7.CFG"));
    EXPECT_TRUE(std::filesystem::exists(output / "STATIC/tmp/FILE.DAT"));
    EXPECT_FALSE(std::filesystem::exists(output / "__support"));
    EXPECT_FALSE(std::filesystem::exists(output / "goggame-1207658746.info"));
    EXPECT_FALSE(std::filesystem::exists(output / "setup_game-1.bin"));
}

TEST(MaterializerTest, CopyCanBeCancelled)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path gameData = tempDir / "data";
    TestUtils::WriteFile(gameData / "A.DAT", "a");
    TestUtils::WriteFile(gameData / "B.DAT", "b");

    Journal journal;
    EXPECT_FALSE(Materializer::CopyGameData(InstallerKind::LinuxArchive, gameData, tempDir / "out", journal, []() { return false; }));
    EXPECT_EQ(journal.lastResult, Journal::Result::Cancelled);
    EXPECT_EQ(journal.filesCopied, 1u);
}

TEST(MaterializerTest, SettingsConfigGetsSharpOutput)
{
    TestUtils::TempDir tempDir;
    TestUtils::WriteFile(tempDir / "dosbox_game.conf", "[sdl]\r\noutput=opengl\r\n[render]\r\naspect=false\r\n");

    Journal journal;
    bool sharpOutputApplied = false;
    ASSERT_TRUE(Materializer::InstallSettingsConfig(tempDir / "dosbox_game.conf", tempDir.GetPath(), journal, sharpOutputApplied));
    EXPECT_TRUE(sharpOutputApplied);
    EXPECT_EQ(TestUtils::ReadFile(tempDir / Materializer::SettingsConfigName), "[sdl]\r\noutput=openglnb\r\n[render]\r\naspect=false\r\n");

    // Running over the already patched file changes nothing.
    ASSERT_TRUE(Materializer::InstallSettingsConfig(tempDir / Materializer::SettingsConfigName, tempDir.GetPath(), journal, sharpOutputApplied));
    EXPECT_FALSE(sharpOutputApplied);
    EXPECT_EQ(TestUtils::ReadFile(tempDir / Materializer::SettingsConfigName), "[sdl]\r\noutput=openglnb\r\n[render]\r\naspect=false\r\n");
}

TEST(MaterializerTest, AutoexecUsesCdAudioImageWhenPresent)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path output = tempDir / "out";
    TestUtils::WriteFile(tempDir / "dosbox.conf", "[autoexec]\nmount c \"data\"\nimgmount d \"data/game.gog\" -t iso\n");
    TestUtils::WriteFile(output / "game.ins", "cue");

    Journal journal;
    Materializer::AutoexecPatches patches;
    ASSERT_TRUE(Materializer::InstallAutoexecConfig(tempDir / "dosbox.conf", output, journal, patches));
    EXPECT_TRUE(patches.cdAudioImage);
    EXPECT_TRUE(patches.flatMountPaths);
    EXPECT_EQ(TestUtils::ReadFile(output / Materializer::AutoexecConfigName), "[autoexec]\nmount C \".\"\nimgmount d \"./game.ins\" -t iso\n");
}

TEST(MaterializerTest, AutoexecKeepsGameGogWithoutCdAudioImage)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path output = tempDir / "out";
    TestUtils::WriteFile(tempDir / "dosbox.conf", "[autoexec]\nimgmount d \"..\\game.gog\" -t iso\n");
    TestUtils::MakeDirectory(output);

    Journal journal;
    Materializer::AutoexecPatches patches;
    ASSERT_TRUE(Materializer::InstallAutoexecConfig(tempDir / "dosbox.conf", output, journal, patches));
    EXPECT_FALSE(patches.cdAudioImage);
    EXPECT_FALSE(patches.flatMountPaths);
    EXPECT_EQ(TestUtils::ReadFile(output / Materializer::AutoexecConfigName), "[autoexec]\nimgmount d \"..\\game.gog\" -t iso\n");
}

TEST(MaterializerTest, MissingSourceIsFileSystemError)
{
    TestUtils::TempDir tempDir;

    Journal journal;
    Materializer::AutoexecPatches patches;
    EXPECT_FALSE(Materializer::InstallAutoexecConfig(tempDir / "missing.conf", tempDir.GetPath(), journal, patches));
    EXPECT_EQ(journal.lastResult, Journal::Result::FileReadFailed);
    EXPECT_EQ(Journal::GetCategory(journal.lastResult), Journal::Category::FileSystem);
    EXPECT_NE(journal.lastErrorMessage.find("missing.conf"), std::string::npos);
}

TEST(MaterializerTest, CopiesGameConfigsExceptDosboxOnes)
{
    TestUtils::TempDir tempDir;
    const std::filesystem::path configRoot = tempDir / "__support/app";
    const std::filesystem::path output = tempDir / "out";
    TestUtils::WriteFile(configRoot / "SOUND.CFG", "upper");
    TestUtils::WriteFile(configRoot / "setup.cfg", "lower");
    TestUtils::WriteFile(configRoot / "dosbox_game.cfg", "skipped");
    TestUtils::WriteFile(configRoot / "dosbox_game.conf", "[autoexec]\n");
    TestUtils::MakeDirectory(output);

    Journal journal;
    std::vector<std::string> copiedNames;
    ASSERT_TRUE(Materializer::CopyGameConfigs(configRoot, output, journal, copiedNames));
    EXPECT_EQ(copiedNames, (std::vector<std::string>{ "SOUND.CFG", "setup.cfg" }));
    EXPECT_EQ(TestUtils::ReadFile(output / "SOUND.CFG"), "upper");
    EXPECT_FALSE(std::filesystem::exists(output / "dosbox_game.cfg"));
}

TEST(MaterializerTest, DisplayConfigIsFixedText)
{
    TestUtils::TempDir tempDir;
    TestUtils::WriteFile(tempDir / Materializer::DisplayConfigName, "user edits");

    Journal journal;
    ASSERT_TRUE(Materializer::WriteDisplayConfig(tempDir.GetPath(), journal));
    const std::string first = TestUtils::ReadFile(tempDir / Materializer::DisplayConfigName);
    ASSERT_TRUE(Materializer::WriteDisplayConfig(tempDir.GetPath(), journal));

    EXPECT_EQ(first, std::string(Materializer::DisplayConfigContent));
    EXPECT_EQ(TestUtils::ReadFile(tempDir / Materializer::DisplayConfigName), first);
    EXPECT_NE(first.find("output=openglnb\n"), std::string::npos);
    EXPECT_NE(first.find("scaler=normal2x\n"), std::string::npos);
}

TEST(MaterializerTest, LauncherLoadsConfigsInOrder)
{
    std::string withSettings = Materializer::BuildLauncherScript(true, { "dosbox-staging", "dosbox" });
    EXPECT_EQ(withSettings.rfind("#!/bin/bash\n", 0), 0u);
    EXPECT_NE(withSettings.find("if command -v dosbox-staging &> /dev/null; then\n    DOSBOX=\"dosbox-staging\"\n"), std::string::npos);
    EXPECT_NE(withSettings.find("elif command -v dosbox &> /dev/null; then\n    DOSBOX=\"dosbox\"\n"), std::string::npos);
    EXPECT_NE(withSettings.find("Error: DOSBox not found. Install dosbox or dosbox-staging."), std::string::npos);

    size_t settings = withSettings.find("-conf \"$SCRIPT_DIR/dosbox_settings.conf\"");
    size_t autoexec = withSettings.find("-conf \"$SCRIPT_DIR/dosbox_autoexec.conf\"");
    size_t display = withSettings.find("-conf \"$SCRIPT_DIR/display.conf\"");
    ASSERT_NE(settings, std::string::npos);
    EXPECT_LT(settings, autoexec);
    EXPECT_LT(autoexec, display);

    std::string withoutSettings = Materializer::BuildLauncherScript(false, { "dosbox-staging", "dosbox" });
    EXPECT_EQ(withoutSettings.find("dosbox_settings.conf"), std::string::npos);
    EXPECT_LT(withoutSettings.find("dosbox_autoexec.conf"), withoutSettings.find("display.conf"));
}

TEST(MaterializerTest, DefaultLauncherIsFixedText)
{
    const std::string expected =
        "#!/bin/bash\n"
        "SCRIPT_DIR=\"$(cd \"$(dirname \"$0\")\" && pwd)\"\n"
        "cd \"$SCRIPT_DIR\"\n"
        "\n"
        "if command -v dosbox-staging &> /dev/null; then\n"
        "    DOSBOX=\"dosbox-staging\"\n"
        "elif command -v dosbox &> /dev/null; then\n"
        "    DOSBOX=\"dosbox\"\n"
        "else\n"
        "    echo \"Error: DOSBox not found. Install dosbox or dosbox-staging.\"\n"
        "    exit 1\n"
        "fi\n"
        "\n"
        "echo \"Starting game with $DOSBOX...\"\n"
        "# Load autoexec config, then display settings\n"
        "exec $DOSBOX -conf \"$SCRIPT_DIR/dosbox_autoexec.conf\" \\\n"
        "             -conf \"$SCRIPT_DIR/display.conf\"\n";

    EXPECT_EQ(Materializer::BuildLauncherScript(false, {}), expected);
    EXPECT_NE(Materializer::BuildLauncherScript(true, { "dosbox-x", "dosbox-staging", "dosbox" }).find("Install dosbox or dosbox-staging or dosbox-x."), std::string::npos);
}

TEST(MaterializerTest, LauncherIgnoresUnsafeEmulatorNames)
{
    std::string script = Materializer::BuildLauncherScript(true, { "dosbox-x", "rm -rf /; dosbox" });
    EXPECT_NE(script.find("DOSBOX=\"dosbox-x\""), std::string::npos);
    EXPECT_EQ(script.find("rm -rf"), std::string::npos);

    std::string fallback = Materializer::BuildLauncherScript(true, {});
    EXPECT_NE(fallback.find("command -v dosbox-staging"), std::string::npos);
}

TEST(MaterializerTest, LauncherIsExecutableAndStable)
{
    TestUtils::TempDir tempDir;

    Journal journal;
    ASSERT_TRUE(Materializer::WriteLauncher(tempDir.GetPath(), false, { "dosbox" }, journal));
    const std::string first = TestUtils::ReadFile(tempDir / Materializer::LauncherName);
    ASSERT_TRUE(Materializer::WriteLauncher(tempDir.GetPath(), false, { "dosbox" }, journal));
    EXPECT_EQ(TestUtils::ReadFile(tempDir / Materializer::LauncherName), first);

    struct stat st;
    ASSERT_EQ(stat((tempDir / Materializer::LauncherName).c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);
}
