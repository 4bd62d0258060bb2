#include <install/reporter.h>

#include <os/logger.h>

#include "test_utils.h"

TEST(ReporterTest, FormatsSizesLikeDu)
{
    EXPECT_EQ(Reporter::FormatSize(0), "0");
    EXPECT_EQ(Reporter::FormatSize(1023), "1023");
    EXPECT_EQ(Reporter::FormatSize(1024), "1.0K");
    EXPECT_EQ(Reporter::FormatSize(1025), "1.1K");
    EXPECT_EQ(Reporter::FormatSize(10 * 1024), "10K");
    EXPECT_EQ(Reporter::FormatSize(10 * 1024 + 1), "11K");
    EXPECT_EQ(Reporter::FormatSize(1023 * 1024 + 1), "1.0M");
    EXPECT_EQ(Reporter::FormatSize(12ull * 1024 * 1024), "12M");
    EXPECT_EQ(Reporter::FormatSize(3ull * 1024 * 1024 * 1024 / 2), "1.5G");
}

TEST(ReporterTest, SumsRegularFiles)
{
    TestUtils::TempDir tempDir;
    TestUtils::WriteFile(tempDir / "GAME.EXE", std::string(1000, 'x'));
    TestUtils::WriteFile(tempDir / "SOUND/SB.DRV", std::string(24, 'y'));
    std::filesystem::create_symlink("GAME.EXE", tempDir / "START.EXE");

    EXPECT_EQ(Reporter::ComputeDirectorySize(tempDir.GetPath()), 1024u);
    EXPECT_EQ(Reporter::ComputeDirectorySize(tempDir / "missing"), 0u);
}

TEST(ReporterTest, ErrorEndsWithCategoryHint)
{
    os::logger::Init(false, false);

    Journal journal;
    journal.lastResult = Journal::Result::ExtractionFailed;
    journal.lastErrorMessage = "Extraction failed.";
    journal.lastErrorDetails = { "unzip: cannot find zipfile directory" };

    testing::internal::CaptureStderr();
    Reporter::Error(journal);
    std::string output = testing::internal::GetCapturedStderr();

    size_t message = output.find("Error: Extraction failed.");
    size_t detail = output.find("unzip: cannot find zipfile directory\n");
    size_t hint = output.find(std::string(Reporter::GetHint(Journal::Category::Extraction)));
    ASSERT_NE(message, std::string::npos);
    ASSERT_NE(detail, std::string::npos);
    ASSERT_NE(hint, std::string::npos);
    EXPECT_LT(message, detail);
    EXPECT_LT(detail, hint);
}

TEST(ReporterTest, HintsFollowCategories)
{
    EXPECT_EQ(Reporter::GetHint(Journal::GetCategory(Journal::Result::UnsupportedInstaller)), "Run gog-dosbox-setup --help for usage.");
    EXPECT_EQ(Reporter::GetHint(Journal::GetCategory(Journal::Result::GameDataMissing)), "This installer does not use a known GOG DOS layout.");
    EXPECT_EQ(Reporter::GetHint(Journal::GetCategory(Journal::Result::AutoexecMissing)), "The installer ships no DOSBox config that starts the game.");
    EXPECT_EQ(Reporter::GetHint(Journal::GetCategory(Journal::Result::FileCopyFailed)), "Check the permissions and free space of the output directory.");

    // Tool errors already carry install hints in their details.
    EXPECT_TRUE(Reporter::GetHint(Journal::GetCategory(Journal::Result::ToolMissing)).empty());
    EXPECT_TRUE(Reporter::GetHint(Journal::GetCategory(Journal::Result::Cancelled)).empty());
}
