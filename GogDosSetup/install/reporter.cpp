#include "reporter.h"

#include <cmath>

#include <os/logger.h>

namespace Reporter
{
    void Banner(const std::filesystem::path& installerPath, const std::filesystem::path& outputDirectory)
    {
        LOGN_SUCCESS("=== GOG DOS Game Extractor ===");
        LOGFN("Installer: {}", installerPath.string());
        LOGFN("Output:    {}", outputDirectory.string());
        LOGN("");
    }

    void Step(int index, std::string_view title)
    {
        LOGFN_STEP("[{}/{}] {}", index, StepCount, title);
    }

    void Item(std::string_view text)
    {
        LOGFN("  - {}", text);
    }

    void Info(std::string_view text)
    {
        LOGN(text);
    }

    void Error(const Journal& journal)
    {
        LOGFN_ERROR("Error: {}", journal.lastErrorMessage);

        for (const std::string& detail : journal.lastErrorDetails)
        {
            os::logger::Log(detail, ELogType::ErrorDetail);
        }

        std::string_view hint = GetHint(Journal::GetCategory(journal.lastResult));
        if (!hint.empty())
        {
            os::logger::Log(hint, ELogType::ErrorDetail);
        }
    }

    std::string_view GetHint(Journal::Category category)
    {
        switch (category)
        {
        case Journal::Category::Usage:
            return "Run gog-dosbox-setup --help for usage.";
        case Journal::Category::Extraction:
            return "The installer may be damaged or incomplete. Try downloading it again.";
        case Journal::Category::Structural:
            return "This installer does not use a known GOG DOS layout.";
        case Journal::Category::Content:
            return "The installer ships no DOSBox config that starts the game.";
        case Journal::Category::FileSystem:
            return "Check the permissions and free space of the output directory.";
        default:
            return {};
        }
    }

    void Summary(const std::filesystem::path& outputDirectory)
    {
        LOGN("");
        LOGN_SUCCESS("=== Done! ===");
        LOGFN("Size: {}", FormatSize(ComputeDirectorySize(outputDirectory)));
        LOGN("");
        LOGN("To play:");
        LOGFN("  cd \"{}\" && ./play.sh", outputDirectory.string());
    }

    uint64_t ComputeDirectorySize(const std::filesystem::path& directory)
    {
        uint64_t total = 0;

        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(directory, ec), end;
        for (; !ec && it != end; it.increment(ec))
        {
            std::error_code entryEc;
            if (!it->is_regular_file(entryEc) || it->is_symlink(entryEc))
            {
                continue;
            }

            uint64_t size = it->file_size(entryEc);
            if (!entryEc)
            {
                total += size;
            }
        }

        return total;
    }

    std::string FormatSize(uint64_t bytes)
    {
        static const char Units[] = { 'K', 'M', 'G', 'T', 'P' };

        if (bytes < 1024)
        {
            return fmt::format("{}", bytes);
        }

        double value = double(bytes);
        size_t unit = 0;
        value /= 1024.0;
        while (value >= 1024.0 && unit + 1 < std::size(Units))
        {
            value /= 1024.0;
            unit++;
        }

        if (value < 10.0)
        {
            double rounded = std::ceil(value * 10.0) / 10.0;
            if (rounded < 10.0)
            {
                return fmt::format("{:.1f}{}", rounded, Units[unit]);
            }

            value = rounded;
        }

        double whole = std::ceil(value);
        if (whole >= 1024.0 && unit + 1 < std::size(Units))
        {
            return fmt::format("1.0{}", Units[unit + 1]);
        }

        return fmt::format("{}{}", uint64_t(whole), Units[unit]);
    }
}
