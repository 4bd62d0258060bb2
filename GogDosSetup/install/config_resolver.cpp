#include "config_resolver.h"
#include "dosbox_config.h"

#include <algorithm>

#include <fnmatch.h>
#include <os/logger.h>

namespace ConfigResolver
{
    static std::vector<std::string> listEntries(const std::filesystem::path& directory)
    {
        std::vector<std::string> entries;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entryEc;
            std::string name = it->path().filename().string();
            if (it->is_directory(entryEc))
            {
                entries.push_back(fmt::format("  {}/", name));
            }
            else
            {
                uintmax_t size = it->file_size(entryEc);
                entries.push_back(entryEc ? fmt::format("  {}", name) : fmt::format("  {} ({} bytes)", name, size));
            }
        }

        std::sort(entries.begin(), entries.end());
        return entries;
    }

    std::vector<std::filesystem::path> FindMatching(const std::filesystem::path& configRoot, const char* pattern)
    {
        std::vector<std::filesystem::path> matches;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(configRoot, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entryEc;
            if (!it->is_regular_file(entryEc))
            {
                continue;
            }

            const std::string name = it->path().filename().string();
            if (fnmatch(pattern, name.c_str(), FNM_PERIOD) == 0)
            {
                matches.push_back(it->path());
            }
        }

        // Byte-wise order keeps "last match wins" independent of the file system.
        std::sort(matches.begin(), matches.end(), [](const std::filesystem::path& a, const std::filesystem::path& b)
        {
            return a.filename().string() < b.filename().string();
        });

        return matches;
    }

    bool InspectCandidate(const std::filesystem::path& path, CandidateConfig& candidate)
    {
        std::vector<std::string> lines;
        if (!DosboxConfig::ReadLines(path, lines))
        {
            return false;
        }

        candidate.path = path;
        candidate.hasDisplaySection = DosboxConfig::HasSection(lines, DosboxConfig::DisplaySection);
        candidate.hasStartupSection = DosboxConfig::HasSection(lines, DosboxConfig::StartupSection);
        candidate.hasNonEmptyStartupSection = DosboxConfig::HasStartupCommands(lines);
        return true;
    }

    std::vector<CandidateConfig> ScanCandidates(const std::filesystem::path& configRoot)
    {
        std::vector<CandidateConfig> candidates;
        for (const char* pattern : ConfigPatterns)
        {
            for (const std::filesystem::path& path : FindMatching(configRoot, pattern))
            {
                CandidateConfig candidate;
                if (!InspectCandidate(path, candidate))
                {
                    LOGFN_WARNING("  - Skipping unreadable config: {}", path.filename().string());
                    continue;
                }

                LOGF_UTILITY("{}: sdl={} autoexec={} commands={}", path.filename().string(),
                    candidate.hasDisplaySection, candidate.hasStartupSection, candidate.hasNonEmptyStartupSection);

                candidates.push_back(candidate);
            }
        }

        return candidates;
    }

    std::optional<ResolvedConfigs> Choose(const std::vector<CandidateConfig>& candidates)
    {
        ResolvedConfigs configs;
        const CandidateConfig* autoexec = nullptr;

        for (const CandidateConfig& candidate : candidates)
        {
            if (candidate.hasDisplaySection)
            {
                configs.settingsConfig = candidate.path;
            }

            if (candidate.hasNonEmptyStartupSection)
            {
                bool singleLaunch = candidate.path.filename().string().find(SingleLaunchMarker) != std::string::npos;
                if (singleLaunch || autoexec == nullptr)
                {
                    autoexec = &candidate;
                }
            }
        }

        if (autoexec == nullptr)
        {
            // Fall back to any config that has the section, even an empty one.
            auto it = std::find_if(candidates.begin(), candidates.end(), [](const CandidateConfig& candidate)
            {
                return candidate.hasStartupSection;
            });

            if (it != candidates.end())
            {
                autoexec = &(*it);
            }
        }

        if (autoexec == nullptr)
        {
            return std::nullopt;
        }

        configs.autoexecConfig = autoexec->path;
        return configs;
    }

    bool Resolve(const std::filesystem::path& configRoot, ResolvedConfigs& configs, Journal& journal)
    {
        std::optional<ResolvedConfigs> chosen = Choose(ScanCandidates(configRoot));
        if (!chosen)
        {
            journal.lastResult = Journal::Result::AutoexecMissing;
            journal.lastErrorMessage = "No DOSBox config with autoexec found";
            journal.lastErrorDetails = { fmt::format("Looked in: {}", configRoot.string()) };

            std::vector<std::string> entries = listEntries(configRoot);
            journal.lastErrorDetails.insert(journal.lastErrorDetails.end(), entries.begin(), entries.end());
            return false;
        }

        configs = *chosen;
        return true;
    }
}
