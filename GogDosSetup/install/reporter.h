#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "journal.h"

namespace Reporter
{
    constexpr int StepCount = 7;

    void Banner(const std::filesystem::path& installerPath, const std::filesystem::path& outputDirectory);

    // "[n/7] title"
    void Step(int index, std::string_view title);

    // Indented bullet below a step.
    void Item(std::string_view text);

    void Info(std::string_view text);

    /**
     * Print the failure stored in the journal to stderr, followed by its
     * detail lines and the hint for its category.
     */
    void Error(const Journal& journal);

    // Empty when the category has nothing to add to the details.
    std::string_view GetHint(Journal::Category category);

    /**
     * Completion banner with the output size and the command to start the game.
     */
    void Summary(const std::filesystem::path& outputDirectory);

    /**
     * Apparent size of all regular files below directory, symlinks not followed.
     */
    uint64_t ComputeDirectorySize(const std::filesystem::path& directory);

    /**
     * Human-readable size in the style of "du -h": 512, 4.0K, 12M, 1.3G.
     * Fractions are rounded up.
     */
    std::string FormatSize(uint64_t bytes);
}
