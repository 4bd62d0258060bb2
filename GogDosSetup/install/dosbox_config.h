#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * Line-oriented helpers for DOSBox configuration files.
 *
 * GOG ships free-form key/value text, so nothing here parses the files into
 * a structure. Every rewrite is a function over the line list, and applying
 * it twice has the same effect as applying it once.
 */
namespace DosboxConfig
{
    constexpr std::string_view DisplaySection = "sdl";
    constexpr std::string_view StartupSection = "autoexec";

    /**
     * Split on '\n'. Carriage returns stay attached to their line and a
     * trailing newline yields a final empty element, so JoinLines restores
     * the input byte for byte.
     */
    std::vector<std::string> SplitLines(std::string_view text);
    std::string JoinLines(const std::vector<std::string>& lines);

    bool ReadLines(const std::filesystem::path& path, std::vector<std::string>& lines);
    bool WriteLines(const std::filesystem::path& path, const std::vector<std::string>& lines);

    // True when the line, trimmed, is "[section]" (case-insensitive).
    bool IsSectionHeader(std::string_view line, std::string_view section);

    bool HasSection(const std::vector<std::string>& lines, std::string_view section);

    /**
     * Lines after the first [autoexec] header up to the end of the file.
     * Empty when there is no header.
     */
    std::vector<std::string> GetStartupLines(const std::vector<std::string>& lines);

    // Startup section holds at least one line that is neither blank nor starts with #.
    bool HasStartupCommands(const std::vector<std::string>& lines);

    // output=opengl -> output=openglnb (whole line only).
    bool ApplySharpOutput(std::vector<std::string>& lines);

    // Every game.gog -> game.ins, so the CD image with audio tracks is mounted.
    bool ApplyCdAudioImage(std::vector<std::string>& lines);

    /**
     * Point mounts authored for the nested GOG layout at the flat output:
     * mount c "data" and mount c ".." become mount C "." and "data/ becomes "./
     */
    bool ApplyFlatMountPaths(std::vector<std::string>& lines);

    bool Contains(const std::vector<std::string>& lines, std::string_view needle);
}
