#include "dosbox_config.h"

#include <array>
#include <cctype>
#include <fstream>
#include <iterator>

namespace DosboxConfig
{
    static std::string_view trim(std::string_view str)
    {
        size_t begin = 0;
        while (begin < str.size() && std::isspace((unsigned char)(str[begin])))
        {
            begin++;
        }

        size_t end = str.size();
        while (end > begin && std::isspace((unsigned char)(str[end - 1])))
        {
            end--;
        }

        return str.substr(begin, end - begin);
    }

    static std::string_view withoutCarriageReturn(std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }

        return line;
    }

    static bool equalsIgnoreCase(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
        {
            return false;
        }

        for (size_t i = 0; i < a.size(); i++)
        {
            if (std::tolower((unsigned char)(a[i])) != std::tolower((unsigned char)(b[i])))
            {
                return false;
            }
        }

        return true;
    }

    static bool replaceAll(std::string& str, std::string_view from, std::string_view to)
    {
        bool replaced = false;
        size_t position = 0;
        while ((position = str.find(from, position)) != std::string::npos)
        {
            str.replace(position, from.size(), to);
            position += to.size();
            replaced = true;
        }

        return replaced;
    }

    std::vector<std::string> SplitLines(std::string_view text)
    {
        std::vector<std::string> lines;
        size_t start = 0;
        while (true)
        {
            size_t end = text.find('\n', start);
            if (end == std::string_view::npos)
            {
                lines.emplace_back(text.substr(start));
                break;
            }

            lines.emplace_back(text.substr(start, end - start));
            start = end + 1;
        }

        return lines;
    }

    std::string JoinLines(const std::vector<std::string>& lines)
    {
        std::string text;
        for (size_t i = 0; i < lines.size(); i++)
        {
            if (i > 0)
            {
                text += '\n';
            }

            text += lines[i];
        }

        return text;
    }

    bool ReadLines(const std::filesystem::path& path, std::vector<std::string>& lines)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream.is_open())
        {
            return false;
        }

        std::string text((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
        if (stream.bad())
        {
            return false;
        }

        lines = SplitLines(text);
        return true;
    }

    bool WriteLines(const std::filesystem::path& path, const std::vector<std::string>& lines)
    {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
        {
            return false;
        }

        std::string text = JoinLines(lines);
        stream.write(text.data(), text.size());
        stream.close();
        return !stream.fail();
    }

    bool IsSectionHeader(std::string_view line, std::string_view section)
    {
        std::string_view trimmed = trim(line);
        if (trimmed.size() != section.size() + 2 || trimmed.front() != '[' || trimmed.back() != ']')
        {
            return false;
        }

        return equalsIgnoreCase(trimmed.substr(1, section.size()), section);
    }

    bool HasSection(const std::vector<std::string>& lines, std::string_view section)
    {
        for (const std::string& line : lines)
        {
            if (IsSectionHeader(line, section))
            {
                return true;
            }
        }

        return false;
    }

    std::vector<std::string> GetStartupLines(const std::vector<std::string>& lines)
    {
        for (size_t i = 0; i < lines.size(); i++)
        {
            if (IsSectionHeader(lines[i], StartupSection))
            {
                return std::vector<std::string>(lines.begin() + i + 1, lines.end());
            }
        }

        return {};
    }

    bool HasStartupCommands(const std::vector<std::string>& lines)
    {
        for (const std::string& line : GetStartupLines(lines))
        {
            // Only a '#' in the first column starts a comment.
            if (!trim(line).empty() && line.front() != '#')
            {
                return true;
            }
        }

        return false;
    }

    bool ApplySharpOutput(std::vector<std::string>& lines)
    {
        bool changed = false;
        for (std::string& line : lines)
        {
            if (withoutCarriageReturn(line) == "output=opengl")
            {
                bool hasCarriageReturn = line.size() != withoutCarriageReturn(line).size();
                line = hasCarriageReturn ? "output=openglnb\r" : "output=openglnb";
                changed = true;
            }
        }

        return changed;
    }

    bool ApplyCdAudioImage(std::vector<std::string>& lines)
    {
        bool changed = false;
        for (std::string& line : lines)
        {
            changed |= replaceAll(line, "game.gog", "game.ins");
        }

        return changed;
    }

    bool ApplyFlatMountPaths(std::vector<std::string>& lines)
    {
        static const std::array<std::string_view, 4> mountPatterns =
        {
            "mount c \"data\"",
            "mount C \"data\"",
            "mount c \"..\"",
            "mount C \"..\""
        };

        bool changed = false;
        for (std::string& line : lines)
        {
            for (std::string_view pattern : mountPatterns)
            {
                changed |= replaceAll(line, pattern, "mount C \".\"");
            }

            changed |= replaceAll(line, "\"data/", "\"./");
        }

        return changed;
    }

    bool Contains(const std::vector<std::string>& lines, std::string_view needle)
    {
        for (const std::string& line : lines)
        {
            if (line.find(needle) != std::string::npos)
            {
                return true;
            }
        }

        return false;
    }
}
