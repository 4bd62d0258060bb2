#include "scratch_tree.h"

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <os/logger.h>
#include <unistd.h>

namespace Install
{
    static const char* ScratchTemplate = "gog-dosbox-setup.XXXXXX";

    ScratchTree::~ScratchTree()
    {
        Release();
    }

    ScratchTree::ScratchTree(ScratchTree&& other) noexcept
        : m_path(std::exchange(other.m_path, {}))
    {
    }

    ScratchTree& ScratchTree::operator=(ScratchTree&& other) noexcept
    {
        if (this != &other)
        {
            Release();
            m_path = std::exchange(other.m_path, {});
        }

        return *this;
    }

    bool ScratchTree::Create(const std::filesystem::path& parentDirectory, std::string& errorMessage)
    {
        Release();

        std::string pathTemplate = (parentDirectory / ScratchTemplate).string();
        std::vector<char> buffer(pathTemplate.begin(), pathTemplate.end());
        buffer.push_back('\0');

        if (mkdtemp(buffer.data()) == nullptr)
        {
            errorMessage = fmt::format("Unable to create temporary directory in {}: {}", parentDirectory.string(), std::strerror(errno));
            return false;
        }

        m_path = std::filesystem::path(buffer.data());
        LOGF_UTILITY("Created {}", m_path.string());
        return true;
    }

    void ScratchTree::Release()
    {
        if (m_path.empty())
        {
            return;
        }

        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        if (ec)
        {
            LOGFN_WARNING("Could not remove temporary directory {}: {}", m_path.string(), ec.message());
        }
        else
        {
            LOGF_UTILITY("Removed {}", m_path.string());
        }

        m_path.clear();
    }
}
