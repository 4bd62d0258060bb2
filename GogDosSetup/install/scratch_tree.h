#pragma once

#include <filesystem>
#include <string>

namespace Install
{
    /**
     * Uniquely named temporary directory holding the raw extraction output.
     * The whole tree is removed when the object goes out of scope, on the
     * success path and on every early return alike.
     */
    class ScratchTree
    {
    public:
        ScratchTree() = default;
        ~ScratchTree();

        // Non-copyable
        ScratchTree(const ScratchTree&) = delete;
        ScratchTree& operator=(const ScratchTree&) = delete;

        // Movable
        ScratchTree(ScratchTree&& other) noexcept;
        ScratchTree& operator=(ScratchTree&& other) noexcept;

        /**
         * Create a fresh directory inside parentDirectory.
         * @param errorMessage Filled when creation fails
         * @return true if the directory was created
         */
        bool Create(const std::filesystem::path& parentDirectory, std::string& errorMessage);

        /**
         * Remove the tree now. Safe to call more than once.
         */
        void Release();

        bool IsValid() const { return !m_path.empty(); }

        const std::filesystem::path& GetPath() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };
}
