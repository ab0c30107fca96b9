#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "Common.h"

namespace PhotoCull
{
    class FSETool {
    public:
        static std::string toAbsolutePath(const std::string& path);

        /**
         * @brief Creates a directory (and parents) if it does not exist.
         * @throws IOFailure if it cannot be created.
         */
        static void createDirectory(const fs::path& dirpath);

        static bool hasSupportedExtension(const fs::path& path);

        /**
         * @brief Lists supported images under @p directory.
         * @return Absolute paths, sorted lexicographically.
         */
        static std::vector<std::string> getImageFiles(const fs::path& directory, bool recursive = true);

        /**
         * @brief Path of @p file relative to @p root, or just the file name
         * when it lies outside @p root.
         */
        static fs::path relativeTo(const fs::path& file, const fs::path& root);
    };

    enum class TransferAction {
        Report,
        Copy,
        Move
    };

    /// "report", "copy" or "move"; throws ConfigurationError otherwise.
    TransferAction parseTransferAction(const std::string& name);
    std::string toString(TransferAction action);

    class FileTransfer {
    public:
        /**
         * @brief Copies or moves @p files from under @p sourceRoot into
         * @p destRoot, keeping their relative directory layout.
         *
         * Stops at the first failure; files already transferred stay where
         * they are.
         *
         * @return Number of files transferred (0 for TransferAction::Report).
         * @throws IOFailure
         */
        static int transfer(const std::vector<std::string>& files,
                            const fs::path& sourceRoot,
                            const fs::path& destRoot,
                            TransferAction action);

    private:
        static void moveFile(const fs::path& from, const fs::path& to);
    };

} // namespace PhotoCull
