#pragma once
#include "Common.h"

namespace ImageConverter
{
    /**
     * @brief Path derivation and directory helpers shared by single and batch conversion.
     */
    class FileSystemEntries
    {
    public:
        // --- Utility Methods ---

        /**
         * @brief Creates a directory (and its parents) when it does not exist yet.
         * @throws PrerequisiteError when the directory cannot be created.
         */
        static void ensureDirectory(const fs::path& directory);

        /**
         * @brief Converts a relative path to an absolute path.
         */
        static fs::path makeAbsolute(const fs::path& path);

        /**
         * @brief Directory holding the running executable, or the working directory
         * when it cannot be determined.
         */
        static fs::path executableDirectory();

        // --- Core File System Methods ---

        /**
         * @brief Derives the output path for a source file.
         *
         * Takes the base name of sourcePath without its extension, appends newExtension
         * and joins the result with outputDir. Pure: no I/O, no existence checks.
         *
         * @param sourcePath   Source image, e.g. "/a/b/photo.PNG".
         * @param outputDir    Directory the output is written to.
         * @param newExtension Extension including the leading dot, e.g. ".webp".
         */
        static fs::path resolveOutputPath(const fs::path& sourcePath,
                                          const fs::path& outputDir,
                                          std::string newExtension);

        /**
         * @brief Lists regular files directly inside directory whose lower-cased name ends in
         * one of SUPPORTED_INPUT_EXTENSIONS, sorted by file name.
         *
         * An empty result is not an error.
         * @throws EnumerationError when the directory is missing, not a directory or unreadable.
         */
        static std::vector<fs::path> listConvertibleImages(const fs::path& directory);
    };

} // namespace ImageConverter
