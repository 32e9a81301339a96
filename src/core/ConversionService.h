#pragma once
#include "Common.h"
#include "EncodeSettings.h"
#include "BatchRunner.h"
#include <functional>

namespace ImageConverter
{
    /**
     * @brief Entry point for callers: single-file and folder conversion.
     *
     * Both operations check their prerequisites (paths set, codec available) before
     * touching the filesystem and report progress through the callback given at
     * construction.
     */
    class ConversionService
    {
    public:
        using CodecProbe = std::function<bool(TargetFormat)>;

        explicit ConversionService(ProgressCallback progress = {}, CodecProbe codecProbe = {});

        /**
         * @brief Converts one image into outputDir, creating the directory if needed.
         * @return Path of the written file.
         * @throws PrerequisiteError (CodecUnavailableError when the codec is missing),
         *         DecodeError, EncodeError
         */
        fs::path convertOne(const fs::path& sourcePath,
                            const fs::path& outputDir,
                            TargetFormat format,
                            const EncodeSettings& settings);

        /**
         * @brief Converts every eligible image of folder into outputDir.
         *
         * An empty folder yields a result whose outcome() is NothingToConvert.
         * @throws PrerequisiteError, EnumerationError
         */
        BatchResult convertBatch(const fs::path& folder,
                                 const fs::path& outputDir,
                                 TargetFormat format,
                                 const EncodeSettings& settings);

    private:
        void requireCodec(TargetFormat format) const;

        ProgressCallback m_progress;
        CodecProbe       m_codecProbe;
    };

} // namespace ImageConverter
