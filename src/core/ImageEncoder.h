#pragma once
#include "Common.h"
#include "EncodeSettings.h"
#include <optional>
#include <opencv2/opencv.hpp>

namespace ImageConverter
{
    /**
     * @brief Format-specific save options derived from an EncodeSettings.
     */
    struct EncodeOptions
    {
        TargetFormat       format{TargetFormat::WebP};
        bool               lossless{false};
        std::optional<int> quality;   ///< Absent for lossless WebP
        int                method{0}; ///< WebP compression effort, 0 (fast) - 6 (smallest)
        int                speed{0};  ///< AVIF encoder speed, 0 (slowest/best) - 10 (fastest)
    };

    /**
     * @brief Maps encode policies to codec options and writes WebP/AVIF files.
     *
     * WebP goes through the libwebp advanced API so the compression method can be pinned,
     * AVIF goes through the OpenCV image writer.
     */
    class ImageEncoder
    {
    public:
        static constexpr int WEBP_METHOD = 6;
        static constexpr int AVIF_SPEED = 5;
        static constexpr int AVIF_LOSSLESS_QUALITY = 100;

        /**
         * @brief Builds codec options for format from settings.
         *
         * WebP: quality only when lossy, method fixed at WEBP_METHOD.
         * AVIF: quality always set (AVIF_LOSSLESS_QUALITY when lossless), speed fixed at AVIF_SPEED.
         */
        static EncodeOptions buildOptions(TargetFormat format, const EncodeSettings& settings);

        /**
         * @brief Encodes image and writes it to destination. The image is not modified.
         * @throws EncodeError on unsupported pixel layout, codec failure or write failure.
         * @throws CodecUnavailableError when the codec for options.format is missing.
         */
        static void encode(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination);

        /**
         * @brief True when a writer for format is compiled into the linked codecs.
         */
        static bool isAvailable(TargetFormat format);

    private:
        static void encodeWebP(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination);
        static void encodeAvif(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination);

        static cv::Mat to8Bit(const cv::Mat& image);

        // 8-bit, 3 or 4 channel copy suitable for the WebP importers
        static cv::Mat toWebPLayout(const cv::Mat& image);
    };

} // namespace ImageConverter
