#pragma once
#include "Common.h"
#include "EncodeSettings.h"
#include <opencv2/opencv.hpp>

namespace ImageConverter
{
    /**
     * @brief Format-agnostic decode and resize steps of a conversion.
     */
    class ImageProcessor
    {
    public:
        /**
         * @brief Decodes an image file with its native channel layout (gray, BGR or BGRA).
         * @throws DecodeError when the file is missing, corrupt or not a decodable image.
         */
        static cv::Mat decode(const fs::path& imagePath);

        /**
         * @brief Applies the resize step of settings.
         *
         * ResizeMode::Specify produces a new image of exactly width x height. If resizing
         * fails the unresized image is returned and the failure is logged.
         * ResizeMode::Original returns an independent copy of image.
         */
        static cv::Mat resize(const cv::Mat& image, const EncodeSettings& settings);

    private:
        static cv::Mat resizeTo(const cv::Mat& image, cv::Size target);
    };

} // namespace ImageConverter
