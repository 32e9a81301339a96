#include "ImageProcessor.h"

namespace ImageConverter
{
    cv::Mat ImageProcessor::decode(const fs::path& imagePath)
    {
        if (!fs::is_regular_file(imagePath)) {
            throw DecodeError("File not found: " + imagePath.string());
        }

        cv::Mat img;
        try
        {
            img = cv::imread(imagePath.string(), cv::IMREAD_UNCHANGED);
        }
        catch (const cv::Exception& e)
        {
            throw DecodeError("Failed to load " + imagePath.string() + ": " + e.what());
        }

        if (img.empty()) {
            throw DecodeError("Failed to load " + imagePath.string() + ": unsupported or corrupt image");
        }
        return img;
    }

    cv::Mat ImageProcessor::resizeTo(const cv::Mat& image, cv::Size target)
    {
        if (image.empty()) {
            throw ResizeError("cannot resize an empty image");
        }

        // Area averaging when shrinking, Lanczos when enlarging
        bool shrinking = target.width <= image.cols && target.height <= image.rows;
        int interpolation = shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4;

        cv::Mat resized;
        try
        {
            cv::resize(image, resized, target, 0, 0, interpolation);
        }
        catch (const cv::Exception& e)
        {
            throw ResizeError(e.what());
        }

        if (resized.size() != target) {
            throw ResizeError("unexpected result size " + std::to_string(resized.cols) + "x" + std::to_string(resized.rows));
        }
        return resized;
    }

    cv::Mat ImageProcessor::resize(const cv::Mat& image, const EncodeSettings& settings)
    {
        if (settings.resizeMode != ResizeMode::Specify) {
            return image.clone();
        }

        try
        {
            return resizeTo(image, cv::Size(settings.width, settings.height));
        }
        catch (const ResizeError& e)
        {
            std::cerr << "Warning: " << e.what() << " (" << settings.width << "x" << settings.height
                      << "); keeping original size." << std::endl;
            return image.clone();
        }
    }

} // namespace ImageConverter
