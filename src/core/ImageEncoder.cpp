#include "ImageEncoder.h"
#include <webp/encode.h>
#include <fstream>

namespace ImageConverter
{
    EncodeOptions ImageEncoder::buildOptions(TargetFormat format, const EncodeSettings& settings)
    {
        EncodeOptions options;
        options.format = format;
        options.lossless = settings.lossless;

        if (format == TargetFormat::WebP) {
            if (!settings.lossless) {
                options.quality = settings.quality;
            }
            options.method = WEBP_METHOD;
        } else {
            options.quality = settings.lossless ? AVIF_LOSSLESS_QUALITY : settings.quality;
            options.speed = AVIF_SPEED;
        }
        return options;
    }

    bool ImageEncoder::isAvailable(TargetFormat format)
    {
        if (format == TargetFormat::WebP) {
            return WebPGetEncoderVersion() > 0;
        }
        try
        {
            return cv::haveImageWriter("probe.avif");
        }
        catch (const cv::Exception& e)
        {
            std::cerr << "Warning: could not query AVIF writer: " << e.what() << std::endl;
            return false;
        }
    }

    void ImageEncoder::encode(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination)
    {
        if (image.empty()) {
            throw EncodeError("Nothing to encode for " + destination.string());
        }
        if (!isAvailable(options.format)) {
            throw CodecUnavailableError(toString(options.format));
        }

        if (options.format == TargetFormat::WebP) {
            encodeWebP(image, options, destination);
        } else {
            encodeAvif(image, options, destination);
        }
    }

    cv::Mat ImageEncoder::to8Bit(const cv::Mat& image)
    {
        cv::Mat img8;
        switch (image.depth()) {
            case CV_8U:
                img8 = image;
                break;
            case CV_16U:
                image.convertTo(img8, CV_8U, 1.0 / 257.0);
                break;
            case CV_32F:
            case CV_64F:
                image.convertTo(img8, CV_8U, 255.0);
                break;
            default:
                throw EncodeError("Unsupported pixel depth: " + std::to_string(image.depth()));
        }
        return img8;
    }

    cv::Mat ImageEncoder::toWebPLayout(const cv::Mat& image)
    {
        cv::Mat img8 = to8Bit(image);
        cv::Mat out;
        switch (img8.channels()) {
            case 1:
                cv::cvtColor(img8, out, cv::COLOR_GRAY2BGR);
                break;
            case 3:
            case 4:
                // Importers need a tightly packed buffer
                out = img8.isContinuous() ? img8 : img8.clone();
                break;
            default:
                throw EncodeError("Unsupported channel count for WebP: " + std::to_string(img8.channels()));
        }
        return out;
    }

    void ImageEncoder::encodeWebP(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination)
    {
        cv::Mat src = toWebPLayout(image);

        WebPConfig config;
        if (!WebPConfigInit(&config)) {
            throw EncodeError("WebPConfigInit failed");
        }
        config.lossless = options.lossless ? 1 : 0;
        if (options.quality) {
            config.quality = static_cast<float>(*options.quality);
        }
        config.method = options.method;
        if (!WebPValidateConfig(&config)) {
            throw EncodeError("Invalid WebP configuration");
        }

        WebPPicture picture;
        if (!WebPPictureInit(&picture)) {
            throw EncodeError("WebPPictureInit failed");
        }
        picture.width = src.cols;
        picture.height = src.rows;
        picture.use_argb = options.lossless ? 1 : 0;

        const int stride = static_cast<int>(src.step[0]);
        int imported = src.channels() == 4
            ? WebPPictureImportBGRA(&picture, src.ptr<uint8_t>(), stride)
            : WebPPictureImportBGR(&picture, src.ptr<uint8_t>(), stride);
        if (!imported) {
            WebPPictureFree(&picture);
            throw EncodeError("WebPPictureImport failed (out of memory?)");
        }

        WebPMemoryWriter writer;
        WebPMemoryWriterInit(&writer);
        picture.writer = WebPMemoryWrite;
        picture.custom_ptr = &writer;

        if (!WebPEncode(&config, &picture)) {
            int code = picture.error_code;
            WebPPictureFree(&picture);
            WebPMemoryWriterClear(&writer);
            throw EncodeError("WebPEncode failed with error code " + std::to_string(code));
        }
        WebPPictureFree(&picture);

        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            WebPMemoryWriterClear(&writer);
            throw EncodeError("Cannot open output file: " + destination.string());
        }
        out.write(reinterpret_cast<const char*>(writer.mem), static_cast<std::streamsize>(writer.size));
        out.close();
        WebPMemoryWriterClear(&writer);

        if (!out) {
            throw EncodeError("Failed to write output file: " + destination.string());
        }
    }

    void ImageEncoder::encodeAvif(const cv::Mat& image, const EncodeOptions& options, const fs::path& destination)
    {
        std::vector<int> params = {
            cv::IMWRITE_AVIF_QUALITY, options.quality.value_or(AVIF_LOSSLESS_QUALITY),
            cv::IMWRITE_AVIF_SPEED, options.speed
        };

        cv::Mat img8 = to8Bit(image);
        bool written = false;
        try
        {
            written = cv::imwrite(destination.string(), img8, params);
        }
        catch (const cv::Exception& e)
        {
            throw EncodeError("AVIF encoding failed for " + destination.string() + ": " + e.what());
        }

        if (!written) {
            throw EncodeError("Failed to write output file: " + destination.string());
        }
    }

} // namespace ImageConverter
