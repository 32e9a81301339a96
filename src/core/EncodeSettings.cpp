#include "EncodeSettings.h"

namespace ImageConverter
{
    std::string toString(TargetFormat format)
    {
        return format == TargetFormat::WebP ? "webp" : "avif";
    }

    std::string extension(TargetFormat format)
    {
        return "." + toString(format);
    }

    TargetFormat parseTargetFormat(const std::string& name)
    {
        std::string fmt = to_lower(name);
        if (!fmt.empty() && fmt[0] == '.') fmt = fmt.substr(1);

        if (fmt == "webp") return TargetFormat::WebP;
        if (fmt == "avif") return TargetFormat::Avif;
        throw PrerequisiteError("Unsupported output format: " + name);
    }

    std::string toString(ResizeMode mode)
    {
        return mode == ResizeMode::Specify ? "specify" : "original";
    }

    ResizeMode parseResizeMode(const std::string& name)
    {
        if (name == "original") return ResizeMode::Original;
        if (name == "specify") return ResizeMode::Specify;
        throw std::invalid_argument("Unknown resize mode: '" + name + "'");
    }

    void EncodeSettings::validate() const
    {
        if (quality < 0 || quality > 100) {
            throw std::invalid_argument("quality must be within 0-100, got " + std::to_string(quality));
        }
        if (width < 1 || height < 1) {
            throw std::invalid_argument("resize dimensions must be positive, got "
                + std::to_string(width) + "x" + std::to_string(height));
        }
    }

    EncodeSettings EncodeSettings::webpDefaults()
    {
        EncodeSettings s;
        s.quality = 90;
        return s;
    }

    EncodeSettings EncodeSettings::avifDefaults()
    {
        EncodeSettings s;
        s.quality = 70;
        return s;
    }

    bool operator==(const EncodeSettings& lhs, const EncodeSettings& rhs) noexcept
    {
        return lhs.lossless == rhs.lossless &&
               lhs.quality == rhs.quality &&
               lhs.resizeMode == rhs.resizeMode &&
               lhs.width == rhs.width &&
               lhs.height == rhs.height;
    }

    bool operator!=(const EncodeSettings& lhs, const EncodeSettings& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    const EncodeSettings& SettingsDocument::settingsFor(TargetFormat format) const
    {
        return format == TargetFormat::WebP ? webp : avif;
    }

    EncodeSettings& SettingsDocument::settingsFor(TargetFormat format)
    {
        return format == TargetFormat::WebP ? webp : avif;
    }

    bool operator==(const SettingsDocument& lhs, const SettingsDocument& rhs) noexcept
    {
        return lhs.webp == rhs.webp &&
               lhs.avif == rhs.avif &&
               lhs.outputFolderPath == rhs.outputFolderPath &&
               lhs.batchFolderPath == rhs.batchFolderPath;
    }

    bool operator!=(const SettingsDocument& lhs, const SettingsDocument& rhs) noexcept
    {
        return !(lhs == rhs);
    }

} // namespace ImageConverter
