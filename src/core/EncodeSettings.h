#pragma once
#include "Common.h"
#include <optional>

namespace ImageConverter
{
    enum class TargetFormat { WebP, Avif };

    enum class ResizeMode { Original, Specify };

    /// "webp" / "avif"
    std::string toString(TargetFormat format);
    /// ".webp" / ".avif"
    std::string extension(TargetFormat format);
    /// Case-insensitive; throws PrerequisiteError for anything but webp/avif.
    TargetFormat parseTargetFormat(const std::string& name);

    std::string toString(ResizeMode mode);
    /// Throws std::invalid_argument for anything but "original"/"specify".
    ResizeMode parseResizeMode(const std::string& name);

    /**
     * @brief Encode policy for one target format.
     */
    struct EncodeSettings
    {
        bool       lossless{false};
        int        quality{90};                    ///< 0-100, unused for lossless WebP
        ResizeMode resizeMode{ResizeMode::Original};
        int        width{1280};                    ///< >= 1, used when resizeMode == Specify
        int        height{720};                    ///< >= 1, used when resizeMode == Specify

        /**
         * @brief Throws std::invalid_argument when quality/width/height are out of range.
         */
        void validate() const;

        static EncodeSettings webpDefaults();
        static EncodeSettings avifDefaults();
    };

    bool operator==(const EncodeSettings& lhs, const EncodeSettings& rhs) noexcept;
    bool operator!=(const EncodeSettings& lhs, const EncodeSettings& rhs) noexcept;

    /**
     * @brief Everything persisted between runs: both encode policies and the last-used folders.
     */
    struct SettingsDocument
    {
        EncodeSettings             webp{EncodeSettings::webpDefaults()};
        EncodeSettings             avif{EncodeSettings::avifDefaults()};
        std::optional<std::string> outputFolderPath;
        std::optional<std::string> batchFolderPath;

        const EncodeSettings& settingsFor(TargetFormat format) const;
        EncodeSettings& settingsFor(TargetFormat format);
    };

    bool operator==(const SettingsDocument& lhs, const SettingsDocument& rhs) noexcept;
    bool operator!=(const SettingsDocument& lhs, const SettingsDocument& rhs) noexcept;

} // namespace ImageConverter
