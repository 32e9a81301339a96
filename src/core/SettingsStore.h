#pragma once
#include "Common.h"
#include "EncodeSettings.h"

namespace ImageConverter
{
    /**
     * @brief Reads and writes the settings document as a JSON file.
     *
     * Recognized top-level keys: webp_settings, avif_settings, output_folder_path and
     * batch_folder_path. Keys present in the file override the compiled-in defaults one
     * field at a time; unknown keys are ignored.
     */
    class SettingsStore
    {
    public:
        static constexpr const char* SETTINGS_FILE_NAME = "image_converter_settings.json";

        enum class LoadStatus { Loaded, NotFound, Corrupt };

        struct LoadResult
        {
            SettingsDocument document;
            LoadStatus       status{LoadStatus::NotFound};
        };

        explicit SettingsStore(fs::path settingsPath);

        /**
         * @brief <executable dir>/image_converter_settings.json
         */
        static fs::path defaultSettingsPath();

        const fs::path& path() const { return m_path; }

        /**
         * @brief Loads the document. Never throws: a missing file reports NotFound and a
         * malformed or mistyped file reports Corrupt, both with default settings.
         */
        LoadResult load() const;

        /**
         * @brief Pretty-printed JSON text of document, as written by save().
         * @throws PersistenceError when the document cannot be serialized.
         */
        static std::string serialize(const SettingsDocument& document);

        /**
         * @brief Writes all four keys as pretty-printed JSON, absent paths as null.
         * @throws PersistenceError when the file cannot be written.
         */
        void save(const SettingsDocument& document) const;

    private:
        fs::path m_path;
    };

} // namespace ImageConverter
