#include "SettingsStore.h"
#include "FileSystemEntries.h"
#include <fstream>

// JSON Support
#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace ImageConverter
{
    namespace
    {
        const char* KEY_WEBP = "webp_settings";
        const char* KEY_AVIF = "avif_settings";
        const char* KEY_OUTPUT_FOLDER = "output_folder_path";
        const char* KEY_BATCH_FOLDER = "batch_folder_path";

        json encodeSettingsToJson(const EncodeSettings& s)
        {
            return json{
                {"lossless", s.lossless},
                {"quality", s.quality},
                {"resize_mode", toString(s.resizeMode)},
                {"width", s.width},
                {"height", s.height}
            };
        }

        int readInteger(const json& j, const char* key)
        {
            const json& value = j.at(key);
            if (!value.is_number_integer()) {
                throw std::invalid_argument(std::string("'") + key + "' must be an integer");
            }
            return value.get<int>();
        }

        // Only keys present in j override the values already in target.
        void mergeEncodeSettings(const json& j, EncodeSettings& target)
        {
            if (!j.is_object()) {
                throw std::invalid_argument("encode settings must be a JSON object");
            }

            EncodeSettings merged = target;
            if (j.contains("lossless")) merged.lossless = j.at("lossless").get<bool>();
            if (j.contains("quality")) merged.quality = readInteger(j, "quality");
            if (j.contains("resize_mode")) merged.resizeMode = parseResizeMode(j.at("resize_mode").get<std::string>());
            if (j.contains("width")) merged.width = readInteger(j, "width");
            if (j.contains("height")) merged.height = readInteger(j, "height");

            merged.validate();
            target = merged;
        }

        std::optional<std::string> readOptionalPath(const json& j, const char* key)
        {
            if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
            return j.at(key).get<std::string>();
        }
    } // namespace

    SettingsStore::SettingsStore(fs::path settingsPath)
        : m_path(std::move(settingsPath))
    {
    }

    fs::path SettingsStore::defaultSettingsPath()
    {
        return FileSystemEntries::executableDirectory() / SETTINGS_FILE_NAME;
    }

    SettingsStore::LoadResult SettingsStore::load() const
    {
        LoadResult result;

        std::error_code ec;
        if (!fs::exists(m_path, ec)) {
            std::cout << "Settings file not found at '" << m_path.string() << "'; using defaults." << std::endl;
            result.status = LoadStatus::NotFound;
            return result;
        }

        try
        {
            std::ifstream f(m_path);
            if (!f) {
                throw std::runtime_error("cannot open file");
            }
            json config = json::parse(f);
            if (!config.is_object()) {
                throw std::invalid_argument("top-level value must be a JSON object");
            }

            SettingsDocument doc;
            if (config.contains(KEY_WEBP)) mergeEncodeSettings(config.at(KEY_WEBP), doc.webp);
            if (config.contains(KEY_AVIF)) mergeEncodeSettings(config.at(KEY_AVIF), doc.avif);
            doc.outputFolderPath = readOptionalPath(config, KEY_OUTPUT_FOLDER);

            // A remembered batch folder is only kept while it still exists
            auto batchFolder = readOptionalPath(config, KEY_BATCH_FOLDER);
            if (batchFolder && fs::is_directory(*batchFolder, ec)) {
                doc.batchFolderPath = batchFolder;
            }

            result.document = doc;
            result.status = LoadStatus::Loaded;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: could not read settings file '" << m_path.string()
                      << "' (" << e.what() << "); using defaults." << std::endl;
            result.document = SettingsDocument{};
            result.status = LoadStatus::Corrupt;
        }
        return result;
    }

    std::string SettingsStore::serialize(const SettingsDocument& document)
    {
        json config;
        config[KEY_WEBP] = encodeSettingsToJson(document.webp);
        config[KEY_AVIF] = encodeSettingsToJson(document.avif);
        config[KEY_OUTPUT_FOLDER] = document.outputFolderPath ? json(*document.outputFolderPath) : json(nullptr);
        config[KEY_BATCH_FOLDER] = document.batchFolderPath ? json(*document.batchFolderPath) : json(nullptr);

        try
        {
            return config.dump(4);
        }
        catch (const json::exception& e)
        {
            throw PersistenceError(std::string("Cannot serialize settings: ") + e.what());
        }
    }

    void SettingsStore::save(const SettingsDocument& document) const
    {
        std::string text = serialize(document);

        std::ofstream out(m_path, std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot open settings file for writing: " + m_path.string());
        }
        out << text << std::endl;
        if (!out) {
            throw PersistenceError("Failed to write settings file: " + m_path.string());
        }
    }

} // namespace ImageConverter
