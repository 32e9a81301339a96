#pragma once
#include "Common.h"
#include "EncodeSettings.h"
#include "SettingsStore.h"

namespace ImageConverter
{
    /**
     * @brief Single owner of the settings document.
     *
     * Loads the document on construction and writes it back after every mutation and
     * once more on destruction. Persistence failures are logged and reported through the
     * return value, never thrown.
     */
    class SettingsManager
    {
    public:
        explicit SettingsManager(SettingsStore store);
        ~SettingsManager();

        SettingsManager(const SettingsManager&) = delete;
        SettingsManager& operator=(const SettingsManager&) = delete;

        const SettingsDocument& document() const { return m_document; }
        SettingsStore::LoadStatus loadStatus() const { return m_loadStatus; }

        /**
         * @throws std::invalid_argument when settings fail EncodeSettings::validate().
         */
        bool setEncodeSettings(TargetFormat format, const EncodeSettings& settings);
        bool setOutputFolder(const std::optional<std::string>& folder);
        bool setBatchFolder(const std::optional<std::string>& folder);

        /**
         * @brief Writes the current document to disk.
         * @return false when the settings file could not be written.
         */
        bool flush();

    private:
        SettingsStore             m_store;
        SettingsDocument          m_document;
        SettingsStore::LoadStatus m_loadStatus;
    };

} // namespace ImageConverter
