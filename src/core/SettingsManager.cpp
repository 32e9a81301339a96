#include "SettingsManager.h"

namespace ImageConverter
{
    SettingsManager::SettingsManager(SettingsStore store)
        : m_store(std::move(store))
    {
        SettingsStore::LoadResult loaded = m_store.load();
        m_document = loaded.document;
        m_loadStatus = loaded.status;
    }

    SettingsManager::~SettingsManager()
    {
        flush();
    }

    bool SettingsManager::setEncodeSettings(TargetFormat format, const EncodeSettings& settings)
    {
        settings.validate();
        m_document.settingsFor(format) = settings;
        return flush();
    }

    bool SettingsManager::setOutputFolder(const std::optional<std::string>& folder)
    {
        m_document.outputFolderPath = folder;
        return flush();
    }

    bool SettingsManager::setBatchFolder(const std::optional<std::string>& folder)
    {
        m_document.batchFolderPath = folder;
        return flush();
    }

    bool SettingsManager::flush()
    {
        try
        {
            m_store.save(m_document);
            return true;
        }
        catch (const PersistenceError& e)
        {
            std::cerr << "ERROR: " << e.what() << std::endl;
            return false;
        }
    }

} // namespace ImageConverter
