#include "BaseTestFixture.h"
#include "SettingsManager.h"

class SettingsManagerTest : public BaseTestFixture {
protected:
    fs::path settingsPath;

    void SetUp() override {
        BaseTestFixture::SetUp();
        settingsPath = tempDir / SettingsStore::SETTINGS_FILE_NAME;
    }
};

TEST_F(SettingsManagerTest, StartsFromDefaultsWithoutFile) {
    SettingsManager manager{SettingsStore(settingsPath)};
    ASSERT_EQ(manager.loadStatus(), SettingsStore::LoadStatus::NotFound);
    ASSERT_EQ(manager.document(), SettingsDocument{});
}

TEST_F(SettingsManagerTest, MutationIsFlushedImmediately) {
    SettingsManager manager{SettingsStore(settingsPath)};

    EncodeSettings avif = manager.document().avif;
    avif.lossless = true;
    ASSERT_TRUE(manager.setEncodeSettings(TargetFormat::Avif, avif));

    // Read back through an independent store while the manager is still alive
    auto loaded = SettingsStore(settingsPath).load();
    ASSERT_EQ(loaded.status, SettingsStore::LoadStatus::Loaded);
    ASSERT_TRUE(loaded.document.avif.lossless);
}

TEST_F(SettingsManagerTest, FolderMutationsPersist) {
    {
        SettingsManager manager{SettingsStore(settingsPath)};
        ASSERT_TRUE(manager.setOutputFolder(outputDir.string()));
        ASSERT_TRUE(manager.setBatchFolder(inputDir.string()));
    }

    SettingsManager reopened{SettingsStore(settingsPath)};
    ASSERT_EQ(reopened.document().outputFolderPath, std::optional<std::string>(outputDir.string()));
    ASSERT_EQ(reopened.document().batchFolderPath, std::optional<std::string>(inputDir.string()));
}

TEST_F(SettingsManagerTest, InvalidSettingsAreRejected) {
    SettingsManager manager{SettingsStore(settingsPath)};
    EncodeSettings bad;
    bad.quality = -1;

    ASSERT_THROW(manager.setEncodeSettings(TargetFormat::WebP, bad), std::invalid_argument);
    ASSERT_EQ(manager.document().webp, EncodeSettings::webpDefaults());
}

TEST_F(SettingsManagerTest, DestructionWritesDocument) {
    {
        SettingsManager manager{SettingsStore(settingsPath)};
    }
    ASSERT_TRUE(fs::exists(settingsPath));
}

TEST_F(SettingsManagerTest, DestructionAloneRestoresLatestDocument) {
    {
        SettingsManager manager{SettingsStore(settingsPath)};
        ASSERT_TRUE(manager.setOutputFolder(outputDir.string()));
        fs::remove(settingsPath);
    }

    auto loaded = SettingsStore(settingsPath).load();
    ASSERT_EQ(loaded.status, SettingsStore::LoadStatus::Loaded);
    ASSERT_EQ(loaded.document.outputFolderPath, std::optional<std::string>(outputDir.string()));
}

TEST_F(SettingsManagerTest, UnwritableFileIsNotFatal) {
    SettingsManager manager{SettingsStore(fileNotes_txt / "settings.json")};
    ASSERT_FALSE(manager.setOutputFolder(std::string("/tmp")));
    ASSERT_EQ(manager.document().outputFolderPath, std::optional<std::string>("/tmp"));
}
