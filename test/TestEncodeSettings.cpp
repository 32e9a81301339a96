#include "gtest/gtest.h"
#include "EncodeSettings.h"

using namespace ImageConverter;

TEST(EncodeSettingsTest, CompiledInDefaults) {
    SettingsDocument doc;
    ASSERT_EQ(doc.webp.quality, 90);
    ASSERT_EQ(doc.avif.quality, 70);
    ASSERT_FALSE(doc.webp.lossless);
    ASSERT_EQ(doc.webp.resizeMode, ResizeMode::Original);
    ASSERT_EQ(doc.avif.width, 1280);
    ASSERT_EQ(doc.avif.height, 720);
    ASSERT_FALSE(doc.outputFolderPath.has_value());
    ASSERT_FALSE(doc.batchFolderPath.has_value());
}

TEST(EncodeSettingsTest, SettingsForSelectsFormat) {
    SettingsDocument doc;
    doc.settingsFor(TargetFormat::Avif).quality = 33;
    ASSERT_EQ(doc.avif.quality, 33);
    ASSERT_EQ(doc.settingsFor(TargetFormat::WebP).quality, 90);
}

TEST(EncodeSettingsTest, ParseTargetFormat) {
    ASSERT_EQ(parseTargetFormat("webp"), TargetFormat::WebP);
    ASSERT_EQ(parseTargetFormat("AVIF"), TargetFormat::Avif);
    ASSERT_EQ(parseTargetFormat(".webp"), TargetFormat::WebP);
    ASSERT_THROW(parseTargetFormat("png"), PrerequisiteError);
}

TEST(EncodeSettingsTest, FormatNamesAndExtensions) {
    ASSERT_EQ(toString(TargetFormat::WebP), "webp");
    ASSERT_EQ(extension(TargetFormat::Avif), ".avif");
}

TEST(EncodeSettingsTest, ResizeModeNames) {
    ASSERT_EQ(parseResizeMode("specify"), ResizeMode::Specify);
    ASSERT_EQ(toString(ResizeMode::Original), "original");
    ASSERT_THROW(parseResizeMode("stretch"), std::invalid_argument);
}

TEST(EncodeSettingsTest, ValidateRejectsOutOfRange) {
    EncodeSettings s;
    ASSERT_NO_THROW(s.validate());

    s.quality = 101;
    ASSERT_THROW(s.validate(), std::invalid_argument);

    s.quality = 50;
    s.width = 0;
    ASSERT_THROW(s.validate(), std::invalid_argument);
}
