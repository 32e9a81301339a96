#include "BaseTestFixture.h"
#include "BatchRunner.h"

class BatchRunnerTest : public BaseTestFixture {
protected:
    fs::path mixedDir;
    fs::path corruptPath;

    void SetUp() override {
        BaseTestFixture::SetUp();
        mixedDir = tempDir / "mixed";
        fs::create_directory(mixedDir);
        ASSERT_TRUE(createImage(mixedDir / "a.png", 40, 30, cv::Scalar(10, 20, 30)));
        ASSERT_TRUE(createImage(mixedDir / "b.jpg", 40, 30, cv::Scalar(40, 50, 60)));
        ASSERT_TRUE(createImage(mixedDir / "c.bmp", 40, 30, cv::Scalar(70, 80, 90)));
        corruptPath = mixedDir / "d_corrupt.png";
        touch(corruptPath, "garbage bytes, not a PNG stream");
    }
};

TEST_F(BatchRunnerTest, EnumerateUsesSortedOrder) {
    BatchRunner runner;
    auto files = runner.enumerate(mixedDir);

    ASSERT_EQ(files.size(), 4);
    ASSERT_EQ(files[0].filename().string(), "a.png");
    ASSERT_EQ(files[3].filename().string(), "d_corrupt.png");
    ASSERT_EQ(runner.state(), BatchRunner::State::Enumerating);
}

TEST_F(BatchRunnerTest, EnumerateMissingFolderIsAnError) {
    BatchRunner runner;
    ASSERT_THROW(runner.enumerate(tempDir / "nowhere"), EnumerationError);
    ASSERT_EQ(runner.state(), BatchRunner::State::Done);
}

TEST_F(BatchRunnerTest, EnumerateEmptyFolderIsNotAnError) {
    BatchRunner runner;
    auto files = runner.enumerate(emptyDir);
    ASSERT_TRUE(files.empty());
}

TEST_F(BatchRunnerTest, CorruptFileIsIsolated) {
    BatchRunner runner;
    auto files = runner.enumerate(mixedDir);

    BatchResult result = runner.run(files, TargetFormat::WebP, EncodeSettings::webpDefaults(), outputDir);

    ASSERT_EQ(result.successes, 3);
    ASSERT_EQ(result.failures, 1);
    ASSERT_EQ(result.perFileErrors.size(), 1);
    ASSERT_EQ(result.perFileErrors[0].path, corruptPath);
    ASSERT_FALSE(result.perFileErrors[0].message.empty());

    ASSERT_TRUE(fs::exists(outputDir / "a.webp"));
    ASSERT_TRUE(fs::exists(outputDir / "b.webp"));
    ASSERT_TRUE(fs::exists(outputDir / "c.webp"));
    ASSERT_FALSE(fs::exists(outputDir / "d_corrupt.webp"));

    ASSERT_EQ(result.outcome(), BatchOutcome::PartialFailure);
    ASSERT_EQ(runner.state(), BatchRunner::State::Done);
}

TEST_F(BatchRunnerTest, ProgressIsReportedAfterEachFile) {
    std::vector<std::pair<std::size_t, std::size_t>> calls;
    std::vector<std::string> messages;
    BatchRunner runner([&](std::size_t current, std::size_t total, const std::string& message) {
        calls.emplace_back(current, total);
        messages.push_back(message);
    });

    auto files = runner.enumerate(mixedDir);
    runner.run(files, TargetFormat::WebP, EncodeSettings::webpDefaults(), outputDir);

    ASSERT_EQ(calls.size(), 4);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        ASSERT_EQ(calls[i].first, i + 1);
        ASSERT_EQ(calls[i].second, 4);
    }
    ASSERT_NE(messages[0].find("a.png"), std::string::npos);
    ASSERT_EQ(messages[3].rfind("Failed d_corrupt.png", 0), 0u);
    ASSERT_EQ(runner.processed(), 4);
}

TEST_F(BatchRunnerTest, ResizeAppliesToEveryFile) {
    EncodeSettings settings = EncodeSettings::webpDefaults();
    settings.resizeMode = ResizeMode::Specify;
    settings.width = 16;
    settings.height = 12;

    BatchRunner runner;
    std::vector<fs::path> files = {imgRed_png, imgGreen_jpg};
    BatchResult result = runner.run(files, TargetFormat::WebP, settings, outputDir);

    ASSERT_EQ(result.successes, 2);
    for (const auto& out : result.outputs) {
        cv::Mat decoded = cv::imread(out.string(), cv::IMREAD_UNCHANGED);
        ASSERT_FALSE(decoded.empty()) << out;
        ASSERT_EQ(decoded.cols, 16);
        ASSERT_EQ(decoded.rows, 12);
    }
}

TEST_F(BatchRunnerTest, SharedBaseNameIsReported) {
    ASSERT_TRUE(createImage(emptyDir / "photo.png", 30, 20, cv::Scalar(0, 0, 255)));
    ASSERT_TRUE(createImage(emptyDir / "photo.jpg", 60, 40, cv::Scalar(0, 255, 0)));

    BatchRunner runner;
    auto files = runner.enumerate(emptyDir);
    BatchResult result = runner.run(files, TargetFormat::WebP, EncodeSettings::webpDefaults(), outputDir);

    ASSERT_EQ(result.successes, 2);
    ASSERT_EQ(result.overwrittenOutputs.size(), 1u);
    ASSERT_EQ(result.overwrittenOutputs[0], outputDir / "photo.webp");

    // photo.png sorts last, so its pixels survive
    cv::Mat decoded = cv::imread((outputDir / "photo.webp").string(), cv::IMREAD_UNCHANGED);
    ASSERT_EQ(decoded.cols, 30);
}

TEST_F(BatchRunnerTest, DistinctBaseNamesAreNotReported) {
    BatchRunner runner;
    auto files = runner.enumerate(inputDir);
    BatchResult result = runner.run(files, TargetFormat::WebP, EncodeSettings::webpDefaults(), outputDir);
    ASSERT_TRUE(result.overwrittenOutputs.empty());
}

TEST_F(BatchRunnerTest, ConvertFileReturnsOutputPath) {
    fs::path out = BatchRunner::convertFile(imgBlue_bmp, TargetFormat::WebP, EncodeSettings::webpDefaults(), outputDir);
    ASSERT_EQ(out, outputDir / "blue_50x50.webp");
    ASSERT_TRUE(fs::exists(out));
}

TEST(BatchResultTest, Outcomes) {
    BatchResult result;
    ASSERT_EQ(result.outcome(), BatchOutcome::NothingToConvert);

    result.successes = 2;
    ASSERT_EQ(result.outcome(), BatchOutcome::AllSucceeded);
    ASSERT_EQ(result.summary(), "Batch conversion complete! Converted 2 image(s).");

    result.failures = 1;
    ASSERT_EQ(result.outcome(), BatchOutcome::PartialFailure);
    ASSERT_EQ(result.summary(), "Batch conversion finished: 2 converted, 1 failed.");

    result.successes = 0;
    ASSERT_EQ(result.outcome(), BatchOutcome::AllFailed);
    ASSERT_EQ(result.total(), 1);
}
