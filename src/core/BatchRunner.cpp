#include "BatchRunner.h"
#include "FileSystemEntries.h"
#include "ImageProcessor.h"
#include "ImageEncoder.h"
#include <set>
#include <sstream>

namespace ImageConverter
{
    BatchOutcome BatchResult::outcome() const
    {
        if (total() == 0) return BatchOutcome::NothingToConvert;
        if (failures == 0) return BatchOutcome::AllSucceeded;
        if (successes == 0) return BatchOutcome::AllFailed;
        return BatchOutcome::PartialFailure;
    }

    std::string BatchResult::summary() const
    {
        std::ostringstream ss;
        switch (outcome()) {
            case BatchOutcome::NothingToConvert:
                ss << "No convertible images found.";
                break;
            case BatchOutcome::AllSucceeded:
                ss << "Batch conversion complete! Converted " << successes << " image(s).";
                break;
            case BatchOutcome::PartialFailure:
                ss << "Batch conversion finished: " << successes << " converted, " << failures << " failed.";
                break;
            case BatchOutcome::AllFailed:
                ss << "Batch conversion failed: none of the " << failures << " image(s) could be converted.";
                break;
        }
        return ss.str();
    }

    BatchRunner::BatchRunner(ProgressCallback progress)
        : m_progress(std::move(progress))
    {
    }

    void BatchRunner::notify(std::size_t current, std::size_t total, const std::string& message) const
    {
        if (m_progress) {
            m_progress(current, total, message);
        }
    }

    std::vector<fs::path> BatchRunner::enumerate(const fs::path& folder)
    {
        m_state = State::Enumerating;
        m_processed = 0;
        try
        {
            auto files = FileSystemEntries::listConvertibleImages(folder);
            if (files.empty()) {
                m_state = State::Done;
            }
            return files;
        }
        catch (const EnumerationError&)
        {
            m_state = State::Done;
            throw;
        }
    }

    fs::path BatchRunner::convertFile(const fs::path& sourcePath,
                                      TargetFormat format,
                                      const EncodeSettings& settings,
                                      const fs::path& outputDir)
    {
        fs::path outputPath = FileSystemEntries::resolveOutputPath(sourcePath, outputDir, extension(format));

        // Scoped so the decoded pixels are released before the caller moves on
        {
            cv::Mat decoded = ImageProcessor::decode(sourcePath);
            cv::Mat prepared = ImageProcessor::resize(decoded, settings);
            EncodeOptions options = ImageEncoder::buildOptions(format, settings);
            ImageEncoder::encode(prepared, options, outputPath);
        }

        std::cout << "Converted '" << sourcePath.filename().string() << "' to '"
                  << outputPath.filename().string() << "'." << std::endl;
        return outputPath;
    }

    BatchResult BatchRunner::run(const std::vector<fs::path>& paths,
                                 TargetFormat format,
                                 const EncodeSettings& settings,
                                 const fs::path& outputDir)
    {
        BatchResult result;
        std::set<fs::path> written;
        const std::size_t total = paths.size();
        m_processed = 0;
        m_state = State::Processing;

        for (std::size_t i = 0; i < total; ++i)
        {
            const fs::path& source = paths[i];
            std::string message;
            try
            {
                fs::path output = convertFile(source, format, settings, outputDir);
                if (!written.insert(output).second) {
                    std::cerr << "Warning: '" << source.filename().string() << "' overwrote '"
                              << output.filename().string() << "' from an earlier file." << std::endl;
                    result.overwrittenOutputs.push_back(output);
                }
                result.outputs.push_back(output);
                result.successes++;
                message = "Converted " + source.filename().string();
            }
            catch (const std::exception& e)
            {
                std::cerr << "ERROR: " << source.string() << ": " << e.what() << std::endl;
                result.failures++;
                result.perFileErrors.push_back({source, e.what()});
                message = "Failed " + source.filename().string() + ": " + e.what();
            }

            m_processed = i + 1;
            notify(i + 1, total, message);
        }

        m_state = State::Done;
        std::cout << "\n" << result.summary() << std::endl;
        return result;
    }

} // namespace ImageConverter
