#include "ConversionService.h"
#include "FileSystemEntries.h"
#include "ImageEncoder.h"
#include <system_error>

namespace ImageConverter
{
    ConversionService::ConversionService(ProgressCallback progress, CodecProbe codecProbe)
        : m_progress(std::move(progress)),
          m_codecProbe(codecProbe ? std::move(codecProbe) : CodecProbe(&ImageEncoder::isAvailable))
    {
    }

    void ConversionService::requireCodec(TargetFormat format) const
    {
        if (!m_codecProbe(format)) {
            throw CodecUnavailableError(toString(format));
        }
    }

    fs::path ConversionService::convertOne(const fs::path& sourcePath,
                                           const fs::path& outputDir,
                                           TargetFormat format,
                                           const EncodeSettings& settings)
    {
        if (sourcePath.empty()) {
            throw PrerequisiteError("No source image selected.");
        }
        if (outputDir.empty()) {
            throw PrerequisiteError("No output folder selected.");
        }
        requireCodec(format);

        std::error_code ec;
        fs::file_status status = fs::status(sourcePath, ec);
        if (ec && status.type() != fs::file_type::not_found) {
            throw PrerequisiteError("Could not access source image " + sourcePath.string() + ": " + ec.message());
        }
        if (!fs::is_regular_file(status)) {
            throw PrerequisiteError("Source image does not exist: " + sourcePath.string());
        }
        if (!hasSupportedInputExtension(sourcePath)) {
            throw PrerequisiteError("Not a supported image file: " + sourcePath.string());
        }
        FileSystemEntries::ensureDirectory(outputDir);

        fs::path outputPath = BatchRunner::convertFile(sourcePath, format, settings, outputDir);
        if (m_progress) {
            m_progress(1, 1, "Converted " + sourcePath.filename().string() + " -> " + outputPath.filename().string());
        }
        return outputPath;
    }

    BatchResult ConversionService::convertBatch(const fs::path& folder,
                                                const fs::path& outputDir,
                                                TargetFormat format,
                                                const EncodeSettings& settings)
    {
        if (folder.empty()) {
            throw PrerequisiteError("No batch folder selected.");
        }
        if (outputDir.empty()) {
            throw PrerequisiteError("No output folder selected.");
        }
        requireCodec(format);

        BatchRunner runner(m_progress);
        std::vector<fs::path> files = runner.enumerate(folder);
        if (files.empty()) {
            std::cout << "No convertible images in '" << folder.string() << "'." << std::endl;
            return BatchResult{};
        }

        FileSystemEntries::ensureDirectory(outputDir);
        return runner.run(files, format, settings, outputDir);
    }

} // namespace ImageConverter
