#pragma once
#include "Common.h"
#include "EncodeSettings.h"
#include <functional>

namespace ImageConverter
{
    struct FileError
    {
        fs::path    path;
        std::string message;
    };

    enum class BatchOutcome { NothingToConvert, AllSucceeded, PartialFailure, AllFailed };

    /**
     * @brief Tally of one batch run. Per-file errors are kept in enumeration order.
     */
    struct BatchResult
    {
        int                    successes{0};
        int                    failures{0};
        std::vector<FileError> perFileErrors;
        std::vector<fs::path>  outputs;
        // Outputs written more than once because two sources share a base name
        std::vector<fs::path>  overwrittenOutputs;

        int total() const { return successes + failures; }
        BatchOutcome outcome() const;

        /**
         * @brief One-line status message for the caller.
         */
        std::string summary() const;
    };

    /**
     * @brief Notified after each file: 1-based index, file count and a status line.
     */
    using ProgressCallback = std::function<void(std::size_t current, std::size_t total, const std::string& message)>;

    /**
     * @brief Converts the eligible images of a folder one after another.
     *
     * Idle -> Enumerating -> Processing(i/N) -> Done. A failing file is recorded and
     * skipped; the run always continues to the next file.
     */
    class BatchRunner
    {
    public:
        enum class State { Idle, Enumerating, Processing, Done };

        explicit BatchRunner(ProgressCallback progress = {});

        /**
         * @brief Convertible images of folder, sorted by name. Empty is not an error.
         * @throws EnumerationError when the folder cannot be read.
         */
        std::vector<fs::path> enumerate(const fs::path& folder);

        /**
         * @brief Converts every path in order into outputDir.
         */
        BatchResult run(const std::vector<fs::path>& paths,
                        TargetFormat format,
                        const EncodeSettings& settings,
                        const fs::path& outputDir);

        /**
         * @brief Decode, resize, encode and write one file.
         * @return The written output path.
         * @throws DecodeError, EncodeError
         */
        static fs::path convertFile(const fs::path& sourcePath,
                                    TargetFormat format,
                                    const EncodeSettings& settings,
                                    const fs::path& outputDir);

        State state() const { return m_state; }
        std::size_t processed() const { return m_processed; }

    private:
        void notify(std::size_t current, std::size_t total, const std::string& message) const;

        ProgressCallback m_progress;
        State            m_state{State::Idle};
        std::size_t      m_processed{0};
    };

} // namespace ImageConverter
