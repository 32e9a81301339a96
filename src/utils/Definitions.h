#ifndef IMAGE_CONVERTER_DEFINITIONS_H
#define IMAGE_CONVERTER_DEFINITIONS_H

#include "BatchRunner.h"

namespace Definitions {

// --- Process Exit Codes ---
const int EXIT_OK = 0;
const int EXIT_CONVERSION_FAILED = 1;
const int EXIT_USAGE_ERROR = 2;
const int EXIT_NOTHING_TO_CONVERT = 3;

// Maps a finished batch to the process exit code. An empty folder is not a success.
inline int exitCodeFor(ImageConverter::BatchOutcome outcome) {
    switch (outcome) {
        case ImageConverter::BatchOutcome::AllSucceeded: return EXIT_OK;
        case ImageConverter::BatchOutcome::NothingToConvert: return EXIT_NOTHING_TO_CONVERT;
        case ImageConverter::BatchOutcome::PartialFailure:
        case ImageConverter::BatchOutcome::AllFailed: break;
    }
    return EXIT_CONVERSION_FAILED;
}

} // namespace Definitions

#endif // IMAGE_CONVERTER_DEFINITIONS_H
