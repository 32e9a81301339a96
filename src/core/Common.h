#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

// --- C++ Namespace Setup ---

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for the Image Converter.
 */
namespace ImageConverter
{
    // Source extensions accepted for single and batch conversion (lower-case, dotted)
    const std::vector<std::string> SUPPORTED_INPUT_EXTENSIONS = {
        ".png", ".jpg", ".jpeg", ".bmp", ".gif"
    };

    /**
     * @brief Base exception for every error raised by the conversion engine.
     */
    class ConverterException : public std::runtime_error {
    public:
        explicit ConverterException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Missing source/output path or codec unavailable. Fatal to the requested operation.
     */
    class PrerequisiteError : public ConverterException {
    public:
        explicit PrerequisiteError(const std::string& message)
            : ConverterException("Prerequisite Error: " + message) {}
    };

    /**
     * @brief Raised when the external codec is not built with the requested writer.
     */
    class CodecUnavailableError : public PrerequisiteError {
    public:
        explicit CodecUnavailableError(const std::string& format)
            : PrerequisiteError("codec unavailable for '" + format + "'") {}
    };

    class DecodeError : public ConverterException {
    public:
        explicit DecodeError(const std::string& message)
            : ConverterException("Decode Error: " + message) {}
    };

    class EncodeError : public ConverterException {
    public:
        explicit EncodeError(const std::string& message)
            : ConverterException("Encode Error: " + message) {}
    };

    // Never escapes ImageProcessor; resize failures fall back to the original image.
    class ResizeError : public ConverterException {
    public:
        explicit ResizeError(const std::string& message)
            : ConverterException("Resize Error: " + message) {}
    };

    /**
     * @brief Batch folder missing or unreadable. Distinct from an empty folder.
     */
    class EnumerationError : public ConverterException {
    public:
        explicit EnumerationError(const std::string& message)
            : ConverterException("Enumeration Error: " + message) {}
    };

    class PersistenceError : public ConverterException {
    public:
        explicit PersistenceError(const std::string& message)
            : ConverterException("Persistence Error: " + message) {}
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    /**
     * @brief True when the lower-cased file name ends in one of SUPPORTED_INPUT_EXTENSIONS.
     *
     * Matches on the whole name, so dot-files such as ".png" count as images.
     */
    inline bool hasSupportedInputExtension(const fs::path& path) {
        std::string name = to_lower(path.filename().string());
        for (const auto& ext : SUPPORTED_INPUT_EXTENSIONS) {
            if (name.size() >= ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
                return true;
            }
        }
        return false;
    }

} // namespace ImageConverter
