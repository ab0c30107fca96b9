#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for PhotoCull.
 */
namespace PhotoCull
{
    const std::string VERSION = "0.1.0";

    // Extensions picked up by the directory scanner (compared lowercase)
    const std::vector<std::string> SUPPORTED_IMG_FORMATS = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tiff", ".tif"
    };

    const std::string DEFAULT_REPORT_FILE = "filter_report.json";

#ifdef PHOTOCULL_CASCADE_DIR
    const std::string DEFAULT_CASCADE_DIR = PHOTOCULL_CASCADE_DIR;
#else
    const std::string DEFAULT_CASCADE_DIR = "/usr/share/opencv4/haarcascades";
#endif

    const std::string FACE_CASCADE_FILE = "haarcascade_frontalface_default.xml";
    const std::string EYE_CASCADE_FILE = "haarcascade_eye.xml";

    /**
     * @brief Base exception for every error PhotoCull reports.
     */
    class PhotoCullException : public std::runtime_error {
    public:
        explicit PhotoCullException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Invalid options or option combinations. Raised before any
     * image is processed.
     */
    class ConfigurationError : public PhotoCullException {
    public:
        explicit ConfigurationError(const std::string& message)
            : PhotoCullException("Configuration error: " + message) {}
    };

    /**
     * @brief A report, directory or file transfer could not be written.
     */
    class IOFailure : public PhotoCullException {
    public:
        explicit IOFailure(const std::string& message)
            : PhotoCullException("I/O error: " + message) {}
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

} // namespace PhotoCull
