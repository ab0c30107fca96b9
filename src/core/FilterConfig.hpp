#pragma once

#include "Common.h"

#include <nlohmann/json.hpp>

namespace PhotoCull
{
    /**
     * @brief Toggles and thresholds for every quality check.
     *
     * Built once before the first image is processed and read-only after
     * that. Field names match the keys of the JSON configuration file.
     */
    struct FilterConfig
    {
        FilterConfig();

        bool check_blur = true;
        double blur_threshold = 100.0;      ///< Laplacian variance; lower is stricter

        bool check_exposure = true;
        double dark_threshold = 0.5;        ///< Fraction of very dark pixels (0-1)
        double bright_threshold = 0.5;      ///< Fraction of very bright pixels (0-1)

        bool check_resolution = true;
        int min_width = 800;
        int min_height = 600;

        bool check_noise = true;
        double noise_threshold = 1000.0;    ///< Bilateral residual; higher is stricter

        bool check_duplicates = true;
        int duplicate_similarity = 5;       ///< Max hamming distance (0-64)

        bool check_closed_eyes = true;
        bool filter_no_people = false;

        std::string cascade_dir = DEFAULT_CASCADE_DIR;

        /**
         * @brief Throws ConfigurationError when a threshold is out of range.
         */
        void validate() const;

        /**
         * @brief True when a face detector has to be loaded for this config.
         */
        bool needsFaceDetector() const { return filter_no_people; }

        /**
         * @brief The check-enabled flags, as written to the report.
         */
        nlohmann::json enabledChecks() const;

        /**
         * @brief Overlays the keys present in @p j onto @p base.
         * @throws ConfigurationError on a key with the wrong type.
         */
        static FilterConfig fromJson(const nlohmann::json& j, FilterConfig base = {});

        /**
         * @brief Reads a JSON configuration file and overlays it onto @p base.
         * @throws ConfigurationError if the file cannot be read or parsed.
         */
        static FilterConfig loadFile(const fs::path& path, FilterConfig base = {});
    };

} // namespace PhotoCull
