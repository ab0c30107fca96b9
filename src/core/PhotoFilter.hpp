#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Common.h"
#include "Detectors.hpp"
#include "FilterConfig.hpp"
#include "FilterResult.hpp"
#include "ImageFinder.hpp"

namespace PhotoCull
{
    /**
     * @brief The per-image checks the aggregator consults.
     *
     * Every method returns nullopt when the image cannot be decoded and never
     * throws for an unreadable file.
     */
    class DetectorSuite {
    public:
        virtual ~DetectorSuite() = default;

        virtual std::optional<CheckOutcome> checkBlur(const std::string& path) = 0;
        virtual std::optional<ExposureOutcome> checkExposure(const std::string& path) = 0;
        virtual std::optional<CheckOutcome> checkResolution(const std::string& path) = 0;
        virtual std::optional<CheckOutcome> checkNoise(const std::string& path) = 0;
        virtual std::optional<int> countFaces(const std::string& path) = 0;
        virtual std::optional<CheckOutcome> checkClosedEyes(const std::string& path) = 0;
    };

    /**
     * @brief DetectorSuite backed by cv::imread and the OpenCV detectors.
     *
     * Keeps the last decoded image so consecutive checks on the same path
     * read the file once.
     */
    class OpenCvDetectorSuite : public DetectorSuite {
    public:
        /**
         * @throws ConfigurationError if face detection is needed and the
         * cascades cannot be loaded.
         */
        explicit OpenCvDetectorSuite(const FilterConfig& config);

        std::optional<CheckOutcome> checkBlur(const std::string& path) override;
        std::optional<ExposureOutcome> checkExposure(const std::string& path) override;
        std::optional<CheckOutcome> checkResolution(const std::string& path) override;
        std::optional<CheckOutcome> checkNoise(const std::string& path) override;
        std::optional<int> countFaces(const std::string& path) override;
        std::optional<CheckOutcome> checkClosedEyes(const std::string& path) override;

    private:
        BlurDetector m_blur;
        ExposureDetector m_exposure;
        ResolutionDetector m_resolution;
        NoiseDetector m_noise;
        std::unique_ptr<FaceDetector> m_faces;

        std::string m_loadedPath;
        cv::Mat m_loadedImage;

        // Empty Mat on decode failure
        const cv::Mat& loadImage(const std::string& path);
    };

    /**
     * @brief Runs the configured checks over photos and decides what to filter.
     */
    class PhotoFilter {
    public:
        /**
         * @brief Validates @p config and builds the OpenCV detectors for it.
         * @throws ConfigurationError
         */
        explicit PhotoFilter(const FilterConfig& config);

        PhotoFilter(const FilterConfig& config,
                    std::unique_ptr<DetectorSuite> detectors,
                    HashLookup hasher = &DuplicateFinder::hashImageFile);

        const FilterConfig& config() const { return m_config; }

        /**
         * @brief Runs every enabled check on one image, in fixed order.
         *
         * Order: blur, exposure, resolution, noise, people, closed eyes. Each
         * triggered check adds one reason (exposure may add two). Closed eyes
         * are only checked when the people check found at least one face. A
         * check whose detector cannot decode the image is treated as passed.
         */
        FilterResult filterImage(const std::string& path);

        /**
         * @brief Groups near-duplicate images using the run's hash cache.
         * Returns no groups when duplicate checking is disabled.
         */
        std::vector<DuplicateGroup> findDuplicates(const std::vector<std::string>& paths);

        /**
         * @brief Filters a batch: each image on its own, then duplicate
         * grouping over the whole batch. Results keep the order of @p paths.
         */
        std::vector<FilterResult> filterImages(const std::vector<std::string>& paths);

        std::vector<FilterResult> filterDirectory(const fs::path& directory, bool recursive = true);

        /**
         * @brief Returns @p results with every non-canonical group member
         * flagged as a duplicate of its group's first image.
         */
        static std::vector<FilterResult> applyDuplicateGroups(std::vector<FilterResult> results,
                                                              const std::vector<DuplicateGroup>& groups);

    private:
        FilterConfig m_config;
        std::unique_ptr<DetectorSuite> m_detectors;
        HashCache m_hashes;
    };

} // namespace PhotoCull
