#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "FilterResult.hpp"

namespace PhotoCull
{
    /// 64-bit average hash of an 8x8 grayscale reduction.
    using PerceptualHash = uint64_t;

    /// Returns the hash of an image, or nullopt if it cannot be decoded.
    using HashLookup = std::function<std::optional<PerceptualHash>(const std::string&)>;

    /**
     * @brief Memoization table for perceptual hashes within one run.
     *
     * Undecodable images are cached as absent too, so a file is read at most
     * once per run.
     */
    class HashCache {
    public:
        explicit HashCache(HashLookup compute);

        std::optional<PerceptualHash> get(const std::string& path);
        size_t size() const { return m_cache.size(); }

    private:
        HashLookup m_compute;
        std::map<std::string, std::optional<PerceptualHash>> m_cache;
    };

    class DuplicateFinder {
    public:
        static PerceptualHash computeAverageHash(const cv::Mat& img);

        // Decodes the file and hashes it; nullopt if it cannot be read
        static std::optional<PerceptualHash> hashImageFile(const std::string& path);

        static int hammingDistance(PerceptualHash h1, PerceptualHash h2);

        /**
         * @brief Partitions images into duplicate groups.
         *
         * Walks @p images in order. Each image not yet assigned starts a group
         * and pulls in every later unassigned image whose hash is within
         * @p threshold of it. Members are compared with the group's first image
         * only, so the grouping is not transitive: C close to member B but far
         * from canonical A stays out of A's group. Images without a hash are
         * skipped. Only groups of two or more are returned.
         */
        static std::vector<DuplicateGroup> findDuplicateGroups(const std::vector<std::string>& images,
                                                               const HashLookup& hashOf,
                                                               int threshold);
    };

} // namespace PhotoCull
