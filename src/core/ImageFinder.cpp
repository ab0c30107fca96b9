#include "ImageFinder.hpp"

#include <iostream>

namespace PhotoCull
{

// ================= HashCache =================

HashCache::HashCache(HashLookup compute) : m_compute(std::move(compute)) {}

std::optional<PerceptualHash> HashCache::get(const std::string& path) {
    auto it = m_cache.find(path);
    if (it != m_cache.end()) return it->second;

    auto hash = m_compute(path);
    m_cache.emplace(path, hash);
    return hash;
}

// ================= DuplicateFinder =================

PerceptualHash DuplicateFinder::computeAverageHash(const cv::Mat& img) {
    if (img.empty()) return 0;
    cv::Mat gray;
    // 1. Convert to Gray, 2. Resize to 8x8
    if (img.channels() == 4) cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
    else if (img.channels() == 3) cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    else gray = img;

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(8, 8), 0, 0, cv::INTER_AREA);
    if (resized.depth() != CV_8U) resized.convertTo(resized, CV_8U);

    // 3. Compute Mean
    double mean = cv::mean(resized)[0];

    // 4. Compute Bits
    PerceptualHash hash = 0;
    for (int i = 0; i < resized.rows; ++i) {
        for (int j = 0; j < resized.cols; ++j) {
            if (resized.at<uint8_t>(i, j) > mean) {
                hash |= (1ULL << (i * 8 + j));
            }
        }
    }
    return hash;
}

std::optional<PerceptualHash> DuplicateFinder::hashImageFile(const std::string& path) {
    cv::Mat img;
    try {
        img = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: failed to hash image " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    if (img.empty()) {
        std::cerr << "Warning: failed to hash image " << path << std::endl;
        return std::nullopt;
    }
    return computeAverageHash(img);
}

int DuplicateFinder::hammingDistance(PerceptualHash h1, PerceptualHash h2) {
    PerceptualHash x = h1 ^ h2;
    // Kernighan's bit count
    int dist = 0;
    while (x) {
        dist++;
        x &= x - 1;
    }
    return dist;
}

std::vector<DuplicateGroup> DuplicateFinder::findDuplicateGroups(const std::vector<std::string>& images,
                                                                 const HashLookup& hashOf,
                                                                 int threshold)
{
    // 1. Calc Hashes (input order, unhashable images dropped)
    std::vector<std::pair<std::string, PerceptualHash>> hashes;
    for (const auto& path : images) {
        auto h = hashOf(path);
        if (h) hashes.push_back({path, *h});
    }

    // 2. Group O(N*M) against each canonical only
    std::vector<DuplicateGroup> groups;
    std::vector<bool> visited(hashes.size(), false);

    for (size_t i = 0; i < hashes.size(); ++i) {
        if (visited[i]) continue;

        DuplicateGroup group;
        group.push_back(hashes[i].first);
        visited[i] = true;

        for (size_t j = i + 1; j < hashes.size(); ++j) {
            if (visited[j]) continue;
            if (hammingDistance(hashes[i].second, hashes[j].second) <= threshold) {
                group.push_back(hashes[j].first);
                visited[j] = true;
            }
        }

        if (group.size() > 1) {
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

} // namespace PhotoCull
