#include "PhotoFilter.hpp"
#include "FileSystemTool.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace PhotoCull
{

namespace {

std::string formatScore(const std::string& label, double score) {
    std::ostringstream ss;
    ss << label << " (score: " << std::fixed << std::setprecision(2) << score << ")";
    return ss.str();
}

} // namespace

// ================= OpenCvDetectorSuite =================

OpenCvDetectorSuite::OpenCvDetectorSuite(const FilterConfig& config)
    : m_blur(config.blur_threshold),
      m_exposure(config.dark_threshold, config.bright_threshold),
      m_resolution(config.min_width, config.min_height),
      m_noise(config.noise_threshold)
{
    if (config.needsFaceDetector()) {
        m_faces = std::make_unique<FaceDetector>(config.cascade_dir);
    }
}

const cv::Mat& OpenCvDetectorSuite::loadImage(const std::string& path) {
    if (path == m_loadedPath) return m_loadedImage;

    m_loadedPath = path;
    try {
        m_loadedImage = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        m_loadedImage.release();
    }
    if (m_loadedImage.empty()) {
        std::cerr << "Warning: failed to load image " << path << std::endl;
    }
    return m_loadedImage;
}

std::optional<CheckOutcome> OpenCvDetectorSuite::checkBlur(const std::string& path) {
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_blur.analyze(img);
}

std::optional<ExposureOutcome> OpenCvDetectorSuite::checkExposure(const std::string& path) {
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_exposure.analyze(img);
}

std::optional<CheckOutcome> OpenCvDetectorSuite::checkResolution(const std::string& path) {
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_resolution.analyze(img);
}

std::optional<CheckOutcome> OpenCvDetectorSuite::checkNoise(const std::string& path) {
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_noise.analyze(img);
}

std::optional<int> OpenCvDetectorSuite::countFaces(const std::string& path) {
    if (!m_faces) return std::nullopt;
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_faces->countFaces(img);
}

std::optional<CheckOutcome> OpenCvDetectorSuite::checkClosedEyes(const std::string& path) {
    if (!m_faces) return std::nullopt;
    const cv::Mat& img = loadImage(path);
    if (img.empty()) return std::nullopt;
    return m_faces->detectClosedEyes(img);
}

// ================= PhotoFilter =================

PhotoFilter::PhotoFilter(const FilterConfig& config)
    : m_config(config), m_hashes(&DuplicateFinder::hashImageFile)
{
    m_config.validate();
    m_detectors = std::make_unique<OpenCvDetectorSuite>(m_config);
}

PhotoFilter::PhotoFilter(const FilterConfig& config,
                         std::unique_ptr<DetectorSuite> detectors,
                         HashLookup hasher)
    : m_config(config), m_detectors(std::move(detectors)), m_hashes(std::move(hasher))
{
    m_config.validate();
    if (!m_detectors) {
        throw ConfigurationError("a detector suite is required");
    }
}

FilterResult PhotoFilter::filterImage(const std::string& path) {
    FilterResult result(path);

    if (m_config.check_blur) {
        auto blur = m_detectors->checkBlur(path);
        double score = blur ? blur->score.value_or(0.0) : 0.0;
        result.setDetail("blur_score", score);
        if (blur && blur->flagged) {
            result.flag(formatScore("Blurred", score));
        }
    }

    if (m_config.check_exposure) {
        auto exposure = m_detectors->checkExposure(path);
        result.setDetail("exposure_stats", exposure ? exposure->stats : nlohmann::json::object());
        if (exposure && exposure->tooDark) {
            result.flag("Too dark");
        }
        if (exposure && exposure->overexposed) {
            result.flag("Overexposed");
        }
    }

    if (m_config.check_resolution) {
        auto resolution = m_detectors->checkResolution(path);
        nlohmann::json info = resolution ? resolution->details : nlohmann::json::object();
        result.setDetail("resolution", info);
        if (resolution && resolution->flagged) {
            result.flag("Low resolution (" + std::to_string(info.value("width", 0)) + "x" +
                        std::to_string(info.value("height", 0)) + ")");
        }
    }

    if (m_config.check_noise) {
        auto noise = m_detectors->checkNoise(path);
        double score = noise ? noise->score.value_or(0.0) : 0.0;
        result.setDetail("noise_score", score);
        if (noise && noise->flagged) {
            result.flag(formatScore("Noisy", score));
        }
    }

    if (m_config.filter_no_people) {
        auto faces = m_detectors->countFaces(path);
        int numFaces = faces.value_or(0);
        result.setDetail("num_faces", numFaces);

        if (faces && numFaces == 0) {
            result.flag("No people detected");
        } else if (numFaces > 0 && m_config.check_closed_eyes) {
            auto eyes = m_detectors->checkClosedEyes(path);
            result.setDetail("eye_detection", eyes ? eyes->details : nlohmann::json::object());
            if (eyes && eyes->flagged) {
                result.flag("Closed eyes detected");
            }
        }
    }

    return result;
}

std::vector<DuplicateGroup> PhotoFilter::findDuplicates(const std::vector<std::string>& paths) {
    if (!m_config.check_duplicates) return {};

    return DuplicateFinder::findDuplicateGroups(
        paths,
        [this](const std::string& path) { return m_hashes.get(path); },
        m_config.duplicate_similarity);
}

std::vector<FilterResult> PhotoFilter::filterImages(const std::vector<std::string>& paths) {
    std::vector<FilterResult> results;
    results.reserve(paths.size());
    for (const auto& path : paths) {
        results.push_back(filterImage(path));
    }

    if (!m_config.check_duplicates) return results;
    return applyDuplicateGroups(std::move(results), findDuplicates(paths));
}

std::vector<FilterResult> PhotoFilter::filterDirectory(const fs::path& directory, bool recursive) {
    return filterImages(FSETool::getImageFiles(directory, recursive));
}

std::vector<FilterResult> PhotoFilter::applyDuplicateGroups(std::vector<FilterResult> results,
                                                            const std::vector<DuplicateGroup>& groups)
{
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < results.size(); ++i) {
        index.emplace(results[i].path(), i);
    }

    for (const auto& group : groups) {
        if (group.empty()) continue;
        std::string canonical = fs::path(group.front()).filename().string();

        for (size_t k = 1; k < group.size(); ++k) {
            auto it = index.find(group[k]);
            if (it != index.end()) {
                results[it->second].flag("Duplicate of " + canonical);
            }
        }
    }
    return results;
}

} // namespace PhotoCull
