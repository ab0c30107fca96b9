#include "Detectors.hpp"
#include "Common.h"

namespace PhotoCull
{

cv::Mat toGray(const cv::Mat& img) {
    cv::Mat gray;
    if (img.channels() == 4) cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
    else if (img.channels() == 3) cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    else gray = img.clone();
    if (gray.depth() != CV_8U) gray.convertTo(gray, CV_8U);
    return gray;
}

// --- Blur ---

double BlurDetector::laplacianVariance(const cv::Mat& img) {
    cv::Mat laplacian;
    cv::Laplacian(toGray(img), laplacian, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return stddev[0] * stddev[0];
}

CheckOutcome BlurDetector::analyze(const cv::Mat& img) const {
    CheckOutcome outcome;
    double variance = laplacianVariance(img);
    outcome.score = variance;
    outcome.flagged = variance < m_threshold;
    return outcome;
}

// --- Exposure ---

ExposureOutcome ExposureDetector::analyze(const cv::Mat& img) const {
    ExposureOutcome outcome;
    cv::Mat gray = toGray(img);

    double total = static_cast<double>(gray.total());
    if (total == 0) return outcome;

    double darkRatio = cv::countNonZero(gray < DARK_LEVEL) / total;
    double brightRatio = cv::countNonZero(gray > BRIGHT_LEVEL) / total;

    outcome.stats = {
        {"mean_brightness", cv::mean(gray)[0]},
        {"dark_ratio", darkRatio},
        {"bright_ratio", brightRatio}
    };
    outcome.tooDark = darkRatio > m_darkThreshold;
    outcome.overexposed = brightRatio > m_brightThreshold;
    return outcome;
}

// --- Resolution ---

CheckOutcome ResolutionDetector::analyze(const cv::Mat& img) const {
    CheckOutcome outcome;
    int width = img.cols;
    int height = img.rows;
    outcome.details = {
        {"width", width},
        {"height", height},
        {"total_pixels", static_cast<long long>(width) * height}
    };
    outcome.flagged = width < m_minWidth || height < m_minHeight;
    return outcome;
}

// --- Noise ---

double NoiseDetector::noiseScore(const cv::Mat& img) {
    cv::Mat gray = toGray(img);
    cv::Mat smoothed, residual;
    cv::bilateralFilter(gray, smoothed, 9, 75, 75);
    cv::absdiff(gray, smoothed, residual);
    return cv::mean(residual)[0];
}

CheckOutcome NoiseDetector::analyze(const cv::Mat& img) const {
    CheckOutcome outcome;
    double score = noiseScore(img);
    outcome.score = score;
    outcome.flagged = score > m_threshold;
    return outcome;
}

// --- Faces ---

FaceDetector::FaceDetector(const std::string& cascadeDir) {
    fs::path dir(cascadeDir);
    std::string facePath = (dir / FACE_CASCADE_FILE).string();
    std::string eyePath = (dir / EYE_CASCADE_FILE).string();

    if (!m_faceCascade.load(facePath)) {
        throw ConfigurationError("could not load face cascade '" + facePath + "'");
    }
    if (!m_eyeCascade.load(eyePath)) {
        throw ConfigurationError("could not load eye cascade '" + eyePath + "'");
    }
}

std::vector<cv::Rect> FaceDetector::detectFaces(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    m_faceCascade.detectMultiScale(gray, faces, 1.3, 5);
    return faces;
}

int FaceDetector::countFaces(const cv::Mat& img) {
    return static_cast<int>(detectFaces(toGray(img)).size());
}

CheckOutcome FaceDetector::detectClosedEyes(const cv::Mat& img) {
    CheckOutcome outcome;
    cv::Mat gray = toGray(img);
    auto faces = detectFaces(gray);

    int withEyes = 0;
    int withoutEyes = 0;
    for (const auto& face : faces) {
        cv::Mat roi = gray(face & cv::Rect(0, 0, gray.cols, gray.rows));
        std::vector<cv::Rect> eyes;
        m_eyeCascade.detectMultiScale(roi, eyes, 1.1, 5);
        if (!eyes.empty()) withEyes++;
        else withoutEyes++;
    }

    outcome.details = {
        {"num_faces", static_cast<int>(faces.size())},
        {"faces_with_eyes_detected", withEyes},
        {"faces_without_eyes", withoutEyes}
    };
    outcome.flagged = !faces.empty() && withoutEyes > 0;
    return outcome;
}

} // namespace PhotoCull
