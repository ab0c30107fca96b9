#pragma once

#include <string>
#include <opencv2/opencv.hpp>
#include <opencv2/objdetect.hpp>

#include "FilterResult.hpp"

namespace PhotoCull
{
    /**
     * @brief Flags blurred images by the variance of the Laplacian.
     */
    class BlurDetector {
    public:
        explicit BlurDetector(double threshold = 100.0) : m_threshold(threshold) {}

        static double laplacianVariance(const cv::Mat& img);

        /// flagged when the variance is below the threshold; score is the variance
        CheckOutcome analyze(const cv::Mat& img) const;

    private:
        double m_threshold;
    };

    /**
     * @brief Flags dark and overexposed images from the gray histogram.
     *
     * A pixel counts as dark below 50 and as bright above 205.
     */
    class ExposureDetector {
    public:
        static constexpr int DARK_LEVEL = 50;
        static constexpr int BRIGHT_LEVEL = 205;

        ExposureDetector(double darkThreshold = 0.5, double brightThreshold = 0.5)
            : m_darkThreshold(darkThreshold), m_brightThreshold(brightThreshold) {}

        ExposureOutcome analyze(const cv::Mat& img) const;

    private:
        double m_darkThreshold;
        double m_brightThreshold;
    };

    class ResolutionDetector {
    public:
        ResolutionDetector(int minWidth = 800, int minHeight = 600)
            : m_minWidth(minWidth), m_minHeight(minHeight) {}

        CheckOutcome analyze(const cv::Mat& img) const;

    private:
        int m_minWidth;
        int m_minHeight;
    };

    /**
     * @brief Estimates noise as the mean residual against a bilateral filter.
     */
    class NoiseDetector {
    public:
        explicit NoiseDetector(double threshold = 1000.0) : m_threshold(threshold) {}

        static double noiseScore(const cv::Mat& img);

        CheckOutcome analyze(const cv::Mat& img) const;

    private:
        double m_threshold;
    };

    /**
     * @brief Haar cascade face and eye detection.
     *
     * A face with no detected eye is taken as a closed-eye face. This is a
     * heuristic: profile angles and poor light produce the same signal.
     */
    class FaceDetector {
    public:
        /**
         * @brief Loads the frontal face and eye cascades from @p cascadeDir.
         * @throws ConfigurationError if either cascade cannot be loaded.
         */
        explicit FaceDetector(const std::string& cascadeDir);

        int countFaces(const cv::Mat& img);

        /// details: num_faces, faces_with_eyes_detected, faces_without_eyes
        CheckOutcome detectClosedEyes(const cv::Mat& img);

    private:
        cv::CascadeClassifier m_faceCascade;
        cv::CascadeClassifier m_eyeCascade;

        std::vector<cv::Rect> detectFaces(const cv::Mat& gray);
    };

    /// BGR, BGRA or single-channel input to 8-bit gray.
    cv::Mat toGray(const cv::Mat& img);

} // namespace PhotoCull
