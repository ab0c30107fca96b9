#pragma once

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

namespace PhotoCull
{
    /**
     * @brief One detector's verdict for one image.
     */
    struct CheckOutcome
    {
        bool flagged = false;
        std::optional<double> score;
        nlohmann::json details = nlohmann::json::object();
    };

    /**
     * @brief Exposure analysis yields two independent flags from one pass.
     */
    struct ExposureOutcome
    {
        bool tooDark = false;
        bool overexposed = false;
        nlohmann::json stats = nlohmann::json::object();
    };

    /**
     * @brief Aggregate decision for a single photo.
     *
     * `shouldFilter` is true exactly when `reasons` is non-empty; flag() is
     * the only way either is changed.
     */
    class FilterResult
    {
    public:
        FilterResult() = default;
        explicit FilterResult(std::string path) : m_path(std::move(path)) {}

        const std::string& path() const { return m_path; }
        bool shouldFilter() const { return !m_reasons.empty(); }
        const std::vector<std::string>& reasons() const { return m_reasons; }
        const nlohmann::json& details() const { return m_details; }

        void flag(const std::string& reason) { m_reasons.push_back(reason); }

        void setDetail(const std::string& check, nlohmann::json value) {
            m_details[check] = std::move(value);
        }

        nlohmann::json toJson() const {
            return {
                {"path", m_path},
                {"should_filter", shouldFilter()},
                {"reasons", m_reasons},
                {"details", m_details}
            };
        }

    private:
        std::string m_path;
        std::vector<std::string> m_reasons;
        nlohmann::json m_details = nlohmann::json::object();
    };

    /// Canonical (kept) image first, then its near-duplicates.
    using DuplicateGroup = std::vector<std::string>;

} // namespace PhotoCull
