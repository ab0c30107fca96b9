#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "Common.h"
#include "FilterConfig.hpp"
#include "FilterResult.hpp"

namespace PhotoCull
{
    struct FilterSummary
    {
        size_t total = 0;
        size_t filtered = 0;
        size_t kept = 0;
        /// Base reason (text before the first '(') and count, most frequent first
        std::vector<std::pair<std::string, int>> reasonCounts;
    };

    class ReportWriter {
    public:
        /**
         * @brief {"config": {check flags}, "results": [{path, should_filter, reasons, details}]}
         */
        static nlohmann::json toJson(const FilterConfig& config, const std::vector<FilterResult>& results);

        /**
         * @brief Writes the report as indented JSON.
         * @throws IOFailure if the file cannot be written.
         */
        static void save(const FilterConfig& config,
                         const std::vector<FilterResult>& results,
                         const fs::path& outputFile);

        static FilterSummary summarize(const std::vector<FilterResult>& results);

        static void printSummary(const FilterSummary& summary, std::ostream& out);

        /// "Blurred (score: 3.10)" -> "Blurred"
        static std::string baseReason(const std::string& reason);
    };

} // namespace PhotoCull
