#include "ReportWriter.hpp"
#include "FileSystemTool.hpp"

#include <fstream>
#include <map>

using json = nlohmann::json;

namespace PhotoCull
{

json ReportWriter::toJson(const FilterConfig& config, const std::vector<FilterResult>& results) {
    json output = {
        {"config", config.enabledChecks()},
        {"results", json::array()}
    };
    for (const auto& result : results) {
        output["results"].push_back(result.toJson());
    }
    return output;
}

void ReportWriter::save(const FilterConfig& config,
                        const std::vector<FilterResult>& results,
                        const fs::path& outputFile)
{
    if (outputFile.has_parent_path()) {
        FSETool::createDirectory(outputFile.parent_path());
    }

    // File names are raw bytes; invalid UTF-8 is written as U+FFFD
    const std::string text = toJson(config, results).dump(2, ' ', false, json::error_handler_t::replace);

    std::ofstream f(outputFile);
    if (!f) {
        throw IOFailure("cannot open report file '" + outputFile.string() + "' for writing");
    }
    f << text << std::endl;
    if (!f) {
        throw IOFailure("failed writing report file '" + outputFile.string() + "'");
    }
}

std::string ReportWriter::baseReason(const std::string& reason) {
    std::string base = reason.substr(0, reason.find('('));
    auto end = base.find_last_not_of(" \t");
    auto begin = base.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    return base.substr(begin, end - begin + 1);
}

FilterSummary ReportWriter::summarize(const std::vector<FilterResult>& results) {
    FilterSummary summary;
    summary.total = results.size();

    std::map<std::string, int> counts;
    for (const auto& result : results) {
        if (!result.shouldFilter()) continue;
        summary.filtered++;
        for (const auto& reason : result.reasons()) {
            counts[baseReason(reason)]++;
        }
    }
    summary.kept = summary.total - summary.filtered;

    summary.reasonCounts.assign(counts.begin(), counts.end());
    std::stable_sort(summary.reasonCounts.begin(), summary.reasonCounts.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    return summary;
}

void ReportWriter::printSummary(const FilterSummary& summary, std::ostream& out) {
    const std::string rule(60, '=');
    out << "\n" << rule << "\n"
        << "Results Summary:\n"
        << rule << "\n"
        << "Total images: " << summary.total << "\n"
        << "Images to filter: " << summary.filtered << "\n"
        << "Images to keep: " << summary.kept << std::endl;

    if (summary.filtered > 0) {
        out << "\nFilter reasons:" << std::endl;
        for (const auto& [reason, count] : summary.reasonCounts) {
            out << "  " << reason << ": " << count << std::endl;
        }
    }
}

} // namespace PhotoCull
