#include <iostream>
#include <string>
#include <vector>

#include "core/Common.h"
#include "core/FileSystemTool.hpp"
#include "core/PhotoFilter.hpp"
#include "core/ReportWriter.hpp"
#include "utils/ArgParser.h"

using namespace PhotoCull;

namespace {

int run(const ArgParser::Arguments& args) {
    ArgParser::validate(args);
    FilterConfig config = ArgParser::toFilterConfig(args);

    const bool quiet = args.boolArgs.at("quiet");
    const bool recursive = !args.boolArgs.at("no-recursive");
    const TransferAction action = parseTransferAction(args.stringArgs.at("action"));
    const fs::path output = args.stringArgs.at("output");
    const fs::path reportFile = args.stringArgs.at("report");

    // Loads cascades up front so a bad --cascade-dir fails before any work
    PhotoFilter filter(config);

    if (action != TransferAction::Report) {
        FSETool::createDirectory(output);
    }

    if (!quiet) std::cout << "Scanning directory: " << args.inputDir << std::endl;
    auto images = FSETool::getImageFiles(args.inputDir, recursive);
    if (!quiet) std::cout << "Found " << images.size() << " image(s)" << std::endl;

    if (images.empty()) {
        std::cout << "No images found to process" << std::endl;
        return 0;
    }

    if (!quiet) std::cout << "\nAnalyzing images..." << std::endl;
    std::vector<FilterResult> results;
    results.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        results.push_back(filter.filterImage(images[i]));
        if (!quiet) {
            std::cout << "[" << (i + 1) << "/" << images.size() << "] "
                      << fs::path(images[i]).filename().string()
                      << (results.back().shouldFilter() ? " - filter" : " - keep") << std::endl;
        }
    }

    if (config.check_duplicates) {
        if (!quiet) std::cout << "\nDetecting duplicates..." << std::endl;
        auto groups = filter.findDuplicates(images);
        if (!quiet) std::cout << "Found " << groups.size() << " duplicate group(s)" << std::endl;
        results = PhotoFilter::applyDuplicateGroups(std::move(results), groups);
    }

    ReportWriter::printSummary(ReportWriter::summarize(results), std::cout);

    std::cout << "\nSaving report to: " << reportFile.string() << std::endl;
    ReportWriter::save(config, results, reportFile);

    if (action != TransferAction::Report) {
        const bool keepFiltered = args.boolArgs.at("keep-filtered");
        std::vector<std::string> selected;
        for (const auto& result : results) {
            if (result.shouldFilter() == keepFiltered) selected.push_back(result.path());
        }

        std::cout << "\n" << (action == TransferAction::Copy ? "Copying " : "Moving ")
                  << (keepFiltered ? "filtered" : "kept") << " photos to: " << output.string() << std::endl;
        int count = FileTransfer::transfer(selected, args.inputDir, output, action);
        std::cout << (action == TransferAction::Copy ? "Copied " : "Moved ") << count << " photos" << std::endl;
    }

    std::cout << "\n" << std::string(60, '=') << "\nDone!" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ArgParser parser;
    ArgParser::Arguments args;
    try {
        args = parser.parseArgs(argc, argv);
    } catch (const ArgParser::InfoDisplayed&) {
        return 0;
    } catch (const std::exception&) {
        // parseArgs has already reported the problem
        return 1;
    }

    try {
        return run(args);
    } catch (const PhotoCullException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
