#include "ArgParser.h"
#include "../core/Common.h"
#include "../core/FileSystemTool.hpp"
#include <iostream>

using namespace std;
namespace pc = PhotoCull;

// --- Helper Functions ---

namespace {

const vector<string> STRING_OPTIONS = {"action", "output", "report", "cascade-dir", "config"};
const vector<string> BOOL_OPTIONS = {
    "keep-filtered", "no-recursive", "quiet",
    "no-blur", "no-exposure", "no-resolution", "no-noise",
    "no-duplicates", "no-closed-eyes", "filter-no-people"
};
const vector<string> INT_OPTIONS = {"min-width", "min-height", "duplicate-similarity"};
const vector<string> DOUBLE_OPTIONS = {"blur-threshold", "dark-threshold", "bright-threshold", "noise-threshold"};

// Function to check if a required argument is present
bool checkRequired(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) {
        cerr << "Argument error: <" << name << "> is required" << endl;
        return false;
    }
    return true;
}

} // namespace

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options("photocull", "Photo culling tool - filter out blurred, dark, duplicate, and low-quality photos.")
{
    m_options.positional_help("<input_dir>");
    m_options.add_options()
        ("input_dir", "Input directory containing photos to analyze", cxxopts::value<std::string>())
        ("h,help", "Display this help menu")
        ("version", "Print the version and exit");

    addOutputArgs(m_options);
    addScanArgs(m_options);
    addToggleArgs(m_options);
    addParameterArgs(m_options);

    m_options.parse_positional({"input_dir"});
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << m_options.help() << std::endl;
            throw InfoDisplayed("Help displayed.");
        }
        if (result.count("version")) {
            std::cout << "photocull " << pc::VERSION << std::endl;
            throw InfoDisplayed("Version displayed.");
        }

        if (!checkRequired(result, "input_dir")) throw std::runtime_error("Missing required args.");

        return mapResults(result);

    } catch (const cxxopts::OptionException& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(e.what());
    }
}

void ArgParser::addOutputArgs(cxxopts::Options& options) {
    options.add_options("Output")
        ("action", "Action to take with photos: 'report'|'copy'|'move'", cxxopts::value<std::string>()->default_value("report"))
        ("output", "Output directory for photos (required for copy/move actions)", cxxopts::value<std::string>()->default_value(""))
        ("report", "Path to save JSON report", cxxopts::value<std::string>()->default_value(pc::DEFAULT_REPORT_FILE))
        ("keep-filtered", "Copy/move the filtered photos instead of the kept ones", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("quiet", "Only print the summary and errors", cxxopts::value<bool>()->implicit_value("true")->default_value("false"));
}

void ArgParser::addScanArgs(cxxopts::Options& options) {
    options.add_options("Scanning")
        ("no-recursive", "Do not scan subdirectories", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("config", "JSON file with filter settings (command line flags take precedence)", cxxopts::value<std::string>()->default_value(""))
        ("cascade-dir", "Directory holding the OpenCV Haar cascade XML files", cxxopts::value<std::string>()->default_value(pc::DEFAULT_CASCADE_DIR));
}

void ArgParser::addToggleArgs(cxxopts::Options& options) {
    options.add_options("Filter toggles")
        ("no-blur", "Disable blur detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("no-exposure", "Disable exposure (dark/bright) detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("no-resolution", "Disable low resolution detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("no-noise", "Disable noise detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("no-duplicates", "Disable duplicate detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("no-closed-eyes", "Disable closed eyes detection", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("filter-no-people", "Filter out photos without people", cxxopts::value<bool>()->implicit_value("true")->default_value("false"));
}

void ArgParser::addParameterArgs(cxxopts::Options& options) {
    options.add_options("Filter parameters")
        ("blur-threshold", "Blur detection threshold (lower = more strict)", cxxopts::value<double>()->default_value("100.0"))
        ("dark-threshold", "Dark photo threshold 0-1", cxxopts::value<double>()->default_value("0.5"))
        ("bright-threshold", "Overexposed photo threshold 0-1", cxxopts::value<double>()->default_value("0.5"))
        ("min-width", "Minimum acceptable width in pixels", cxxopts::value<int>()->default_value("800"))
        ("min-height", "Minimum acceptable height in pixels", cxxopts::value<int>()->default_value("600"))
        ("noise-threshold", "Noise detection threshold (higher = more strict)", cxxopts::value<double>()->default_value("1000.0"))
        ("duplicate-similarity", "Duplicate detection similarity 0-64 (lower = more strict)", cxxopts::value<int>()->default_value("5"));
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result) {
    Arguments args;
    args.inputDir = result["input_dir"].as<std::string>();

    for (const auto& name : STRING_OPTIONS) {
        args.stringArgs[name] = result[name].as<std::string>();
        if (result.count(name)) args.given.insert(name);
    }
    for (const auto& name : BOOL_OPTIONS) {
        args.boolArgs[name] = result[name].as<bool>();
        if (result.count(name)) args.given.insert(name);
    }
    for (const auto& name : INT_OPTIONS) {
        args.intArgs[name] = result[name].as<int>();
        if (result.count(name)) args.given.insert(name);
    }
    for (const auto& name : DOUBLE_OPTIONS) {
        args.doubleArgs[name] = result[name].as<double>();
        if (result.count(name)) args.given.insert(name);
    }
    return args;
}

pc::FilterConfig ArgParser::toFilterConfig(const Arguments& args) {
    pc::FilterConfig config;

    std::string configFile = args.stringArgs.count("config") ? args.stringArgs.at("config") : "";
    if (!configFile.empty()) {
        config = pc::FilterConfig::loadFile(configFile);
    }

    // Without a config file every value applies (cxxopts defaults match FilterConfig's);
    // with one, only what was typed overrides it.
    auto apply = [&](const std::string& name) {
        return configFile.empty() || args.given.count(name) > 0;
    };
    auto flag = [&](const std::string& name) {
        auto it = args.boolArgs.find(name);
        return it != args.boolArgs.end() && it->second;
    };

    if (apply("no-blur")) config.check_blur = !flag("no-blur");
    if (apply("no-exposure")) config.check_exposure = !flag("no-exposure");
    if (apply("no-resolution")) config.check_resolution = !flag("no-resolution");
    if (apply("no-noise")) config.check_noise = !flag("no-noise");
    if (apply("no-duplicates")) config.check_duplicates = !flag("no-duplicates");
    if (apply("no-closed-eyes")) config.check_closed_eyes = !flag("no-closed-eyes");
    if (apply("filter-no-people")) config.filter_no_people = flag("filter-no-people");

    if (apply("blur-threshold") && args.doubleArgs.count("blur-threshold")) config.blur_threshold = args.doubleArgs.at("blur-threshold");
    if (apply("dark-threshold") && args.doubleArgs.count("dark-threshold")) config.dark_threshold = args.doubleArgs.at("dark-threshold");
    if (apply("bright-threshold") && args.doubleArgs.count("bright-threshold")) config.bright_threshold = args.doubleArgs.at("bright-threshold");
    if (apply("noise-threshold") && args.doubleArgs.count("noise-threshold")) config.noise_threshold = args.doubleArgs.at("noise-threshold");
    if (apply("min-width") && args.intArgs.count("min-width")) config.min_width = args.intArgs.at("min-width");
    if (apply("min-height") && args.intArgs.count("min-height")) config.min_height = args.intArgs.at("min-height");
    if (apply("duplicate-similarity") && args.intArgs.count("duplicate-similarity")) config.duplicate_similarity = args.intArgs.at("duplicate-similarity");
    if (apply("cascade-dir") && args.stringArgs.count("cascade-dir")) config.cascade_dir = args.stringArgs.at("cascade-dir");

    config.validate();
    return config;
}

void ArgParser::validate(const Arguments& args) {
    if (!fs::exists(args.inputDir)) {
        throw pc::ConfigurationError("input directory '" + args.inputDir + "' does not exist");
    }
    if (!fs::is_directory(args.inputDir)) {
        throw pc::ConfigurationError("'" + args.inputDir + "' is not a directory");
    }

    std::string actionName = args.stringArgs.count("action") ? args.stringArgs.at("action") : "report";
    pc::TransferAction action = pc::parseTransferAction(actionName);

    std::string output = args.stringArgs.count("output") ? args.stringArgs.at("output") : "";
    if (action != pc::TransferAction::Report && output.empty()) {
        throw pc::ConfigurationError("--output is required for copy/move actions");
    }
}
