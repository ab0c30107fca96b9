#ifndef PHOTOCULL_ARG_PARSER_H
#define PHOTOCULL_ARG_PARSER_H

#include <string>
#include <vector>
#include <map>
#include <set>
#include <stdexcept>
#include "cxxopts.hpp" // Requires cxxopts dependency

#include "../core/FilterConfig.hpp"

/**
 * @brief Utility class to parse the photocull command line using cxxopts.
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string inputDir;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, bool> boolArgs;
        std::map<std::string, int> intArgs;
        std::map<std::string, double> doubleArgs;
        std::set<std::string> given;    ///< Options typed on the command line
    };

    /**
     * @brief Thrown after --help or --version output has been printed.
     */
    class InfoDisplayed : public std::runtime_error {
    public:
        explicit InfoDisplayed(const std::string& what) : std::runtime_error(what) {}
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws InfoDisplayed for --help / --version, std::runtime_error on
     *         malformed or missing arguments.
     */
    Arguments parseArgs(int argc, char** argv);

    /**
     * @brief Builds the filter configuration: defaults, then the --config
     * file if one was given, then any filter option typed explicitly.
     * @throws PhotoCull::ConfigurationError
     */
    static PhotoCull::FilterConfig toFilterConfig(const Arguments& args);

    /**
     * @brief Rejects unusable run options before any image is touched:
     * missing or non-directory input, unknown action, copy/move without
     * --output.
     * @throws PhotoCull::ConfigurationError
     */
    static void validate(const Arguments& args);

private:
    cxxopts::Options m_options;

    void addOutputArgs(cxxopts::Options& options);
    void addScanArgs(cxxopts::Options& options);
    void addToggleArgs(cxxopts::Options& options);
    void addParameterArgs(cxxopts::Options& options);

    /**
     * @brief Extracts and maps results from cxxopts::ParseResult into Arguments structure.
     */
    Arguments mapResults(const cxxopts::ParseResult& result);
};

#endif // PHOTOCULL_ARG_PARSER_H
