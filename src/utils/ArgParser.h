#ifndef IMAGE_CONVERTER_ARG_PARSER_H
#define IMAGE_CONVERTER_ARG_PARSER_H

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include "cxxopts.hpp" // Requires cxxopts dependency

/**
 * @brief Utility class to parse command line arguments using cxxopts.
 *
 * Commands: convert (one image), batch (a folder) and settings (show or edit the
 * stored encode policies and folders).
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     *
     * Optional arguments only appear in the maps when given on the command line.
     */
    struct Arguments {
        std::string command;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, bool> boolArgs;
        std::map<std::string, int> intArgs;
    };

    /**
     * @brief Thrown after the help text has been printed.
     */
    class HelpRequested : public std::runtime_error {
    public:
        HelpRequested() : std::runtime_error("Help displayed.") {}
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @throws HelpRequested for -h/--help, std::runtime_error for invalid input.
     */
    Arguments parseArgs(int argc, char** argv);

private:
    cxxopts::Options m_options;

    /**
     * @brief Builds the parser for one command, including the positional command slot.
     */
    cxxopts::Options createCommandParser(const std::string& command);

    void addConvertArgs(cxxopts::Options& options);
    void addBatchArgs(cxxopts::Options& options);
    void addSettingsArgs(cxxopts::Options& options);

    Arguments mapResults(const cxxopts::ParseResult& result, const std::string& command);
};

#endif // IMAGE_CONVERTER_ARG_PARSER_H
