#include "ArgParser.h"
#include "EncodeSettings.h"
#include <iostream>

using namespace std;

// --- Helper Functions ---

// Function to check if a required argument is present
bool checkRequired(const cxxopts::ParseResult& result, const std::string& name, const std::string& command) {
    if (!result.count(name)) {
        cerr << "Argument error: --" << name << " is required for command '" << command << "'" << endl;
        return false;
    }
    return true;
}

void copyIfPresent(const cxxopts::ParseResult& result, const std::string& name, std::map<std::string, std::string>& target) {
    if (result.count(name)) target[name] = result[name].as<std::string>();
}

void copyIfPresent(const cxxopts::ParseResult& result, const std::string& name, std::map<std::string, int>& target) {
    if (result.count(name)) target[name] = result[name].as<int>();
}

// Rejects names the engine would not accept, so they surface as argument errors
void checkFormatName(const std::string& value, const std::string& name) {
    try {
        ImageConverter::parseTargetFormat(value);
    } catch (const ImageConverter::PrerequisiteError&) {
        throw std::runtime_error("Invalid value for --" + name + ": " + value);
    }
}

void checkResizeModeName(const std::string& value) {
    try {
        ImageConverter::parseResizeMode(value);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid value for --resize_mode: " + value);
    }
}

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options("image_converter", "Convert PNG/JPEG/BMP/GIF images to WebP or AVIF.")
{
    m_options.add_options()
        ("command", "Command to execute (convert, batch, settings)", cxxopts::value<std::string>())
        ("h,help", "Display this help menu");
    m_options.parse_positional({"command"});
    m_options.positional_help("<convert|batch|settings>");
    m_options.allow_unrecognised_options();
}

cxxopts::Options ArgParser::createCommandParser(const std::string& command) {
    cxxopts::Options commandOptions("image_converter " + command, "Arguments for " + command);
    commandOptions.add_options()
        ("command", "Command to execute", cxxopts::value<std::string>())
        ("h,help", "Display this help menu");
    commandOptions.parse_positional({"command"});

    if (command == "convert") addConvertArgs(commandOptions);
    else if (command == "batch") addBatchArgs(commandOptions);
    else if (command == "settings") addSettingsArgs(commandOptions);
    else throw std::runtime_error("Unknown command: " + command);

    return commandOptions;
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    try {
        auto result = m_options.parse(argc, argv);

        if (!result.count("command")) {
            std::cout << m_options.help() << std::endl;
            if (result.count("help")) throw HelpRequested();
            throw std::runtime_error("No command specified.");
        }

        std::string command = result["command"].as<std::string>();
        cxxopts::Options commandOptions = createCommandParser(command);

        // Re-parse all arguments against the command specific options
        auto finalResult = commandOptions.parse(argc, argv);

        if (finalResult.count("help")) {
            std::cout << commandOptions.help() << std::endl;
            throw HelpRequested();
        }

        // --- Custom Requirement Checks ---
        if (command == "convert" && !checkRequired(finalResult, "input_path", command)) throw std::runtime_error("Missing required args.");
        if ((command == "convert" || command == "batch") && !checkRequired(finalResult, "output_format", command)) throw std::runtime_error("Missing required args.");

        return mapResults(finalResult, command);

    } catch (const cxxopts::OptionException& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(e.what());
    }
}

void ArgParser::addConvertArgs(cxxopts::Options& options) {
    options.add_options()
        ("input_path", "The image to convert (.png, .jpg, .jpeg, .bmp, .gif)", cxxopts::value<std::string>())
        ("output_path", "Folder to write the converted image to (Default: stored output folder)", cxxopts::value<std::string>())
        ("output_format", "The format to convert to: 'webp'|'avif'", cxxopts::value<std::string>());
}

void ArgParser::addBatchArgs(cxxopts::Options& options) {
    options.add_options()
        ("input_path", "Folder with the images to convert (Default: stored batch folder)", cxxopts::value<std::string>())
        ("output_path", "Folder to write the converted images to (Default: stored output folder)", cxxopts::value<std::string>())
        ("output_format", "The format to convert to: 'webp'|'avif'", cxxopts::value<std::string>());
}

void ArgParser::addSettingsArgs(cxxopts::Options& options) {
    options.add_options()
        ("format", "Encode policy to edit: 'webp'|'avif'", cxxopts::value<std::string>()->default_value("webp"))
        ("lossless", "Lossless encoding: 'true'|'false'", cxxopts::value<std::string>())
        ("quality", "Lossy quality (0-100)", cxxopts::value<int>())
        ("resize_mode", "Resize mode: 'original'|'specify'", cxxopts::value<std::string>())
        ("width", "Target width when resize_mode is 'specify'", cxxopts::value<int>())
        ("height", "Target height when resize_mode is 'specify'", cxxopts::value<int>())
        ("output_path", "Default output folder", cxxopts::value<std::string>())
        ("batch_path", "Default batch folder", cxxopts::value<std::string>());
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result, const std::string& command) {
    Arguments args;
    args.command = command;

    // --- Convert / Batch Commands ---
    if (command == "convert" || command == "batch") {
        args.stringArgs["output_format"] = result["output_format"].as<std::string>();
        checkFormatName(args.stringArgs["output_format"], "output_format");
        copyIfPresent(result, "input_path", args.stringArgs);
        copyIfPresent(result, "output_path", args.stringArgs);
    }

    // --- Settings Command ---
    else if (command == "settings") {
        args.stringArgs["format"] = result["format"].as<std::string>();
        checkFormatName(args.stringArgs["format"], "format");
        copyIfPresent(result, "resize_mode", args.stringArgs);
        if (args.stringArgs.count("resize_mode")) checkResizeModeName(args.stringArgs["resize_mode"]);
        copyIfPresent(result, "output_path", args.stringArgs);
        copyIfPresent(result, "batch_path", args.stringArgs);
        copyIfPresent(result, "quality", args.intArgs);
        copyIfPresent(result, "width", args.intArgs);
        copyIfPresent(result, "height", args.intArgs);

        if (result.count("lossless")) {
            std::string value = result["lossless"].as<std::string>();
            if (value == "true" || value == "1" || value == "yes") args.boolArgs["lossless"] = true;
            else if (value == "false" || value == "0" || value == "no") args.boolArgs["lossless"] = false;
            else throw std::runtime_error("Invalid value for --lossless: " + value);
        }
    }

    return args;
}
