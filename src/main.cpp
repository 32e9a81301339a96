#include "ArgParser.h"
#include "Definitions.h"
#include "ConversionService.h"
#include "SettingsManager.h"
#include "FileSystemEntries.h"

using namespace ImageConverter;

namespace
{
    void printProgress(std::size_t current, std::size_t total, const std::string& message)
    {
        std::cout << "[" << current << "/" << total << "] " << message << std::endl;
    }

    // Explicit argument first, stored folder second.
    fs::path pickFolder(const ArgParser::Arguments& args, const std::string& key, const std::optional<std::string>& stored)
    {
        auto it = args.stringArgs.find(key);
        if (it != args.stringArgs.end() && !it->second.empty()) return it->second;
        return stored ? fs::path(*stored) : fs::path();
    }

    int runConvert(const ArgParser::Arguments& args, SettingsManager& settings)
    {
        TargetFormat format = parseTargetFormat(args.stringArgs.at("output_format"));
        fs::path source = args.stringArgs.at("input_path");
        fs::path outputDir = pickFolder(args, "output_path", settings.document().outputFolderPath);

        ConversionService service(printProgress);
        fs::path written = service.convertOne(source, outputDir, format, settings.document().settingsFor(format));

        settings.setOutputFolder(FileSystemEntries::makeAbsolute(outputDir).string());
        std::cout << "Saved: " << written.string() << std::endl;
        return Definitions::EXIT_OK;
    }

    int runBatch(const ArgParser::Arguments& args, SettingsManager& settings)
    {
        TargetFormat format = parseTargetFormat(args.stringArgs.at("output_format"));
        fs::path folder = pickFolder(args, "input_path", settings.document().batchFolderPath);
        fs::path outputDir = pickFolder(args, "output_path", settings.document().outputFolderPath);

        ConversionService service(printProgress);
        BatchResult result = service.convertBatch(folder, outputDir, format, settings.document().settingsFor(format));

        settings.setBatchFolder(FileSystemEntries::makeAbsolute(folder).string());
        if (result.outcome() != BatchOutcome::NothingToConvert) {
            settings.setOutputFolder(FileSystemEntries::makeAbsolute(outputDir).string());
        }

        for (const auto& error : result.perFileErrors) {
            std::cerr << "  " << error.path.filename().string() << ": " << error.message << std::endl;
        }

        return Definitions::exitCodeFor(result.outcome());
    }

    int runSettings(const ArgParser::Arguments& args, SettingsManager& settings)
    {
        TargetFormat format = parseTargetFormat(args.stringArgs.at("format"));
        EncodeSettings edited = settings.document().settingsFor(format);
        bool changed = false;

        if (args.boolArgs.count("lossless")) { edited.lossless = args.boolArgs.at("lossless"); changed = true; }
        if (args.intArgs.count("quality")) { edited.quality = args.intArgs.at("quality"); changed = true; }
        if (args.intArgs.count("width")) { edited.width = args.intArgs.at("width"); changed = true; }
        if (args.intArgs.count("height")) { edited.height = args.intArgs.at("height"); changed = true; }
        if (args.stringArgs.count("resize_mode")) {
            edited.resizeMode = parseResizeMode(args.stringArgs.at("resize_mode"));
            changed = true;
        }

        bool saved = true;
        if (changed) saved = settings.setEncodeSettings(format, edited) && saved;
        if (args.stringArgs.count("output_path")) saved = settings.setOutputFolder(args.stringArgs.at("output_path")) && saved;
        if (args.stringArgs.count("batch_path")) saved = settings.setBatchFolder(args.stringArgs.at("batch_path")) && saved;

        std::cout << SettingsStore::serialize(settings.document()) << std::endl;
        return saved ? Definitions::EXIT_OK : Definitions::EXIT_CONVERSION_FAILED;
    }
} // namespace

int main(int argc, char* argv[])
{
    ArgParser parser;
    ArgParser::Arguments args;
    try {
        args = parser.parseArgs(argc, argv);
    } catch (const ArgParser::HelpRequested&) {
        return Definitions::EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return Definitions::EXIT_USAGE_ERROR;
    }

    SettingsManager settings(SettingsStore(SettingsStore::defaultSettingsPath()));

    int exitCode = Definitions::EXIT_CONVERSION_FAILED;
    try {
        if (args.command == "convert") exitCode = runConvert(args, settings);
        else if (args.command == "batch") exitCode = runBatch(args, settings);
        else if (args.command == "settings") exitCode = runSettings(args, settings);
    } catch (const ConverterException& e) {
        std::cerr << e.what() << std::endl;
        exitCode = Definitions::EXIT_CONVERSION_FAILED;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid setting: " << e.what() << std::endl;
        exitCode = Definitions::EXIT_USAGE_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        exitCode = Definitions::EXIT_CONVERSION_FAILED;
    }

    // ~SettingsManager writes the document once more on the way out
    return exitCode;
}
