#include "FileSystemEntries.h"
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace ImageConverter
{
    // --- Utility Method Implementations ---

    void FileSystemEntries::ensureDirectory(const fs::path& directory)
    {
        std::error_code ec;
        if (directory.empty() || fs::is_directory(directory, ec)) return;

        try
        {
            fs::create_directories(directory);
            std::cout << "Created directory: '" << directory.string() << "'." << std::endl;
        }
        catch (const std::exception& e)
        {
            throw PrerequisiteError("Could not create directory: " + directory.string() + ". Reason: " + e.what());
        }
    }

    fs::path FileSystemEntries::makeAbsolute(const fs::path& path)
    {
        return fs::absolute(path);
    }

    fs::path FileSystemEntries::executableDirectory()
    {
        std::error_code ec;
#ifdef _WIN32
        wchar_t buffer[MAX_PATH];
        DWORD length = GetModuleFileNameW(NULL, buffer, MAX_PATH);
        if (length > 0 && length < MAX_PATH) {
            return fs::path(std::wstring(buffer, length)).parent_path();
        }
#elif __linux__
        fs::path exe = fs::read_symlink("/proc/self/exe", ec);
        if (!ec && !exe.empty()) {
            return exe.parent_path();
        }
#endif
        fs::path cwd = fs::current_path(ec);
        return ec ? fs::path(".") : cwd;
    }

    // --- Core Method Implementations ---

    fs::path FileSystemEntries::resolveOutputPath(const fs::path& sourcePath,
                                                  const fs::path& outputDir,
                                                  std::string newExtension)
    {
        if (newExtension.empty() || newExtension[0] != '.') {
            newExtension = "." + newExtension;
        }
        return outputDir / (sourcePath.stem().string() + newExtension);
    }

    std::vector<fs::path> FileSystemEntries::listConvertibleImages(const fs::path& directory)
    {
        if (directory.empty()) {
            throw EnumerationError("No folder specified.");
        }
        std::error_code ec;
        fs::file_status status = fs::status(directory, ec);
        if (status.type() == fs::file_type::not_found) {
            throw EnumerationError("Folder does not exist: " + directory.string());
        }
        if (ec) {
            throw EnumerationError("Could not access folder " + directory.string() + ": " + ec.message());
        }
        if (!fs::is_directory(status)) {
            throw EnumerationError("Not a folder: " + directory.string());
        }

        std::vector<fs::path> files;
        try
        {
            for (const auto& entry : fs::directory_iterator(directory)) {
                if (fs::is_regular_file(entry) && hasSupportedInputExtension(entry.path())) {
                    files.push_back(entry.path());
                }
            }
        }
        catch (const fs::filesystem_error& e)
        {
            throw EnumerationError("Could not read folder " + directory.string() + ": " + e.what());
        }

        std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
            return a.filename().string() < b.filename().string();
        });
        return files;
    }

} // namespace ImageConverter
