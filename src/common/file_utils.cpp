#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>

namespace reprise {
namespace utils {

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_DEBUG().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    const std::string tempFilePath = filePath + ".tmp";
    std::error_code ec;

    {
        std::ofstream tempFile(tempFilePath);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }

        tempFile << jsonData.dump(2);
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write JSON to temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file").context("error", ec.message());
        std::filesystem::remove(tempFilePath, ec);
        return false;
    }

    SLOG_DEBUG().message("Saved JSON to file").context("path", filePath);
    return true;
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided");
        return false;
    }

    if (filePath.find('\0') != std::string::npos) {
        SLOG_ERROR().message("Invalid character in file path");
        return false;
    }

    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parentPath = std::filesystem::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(parentPath, ec)) {
        return true;
    }

    std::filesystem::create_directories(parentPath, ec);
    if (ec) {
        SLOG_ERROR().message("Could not create directory").context("path", parentPath.string()).context("error", ec.message());
        return false;
    }
    return true;
}

} // namespace utils
} // namespace reprise
