#include "adapters/compression_adapter.hpp"
#include "common/logger.hpp"
#include "common/subprocess.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string archiveFormatToString(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP: return "zip";
        case ArchiveFormat::TAR_GZ: return "tar.gz";
        case ArchiveFormat::TAR_BZ2: return "tar.bz2";
        case ArchiveFormat::TAR_XZ: return "tar.xz";
        case ArchiveFormat::SEVEN_ZIP: return "7z";
        case ArchiveFormat::NONE: return "none";
    }
    return "none";
}

ArchiveFormat parseArchiveFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "zip") return ArchiveFormat::ZIP;
    if (lower == "tar.gz") return ArchiveFormat::TAR_GZ;
    if (lower == "tar.bz2") return ArchiveFormat::TAR_BZ2;
    if (lower == "tar.xz") return ArchiveFormat::TAR_XZ;
    if (lower == "7z") return ArchiveFormat::SEVEN_ZIP;
    return ArchiveFormat::NONE;
}

std::string archiveExtension(ArchiveFormat format) {
    if (format == ArchiveFormat::NONE) {
        return "";
    }
    return "." + archiveFormatToString(format);
}

ArchiveFormat detectArchiveFormat(const std::string& path) {
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (endsWith(lower, ".zip")) return ArchiveFormat::ZIP;
    if (endsWith(lower, ".tar.gz") || endsWith(lower, ".tgz")) return ArchiveFormat::TAR_GZ;
    if (endsWith(lower, ".tar.bz2") || endsWith(lower, ".tbz2")) return ArchiveFormat::TAR_BZ2;
    if (endsWith(lower, ".tar.xz") || endsWith(lower, ".txz")) return ArchiveFormat::TAR_XZ;
    if (endsWith(lower, ".7z")) return ArchiveFormat::SEVEN_ZIP;
    return ArchiveFormat::NONE;
}

bool CommandCompressionAdapter::runTool(const std::vector<std::string>& argv) {
    if (!Subprocess::existsInPath(argv.front())) {
        lastError_ = argv.front() + " is not installed";
        return false;
    }

    SubprocessResult result = Subprocess::run(argv);
    if (result.exitCode != 0) {
        lastError_ = argv.front() + " exited with code " + std::to_string(result.exitCode) +
                     ": " + result.output;
        return false;
    }
    return true;
}

bool CommandCompressionAdapter::compress(const std::string& directory, const std::string& archivePath,
                                         ArchiveFormat format) {
    lastError_.clear();
    fs::path source = fs::absolute(directory);
    std::string parent = source.parent_path().string();
    std::string name = source.filename().string();
    std::string archive = fs::absolute(archivePath).string();

    Logger::info("Compressing " + source.string() + " to " + archive);
    switch (format) {
        case ArchiveFormat::ZIP:
            // zip has no -C; run it from the parent through the shell
            return runTool({"sh", "-c", "cd " + utils::shellQuote(parent) + " && zip -qr " +
                            utils::shellQuote(archive) + " " + utils::shellQuote(name)});
        case ArchiveFormat::TAR_GZ:
            return runTool({"tar", "-czf", archive, "-C", parent, name});
        case ArchiveFormat::TAR_BZ2:
            return runTool({"tar", "-cjf", archive, "-C", parent, name});
        case ArchiveFormat::TAR_XZ:
            return runTool({"tar", "-cJf", archive, "-C", parent, name});
        case ArchiveFormat::SEVEN_ZIP:
            return runTool({"7z", "a", "-bd", archive, source.string()});
        case ArchiveFormat::NONE:
            break;
    }
    lastError_ = "No archive format selected";
    return false;
}

bool CommandCompressionAdapter::decompress(const std::string& archivePath, const std::string& directory) {
    lastError_.clear();
    std::error_code ec;
    fs::create_directories(directory, ec);

    switch (detectFormat(archivePath)) {
        case ArchiveFormat::ZIP:
            return runTool({"unzip", "-qo", archivePath, "-d", directory});
        case ArchiveFormat::TAR_GZ:
        case ArchiveFormat::TAR_BZ2:
        case ArchiveFormat::TAR_XZ:
            return runTool({"tar", "-xf", archivePath, "-C", directory});
        case ArchiveFormat::SEVEN_ZIP:
            return runTool({"7z", "x", "-y", "-o" + directory, archivePath});
        case ArchiveFormat::NONE:
            break;
    }
    lastError_ = "Unrecognised archive: " + archivePath;
    return false;
}
