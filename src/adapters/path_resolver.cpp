#include "adapters/path_resolver.hpp"
#include "common/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

nlohmann::json DataLocation::summary() const {
    return {
        {"data_directory", dataDirectory},
        {"app_directory", appDirectory},
        {"databases_directory", databasesDirectory},
        {"main_database", mainDatabase},
        {"preferences_file", preferencesFile},
        {"machine_identifier", machineIdentifier},
        {"server_name", serverName}
    };
}

FixedPathResolver::FixedPathResolver(const LayoutSettings& layout)
    : layout_(layout) {
}

DataLocation FixedPathResolver::describe(const std::string& dataDirectory, const LayoutSettings& layout) {
    DataLocation location;
    fs::path app = fs::path(dataDirectory) / layout.backupDirName;
    location.dataDirectory = dataDirectory;
    location.appDirectory = app.string();
    location.databasesDirectory = (app / layout.databasesDir).string();
    location.mainDatabase = (app / layout.databasesDir / layout.mainDatabase).string();
    location.preferencesFile = (app / layout.preferencesFile).string();
    return location;
}

std::optional<DataLocation> FixedPathResolver::locate() {
    if (layout_.dataDirectory.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path app = fs::path(layout_.dataDirectory) / layout_.backupDirName;
    if (!fs::is_directory(app, ec)) {
        Logger::debug("No application directory at " + app.string());
        return std::nullopt;
    }
    return describe(layout_.dataDirectory, layout_);
}
