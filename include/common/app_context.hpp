#pragma once

#include "common/settings.hpp"
#include <memory>
#include <string>

class PathResolver;
class ServiceController;
class DatabaseAdapter;
class PreferencesAdapter;
class CompressionAdapter;

// Process-wide state built once and handed to every component that needs it.
struct AppContext {
    Settings settings;
    std::string hostname;
    std::string platform;
    std::string instanceId;

    std::shared_ptr<PathResolver> pathResolver;
    std::shared_ptr<ServiceController> serviceController;
    std::shared_ptr<DatabaseAdapter> database;
    std::shared_ptr<PreferencesAdapter> preferences;
    std::shared_ptr<CompressionAdapter> compression;

    // Wires the command/file/SQLite implementations and initializes logging.
    static std::shared_ptr<AppContext> create(const Settings& settings);
};
