#include "common/app_context.hpp"
#include "adapters/compression_adapter.hpp"
#include "adapters/path_resolver.hpp"
#include "adapters/preferences_adapter.hpp"
#include "adapters/service_controller.hpp"
#include "adapters/sqlite_database_adapter.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

std::shared_ptr<AppContext> AppContext::create(const Settings& settings) {
    if (!Logger::isInitialized()) {
        Logger::initialize(settings.logPath, parseLogLevel(settings.logLevel));
    }

    auto context = std::make_shared<AppContext>();
    context->settings = settings;
    context->hostname = utils::hostname();
    context->platform = utils::platformName();
    context->instanceId = utils::randomHex(8);

    context->pathResolver = std::make_shared<FixedPathResolver>(settings.layout);
    context->serviceController = std::make_shared<CommandServiceController>(settings.service);
    context->database = std::make_shared<SqliteDatabaseAdapter>();

    std::string preferencesFile;
    if (!settings.layout.dataDirectory.empty()) {
        preferencesFile = FixedPathResolver::describe(settings.layout.dataDirectory, settings.layout).preferencesFile;
    }
    context->preferences = std::make_shared<FilePreferencesAdapter>(preferencesFile);
    context->compression = std::make_shared<CommandCompressionAdapter>();

    Logger::info("Context ready: host " + context->hostname + " (" + context->platform +
                 "), instance " + context->instanceId);
    return context;
}
