#pragma once

#include "common/settings.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Everything the core needs to know about where the managed application lives.
struct DataLocation {
    std::string dataDirectory;      // parent of the application directory
    std::string appDirectory;       // dataDirectory/<backup dir name>
    std::string databasesDirectory;
    std::string mainDatabase;
    std::string preferencesFile;
    std::string machineIdentifier;
    std::string serverName;

    nlohmann::json summary() const;
};

class PathResolver {
public:
    virtual ~PathResolver() = default;
    virtual std::optional<DataLocation> locate() = 0;
};

// Resolves against the data directory configured in the layout settings.
// Installation-path heuristics live outside the core.
class FixedPathResolver : public PathResolver {
public:
    explicit FixedPathResolver(const LayoutSettings& layout);

    std::optional<DataLocation> locate() override;

    // Builds the bundle for an arbitrary data directory without checking it exists.
    static DataLocation describe(const std::string& dataDirectory, const LayoutSettings& layout);

private:
    LayoutSettings layout_;
};
