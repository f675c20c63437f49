#pragma once

#include "adapters/database_adapter.hpp"

class SqliteDatabaseAdapter : public DatabaseAdapter {
public:
    static constexpr const char* kBackupSuffix = ".backup";

    IntegrityResult checkIntegrity(const std::string& dbPath) override;
    bool remapPaths(const std::string& dbPath, const std::map<std::string, std::string>& mapping) override;
    bool exportSummary(const std::string& dbPath, const std::string& outputFile) override;
    std::string getLastError() const override { return lastError_; }

private:
    std::string lastError_;
};
