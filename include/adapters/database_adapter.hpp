#pragma once

#include <map>
#include <string>

struct IntegrityResult {
    bool ok = false;
    std::string detail;
};

class DatabaseAdapter {
public:
    virtual ~DatabaseAdapter() = default;

    virtual IntegrityResult checkIntegrity(const std::string& dbPath) = 0;

    // Rewrites stored media paths by prefix. Takes a copy of the database first and
    // puts it back if the write fails.
    virtual bool remapPaths(const std::string& dbPath, const std::map<std::string, std::string>& mapping) = 0;

    // Writes a JSON summary of libraries and locations to outputFile.
    virtual bool exportSummary(const std::string& dbPath, const std::string& outputFile) = 0;

    virtual std::string getLastError() const = 0;
};
