#pragma once

#include "adapters/database_adapter.hpp"
#include <filesystem>
#include <string>
#include <vector>

struct VerificationResult {
    bool success = false;
    std::string errorMessage;
    std::vector<std::string> warnings;
};

// Checks a finished backup tree: critical files present, main database consistent.
// Neither problem fails the backup; both come back as warnings.
class BackupVerifier {
public:
    BackupVerifier(DatabaseAdapter* database,
                   std::vector<std::string> criticalFiles,
                   std::string mainDatabase);

    VerificationResult verify(const std::filesystem::path& backupRoot) const;

private:
    DatabaseAdapter* database_;
    std::vector<std::string> criticalFiles_;
    std::string mainDatabase_;  // relative to the backup root
};
