#include "backup/backup_verifier.hpp"
#include "common/logger.hpp"

namespace fs = std::filesystem;

BackupVerifier::BackupVerifier(DatabaseAdapter* database,
                               std::vector<std::string> criticalFiles,
                               std::string mainDatabase)
    : database_(database)
    , criticalFiles_(std::move(criticalFiles))
    , mainDatabase_(std::move(mainDatabase)) {
}

VerificationResult BackupVerifier::verify(const fs::path& backupRoot) const {
    VerificationResult result;
    std::error_code ec;

    if (!fs::is_directory(backupRoot, ec)) {
        result.errorMessage = "Backup path does not exist: " + backupRoot.string();
        return result;
    }

    for (const auto& critical : criticalFiles_) {
        if (!fs::exists(backupRoot / critical, ec)) {
            result.warnings.push_back("Critical file missing: " + critical);
        }
    }

    fs::path databaseCopy = backupRoot / mainDatabase_;
    if (database_ && fs::exists(databaseCopy, ec)) {
        IntegrityResult integrity = database_->checkIntegrity(databaseCopy.string());
        if (!integrity.ok) {
            result.warnings.push_back("Database integrity check warning: " + integrity.detail);
        } else {
            Logger::debug("Database copy passed integrity check");
        }
    }

    result.success = true;
    return result;
}
