#pragma once

#include "adapters/compression_adapter.hpp"
#include "backup/backup_types.hpp"
#include <string>

struct BackupOptions {
    std::string destination;  // the backup tree is created underneath
    BackupMode mode = BackupMode::HOT;
    bool compress = false;
    ArchiveFormat format = ArchiveFormat::ZIP;
    bool verify = true;
};
