#pragma once

#include "backup/backup_manifest.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// Shell-glob exclusion applied to every component of a relative path.
class ExclusionFilter {
public:
    ExclusionFilter() = default;
    explicit ExclusionFilter(std::vector<std::string> patterns);

    bool excludesName(const std::string& name) const;
    bool excludes(const std::filesystem::path& relativePath) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

struct CopyItem {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string relativePath;
    uint64_t size = 0;
};

struct CopyPlan {
    std::vector<CopyItem> items;
    uint64_t totalBytes = 0;
    uint64_t skipped = 0;  // unchanged since the previous manifest

    void add(CopyItem item);
};

class FileCopier {
public:
    explicit FileCopier(ExclusionFilter filter = ExclusionFilter());

    // Regular files under source that survive the filter. With a previous manifest,
    // files recorded with the same size and mtime are left out.
    CopyPlan plan(const std::filesystem::path& source,
                  const std::filesystem::path& destination,
                  const BackupManifest* previous = nullptr) const;

    // Sum of the file sizes the filter would keep. Paths may be files or directories.
    uint64_t measure(const std::vector<std::string>& paths) const;

    // Copies one file, creating parents and preserving the modification time.
    static bool copyFile(const CopyItem& item, std::string& error);

private:
    ExclusionFilter filter_;
};
