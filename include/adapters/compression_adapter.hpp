#pragma once

#include <string>
#include <vector>

enum class ArchiveFormat {
    NONE,
    ZIP,
    TAR_GZ,
    TAR_BZ2,
    TAR_XZ,
    SEVEN_ZIP
};

std::string archiveFormatToString(ArchiveFormat format);
// Accepts "zip", "tar.gz", "tar.bz2", "tar.xz", "7z"; anything else is NONE.
ArchiveFormat parseArchiveFormat(const std::string& name);
// File suffix including the leading dot, empty for NONE.
std::string archiveExtension(ArchiveFormat format);
// Detects the format from a file name suffix (case-insensitive).
ArchiveFormat detectArchiveFormat(const std::string& path);

// Codecs are supplied by the embedding application.
class CompressionAdapter {
public:
    virtual ~CompressionAdapter() = default;

    virtual bool compress(const std::string& directory, const std::string& archivePath, ArchiveFormat format) = 0;
    virtual bool decompress(const std::string& archivePath, const std::string& directory) = 0;
    virtual ArchiveFormat detectFormat(const std::string& path) const { return detectArchiveFormat(path); }

    virtual std::string getLastError() const = 0;
};

// Drives the system tar, zip/unzip and 7z tools.
class CommandCompressionAdapter : public CompressionAdapter {
public:
    bool compress(const std::string& directory, const std::string& archivePath, ArchiveFormat format) override;
    bool decompress(const std::string& archivePath, const std::string& directory) override;
    std::string getLastError() const override { return lastError_; }

private:
    bool runTool(const std::vector<std::string>& argv);

    std::string lastError_;
};
