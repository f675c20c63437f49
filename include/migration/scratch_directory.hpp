#pragma once

#include <filesystem>
#include <string>

// Uniquely named working directory, removed with everything in it on destruction.
class ScratchDirectory {
public:
    // An empty base uses the system temp directory. Throws std::filesystem::filesystem_error.
    ScratchDirectory(const std::string& base, const std::string& label);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};
