#include "backup/file_copier.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fnmatch.h>

namespace fs = std::filesystem;

ExclusionFilter::ExclusionFilter(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {
}

bool ExclusionFilter::excludesName(const std::string& name) const {
    for (const auto& pattern : patterns_) {
        if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

bool ExclusionFilter::excludes(const fs::path& relativePath) const {
    for (const auto& component : relativePath) {
        if (excludesName(component.string())) {
            return true;
        }
    }
    return false;
}

void CopyPlan::add(CopyItem item) {
    totalBytes += item.size;
    items.push_back(std::move(item));
}

FileCopier::FileCopier(ExclusionFilter filter)
    : filter_(std::move(filter)) {
}

CopyPlan FileCopier::plan(const fs::path& source, const fs::path& destination,
                          const BackupManifest* previous) const {
    CopyPlan result;
    std::error_code ec;

    for (auto it = fs::recursive_directory_iterator(source, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::warning("Cannot read " + source.string() + ": " + ec.message());
            ec.clear();
            continue;
        }

        if (filter_.excludesName(it->path().filename().string())) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        fs::path relative = fs::relative(it->path(), source, ec);
        if (ec) {
            ec.clear();
            continue;
        }

        CopyItem item;
        item.source = it->path();
        item.destination = destination / relative;
        item.relativePath = relative.generic_string();
        item.size = it->file_size(ec);
        if (ec) {
            ec.clear();
            continue;
        }

        if (previous &&
            previous->isUnchanged(item.relativePath, item.size, utils::modificationTime(item.source))) {
            ++result.skipped;
            continue;
        }
        result.add(std::move(item));
    }

    return result;
}

uint64_t FileCopier::measure(const std::vector<std::string>& paths) const {
    uint64_t total = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            total += fs::file_size(path, ec);
        } else if (fs::is_directory(path, ec)) {
            total += plan(path, path).totalBytes;
        }
    }
    return total;
}

bool FileCopier::copyFile(const CopyItem& item, std::string& error) {
    std::error_code ec;
    fs::create_directories(item.destination.parent_path(), ec);
    if (ec) {
        error = "Could not create " + item.destination.parent_path().string() + ": " + ec.message();
        return false;
    }

    fs::copy_file(item.source, item.destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "Could not copy " + item.relativePath + ": " + ec.message();
        return false;
    }

    auto mtime = fs::last_write_time(item.source, ec);
    if (!ec) {
        fs::last_write_time(item.destination, mtime, ec);
    }
    if (ec) {
        Logger::debug("Could not preserve mtime of " + item.relativePath + ": " + ec.message());
    }
    return true;
}
