#include "migration/scratch_directory.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace fs = std::filesystem;

ScratchDirectory::ScratchDirectory(const std::string& base, const std::string& label) {
    fs::path parent = base.empty() ? fs::temp_directory_path() : fs::path(base);
    path_ = parent / ("servershift_" + label + "_" + utils::randomHex());
    fs::create_directories(path_);
    Logger::debug("Scratch directory " + path_.string());
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        Logger::warning("Could not remove scratch directory " + path_.string() + ": " + ec.message());
    }
}
