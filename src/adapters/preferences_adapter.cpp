#include "adapters/preferences_adapter.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <openssl/rand.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr size_t kIdentifierLength = 40;
constexpr const char* kRootElement = "<Preferences";
const char* const kIdentityAttributes[] = {"MachineIdentifier", "ProcessedMachineIdentifier"};

// Position of the '>' closing the start tag at `start`, skipping quoted values.
size_t tagEnd(const std::string& xml, size_t start) {
    char quote = 0;
    for (size_t i = start; i < xml.size(); ++i) {
        char c = xml[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

// Sets name="value" inside the start tag [begin, end); returns the new end.
size_t setAttribute(std::string& xml, size_t begin, size_t end, const std::string& name, const std::string& value) {
    size_t pos = begin;
    while ((pos = xml.find(name, pos)) != std::string::npos && pos < end) {
        size_t eq = pos + name.size();
        bool boundary = std::isspace(static_cast<unsigned char>(xml[pos - 1]));
        if (boundary && eq + 1 < end && xml[eq] == '=' && (xml[eq + 1] == '"' || xml[eq + 1] == '\'')) {
            char quote = xml[eq + 1];
            size_t valueStart = eq + 2;
            size_t valueEnd = xml.find(quote, valueStart);
            if (valueEnd == std::string::npos || valueEnd >= end) {
                break;
            }
            xml.replace(valueStart, valueEnd - valueStart, value);
            return end + value.size() - (valueEnd - valueStart);
        }
        pos = eq;
    }

    size_t insertAt = (xml[end - 1] == '/') ? end - 1 : end;
    std::string attribute = " " + name + "=\"" + value + "\"";
    xml.insert(insertAt, attribute);
    return end + attribute.size();
}

} // namespace

std::string generateMachineIdentifier() {
    unsigned char seed[32];
    if (RAND_bytes(seed, sizeof(seed)) != 1) {
        Logger::error("Random generator unavailable for a machine identifier");
        return "";
    }
    std::string digest = sha256Hex(std::string(reinterpret_cast<const char*>(seed), sizeof(seed)));
    return digest.substr(0, kIdentifierLength);
}

FilePreferencesAdapter::FilePreferencesAdapter(std::string preferencesFile)
    : preferencesFile_(std::move(preferencesFile)) {
}

bool FilePreferencesAdapter::backup(const std::string& directory) {
    lastError_.clear();
    std::error_code ec;
    if (preferencesFile_.empty() || !fs::exists(preferencesFile_, ec)) {
        lastError_ = "Preferences file not found: " + preferencesFile_;
        return false;
    }

    fs::create_directories(directory, ec);
    fs::path target = fs::path(directory) / fs::path(preferencesFile_).filename();
    fs::copy_file(preferencesFile_, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        lastError_ = "Failed to snapshot preferences: " + ec.message();
        return false;
    }
    Logger::debug("Preferences snapshot written to " + target.string());
    return true;
}

bool FilePreferencesAdapter::regenerateIdentity(const std::string& preferencesPath) {
    lastError_.clear();
    std::ifstream input(preferencesPath, std::ios::binary);
    if (!input.is_open()) {
        lastError_ = "Preferences file not found: " + preferencesPath;
        return false;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    input.close();
    std::string xml = buffer.str();

    size_t begin = xml.find(kRootElement);
    size_t end = begin == std::string::npos ? std::string::npos : tagEnd(xml, begin);
    if (end == std::string::npos) {
        lastError_ = "No <Preferences> element in " + preferencesPath;
        return false;
    }

    std::string identifier = generateMachineIdentifier();
    if (identifier.size() != kIdentifierLength) {
        lastError_ = "Could not generate a machine identifier";
        return false;
    }
    for (const char* attribute : kIdentityAttributes) {
        end = setAttribute(xml, begin + 1, end, attribute, identifier);
    }

    fs::path temporary = preferencesPath + ".tmp";
    {
        std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
        output << xml;
        output.close();
        if (!output) {
            lastError_ = "Failed to write " + temporary.string();
            return false;
        }
    }
    std::error_code ec;
    fs::rename(temporary, preferencesPath, ec);
    if (ec) {
        lastError_ = "Failed to replace " + preferencesPath + ": " + ec.message();
        fs::remove(temporary, ec);
        return false;
    }

    Logger::info("Machine identifier regenerated in " + preferencesPath);
    return true;
}
