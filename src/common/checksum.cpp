#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string toHex(const unsigned char* hash, unsigned int length) {
    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

std::string sha256File(const std::filesystem::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        Logger::warning("Cannot open file for checksum: " + filePath.string());
        return "";
    }

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        Logger::error("Failed to initialize SHA-256 digest");
        return "";
    }

    std::vector<char> buffer(64 * 1024);
    while (file.good()) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
                Logger::error("Failed to update digest for " + filePath.string());
                return "";
            }
        }
    }
    if (file.bad()) {
        Logger::warning("Read error while hashing " + filePath.string());
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        Logger::error("Failed to finalize digest for " + filePath.string());
        return "";
    }

    return toHex(hash, hashLen);
}

std::string sha256Hex(const std::string& data) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        Logger::error("SHA-256 digest failed");
        return "";
    }

    return toHex(hash, hashLen);
}
