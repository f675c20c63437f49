#include "network/transfer_protocol.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

double TransferProgress::percent() const {
    if (totalBytes == 0) {
        return 0.0;
    }
    return static_cast<double>(transferredBytes) / static_cast<double>(totalBytes) * 100.0;
}

TransferChannel::TransferChannel(Socket& socket)
    : socket_(socket) {
}

void TransferChannel::addProgressObserver(ObserverList<TransferProgress>::Observer observer) {
    observers_.add(std::move(observer));
}

void TransferChannel::notify() {
    observers_.notify(progress_);
}

bool TransferChannel::isSafeName(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos) {
        return false;
    }
    for (const auto& part : fs::path(name)) {
        if (part == ".." || part.string().empty()) {
            return false;
        }
    }
    return !fs::path(name).has_root_name();
}

void TransferChannel::sendMessage(const json& header) {
    std::string payload = header.dump();
    if (payload.size() > kMaxHeaderSize) {
        throw TransferError("Header too large: " + std::to_string(payload.size()) + " bytes");
    }

    uint32_t length = htonl(static_cast<uint32_t>(payload.size()));
    socket_.sendAll(&length, sizeof(length));
    socket_.sendAll(payload.data(), payload.size());
}

json TransferChannel::readHeader() {
    auto header = tryReadHeader();
    if (!header) {
        throw TransferError("Connection closed by peer");
    }
    return *header;
}

std::optional<json> TransferChannel::tryReadHeader() {
    uint32_t length = 0;
    size_t received = socket_.receiveExact(&length, sizeof(length));
    if (received == 0) {
        return std::nullopt;
    }
    if (received < sizeof(length)) {
        throw TransferError("Truncated frame length");
    }

    length = ntohl(length);
    if (length == 0 || length > kMaxHeaderSize) {
        throw TransferError("Invalid header length " + std::to_string(length));
    }

    std::string payload(length, '\0');
    if (socket_.receiveExact(payload.data(), length) < length) {
        throw TransferError("Truncated frame header");
    }

    try {
        json header = json::parse(payload);
        if (!header.is_object() || !header.contains("type") || !header.at("type").is_string()) {
            throw TransferError("Frame header without a type");
        }
        return header;
    } catch (const json::exception& e) {
        throw TransferError(std::string("Malformed frame header: ") + e.what());
    }
}

void TransferChannel::sendFile(const fs::path& file, const std::string& name) {
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw TransferError("Cannot open " + file.string() + " for sending");
    }
    uint64_t size = fs::file_size(file);

    sendMessage({{"type", "file"}, {"name", name}, {"size", size}});

    progress_.currentFile = name;
    std::vector<char> buffer(kChunkSize);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, kChunkSize));
        input.read(buffer.data(), static_cast<std::streamsize>(chunk));
        if (static_cast<size_t>(input.gcount()) != chunk) {
            throw TransferError("File shrank while sending: " + file.string());
        }
        socket_.sendAll(buffer.data(), chunk);
        remaining -= chunk;
        progress_.transferredBytes += chunk;
        notify();
    }
    progress_.filesDone++;
    notify();
}

fs::path TransferChannel::receiveFile(const fs::path& directory) {
    json header = readHeader();
    if (header.at("type") != "file") {
        throw TransferError("Expected a file frame, got " + header.at("type").get<std::string>());
    }
    return receiveFileBody(header, directory);
}

fs::path TransferChannel::receiveFileBody(const json& header, const fs::path& directory) {
    std::string name = header.value("name", "");
    if (!isSafeName(name)) {
        throw TransferError("Refusing unsafe file name: " + name);
    }
    if (!header.contains("size") || !header.at("size").is_number_unsigned()) {
        throw TransferError("File frame without a size: " + name);
    }
    uint64_t size = header.at("size").get<uint64_t>();

    fs::path target = directory / fs::path(name);
    fs::create_directories(target.parent_path());
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw TransferError("Cannot create " + target.string());
    }

    progress_.currentFile = name;
    std::vector<char> buffer(kChunkSize);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, kChunkSize));
        size_t received = socket_.receiveExact(buffer.data(), chunk);
        output.write(buffer.data(), static_cast<std::streamsize>(received));
        progress_.transferredBytes += received;
        remaining -= received;
        notify();

        if (received < chunk) {
            output.close();
            std::error_code ec;
            fs::remove(target, ec);
            throw TransferError("Connection closed after " + std::to_string(size - remaining) +
                                " of " + std::to_string(size) + " bytes of " + name);
        }
    }

    output.close();
    if (!output) {
        throw TransferError("Failed writing " + target.string());
    }
    progress_.filesDone++;
    notify();
    return target;
}

DirectoryStats TransferChannel::sendDirectory(const fs::path& root, const Checkpoint& checkpoint) {
    std::vector<std::pair<fs::path, std::string>> files;
    DirectoryStats stats;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        files.emplace_back(entry.path(), fs::relative(entry.path(), root).generic_string());
        stats.bytes += entry.file_size();
    }
    stats.files = files.size();

    progress_ = TransferProgress();
    progress_.filesTotal = stats.files;
    progress_.totalBytes = stats.bytes;
    notify();

    Logger::info("Sending " + std::to_string(stats.files) + " files (" +
                 std::to_string(stats.bytes) + " bytes) from " + root.string());
    sendMessage({{"type", "begin"}, {"files", stats.files}, {"bytes", stats.bytes}});
    for (const auto& [path, name] : files) {
        if (checkpoint) {
            checkpoint();
        }
        sendFile(path, name);
    }
    sendMessage({{"type", "end"}, {"files", stats.files}, {"bytes", progress_.transferredBytes}});
    return stats;
}

DirectoryStats TransferChannel::receiveDirectory(const fs::path& root, const Checkpoint& checkpoint) {
    json begin = readHeader();
    if (begin.at("type") != "begin") {
        throw TransferError("Expected a begin frame, got " + begin.at("type").get<std::string>());
    }

    progress_ = TransferProgress();
    progress_.filesTotal = begin.value("files", static_cast<uint64_t>(0));
    progress_.totalBytes = begin.value("bytes", static_cast<uint64_t>(0));
    notify();
    fs::create_directories(root);

    DirectoryStats stats;
    while (true) {
        if (checkpoint) {
            checkpoint();
        }

        json header = readHeader();
        const std::string type = header.at("type").get<std::string>();
        if (type == "file") {
            receiveFileBody(header, root);
            stats.files++;
            stats.bytes += header.at("size").get<uint64_t>();
        } else if (type == "end") {
            uint64_t declared = header.value("files", static_cast<uint64_t>(0));
            if (declared != stats.files) {
                throw TransferError("Sender declared " + std::to_string(declared) +
                                    " files but " + std::to_string(stats.files) + " arrived");
            }
            break;
        } else {
            throw TransferError("Unexpected frame during directory transfer: " + type);
        }
    }

    Logger::info("Received " + std::to_string(stats.files) + " files into " + root.string());
    return stats;
}
