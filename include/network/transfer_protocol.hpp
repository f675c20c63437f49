#pragma once

#include "common/observer_list.hpp"
#include "network/socket.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct TransferProgress {
    uint64_t totalBytes = 0;
    uint64_t transferredBytes = 0;
    uint64_t filesTotal = 0;
    uint64_t filesDone = 0;
    std::string currentFile;

    double percent() const;
};

struct DirectoryStats {
    uint64_t files = 0;
    uint64_t bytes = 0;
};

// Frames on one connected stream: a 4-byte big-endian header length, a JSON header,
// then for "file" frames exactly `size` raw bytes.
class TransferChannel {
public:
    static constexpr size_t kChunkSize = 1024 * 1024;
    static constexpr uint32_t kMaxHeaderSize = 64 * 1024;

    // Called between files; throws to abandon the transfer.
    using Checkpoint = std::function<void()>;

    explicit TransferChannel(Socket& socket);

    void addProgressObserver(ObserverList<TransferProgress>::Observer observer);
    TransferProgress progress() const { return progress_; }

    void sendMessage(const nlohmann::json& header);
    // Throws TransferError on a closed connection or a malformed header.
    nlohmann::json readHeader();
    // Like readHeader(), but a clean close before the first byte returns nothing.
    std::optional<nlohmann::json> tryReadHeader();

    void sendFile(const std::filesystem::path& file, const std::string& name);
    // Reads the next frame, which must be a file, into directory/name.
    std::filesystem::path receiveFile(const std::filesystem::path& directory);
    // Body of a file frame whose header was already read.
    std::filesystem::path receiveFileBody(const nlohmann::json& header, const std::filesystem::path& directory);

    // begin, one file frame per regular file under root, end.
    DirectoryStats sendDirectory(const std::filesystem::path& root, const Checkpoint& checkpoint = nullptr);
    DirectoryStats receiveDirectory(const std::filesystem::path& root, const Checkpoint& checkpoint = nullptr);

    // Rejects absolute names and ".." components.
    static bool isSafeName(const std::string& name);

private:
    void notify();

    Socket& socket_;
    ObserverList<TransferProgress> observers_;
    TransferProgress progress_;
};
