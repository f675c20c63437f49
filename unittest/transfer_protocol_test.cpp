#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "network/transfer_protocol.hpp"
#include "test_helpers.hpp"
#include <arpa/inet.h>
#include <future>

namespace fs = std::filesystem;
using namespace testing_support;
using json = nlohmann::json;

class TransferProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_ = std::make_unique<TcpListener>(0, "127.0.0.1");
        auto accepted = std::async(std::launch::async, [this]() {
            return listener_->accept(std::chrono::seconds(5));
        });
        sender_ = Socket::connectTo("127.0.0.1", listener_->port(), std::chrono::seconds(5));
        auto socket = accepted.get();
        ASSERT_TRUE(socket.has_value());
        receiver_ = std::move(*socket);
    }

    std::unique_ptr<TcpListener> listener_;
    Socket sender_;
    Socket receiver_;
    TempDir source_;
    TempDir target_;
};

TEST_F(TransferProtocolTest, LargeFileArrivesInChunks) {
    const size_t size = 2621440;
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>(i % 251);
    }
    writeFile(source_.path() / "library.db", content);

    auto sent = std::async(std::launch::async, [this]() {
        TransferChannel channel(sender_);
        channel.sendFile(source_.path() / "library.db", "Databases/library.db");
    });

    TransferChannel channel(receiver_);
    json header = channel.readHeader();
    EXPECT_EQ(header["type"], "file");
    EXPECT_EQ(header["size"].get<uint64_t>(), 2621440u);
    fs::path written = channel.receiveFileBody(header, target_.path());
    sent.get();

    EXPECT_EQ(written, target_.path() / "Databases/library.db");
    EXPECT_EQ(fs::file_size(written), 2621440u);
    EXPECT_EQ(readFile(written), content);
    EXPECT_EQ(channel.progress().transferredBytes, 2621440u);
    EXPECT_EQ(channel.progress().filesDone, 1u);
}

TEST_F(TransferProtocolTest, ShortConnectionRemovesPartialFile) {
    {
        TransferChannel channel(sender_);
        channel.sendMessage({{"type", "file"}, {"name", "cut.bin"}, {"size", 100}});
        std::string partial(10, 'x');
        sender_.sendAll(partial.data(), partial.size());
        sender_.close();
    }

    TransferChannel channel(receiver_);
    EXPECT_THROW(channel.receiveFile(target_.path()), TransferError);
    EXPECT_FALSE(fs::exists(target_.path() / "cut.bin"));
}

TEST_F(TransferProtocolTest, DirectoryTransferKeepsTreeAndCounts) {
    writeFile(source_.path() / "Preferences.xml", "<Preferences/>");
    writeFile(source_.path() / "Plug-in Support/Databases/library.db", std::string(5000, 'd'));
    writeFile(source_.path() / "Media/a/b/c.jpg", std::string(300, 'm'));

    auto sent = std::async(std::launch::async, [this]() {
        TransferChannel channel(sender_);
        return channel.sendDirectory(source_.path());
    });

    TransferChannel channel(receiver_);
    DirectoryStats received = channel.receiveDirectory(target_.path());
    DirectoryStats stats = sent.get();

    EXPECT_EQ(stats.files, 3u);
    EXPECT_EQ(stats.bytes, 5314u);
    EXPECT_EQ(received.files, 3u);
    EXPECT_EQ(received.bytes, 5314u);
    EXPECT_EQ(readFile(target_.path() / "Media/a/b/c.jpg"), std::string(300, 'm'));
    EXPECT_EQ(readFile(target_.path() / "Preferences.xml"), "<Preferences/>");
}

TEST_F(TransferProtocolTest, MismatchedEndCountIsRejected) {
    {
        TransferChannel channel(sender_);
        channel.sendMessage({{"type", "begin"}, {"files", 2}, {"bytes", 0}});
        channel.sendMessage({{"type", "end"}, {"files", 2}, {"bytes", 0}});
    }

    TransferChannel channel(receiver_);
    EXPECT_THROW(channel.receiveDirectory(target_.path()), TransferError);
}

TEST_F(TransferProtocolTest, UnsafeNamesAreRefused) {
    {
        TransferChannel channel(sender_);
        channel.sendMessage({{"type", "file"}, {"name", "../escape.txt"}, {"size", 0}});
    }

    TransferChannel channel(receiver_);
    EXPECT_THROW(channel.receiveFile(target_.path()), TransferError);
    EXPECT_FALSE(fs::exists(target_.path().parent_path() / "escape.txt"));
}

TEST_F(TransferProtocolTest, OversizedHeaderIsAProtocolError) {
    uint32_t length = htonl(TransferChannel::kMaxHeaderSize + 1);
    sender_.sendAll(&length, sizeof(length));

    TransferChannel channel(receiver_);
    EXPECT_THROW(channel.readHeader(), TransferError);
}

TEST_F(TransferProtocolTest, CleanCloseIsNotAHeader) {
    sender_.close();
    TransferChannel channel(receiver_);
    EXPECT_FALSE(channel.tryReadHeader().has_value());
}

TEST(TransferNameTest, SafeNames) {
    EXPECT_TRUE(TransferChannel::isSafeName("Plug-in Support/Databases/x.db"));
    EXPECT_TRUE(TransferChannel::isSafeName("file.txt"));
    EXPECT_FALSE(TransferChannel::isSafeName("/etc/passwd"));
    EXPECT_FALSE(TransferChannel::isSafeName("a/../../b"));
    EXPECT_FALSE(TransferChannel::isSafeName(""));
}
