#include "sender/file_sender.h"
#include "core/executor_fixture.h"
#include "core/fake_channel.h"
#include "core/temp_dir.h"
#include "protocol/messages.h"
#include "util/hash.h"
#include <algorithm>
#include <fstream>
#include <iterator>

using namespace std::chrono_literals;
using protocol::MessageType;
using sender::FileSender;
using sender::SendResult;
using sender::SendStatus;
using test_utils::on_io;
using test_utils::spawn_future;

namespace {
constexpr std::size_t kChunk = 8 * 1024;

util::PacingSettings pacing() {
    util::PacingSettings settings;
    settings.high_water_mark = 32 * 1024;
    settings.low_threshold = 8 * 1024;
    settings.wait_timeout_ms = 500;
    settings.drain_poll_ms = 5;
    settings.drain_timeout_ms = 150;
    return settings;
}

util::ChunkingSettings chunking() {
    util::ChunkingSettings settings;
    settings.adaptive = false;
    settings.min_chunk_size = 1024;
    settings.max_chunk_size = 64 * 1024;
    settings.default_chunk_size = kChunk;
    return settings;
}

struct SentChunk {
    wire::ChunkHeader header;
    ByteBuffer data;
};

ByteBuffer read_all(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ByteBuffer data(raw.size());
    std::transform(raw.begin(), raw.end(), data.begin(), [](char c) { return static_cast<std::byte>(c); });
    return data;
}

wire::FileError error_of(error::ErrorKind kind, const std::string& message) {
    wire::FileError err;
    err.set_kind(static_cast<std::uint32_t>(kind));
    err.set_message(message);
    return err;
}
} // namespace

class FileSenderTest : public ExecutorTest {
  protected:
    test_utils::TempDir dir;
    sender::TransmissionPacer pacer{executor.get_io_context().get_executor(), pacing()};
    sender::ChunkPlanner planner{chunking()};
    sender::NetworkMonitor monitor;
    progress::ProgressTracker tracker;
    error::ErrorClassifier errors{error::Role::Sender};
    std::shared_ptr<test_utils::StuckChannel> channel = std::make_shared<test_utils::StuckChannel>("bob");
    std::filesystem::path file;
    std::unique_ptr<FileSender> sender;

    void TearDown() override {
        on_io(executor, [this]() {
            pacer.detach("bob");
            sender.reset();
        });
        ExecutorTest::TearDown();
    }

    void make_sender(std::size_t size) {
        file = dir.write_file("report.bin", size);
        util::SenderSettings settings;
        settings.replan_interval = 1000;
        sender = std::make_unique<FileSender>(
            sender::SenderContext{executor, pacer, planner, monitor, tracker, errors, settings},
            std::vector<std::shared_ptr<core::Channel>>{channel},
            file,
            "t1");
    }

    SendResult send() {
        auto future = spawn_future(executor, sender->send_file());
        if (future.wait_for(5s) != std::future_status::ready) {
            throw std::runtime_error("send_file did not finish");
        }
        return future.get();
    }

    void resend(std::vector<std::uint64_t> indices) {
        auto future = spawn_future(executor, sender->resend_chunks(std::move(indices)));
        ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
        future.get();
    }

    std::vector<protocol::Frame> frames() {
        return on_io(executor, [this]() {
            std::vector<protocol::Frame> decoded;
            for (const auto& message : channel->sent) {
                decoded.push_back(protocol::decode(ConstDataBlock(message.data(), message.size())).value());
            }
            return decoded;
        });
    }

    std::vector<SentChunk> chunks() {
        std::vector<SentChunk> result;
        for (const auto& frame : frames()) {
            if (!frame.is(MessageType::Data)) {
                continue;
            }
            const auto view = protocol::unpack_chunk(ConstDataBlock(frame.payload.data(), frame.payload.size()));
            result.push_back({view.value().header, ByteBuffer(view->data.begin(), view->data.end())});
        }
        return result;
    }

    std::size_t sent_count() {
        return on_io(executor, [this]() { return channel->sent.size(); });
    }

    void clear_sent() {
        on_io(executor, [this]() { channel->sent.clear(); });
    }
};

TEST_F(FileSenderTest, SendsStartChunksEnd) {
    make_sender(20000);
    const auto result = send();
    EXPECT_EQ(result.status, SendStatus::Sent);
    EXPECT_EQ(result.total_chunks, 3u);
    EXPECT_EQ(result.bytes_sent, 20000u);

    const auto all = frames();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_TRUE(all.front().is(MessageType::Start));
    EXPECT_TRUE(all.back().is(MessageType::End));
    const auto start = protocol::parse_body<wire::FileStart>(all.front()).value();
    EXPECT_EQ(start.file_name(), "report.bin");
    EXPECT_EQ(start.file_hash(), util::hash::sha256_file_hex(file).value());
    const auto end = protocol::parse_body<wire::FileEnd>(all.back()).value();
    EXPECT_EQ(end.total_chunks(), 3u);
    EXPECT_EQ(end.total_bytes(), 20000u);
}

TEST_F(FileSenderTest, RefusedChunkIsSentAgainSmallerUnderSameIndex) {
    make_sender(40000);
    // START and two chunks pass, then the limit drops below a full chunk.
    channel->shrink_after(3, 6000);
    const auto result = send();
    ASSERT_EQ(result.status, SendStatus::Sent);

    const auto sent = chunks();
    ASSERT_GT(sent.size(), 3u);
    EXPECT_EQ(sent[1].data.size(), kChunk);
    EXPECT_EQ(sent[2].header.chunk_index(), 2u);
    EXPECT_EQ(sent[2].header.offset(), 2 * kChunk);
    EXPECT_LT(sent[2].data.size(), kChunk);
    EXPECT_EQ(sent[2].data.size(), planner.current_chunk_size());

    ByteBuffer joined;
    for (std::size_t i = 0; i < sent.size(); ++i) {
        EXPECT_EQ(sent[i].header.chunk_index(), i);
        EXPECT_EQ(sent[i].header.offset(), joined.size());
        EXPECT_EQ(sent[i].header.chunk_hash(),
                  util::hash::sha256_hex(ConstDataBlock(sent[i].data.data(), sent[i].data.size())).value());
        joined.insert(joined.end(), sent[i].data.begin(), sent[i].data.end());
    }
    EXPECT_EQ(joined, read_all(file));
    EXPECT_EQ(result.total_chunks, sent.size());
    EXPECT_EQ(protocol::parse_body<wire::FileEnd>(frames().back()).value().total_chunks(), sent.size());
}

TEST_F(FileSenderTest, ResendRepeatsRecordedChunksThenEnd) {
    make_sender(30000);
    ASSERT_EQ(send().status, SendStatus::Sent);
    const auto original = chunks();
    ASSERT_EQ(original.size(), 4u);

    clear_sent();
    resend({3, 1, 3});

    const auto all = frames();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(all.back().is(MessageType::End));
    EXPECT_EQ(protocol::parse_body<wire::FileEnd>(all.back()).value().total_chunks(), 4u);

    const auto again = chunks();
    ASSERT_EQ(again.size(), 2u);
    for (const auto& chunk : again) {
        const auto& first = original[chunk.header.chunk_index()];
        EXPECT_EQ(chunk.header.offset(), first.header.offset());
        EXPECT_EQ(chunk.header.payload_length(), first.header.payload_length());
        EXPECT_EQ(chunk.header.chunk_hash(), first.header.chunk_hash());
        EXPECT_EQ(chunk.data, first.data);
    }
    EXPECT_EQ(again[0].header.chunk_index(), 1u);
    EXPECT_EQ(again[1].header.chunk_index(), 3u);
    EXPECT_EQ(sender->status(), SendStatus::Sent);
}

TEST_F(FileSenderTest, ResendKeepsSizesAfterChunkSizeChange) {
    make_sender(40000);
    channel->shrink_after(3, 6000);
    ASSERT_EQ(send().status, SendStatus::Sent);
    const auto original = chunks();
    const auto last = original.size() - 1;

    on_io(executor, [this]() {
        channel->set_max_message_size(256 * 1024);
        channel->sent.clear();
    });
    // The next plan is different again; recorded chunks must not follow it.
    on_io(executor, [this]() { planner.set_chunk_size(2048); });
    resend({0, last});

    const auto again = chunks();
    ASSERT_EQ(again.size(), 2u);
    EXPECT_EQ(again[0].header.chunk_index(), 0u);
    EXPECT_EQ(again[0].data.size(), kChunk);
    EXPECT_EQ(again[0].header.offset(), 0u);
    EXPECT_EQ(again[1].header.chunk_index(), last);
    EXPECT_EQ(again[1].header.offset(), original[last].header.offset());
    EXPECT_EQ(again[1].data, original[last].data);
    EXPECT_TRUE(frames().back().is(MessageType::End));
}

TEST_F(FileSenderTest, UnknownResendIndexOnlyRepeatsEnd) {
    make_sender(10000);
    ASSERT_EQ(send().status, SendStatus::Sent);
    clear_sent();
    resend({7});

    const auto all = frames();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].is(MessageType::End));
}

TEST_F(FileSenderTest, RemoteErrorAfterSentFailsTransfer) {
    make_sender(10000);
    ASSERT_EQ(send().status, SendStatus::Sent);
    clear_sent();

    on_io(executor, [this]() {
        sender->on_remote_error("bob", error_of(error::ErrorKind::Integrity, "file hash mismatch"));
    });
    EXPECT_EQ(sender->status(), SendStatus::Failed);
    // The receiver already knows; nothing is echoed back.
    EXPECT_EQ(sent_count(), 0u);

    const auto progress = on_io(executor, [this]() { return tracker.progress("t1"); });
    ASSERT_TRUE(progress);
    EXPECT_EQ(progress->status, progress::TransferStatus::Error);
    const auto history = on_io(executor, [this]() { return errors.error_history("t1"); });
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.back().kind, error::ErrorKind::Integrity);
}

TEST_F(FileSenderTest, RemoteCancelAfterSentCancelsTransfer) {
    make_sender(10000);
    ASSERT_EQ(send().status, SendStatus::Sent);

    on_io(executor, [this]() {
        sender->on_remote_error("bob", error_of(error::ErrorKind::UserCancelled, "declined"));
    });
    EXPECT_EQ(sender->status(), SendStatus::Cancelled);
    const auto progress = on_io(executor, [this]() { return tracker.progress("t1"); });
    ASSERT_TRUE(progress);
    EXPECT_EQ(progress->status, progress::TransferStatus::Cancelled);
}

TEST_F(FileSenderTest, CancelAfterSentNotifiesReceiverAndStopsResends) {
    make_sender(10000);
    ASSERT_EQ(send().status, SendStatus::Sent);
    clear_sent();

    on_io(executor, [this]() { sender->cancel(); });
    EXPECT_EQ(sender->status(), SendStatus::Cancelled);
    EXPECT_TRUE(sender->cancelled());

    auto all = frames();
    ASSERT_EQ(all.size(), 1u);
    ASSERT_TRUE(all[0].is(MessageType::Error));
    EXPECT_EQ(protocol::parse_body<wire::FileError>(all[0]).value().kind(),
              static_cast<std::uint32_t>(error::ErrorKind::UserCancelled));

    resend({0});
    EXPECT_EQ(sent_count(), 1u);
}

TEST_F(FileSenderTest, CancelWhileWaitingForDrain) {
    make_sender(40000);
    channel->set_buffered(64 * 1024);
    auto future = spawn_future(executor, sender->send_file());
    ASSERT_TRUE(test_utils::wait_until([this]() { return sent_count() >= 2; }));

    on_io(executor, [this]() {
        sender->cancel();
        channel->release();
    });
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    const auto result = future.get();
    EXPECT_EQ(result.status, SendStatus::Cancelled);

    const auto all = frames();
    ASSERT_FALSE(all.empty());
    EXPECT_TRUE(all.back().is(MessageType::Error));
    for (const auto& frame : all) {
        EXPECT_FALSE(frame.is(MessageType::End));
    }
}

TEST_F(FileSenderTest, ClosedChannelFailsWithNetworkError) {
    make_sender(10000);
    channel->set_open(false);
    const auto result = send();
    EXPECT_EQ(result.status, SendStatus::Failed);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->kind, error::ErrorKind::Network);
}
