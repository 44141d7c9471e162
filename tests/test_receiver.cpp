// ============================================================
// test_receiver.cpp -- Receiver handler against a hand-driven sender
// ============================================================

#include "common/errors.hpp"
#include "receiver/receive_handler.hpp"
#include "transport/memory_transport.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <future>

using namespace testing_util;
using namespace std::chrono_literals;

namespace {

class ReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ends = MemoryTransport::pair();
        dial   = ends.first;
        listen = ends.second;
        handler = std::make_unique<ReceiveHandler>(profile_of("", "bob"), config_of(1024, 4));
        handler->subscribe(got);
    }

    std::future<void> start_accept() {
        return std::async(std::launch::async, [this] { handler->accept(listen); });
    }

    // The close the receiver reported back to the sender.
    static u32 close_code_seen_by(Connection& conn) {
        try {
            conn.open_uni();
        } catch (const ConnectionClosed& e) {
            return e.code();
        }
        return 0xFFFFFFFFu;
    }

    std::shared_ptr<MemoryConnection>  dial, listen;
    std::unique_ptr<ReceiveHandler>    handler;
    std::shared_ptr<RecordingReceiver> got{std::make_shared<RecordingReceiver>()};
};

} // namespace

TEST_F(ReceiverTest, GracefulCloseAfterAllBytesSucceeds) {
    auto done = start_accept();
    NegotiatedConfig n = greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 5}},
                                         config_of(4096, 2));
    EXPECT_EQ(n.chunk_size, 1024u);
    EXPECT_EQ(n.parallel_streams, 2u);

    send_file_chunk(*dial, "a", bytes_of("hello"));
    dial->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);

    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(got->joined("a"), bytes_of("hello"));
    EXPECT_TRUE(got->finished);
    EXPECT_TRUE(handler->is_finished());
    EXPECT_EQ(handler->stats().files_done.load(), 1u);
}

TEST_F(ReceiverTest, SecondConnectionIsRejectedUntouched) {
    auto done = start_accept();
    while (!handler->is_consumed()) std::this_thread::sleep_for(1ms);

    auto other = MemoryTransport::pair();
    EXPECT_THROW(handler->accept(other.second), NotAllowed);
    EXPECT_FALSE(other.second->is_closed());
    EXPECT_FALSE(other.first->is_closed());
    EXPECT_EQ(other.second->stream_count(), 0u);

    // The first session is unaffected.
    greet_as_sender(*dial, {}, config_of(1024, 4));
    dial->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);
    EXPECT_NO_THROW(done.get());

    EXPECT_THROW(handler->accept(other.second), NotAllowed);
}

// The sender may close right after reading the reply, before the receiver
// has wound its handshake stream down.
TEST(ReceiveHandler, CloseRightAfterHandshakeReplyIsGraceful) {
    for (int round = 0; round < 100; ++round) {
        auto ends = MemoryTransport::pair();
        ReceiveHandler handler(profile_of("", "bob"), config_of(1024, 4));
        auto got = std::make_shared<RecordingReceiver>();
        handler.subscribe(got);

        auto done = std::async(std::launch::async, [&] { handler.accept(ends.second); });
        greet_as_sender(*ends.first, {}, config_of(1024, 4));
        ends.first->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);

        ASSERT_NO_THROW(done.get()) << "round " << round;
        EXPECT_TRUE(got->finished);
    }
}

TEST_F(ReceiverTest, NullConnectionIsInvalid) {
    EXPECT_THROW(handler->accept(nullptr), std::invalid_argument);
    EXPECT_FALSE(handler->is_consumed());
}

TEST_F(ReceiverTest, OtherCloseCodeIsAnError) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 3}}, config_of(1024, 4));
    send_file_chunk(*dial, "a", bytes_of("abc"));
    dial->close(7, "gone");

    try {
        done.get();
        FAIL() << "expected ConnectionClosed";
    } catch (const ConnectionClosed& e) {
        EXPECT_EQ(e.code(), 7u);
        EXPECT_EQ(e.reason(), "gone");
        EXPECT_TRUE(e.by_peer());
    }
    EXPECT_FALSE(got->finished);
}

TEST_F(ReceiverTest, FinishedCodeWithWrongReasonIsAnError) {
    auto done = start_accept();
    greet_as_sender(*dial, {}, config_of(1024, 4));
    dial->close(ARKDROP_CLOSE_FINISHED, "bye");
    EXPECT_THROW(done.get(), ConnectionClosed);
}

TEST_F(ReceiverTest, LostLinkIsAnError) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 3}}, config_of(1024, 4));
    dial->drop();
    EXPECT_THROW(done.get(), ConnectionLost);
}

TEST_F(ReceiverTest, MissingBytesFailAsIncomplete) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 10}}, config_of(1024, 4));
    send_file_chunk(*dial, "a", bytes_of("12345"));
    dial->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);

    EXPECT_THROW(done.get(), ProtocolError);
    EXPECT_FALSE(got->finished);
}

TEST_F(ReceiverTest, UnknownFileIdFailsAndClosesWithFailureCode) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 3}}, config_of(1024, 4));
    EXPECT_THROW(send_file_chunk(*dial, "nope", bytes_of("abc")), ConnectionClosed);

    EXPECT_THROW(done.get(), ProtocolError);
    EXPECT_EQ(close_code_seen_by(*dial), (u32)ARKDROP_CLOSE_FAILED);
}

TEST_F(ReceiverTest, CorruptedChunkIsRejected) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 4}}, config_of(1024, 4));

    auto stream = dial->open_uni();
    ChunkProjection chunk = framing::project_chunk("a", bytes_of("data"), false);
    chunk.checksum ^= 0x1u;
    framing::write_chunk_message(*stream, chunk);
    stream->finish();

    EXPECT_THROW(done.get(), ProtocolError);
    EXPECT_EQ(close_code_seen_by(*dial), (u32)ARKDROP_CLOSE_FAILED);
}

TEST_F(ReceiverTest, ChunkLargerThanNegotiatedIsRejected) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.bin", 4096}}, config_of(4096, 4));
    auto stream = dial->open_uni();
    framing::write_chunk_message(*stream, framing::project_chunk("a", random_bytes(2048, 1), false));
    stream->finish();
    EXPECT_THROW(done.get(), ProtocolError);
}

TEST_F(ReceiverTest, StreamMayNotSwitchFiles) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 1}, FileDescriptor{"b", "b.txt", 1}},
                    config_of(1024, 4));
    auto stream = dial->open_uni();
    framing::write_chunk_message(*stream, framing::project_chunk("a", bytes_of("1"), false));
    framing::write_chunk_message(*stream, framing::project_chunk("b", bytes_of("2"), false));
    stream->finish();
    EXPECT_THROW(done.get(), ProtocolError);
}

TEST_F(ReceiverTest, OverrunIsRejected) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 2}}, config_of(1024, 4));
    auto stream = dial->open_uni();
    framing::write_chunk_message(*stream, framing::project_chunk("a", bytes_of("abc"), false));
    stream->finish();
    EXPECT_THROW(done.get(), ProtocolError);
}

TEST_F(ReceiverTest, DuplicateIdsInHandshakeAreRejected) {
    auto done = start_accept();
    EXPECT_ANY_THROW(greet_as_sender(*dial,
                                     {FileDescriptor{"a", "x", 1}, FileDescriptor{"a", "y", 1}},
                                     config_of(1024, 4)));
    EXPECT_THROW(done.get(), ProtocolError);
}

TEST_F(ReceiverTest, CancelClosesWithCancellationCode) {
    auto done = start_accept();
    greet_as_sender(*dial, {FileDescriptor{"a", "a.txt", 5}}, config_of(1024, 4));
    std::this_thread::sleep_for(20ms);
    handler->cancel();

    try {
        done.get();
        FAIL() << "expected ConnectionClosed";
    } catch (const ConnectionClosed& e) {
        EXPECT_EQ(e.code(), (u32)ARKDROP_CLOSE_CANCELLED);
        EXPECT_FALSE(e.by_peer());
    }
    EXPECT_EQ(close_code_seen_by(*dial), (u32)ARKDROP_CLOSE_CANCELLED);
}

TEST_F(ReceiverTest, ShutdownOnlyFlipsTheFlag) {
    EXPECT_FALSE(handler->is_finished());
    handler->shutdown();
    EXPECT_TRUE(handler->is_finished());
    EXPECT_FALSE(handler->is_consumed());
}
