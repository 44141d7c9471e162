// ============================================================
// test_tcp.cpp -- Sessions over loopback TCP
// ============================================================

#include "common/data_sink.hpp"
#include "common/errors.hpp"
#include "receiver/receive_handler.hpp"
#include "receiver/sink_subscriber.hpp"
#include "sender/send_bubble.hpp"
#include "transport/tcp_transport.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <future>
#include <iterator>

using namespace testing_util;

TEST(TcpTransport, StreamsCrossTheSocket) {
    TcpListener listener;
    auto dial   = TcpConnection::connect("127.0.0.1", listener.port());
    auto listen = listener.accept();
    EXPECT_EQ(dial->side(), StreamMux::Side::DIALER);
    EXPECT_EQ(listen->side(), StreamMux::Side::LISTENER);

    std::vector<u8> data = random_bytes(3 * MAX_MUX_DATA + 5, 21);
    auto send = dial->open_uni();
    send->write_all(data);
    send->finish();

    auto recv = listen->accept_uni();
    std::vector<u8> back(data.size());
    EXPECT_EQ(recv->read_full(back.data(), back.size()), data.size());
    u8 extra;
    EXPECT_EQ(recv->read(&extra, 1), 0u);
    EXPECT_EQ(back, data);
    EXPECT_FALSE(send->stopped().has_value());

    dial->close(ARKDROP_CLOSE_FINISHED, ARKDROP_FINISHED_REASON);
    try {
        listen->accept_uni();
        FAIL() << "expected ConnectionClosed";
    } catch (const ConnectionClosed& e) {
        EXPECT_TRUE(e.is_graceful());
        EXPECT_TRUE(e.by_peer());
    }
}

TEST(TcpTransport, DestroyedPeerIsConnectionLost) {
    TcpListener listener;
    auto dial   = TcpConnection::connect("127.0.0.1", listener.port());
    auto listen = listener.accept();
    dial.reset();
    EXPECT_THROW(listen->accept_bi(), ConnectionLost);
}

TEST(TcpTransport, ConnectToClosedPortFails) {
    u16 port;
    {
        TcpListener listener;
        port = listener.port();
        listener.close();
    }
    EXPECT_THROW(TcpConnection::connect("127.0.0.1", port), ConnectionLost);
    EXPECT_THROW(TcpConnection::connect("not-an-ip", port), std::invalid_argument);
}

TEST(TcpTransport, FilesLandInDirectorySink) {
    auto out = temp_dir("tcp");
    TcpListener listener;
    auto dial = TcpConnection::connect("127.0.0.1", listener.port());
    std::shared_ptr<Connection> listen = listener.accept();

    std::vector<u8> big   = random_bytes(1500000, 77);
    std::vector<u8> small = bytes_of("small file\n");
    SendBubble bubble(profile_of("", "alice"),
                      {SendFile::from_bytes("big.bin", big),
                       SendFile::from_bytes("docs/small.txt", small)},
                      ProposedConfig::high_performance(), dial);

    ReceiveHandler handler(profile_of("", "bob"), ProposedConfig::balanced());
    auto sink = std::make_shared<DirectorySink>(out.string());
    handler.subscribe(std::make_shared<SinkSubscriber>("disk", sink));

    auto receiving = std::async(std::launch::async, [&] { handler.accept(listen); });
    bubble.start();
    bubble.wait();
    receiving.get();

    auto read_all = [](const std::filesystem::path& p) {
        std::ifstream f(p, std::ios::binary);
        return std::vector<u8>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    };
    EXPECT_EQ(read_all(out / "big.bin"), big);
    EXPECT_EQ(read_all(out / "docs" / "small.txt"), small);
    EXPECT_EQ(handler.stats().files_done.load(), 2u);
    std::filesystem::remove_all(out);
}
