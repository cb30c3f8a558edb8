#include <cerrno>
#include <memory>
#include <thread>
#include <sys/socket.h>
#include <gtest/gtest.h>
#include "framed_connection.hpp"
#include "test_support.hpp"

namespace
{

class FramedConnectionTest : public ::testing::Test
{
protected:
    std::unique_ptr<FramedConnection> framed;
    ScopedFd peer;

    void SetUp() override
    {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        framed = std::make_unique<FramedConnection>(std::make_unique<Connection>(fds[0]), 200);
        peer.reset(fds[1]);
    }
};

} // namespace

TEST_F(FramedConnectionTest, SendAppendsTerminator)
{
    framed->send(nlohmann::json{{"Hello", 0}});

    std::string expected = std::string("{\"Hello\":0}") + '\0';
    EXPECT_EQ(read_exactly(peer.get(), expected.size()), expected);
}

TEST_F(FramedConnectionTest, SendRejectsOversizedFrameWithoutWriting)
{
    nlohmann::json big = {{"Authenticate", std::string(300, 'a')}};
    EXPECT_EQ(error_code_of([&] { framed->send(big); }), ErrorCode::FrameTooLarge);

    char byte;
    EXPECT_EQ(recv(peer.get(), &byte, 1, MSG_DONTWAIT), -1);
}

TEST_F(FramedConnectionTest, StalledWriteFailsWithIOError)
{
    // Fill the socket until the peer, which never reads, pushes back.
    int fd = framed->connection().get_fd();
    std::string filler(4096, 'x');
    while (::send(fd, filler.data(), filler.size(), MSG_DONTWAIT | MSG_NOSIGNAL) > 0)
    {
    }
    ASSERT_TRUE(errno == EAGAIN || errno == EWOULDBLOCK);

    EXPECT_EQ(error_code_of([&] { framed->send(nlohmann::json{{"Hello", 0}}); }), ErrorCode::IOError);
}

TEST_F(FramedConnectionTest, ReceivesConsecutiveFrames)
{
    send_raw(peer.get(), std::string("\"Heartbeat\"") + '\0' + "{\"Hello\":1}" + '\0');

    std::string frame;
    ASSERT_TRUE(framed->receive(frame, true));
    EXPECT_EQ(frame, "\"Heartbeat\"");
    ASSERT_TRUE(framed->receive(frame, true));
    EXPECT_EQ(frame, "{\"Hello\":1}");
}

TEST_F(FramedConnectionTest, CleanCloseIsAbsentNotError)
{
    peer.reset();

    std::string frame;
    EXPECT_FALSE(framed->receive(frame, true));
}

TEST_F(FramedConnectionTest, SilentPeerTimesOut)
{
    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, true); }), ErrorCode::TimedOut);
}

TEST_F(FramedConnectionTest, TimeoutMidFrameIsNotAbsent)
{
    send_raw(peer.get(), "{\"Hel");

    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, true); }), ErrorCode::TimedOut);
}

TEST_F(FramedConnectionTest, UntimedReceiveOutlastsTimeout)
{
    std::thread writer([this]
                       {
                           std::this_thread::sleep_for(std::chrono::milliseconds(400));
                           send_frame(peer.get(), "\"Heartbeat\"");
                       });

    std::string frame;
    EXPECT_TRUE(framed->receive(frame, false));
    EXPECT_EQ(frame, "\"Heartbeat\"");
    writer.join();
}

TEST_F(FramedConnectionTest, RejectsEmptyFrame)
{
    send_raw(peer.get(), std::string(1, '\0'));

    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, true); }), ErrorCode::EmptyFrame);
}

TEST_F(FramedConnectionTest, AcceptsFrameOfMaximumLength)
{
    std::string payload = "\"" + std::string(MAX_FRAME_LENGTH - 2, 'x') + "\"";
    send_frame(peer.get(), payload);

    std::string frame;
    ASSERT_TRUE(framed->receive(frame, true));
    EXPECT_EQ(frame.size(), MAX_FRAME_LENGTH);
}

TEST_F(FramedConnectionTest, RejectsOversizedTerminatedFrame)
{
    send_frame(peer.get(), std::string(MAX_FRAME_LENGTH + 1, 'x'));

    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, true); }), ErrorCode::FrameTooLarge);
}

TEST_F(FramedConnectionTest, RejectsOversizedUnterminatedFrame)
{
    send_raw(peer.get(), std::string(MAX_FRAME_LENGTH * 3, 'x'));

    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, false); }), ErrorCode::FrameTooLarge);
}

TEST_F(FramedConnectionTest, PartialFrameThenCloseIsUnexpectedEof)
{
    send_raw(peer.get(), "{\"Hello\":");
    peer.reset();

    std::string frame;
    EXPECT_EQ(error_code_of([&] { framed->receive(frame, true); }), ErrorCode::UnexpectedEOF);
}

TEST_F(FramedConnectionTest, DrainReturnsBytesPastLastFrame)
{
    send_raw(peer.get(), std::string("\"Heartbeat\"") + '\0' + "payload");

    std::string frame;
    ASSERT_TRUE(framed->receive(frame, true));

    std::vector<uint8_t> buffered = framed->drain_buffered();
    EXPECT_EQ(std::string(buffered.begin(), buffered.end()), "payload");
    EXPECT_TRUE(framed->drain_buffered().empty());

    // The socket itself is untouched.
    send_raw(peer.get(), "more");
    uint8_t chunk[16];
    ssize_t len = framed->connection().recv_data(chunk, sizeof(chunk));
    EXPECT_EQ(std::string(chunk, chunk + len), "more");
}
