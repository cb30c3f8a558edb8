#include <memory>
#include <sys/socket.h>
#include <gtest/gtest.h>
#include "crypto/authenticator.hpp"
#include "framed_connection.hpp"
#include "test_support.hpp"

namespace
{

const char *kChallenge = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
const char *kSecretTag = "8f7d2bfee173b0184e2f1d28d7f32567cac3ae0cb40246c0672cd88590b71e5f";

Uuid challenge_id()
{
    Uuid id;
    Uuid::parse(kChallenge, id);
    return id;
}

struct FramedPair
{
    std::unique_ptr<FramedConnection> framed;
    ScopedFd peer;

    FramedPair()
    {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0)
        {
            ADD_FAILURE() << "socketpair failed";
            return;
        }
        framed = std::make_unique<FramedConnection>(std::make_unique<Connection>(fds[0]), 500);
        peer.reset(fds[1]);
    }
};

} // namespace

TEST(AuthenticatorTest, MatchesReferenceTag)
{
    Authenticator auth("secret");
    EXPECT_EQ(auth.answer(Uuid()), "f595dd2e2c05b7bc7042dc3541159dc9eaf2ded8f547cfd51966c2ec464773b1");
    EXPECT_EQ(auth.answer(challenge_id()), kSecretTag);
}

TEST(AuthenticatorTest, AnswerIsDeterministicAcrossInstances)
{
    Authenticator first("secret");
    Authenticator second("secret");

    std::string tag = first.answer(challenge_id());
    EXPECT_EQ(first.answer(challenge_id()), tag);
    EXPECT_EQ(second.answer(challenge_id()), tag);
}

TEST(AuthenticatorTest, DifferentSecretGivesDifferentTag)
{
    Authenticator other("other");
    EXPECT_EQ(other.answer(challenge_id()), "b1891c89f635a173db26545b31bebccfa041d2384d66b5b3883d145d4810914b");
    EXPECT_NE(other.answer(challenge_id()), kSecretTag);
}

TEST(AuthenticatorTest, HandshakeAnswersChallenge)
{
    FramedPair pair;
    send_frame(pair.peer.get(), std::string("{\"Challenge\":\"") + kChallenge + "\"}");

    Authenticator auth("secret");
    auth.client_handshake(*pair.framed);

    std::string frame;
    ASSERT_TRUE(read_frame(pair.peer.get(), frame));
    EXPECT_EQ(frame, std::string("{\"Authenticate\":\"") + kSecretTag + "\"}");
}

TEST(AuthenticatorTest, HandshakeRejectsOtherMessages)
{
    FramedPair pair;
    send_frame(pair.peer.get(), "{\"Hello\":80}");

    Authenticator auth("secret");
    EXPECT_EQ(error_code_of([&] { auth.client_handshake(*pair.framed); }), ErrorCode::UnexpectedHandshakeMessage);
}

TEST(AuthenticatorTest, HandshakeFailsOnEof)
{
    FramedPair pair;
    pair.peer.reset();

    Authenticator auth("secret");
    EXPECT_EQ(error_code_of([&] { auth.client_handshake(*pair.framed); }), ErrorCode::UnexpectedEOF);
}

TEST(AuthenticatorTest, HandshakeTimesOutWithoutChallenge)
{
    FramedPair pair;

    Authenticator auth("secret");
    EXPECT_EQ(error_code_of([&] { auth.client_handshake(*pair.framed); }), ErrorCode::TimedOut);
}
