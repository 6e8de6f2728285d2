#include "fakes.h"
#include "unlock_handshake.h"

#include <gtest/gtest.h>

using std::chrono::milliseconds;
using std::chrono::seconds;

class UnlockHandshakeTest : public ::testing::Test {
protected:
    UnlockConfig config() {
        UnlockConfig c;
        c.attempts = 3;
        c.window = milliseconds(5000);
        c.polls_required = 1;
        c.attempt_settle = milliseconds(300);
        c.read_slice = milliseconds(100);
        return c;
    }

    PayloadSource payloads() {
        return [this](TileId t) {
            requested.push_back(t);
            return std::string("{CPU:test}");
        };
    }

    FakeClock clock;
    FakeTransport transport{clock};
    AgentMetrics metrics;
    PanelLink link{transport, clock, metrics};
    std::vector<TileId> requested;
};

TEST_F(UnlockHandshakeTest, PollInSecondAttemptUnlocksImmediately) {
    auto t0 = clock.now();
    transport.push_at(t0 + seconds(7), poll_frame('5'));

    UnlockHandshake hs(link, clock, config(), metrics);
    HandshakeState s = hs.run(payloads());

    EXPECT_EQ(s, HandshakeState::Unlocked);
    EXPECT_EQ(hs.session().attempt, 2);
    EXPECT_EQ(hs.session().polls_answered, 1);
    EXPECT_EQ(transport.dtr_pulses, 1);

    ASSERT_EQ(transport.writes.size(), 1u);
    const auto &w = transport.writes[0];
    EXPECT_EQ(w.at, t0 + seconds(7)); // answered in the same read cycle
    EXPECT_EQ(w.bytes[1], tile_byte(TileId::Cpu));
    EXPECT_EQ(w.bytes[3], '5');       // poll sequence echoed
    EXPECT_EQ(payload_of(w.bytes), "{CPU:test}");
    ASSERT_EQ(requested.size(), 1u);
    EXPECT_EQ(requested[0], TileId::Cpu);
}

TEST_F(UnlockHandshakeTest, SilenceDegradesExactlyOnce) {
    auto t0 = clock.now();
    UnlockHandshake hs(link, clock, config(), metrics);

    EXPECT_EQ(hs.run(payloads()), HandshakeState::Degraded);
    EXPECT_GE(clock.now() - t0, seconds(15));
    EXPECT_EQ(metrics.unlock_attempts.load(), 3u);
    EXPECT_EQ(transport.dtr_pulses, 2);
    EXPECT_TRUE(transport.writes.empty());

    // further steps keep the outcome and start nothing new
    EXPECT_EQ(hs.step(payloads()), HandshakeState::Degraded);
    EXPECT_EQ(hs.step(payloads()), HandshakeState::Degraded);
    EXPECT_EQ(metrics.unlock_attempts.load(), 3u);
    EXPECT_EQ(transport.dtr_pulses, 2);
}

TEST_F(UnlockHandshakeTest, EachAttemptGetsFullWindow) {
    UnlockHandshake hs(link, clock, config(), metrics);
    hs.start();
    auto first_deadline = hs.session().deadline;
    EXPECT_EQ(first_deadline, clock.now() + seconds(5));

    while (hs.session().attempt == 1)
        hs.step(payloads());

    EXPECT_EQ(hs.session().attempt, 2);
    EXPECT_EQ(hs.session().deadline, first_deadline + milliseconds(300) + seconds(5));
}

TEST_F(UnlockHandshakeTest, MalformedBytesDoNotEndAttempt) {
    auto t0 = clock.now();
    transport.push_at(t0 + seconds(1), {0x01, 0x02, 0xAA, 0x09});
    transport.push_at(t0 + seconds(2), poll_frame('0'));

    UnlockHandshake hs(link, clock, config(), metrics);
    EXPECT_EQ(hs.run(payloads()), HandshakeState::Unlocked);
    EXPECT_EQ(hs.session().attempt, 1);
    EXPECT_GE(metrics.malformed.load(), 1u);
    ASSERT_EQ(transport.writes.size(), 1u);
    EXPECT_EQ(transport.writes[0].at, t0 + seconds(2));
}

TEST_F(UnlockHandshakeTest, RequiredPollsRotateThroughUnlockTiles) {
    auto t0 = clock.now();
    transport.push_at(t0 + milliseconds(500), poll_frame('1'));
    transport.push_at(t0 + milliseconds(900), poll_frame('2'));
    transport.push_at(t0 + milliseconds(1300), poll_frame('3'));

    UnlockConfig c = config();
    c.polls_required = 3;
    UnlockHandshake hs(link, clock, c, metrics);
    EXPECT_EQ(hs.run(payloads()), HandshakeState::Unlocked);

    ASSERT_EQ(transport.writes.size(), 3u);
    EXPECT_EQ(transport.writes[0].bytes[1], tile_byte(TileId::Cpu));
    EXPECT_EQ(transport.writes[1].bytes[1], tile_byte(TileId::Gpu));
    EXPECT_EQ(transport.writes[2].bytes[1], tile_byte(TileId::Memory));
    EXPECT_EQ(transport.writes[2].bytes[3], '3');
}

TEST_F(UnlockHandshakeTest, CancelResolvesAsCancelled) {
    std::atomic<bool> cancel{true};
    UnlockHandshake hs(link, clock, config(), metrics);
    EXPECT_EQ(hs.run(payloads(), &cancel), HandshakeState::Cancelled);
    EXPECT_TRUE(transport.writes.empty());
}

TEST_F(UnlockHandshakeTest, WriteFailureDuringUnlockPropagates) {
    transport.push_at(clock.now() + seconds(1), poll_frame('1'));
    transport.fail_writes = true;
    UnlockHandshake hs(link, clock, config(), metrics);
    EXPECT_THROW(hs.run(payloads()), TransportError);
}

TEST(HandshakeStateTest, Names) {
    EXPECT_STREQ(handshake_state_name(HandshakeState::Unlocked), "unlocked");
    EXPECT_STREQ(handshake_state_name(HandshakeState::Degraded), "degraded");
}
