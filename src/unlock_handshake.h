#pragma once
#include "clock.h"
#include "metrics.h"
#include "panel_link.h"
#include "tile_registry.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

enum class HandshakeState : uint8_t {
    Listening = 0,
    Unlocked  = 1, // panel accepted the host
    Degraded  = 2, // attempts exhausted, keep sending anyway
    Cancelled = 3  // shutdown requested while listening
};

const char *handshake_state_name(HandshakeState s);

struct UnlockConfig {
    int attempts{3};
    std::chrono::milliseconds window{5000};
    int polls_required{1};
    std::chrono::milliseconds attempt_settle{300};
    std::chrono::milliseconds read_slice{100};
};

struct UnlockSession {
    int attempt{0};        // 1-based, 0 until start()
    int attempts_total{0};
    Clock::time_point deadline{};
    int polls_answered{0};
    HandshakeState outcome{HandshakeState::Listening};
};

// Supplies the payload for a tile answered during the handshake.
using PayloadSource = std::function<std::string(TileId)>;

// Waits for the panel's poll frame and answers it with the kick tile,
// echoing the poll's sequence byte. Each attempt is a fixed window measured
// on the injected clock; DTR is pulsed between attempts. Exhausting every
// attempt resolves to Degraded exactly once.
class UnlockHandshake {
public:
    UnlockHandshake(PanelLink &link,
                    Clock &clock,
                    const UnlockConfig &cfg,
                    AgentMetrics &metrics);

    void start();

    // One read cycle bounded by the attempt deadline.
    HandshakeState step(const PayloadSource &payloads);

    // Loops step() until resolved or `cancel` is set.
    HandshakeState run(const PayloadSource &payloads,
                       const std::atomic<bool> *cancel = nullptr);

    const UnlockSession &session() const { return session_; }

private:
    void begin_attempt(int k);
    void answer_poll(uint8_t seq, const PayloadSource &payloads);
    void fail_attempt();

    PanelLink    &link_;
    Clock        &clock_;
    UnlockConfig  cfg_;
    AgentMetrics &metrics_;
    UnlockSession session_;
};
