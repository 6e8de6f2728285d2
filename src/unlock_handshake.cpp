#include "unlock_handshake.h"
#include "frame_codec.h"
#include <algorithm>
#include <iostream>

const char *handshake_state_name(HandshakeState s)
{
    switch (s)
    {
    case HandshakeState::Listening: return "listening";
    case HandshakeState::Unlocked:  return "unlocked";
    case HandshakeState::Degraded:  return "degraded";
    case HandshakeState::Cancelled: return "cancelled";
    }
    return "unknown";
}

UnlockHandshake::UnlockHandshake(PanelLink &link,
                                 Clock &clock,
                                 const UnlockConfig &cfg,
                                 AgentMetrics &metrics)
    : link_(link), clock_(clock), cfg_(cfg), metrics_(metrics)
{
    if (cfg_.attempts < 1)
        cfg_.attempts = 1;
    if (cfg_.polls_required < 1)
        cfg_.polls_required = 1;
    if (cfg_.read_slice.count() < 1)
        cfg_.read_slice = std::chrono::milliseconds(1);
}

void UnlockHandshake::start()
{
    session_ = UnlockSession{};
    session_.attempts_total = cfg_.attempts;
    begin_attempt(1);
}

void UnlockHandshake::begin_attempt(int k)
{
    session_.attempt = k;
    session_.polls_answered = 0;
    session_.deadline = clock_.now() + cfg_.window;
    metrics_.unlock_attempts.fetch_add(1, std::memory_order_relaxed);

    std::cout << "[Unlock] Attempt " << k << "/" << session_.attempts_total
              << " window " << cfg_.window.count() << "ms, answering with "
              << TileRegistry::kick_tile().name << "\n";
}

void UnlockHandshake::answer_poll(uint8_t seq, const PayloadSource &payloads)
{
    const auto &rot = TileRegistry::unlock_rotation();
    TileId tile = rot[static_cast<std::size_t>(session_.polls_answered) % rot.size()];

    std::string payload = payloads ? payloads(tile) : std::string();
    try
    {
        link_.send(tile, seq, payload);
    }
    catch (const InvalidPayload &ex)
    {
        std::cerr << "[Unlock] Not answering poll, bad payload for tile 0x"
                  << std::hex << int(tile_byte(tile)) << std::dec
                  << ": " << ex.what() << "\n";
        return;
    }
    session_.polls_answered++;

    if (session_.polls_answered >= cfg_.polls_required)
    {
        session_.outcome = HandshakeState::Unlocked;
        std::cout << "[Unlock] Attempt " << session_.attempt << ": panel activated (";
        if (FrameCodec::is_ascii_seq(seq))
            std::cout << "boot poll '" << static_cast<char>(seq) << "'";
        else
            std::cout << "tile poll 0x" << std::hex << int(seq) << std::dec;
        std::cout << ")\n";
    }
}

void UnlockHandshake::fail_attempt()
{
    std::cout << "[Unlock] Attempt " << session_.attempt
              << ": no activation within window\n";

    if (session_.attempt >= session_.attempts_total)
    {
        session_.outcome = HandshakeState::Degraded;
        std::cerr << "[Unlock] WARN: panel might not be activated, continuing anyway\n";
        return;
    }

    link_.pulse_dtr();
    clock_.sleep_for(cfg_.attempt_settle);
    begin_attempt(session_.attempt + 1);
}

HandshakeState UnlockHandshake::step(const PayloadSource &payloads)
{
    if (session_.outcome != HandshakeState::Listening)
    {
        return session_.outcome;
    }
    if (session_.attempt == 0)
    {
        start();
    }

    auto now = clock_.now();
    if (now >= session_.deadline)
    {
        fail_attempt();
        return session_.outcome;
    }

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(session_.deadline - now);
    auto timeout = std::min(remaining, cfg_.read_slice);

    uint8_t seq = 0;
    if (link_.read_poll(timeout, seq))
    {
        answer_poll(seq, payloads);
    }

    if (session_.outcome == HandshakeState::Listening &&
        clock_.now() >= session_.deadline)
    {
        fail_attempt();
    }
    return session_.outcome;
}

HandshakeState UnlockHandshake::run(const PayloadSource &payloads,
                                    const std::atomic<bool> *cancel)
{
    if (session_.attempt == 0)
    {
        start();
    }
    while (session_.outcome == HandshakeState::Listening)
    {
        if (cancel && cancel->load(std::memory_order_relaxed))
        {
            session_.outcome = HandshakeState::Cancelled;
            std::cout << "[Unlock] Cancelled during attempt " << session_.attempt << "\n";
            break;
        }
        step(payloads);
    }
    return session_.outcome;
}
