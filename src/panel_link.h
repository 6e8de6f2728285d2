#pragma once
#include "clock.h"
#include "frame_codec.h"
#include "metrics.h"
#include "tile_registry.h"
#include "transport.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Frame-level view of the panel transport.
//   RX: accumulates bytes and pulls poll frames out of them. Frames may
//       arrive split across reads; garbage is dropped up to the next start
//       marker and counted in AgentMetrics::malformed.
//   TX: encodes reply frames and writes them, keeping the send counters.
class PanelLink {
public:
    PanelLink(Transport &transport, Clock &clock, AgentMetrics &metrics);

    // Returns a buffered poll if one is complete, otherwise performs one
    // read bounded by `timeout` and tries again.
    bool read_poll(std::chrono::milliseconds timeout, uint8_t &seq);

    // Throws InvalidPayload (nothing written) or TransportError.
    void send(TileId tile, uint8_t seq, const std::string &payload);

    void pulse_dtr() { transport_.pulse_dtr(); }

    std::size_t buffered() const { return buf_.size(); }

private:
    bool next_buffered(uint8_t &seq);

    Transport    &transport_;
    Clock        &clock_;
    AgentMetrics &metrics_;
    std::vector<uint8_t> buf_;
    static constexpr std::size_t READ_CHUNK = 256;
    static constexpr std::size_t MAX_BUFFERED = 4096;
};
