#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// AtomMan panel frames
//   Poll  (panel -> host): [0] 0xAA  [1] 0x05  [2] seq  [3-6] CC 33 C3 3C
//   Reply (host -> panel): [0] 0xAA  [1] tile  [2] 0x00 [3] seq
//                          [4..] ASCII payload  [N-4..N-1] CC 33 C3 3C
constexpr uint8_t     kFrameStart     = 0xAA;
constexpr uint8_t     kPollRole       = 0x05;
constexpr uint8_t     kReplyReserved  = 0x00;
constexpr uint8_t     kFrameEnd[4]    = {0xCC, 0x33, 0xC3, 0x3C};
constexpr std::size_t kPollFrameLen   = 7;
constexpr std::size_t kReplyOverhead  = 8;   // everything but the payload
constexpr std::size_t kMaxPayload     = 240; // panel drops longer frames

class InvalidPayload : public std::runtime_error {
public:
    explicit InvalidPayload(const std::string &what)
        : std::runtime_error(what) {}
};

enum class DecodeStatus : uint8_t {
    Poll         = 0,
    NeedMoreData = 1,
    Malformed    = 2
};

struct DecodeResult {
    DecodeStatus status{DecodeStatus::NeedMoreData};
    uint8_t      seq{0};      // only meaningful for Poll
    std::size_t  consumed{0}; // bytes the caller must drop from the front
};

class FrameCodec {
public:
    // Throws InvalidPayload on non-printable bytes or an oversized payload.
    static std::vector<uint8_t> encode(uint8_t tile_id,
                                       uint8_t seq,
                                       const std::string &payload);

    // Looks at the front of `data` only. Leading garbage and broken frames
    // come back as Malformed with `consumed` pointing at the next start
    // marker, so repeated calls always make progress.
    static DecodeResult decode(const uint8_t *data, std::size_t len);

    // Sequence bytes the panel sends while booting ('0'..'9', '<').
    static bool is_ascii_seq(uint8_t b);
};
