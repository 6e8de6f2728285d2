#include "frame_codec.h"
#include <algorithm>
#include <cstdio>

namespace {

std::size_t resync_offset(const uint8_t *data, std::size_t len)
{
    const uint8_t *next = std::find(data + 1, data + len, kFrameStart);
    return static_cast<std::size_t>(next - data);
}

} // namespace

std::vector<uint8_t> FrameCodec::encode(uint8_t tile_id,
                                        uint8_t seq,
                                        const std::string &payload)
{
    if (payload.size() > kMaxPayload)
    {
        throw InvalidPayload("payload too long: " + std::to_string(payload.size()) +
                             " bytes (max " + std::to_string(kMaxPayload) + ")");
    }
    for (std::size_t i = 0; i < payload.size(); ++i)
    {
        uint8_t b = static_cast<uint8_t>(payload[i]);
        if (b < 0x20 || b > 0x7E)
        {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02X", b);
            throw InvalidPayload(std::string("non-ASCII byte ") + hex +
                                 " at offset " + std::to_string(i));
        }
    }

    std::vector<uint8_t> out;
    out.reserve(payload.size() + kReplyOverhead);
    out.push_back(kFrameStart);
    out.push_back(tile_id);
    out.push_back(kReplyReserved);
    out.push_back(seq);
    out.insert(out.end(), payload.begin(), payload.end());
    out.insert(out.end(), std::begin(kFrameEnd), std::end(kFrameEnd));
    return out;
}

DecodeResult FrameCodec::decode(const uint8_t *data, std::size_t len)
{
    DecodeResult r;
    if (len == 0)
    {
        return r;
    }

    const uint8_t *start = std::find(data, data + len, kFrameStart);
    if (start != data)
    {
        r.status   = DecodeStatus::Malformed;
        r.consumed = static_cast<std::size_t>(start - data);
        return r;
    }

    // [1] role, [2] seq (any byte), [3-6] end marker
    std::size_t avail = std::min(len, kPollFrameLen);
    for (std::size_t i = 1; i < avail; ++i)
    {
        if (i == 2)
            continue;
        uint8_t want = (i == 1) ? kPollRole : kFrameEnd[i - 3];
        if (data[i] != want)
        {
            r.status   = DecodeStatus::Malformed;
            r.consumed = resync_offset(data, len);
            return r;
        }
    }

    if (len < kPollFrameLen)
    {
        return r;
    }

    r.status   = DecodeStatus::Poll;
    r.seq      = data[2];
    r.consumed = kPollFrameLen;
    return r;
}

bool FrameCodec::is_ascii_seq(uint8_t b)
{
    return (b >= 0x30 && b <= 0x39) || b == 0x3C;
}
