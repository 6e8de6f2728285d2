#include "panel_link.h"
#include <iostream>

PanelLink::PanelLink(Transport &transport, Clock &clock, AgentMetrics &metrics)
    : transport_(transport), clock_(clock), metrics_(metrics) {}

bool PanelLink::next_buffered(uint8_t &seq)
{
    while (!buf_.empty())
    {
        DecodeResult r = FrameCodec::decode(buf_.data(), buf_.size());
        if (r.status == DecodeStatus::NeedMoreData)
        {
            return false;
        }

        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(r.consumed));

        if (r.status == DecodeStatus::Malformed)
        {
            metrics_.malformed.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[Serial] Dropped " << r.consumed << " malformed byte(s)\n";
            continue;
        }

        metrics_.polls_seen.fetch_add(1, std::memory_order_relaxed);
        seq = r.seq;
        return true;
    }
    return false;
}

bool PanelLink::read_poll(std::chrono::milliseconds timeout, uint8_t &seq)
{
    if (next_buffered(seq))
    {
        return true;
    }

    uint8_t chunk[READ_CHUNK];
    std::size_t n = transport_.read_some(chunk, sizeof(chunk), timeout);
    if (n == 0)
    {
        return false;
    }
    metrics_.bytes_recv.fetch_add(n, std::memory_order_relaxed);

    if (buf_.size() + n > MAX_BUFFERED)
    {
        std::cerr << "[Serial] RX buffer overflow, dropping " << buf_.size() << " byte(s)\n";
        metrics_.malformed.fetch_add(1, std::memory_order_relaxed);
        buf_.clear();
    }
    buf_.insert(buf_.end(), chunk, chunk + n);

    return next_buffered(seq);
}

void PanelLink::send(TileId tile, uint8_t seq, const std::string &payload)
{
    std::vector<uint8_t> frame = FrameCodec::encode(tile_byte(tile), seq, payload);

    auto t_start = clock_.now();
    transport_.write_all(frame);
    auto t_end = clock_.now();

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count();
    record_write_latency(metrics_, static_cast<uint64_t>(us));
    metrics_.frames_sent.fetch_add(1, std::memory_order_relaxed);
    metrics_.bytes_sent.fetch_add(frame.size(), std::memory_order_relaxed);
}
