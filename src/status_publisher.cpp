#include "status_publisher.h"
#include <cstring>

StatusPublisher::StatusPublisher(RedisConnector &redis,
                                 const AgentMetrics &metrics,
                                 const std::string &agent_id)
    : redis_(redis), metrics_(metrics)
{
    uint32_t aid = 0;
    for (char c : agent_id)
    {
        aid = aid * 131u + (uint8_t)c;
    }
    agent_field_.resize(4);
    std::memcpy(agent_field_.data(), &aid, 4);
}

void StatusPublisher::on_frame_sent(const TileDefinition &tile,
                                    const std::string &payload,
                                    const MetricsSnapshot &,
                                    const SchedulerState &)
{
    redis_.hset("atomman:tiles", tile.name, payload);
}

void StatusPublisher::on_cycle_complete(const SchedulerState &state)
{
    redis_.hset("atomman:state", "mode", handshake_state_name(state.mode));
    redis_.hset("atomman:state", "cycles", std::to_string(state.cycles));
    if (state.seq_observed)
    {
        redis_.hset("atomman:state", "last_seq", std::to_string(int(state.last_seq)));
    }

    auto blob = build_metrics_blob(metrics_);
    redis_.hset_binary("atomman:metrics", agent_field_, blob);
    redis_.xadd_binary("atomman:metrics_stream", "m", blob);
}
