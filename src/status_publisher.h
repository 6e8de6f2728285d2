#pragma once
#include "metrics.h"
#include "redis_connector.h"
#include "tile_scheduler.h"

#include <string>

// Mirrors what the panel is showing into Redis:
//   atomman:tiles            HASH  tile name -> last payload sent
//   atomman:state            HASH  mode, last_seq, cycles
//   atomman:metrics          HASH  agent hash -> metrics blob
//   atomman:metrics_stream   STREAM "m" -> metrics blob, once per cycle
class StatusPublisher : public FrameObserver {
public:
    StatusPublisher(RedisConnector &redis,
                    const AgentMetrics &metrics,
                    const std::string &agent_id);

    void on_frame_sent(const TileDefinition &tile,
                       const std::string &payload,
                       const MetricsSnapshot &snap,
                       const SchedulerState &state) override;
    void on_cycle_complete(const SchedulerState &state) override;

private:
    RedisConnector     &redis_;
    const AgentMetrics &metrics_;
    std::vector<uint8_t> agent_field_;
};
