#include "tile_registry.h"

// CPU and BAT share '2'; the panel firmware expects exactly these values.
const std::vector<TileDefinition> &TileRegistry::all()
{
    static const std::vector<TileDefinition> table = {
        {TileId::Cpu,     '2', "cpu",     {"CPU", "Tempr", "Useage", "Freq", "Tempr1"}},
        {TileId::Gpu,     '3', "gpu",     {"GPU", "Tempr", "Useage"}},
        {TileId::Memory,  '4', "memory",  {"Memory", "Used", "Available", "Total", "Useage"}},
        {TileId::Disk,    '5', "disk",    {"DiskName", "Tempr", "UsageSpace", "AllSpace", "Usage"}},
        {TileId::Date,    '6', "date",    {"Date", "Time", "Week", "Weather", "TemprLo",
                                           "TemprHi", "Zone", "Desc"}},
        {TileId::Network, '7', "network", {"SPEED", "NETWORK"}},
        {TileId::Volume,  '9', "volume",  {"VOLUME"}},
        {TileId::Battery, '2', "battery", {"Battery"}},
    };
    return table;
}

const TileDefinition *TileRegistry::find(TileId id)
{
    for (const auto &t : all())
    {
        if (t.id == id)
            return &t;
    }
    return nullptr;
}

const TileDefinition &TileRegistry::kick_tile()
{
    return all().front();
}

const std::vector<TileId> &TileRegistry::unlock_rotation()
{
    static const std::vector<TileId> rot = {TileId::Cpu, TileId::Gpu, TileId::Memory};
    return rot;
}
