#pragma once
#include <cstdint>
#include <vector>

// Protocol identifier byte of each panel tile.
enum class TileId : uint8_t {
    Cpu     = 0x53,
    Gpu     = 0x36,
    Memory  = 0x49,
    Disk    = 0x4F,
    Date    = 0x6B,
    Network = 0x27,
    Volume  = 0x10,
    Battery = 0x1A
};

struct TileDefinition {
    TileId      id;
    char        seq;    // default sequence character, sent verbatim
    const char *name;   // used only for logs / status mirror
    std::vector<const char *> fields; // payload keys in wire order
};

class TileRegistry {
public:
    // All eight tiles in cycling order (CPU first).
    static const std::vector<TileDefinition> &all();

    // nullptr for an unknown id.
    static const TileDefinition *find(TileId id);

    // Tile answered first when the panel unlocks.
    static const TileDefinition &kick_tile();

    // Tiles rotated through while the panel is still unlocking.
    static const std::vector<TileId> &unlock_rotation();
};

inline uint8_t tile_byte(TileId id) { return static_cast<uint8_t>(id); }
