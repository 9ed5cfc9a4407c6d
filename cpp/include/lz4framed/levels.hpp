#pragma once

#include <lz4hc.h>

namespace lz4framed {

constexpr int kCompressionMinAccelerated = -65536;
constexpr int kCompressionMin = 0;
constexpr int kCompressionMinHC = LZ4HC_CLEVEL_MIN;
constexpr int kCompressionMax = LZ4HC_CLEVEL_MAX;

enum class CompressionMode {
    Fast,
    HighCompression
};

struct LevelConfig {
    CompressionMode mode;
    int acceleration; // fast mode only
    int hc_level;     // high-compression mode only
};

inline bool is_valid_level(int level) {
    return level >= kCompressionMinAccelerated && level <= kCompressionMax;
}

// Caller validates the level first (see FrameOptions::validate).
inline LevelConfig config_from_level(int level) {
    if (level < 0) {
        // Accelerated: every step below zero trades ratio for speed.
        return LevelConfig{CompressionMode::Fast, 1 - level, 0};
    }
    if (level < kCompressionMinHC) {
        return LevelConfig{CompressionMode::Fast, 1, 0};
    }
    return LevelConfig{CompressionMode::HighCompression, 1, level};
}

} // namespace lz4framed
