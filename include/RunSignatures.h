#pragma once

#include <cstddef>
#include <cstdint>

#include "CoreConfig.h"
#include "CoreState.h"

namespace ssd {

// Repeatability signatures for a run. Two runs with the same params, seed and
// pressure schedule produce identical signatures.
struct RunSignatures {
    std::uint32_t config_hash_u32 = 0;   // FNV-1a32 over effective parameters
    std::uint32_t telemetry_crc_u32 = 0; // CRC32 over the telemetry stream
    std::uint32_t state_digest_u32 = 0;  // FNV-1a32 over the final state
};

std::uint32_t fnv1a32Begin();
std::uint32_t fnv1a32Update(std::uint32_t h, const void* data, std::size_t len);
std::uint32_t crc32Update(std::uint32_t crc, const void* data, std::size_t len);

// Hash over every field of the params record (per-layer arrays included).
std::uint32_t paramsHash(const CoreParams& params);

// Hash over E, kappa, time, step count, gain state and leap history.
std::uint32_t stateDigest(const CoreState& state);

// Stable key=value dump of the effective parameters (deterministic order),
// followed by the FNV-1a32 hash of the text itself. Output is truncated at
// cap; returns the number of characters written.
int exportConfigText(const CoreParams& params, char* buf, int cap);

} // namespace ssd
