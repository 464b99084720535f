#pragma once

#include <cstdint>

namespace core {

// Xorshift32 stream. The caller owns the state; zero is remapped to a
// fixed non-zero value.
uint32_t NextU32(uint32_t& state);
float NextFloat01(uint32_t& state);
float NextFloat(uint32_t& state, float min, float max);
int NextInt(uint32_t& state, int min, int max);

// Stateless 32-bit mixer (murmur3 finalizer).
uint32_t HashU32(uint32_t value);

// Combines a course seed with a cell index into a value in [0, 1).
float HashFloat01(uint32_t seed, uint32_t index);

}  // namespace core
