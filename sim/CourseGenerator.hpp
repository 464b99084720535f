#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

// Seeded course generator. Same seed, length category, tier, weights and
// config always produce a bit-identical TerrainGrid.

// Named weight presets for themed courses.
enum class CourseTheme {
  Balanced,  // tier weights unchanged
  Wetlands,  // water heavy
  Highlands, // rock heavy
  Gauntlet,  // obstacle and rock heavy
};

struct CourseConstraints {
  std::array<DistributionBand, kTerrainKindCount> bands{};
  int maxObstacleRun = 2;
};

const char *CourseThemeName(CourseTheme theme);
std::optional<CourseTheme> ParseCourseTheme(const std::string &name);

// Weight override for a theme; nullopt for Balanced.
std::optional<TerrainWeights> ThemeWeights(CourseTheme theme);

// Inclusive cell-count range for a length category.
void LengthRange(const GenerationConfig &config, LengthCategory category,
                 int &outMin, int &outMax);

// Constraints the validation pass applies. Caller weights replace the tier
// bands with weight +/- overrideTolerance.
CourseConstraints ConstraintsFor(DifficultyTier tier,
                                 const TerrainWeights *weights,
                                 const GenerationConfig &config);

// Returns true when the grid satisfies every constraint. On failure the
// reason is written to `outReason` when provided.
bool ValidateCourse(const TerrainGrid &grid,
                    const CourseConstraints &constraints,
                    std::string *outReason = nullptr);

// Throws GenerationError when no valid course is found within
// config.maxAttempts sub-seeds (seed, seed + 1, ...).
TerrainGrid GenerateCourse(uint32_t seed, LengthCategory lengthCategory,
                           DifficultyTier tier,
                           const TerrainWeights *weights = nullptr,
                           const GenerationConfig &config = GenerationConfig{});
