#include "sim/CourseGenerator.hpp"

#include <algorithm>
#include <cmath>

#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/Errors.hpp"

namespace {
constexpr float kBandEpsilon = 1e-5f;
constexpr uint32_t kLengthSalt = 0x1E4C7A5Bu;

// Builds one candidate course from a sub-seed. Mirrors the chunk builder of
// the endless generator: one private RNG stream, no global state.
struct CourseBuilder {
  uint32_t rngState = 1u;
  const GenerationConfig *config = nullptr;
  const TierProfile *tier = nullptr;
  TerrainWeights weights{};

  TerrainGrid Build(int length);

private:
  TerrainKind DrawKind(bool allowObstacle);
  float NextFloat01() { return core::NextFloat01(rngState); }
};

TerrainGrid CourseBuilder::Build(const int length) {
  TerrainGrid grid{};
  grid.cells.reserve(static_cast<size_t>(length));

  for (int i = 0; i < length; ++i) {
    const bool endpoint = (i == 0) || (i == length - 1);

    TerrainCell cell{};
    cell.index = i;
    cell.kind = DrawKind(!endpoint);

    const float jitter = 1.0f + config->costJitter * (2.0f * NextFloat01() - 1.0f);
    cell.costMultiplier =
        config->baseCost[KindIndex(cell.kind)] * tier->costScale * jitter;

    // Hazards never sit on grass or on the start/finish cells.
    const float hazardRoll = NextFloat01();
    if (!endpoint && cell.kind != TerrainKind::Grass &&
        hazardRoll < tier->hazardDensity) {
      cell.hazard = true;
      cell.costMultiplier *= config->hazardCostMultiplier;
    }

    const float recoveryRoll = NextFloat01();
    if (!endpoint && cell.kind == TerrainKind::Grass &&
        recoveryRoll < config->recoveryCellChance) {
      cell.recovery = true;
    }

    grid.cells.push_back(cell);
  }
  return grid;
}

TerrainKind CourseBuilder::DrawKind(const bool allowObstacle) {
  float total = 0.0f;
  for (int k = 0; k < kTerrainKindCount; ++k) {
    if (!allowObstacle && k == KindIndex(TerrainKind::Obstacle)) {
      continue;
    }
    total += weights[k];
  }

  const float roll = NextFloat01() * total;
  float acc = 0.0f;
  int last = 0;
  for (int k = 0; k < kTerrainKindCount; ++k) {
    if (!allowObstacle && k == KindIndex(TerrainKind::Obstacle)) {
      continue;
    }
    if (weights[k] <= 0.0f) {
      continue;
    }
    last = k;
    acc += weights[k];
    if (roll < acc) {
      return static_cast<TerrainKind>(k);
    }
  }
  return static_cast<TerrainKind>(last);
}

void CheckWeights(const TerrainWeights &weights, const uint32_t seed) {
  float total = 0.0f;
  for (const float w : weights) {
    if (!std::isfinite(w) || w < 0.0f) {
      throw GenerationError("terrain weights must be finite and non-negative",
                            seed, 0);
    }
    total += w;
  }
  if (total <= 0.0f) {
    throw GenerationError("terrain weights sum to zero", seed, 0);
  }
  if (total - weights[KindIndex(TerrainKind::Obstacle)] <= 0.0f) {
    throw GenerationError(
        "terrain weights leave no walkable kind for the start and finish cells",
        seed, 0);
  }
}

} // namespace

const char *CourseThemeName(const CourseTheme theme) {
  switch (theme) {
  case CourseTheme::Balanced:
    return "balanced";
  case CourseTheme::Wetlands:
    return "wetlands";
  case CourseTheme::Highlands:
    return "highlands";
  case CourseTheme::Gauntlet:
    return "gauntlet";
  }
  return "unknown";
}

std::optional<CourseTheme> ParseCourseTheme(const std::string &name) {
  if (name == "balanced")
    return CourseTheme::Balanced;
  if (name == "wetlands")
    return CourseTheme::Wetlands;
  if (name == "highlands")
    return CourseTheme::Highlands;
  if (name == "gauntlet")
    return CourseTheme::Gauntlet;
  return std::nullopt;
}

std::optional<TerrainWeights> ThemeWeights(const CourseTheme theme) {
  switch (theme) {
  case CourseTheme::Balanced:
    return std::nullopt;
  case CourseTheme::Wetlands:
    return TerrainWeights{0.30f, 0.50f, 0.12f, 0.08f};
  case CourseTheme::Highlands:
    return TerrainWeights{0.30f, 0.10f, 0.50f, 0.10f};
  case CourseTheme::Gauntlet:
    return TerrainWeights{0.25f, 0.10f, 0.35f, 0.30f};
  }
  return std::nullopt;
}

void LengthRange(const GenerationConfig &config, const LengthCategory category,
                 int &outMin, int &outMax) {
  switch (category) {
  case LengthCategory::Short:
    outMin = config.shortMin;
    outMax = config.shortMax;
    return;
  case LengthCategory::Medium:
    outMin = config.mediumMin;
    outMax = config.mediumMax;
    return;
  case LengthCategory::Long:
    outMin = config.longMin;
    outMax = config.longMax;
    return;
  }
  outMin = config.shortMin;
  outMax = config.shortMax;
}

CourseConstraints ConstraintsFor(const DifficultyTier tier,
                                 const TerrainWeights *weights,
                                 const GenerationConfig &config) {
  const TierProfile &profile = config.tiers[TierIndex(tier)];
  CourseConstraints c{};
  c.maxObstacleRun = profile.maxObstacleRun;

  if (!config.enforceDistribution) {
    for (auto &band : c.bands) {
      band = DistributionBand{0.0f, 1.0f};
    }
    return c;
  }

  if (weights == nullptr) {
    c.bands = profile.bands;
    return c;
  }

  float total = 0.0f;
  for (const float w : *weights) {
    total += w;
  }
  for (int k = 0; k < kTerrainKindCount; ++k) {
    const float share = (total > 0.0f) ? (*weights)[k] / total : 0.0f;
    c.bands[k].floor = std::max(0.0f, share - config.overrideTolerance);
    c.bands[k].ceiling = std::min(1.0f, share + config.overrideTolerance);
  }
  return c;
}

bool ValidateCourse(const TerrainGrid &grid,
                    const CourseConstraints &constraints,
                    std::string *outReason) {
  auto fail = [&](const std::string &reason) {
    if (outReason) {
      *outReason = reason;
    }
    return false;
  };

  if (grid.Empty()) {
    return fail("course is empty");
  }

  const TerrainCounts counts = CountTerrain(grid);
  const float n = static_cast<float>(grid.Length());
  for (int k = 0; k < kTerrainKindCount; ++k) {
    const float share = static_cast<float>(counts[k]) / n;
    const auto &band = constraints.bands[k];
    if (share + kBandEpsilon < band.floor || share - kBandEpsilon > band.ceiling) {
      return fail(std::string(TerrainKindName(static_cast<TerrainKind>(k))) +
                  " share " + std::to_string(share) + " outside [" +
                  std::to_string(band.floor) + ", " +
                  std::to_string(band.ceiling) + "]");
    }
  }

  const int run = LongestObstacleRun(grid);
  if (run > constraints.maxObstacleRun) {
    return fail("obstacle run of " + std::to_string(run) + " exceeds " +
                std::to_string(constraints.maxObstacleRun));
  }

  if (!IsCompletable(grid, constraints.maxObstacleRun)) {
    return fail("finish cell not reachable from start");
  }

  for (const auto &cell : grid.cells) {
    if (!(cell.costMultiplier > 0.0f) || !std::isfinite(cell.costMultiplier)) {
      return fail("cell " + std::to_string(cell.index) +
                  " has non-positive cost");
    }
  }
  return true;
}

TerrainGrid GenerateCourse(const uint32_t seed,
                           const LengthCategory lengthCategory,
                           const DifficultyTier tier,
                           const TerrainWeights *weights,
                           const GenerationConfig &config) {
  const TierProfile &profile = config.tiers[TierIndex(tier)];
  const TerrainWeights activeWeights = weights ? *weights : profile.weights;
  CheckWeights(activeWeights, seed);

  // Length comes from the requested seed so retries keep the same length.
  int minLen = 0;
  int maxLen = 0;
  LengthRange(config, lengthCategory, minLen, maxLen);
  if (minLen < 1 || maxLen < minLen) {
    throw GenerationError("invalid length range for " +
                              std::string(LengthCategoryName(lengthCategory)),
                          seed, 0);
  }
  uint32_t lengthState = core::HashU32(seed ^ kLengthSalt);
  const int length = core::NextInt(lengthState, minLen, maxLen);

  const CourseConstraints constraints = ConstraintsFor(tier, weights, config);

  CourseBuilder builder{};
  builder.config = &config;
  builder.tier = &profile;
  builder.weights = activeWeights;

  std::string reason;
  for (int attempt = 0; attempt < config.maxAttempts; ++attempt) {
    const uint32_t subSeed = seed + static_cast<uint32_t>(attempt);
    builder.rngState = core::HashU32(subSeed) | 1u;

    TerrainGrid grid = builder.Build(length);
    grid.seed = seed;
    grid.generationSeed = subSeed;
    grid.attempt = attempt;
    grid.tier = tier;
    grid.lengthCategory = lengthCategory;

    if (ValidateCourse(grid, constraints, &reason)) {
      LOG_DEBUG("Course seed={} tier={} length={} accepted on attempt {}",
                seed, DifficultyTierName(tier), length, attempt);
      return grid;
    }
    LOG_DEBUG("Course seed={} attempt {} rejected: {}", seed, attempt, reason);
  }

  LOG_WARN("No valid {} {} course for seed {} after {} attempts (last: {})",
           DifficultyTierName(tier), LengthCategoryName(lengthCategory), seed,
           config.maxAttempts, reason);
  throw GenerationError("no valid course for seed " + std::to_string(seed) +
                            " after " + std::to_string(config.maxAttempts) +
                            " attempts: " + reason,
                        seed, config.maxAttempts);
}
