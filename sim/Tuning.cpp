#include "sim/Tuning.hpp"

#include <cmath>

namespace {

// Weight order: grass, water, rock, obstacle.
TierProfile MakeTier(const TerrainWeights &weights,
                     const std::array<DistributionBand, kTerrainKindCount> &bands,
                     const float costScale, const float hazardDensity,
                     const int maxObstacleRun) {
  TierProfile t{};
  t.weights = weights;
  t.bands = bands;
  t.costScale = costScale;
  t.hazardDensity = hazardDensity;
  t.maxObstacleRun = maxObstacleRun;
  return t;
}

bool Positive(const float v) { return std::isfinite(v) && v > 0.0f; }
bool NonNegative(const float v) { return std::isfinite(v) && v >= 0.0f; }
bool Fraction(const float v) { return std::isfinite(v) && v >= 0.0f && v < 1.0f; }
bool UnitInterval(const float v) {
  return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

// Returns an empty string when the section is valid, otherwise the first
// offending field.
std::string CheckGeneration(const GenerationConfig &g) {
  if (g.shortMin < 1 || g.shortMax < g.shortMin)
    return "generation.short length range";
  if (g.mediumMin < 1 || g.mediumMax < g.mediumMin)
    return "generation.medium length range";
  if (g.longMin < 1 || g.longMax < g.longMin)
    return "generation.long length range";
  if (g.maxAttempts < 1)
    return "generation.maxAttempts must be >= 1";
  if (!Fraction(g.costJitter))
    return "generation.costJitter must be in [0, 1)";
  if (!Positive(g.hazardCostMultiplier))
    return "generation.hazardCostMultiplier must be > 0";
  if (!NonNegative(g.overrideTolerance))
    return "generation.overrideTolerance must be >= 0";
  if (!UnitInterval(g.recoveryCellChance))
    return "generation.recoveryCellChance must be in [0, 1]";
  for (int k = 0; k < kTerrainKindCount; ++k) {
    if (!Positive(g.baseCost[k]))
      return std::string("generation.baseCost.") +
             TerrainKindName(static_cast<TerrainKind>(k)) + " must be > 0";
  }

  for (int t = 0; t < kDifficultyTierCount; ++t) {
    const TierProfile &tier = g.tiers[t];
    const std::string prefix = std::string("generation.tiers.") +
                               DifficultyTierName(static_cast<DifficultyTier>(t));
    float walkable = 0.0f;
    for (int k = 0; k < kTerrainKindCount; ++k) {
      const std::string kind = TerrainKindName(static_cast<TerrainKind>(k));
      if (!NonNegative(tier.weights[k]))
        return prefix + ".weights." + kind + " must be >= 0";
      if (k != KindIndex(TerrainKind::Obstacle))
        walkable += tier.weights[k];
      const DistributionBand &band = tier.bands[k];
      if (!UnitInterval(band.floor) || !UnitInterval(band.ceiling) ||
          band.floor > band.ceiling)
        return prefix + ".bands." + kind + " must satisfy 0 <= floor <= ceiling <= 1";
    }
    if (!(walkable > 0.0f))
      return prefix + ".weights need a non-obstacle kind";
    if (!Positive(tier.costScale))
      return prefix + ".costScale must be > 0";
    if (!UnitInterval(tier.hazardDensity))
      return prefix + ".hazardDensity must be in [0, 1]";
    if (tier.maxObstacleRun < 0)
      return prefix + ".maxObstacleRun must be >= 0";
  }
  return {};
}

std::string CheckPlanner(const PlannerConfig &p) {
  if (!Positive(p.minPace) || !Positive(p.maxPace) || p.maxPace < p.minPace)
    return "planner pace range must satisfy 0 < minPace <= maxPace";
  if (!Positive(p.paceStep))
    return "planner.paceStep must be > 0";
  if (!Positive(p.minEffectiveSkill))
    return "planner.minEffectiveSkill must be > 0";
  if (!Positive(p.energyPerCost))
    return "planner.energyPerCost must be > 0";
  if (!Positive(p.hazardDrainMultiplier))
    return "planner.hazardDrainMultiplier must be > 0";
  if (!NonNegative(p.staminaDrainBase))
    return "planner.staminaDrainBase must be >= 0";
  if (!NonNegative(p.recoveryAmount))
    return "planner.recoveryAmount must be >= 0";
  for (int i = 0; i < 3; ++i) {
    if (!Fraction(p.reserveFraction[i]))
      return std::string("planner.reserveFraction.") +
             PacingStyleName(static_cast<PacingStyle>(i)) +
             " must be in [0, 1)";
  }
  return {};
}

std::string CheckSim(const SimConfig &s) {
  for (int k = 0; k < kTerrainKindCount; ++k) {
    if (!Fraction(s.varianceAmplitude[k]))
      return std::string("sim.varianceAmplitude.") +
             TerrainKindName(static_cast<TerrainKind>(k)) + " must be in [0, 1)";
  }
  return {};
}

std::string CheckScoring(const ScoringConfig &s) {
  if (!UnitInterval(s.parStat))
    return "scoring.parStat must be in [0, 1]";
  if (!NonNegative(s.parEnergyCapacity))
    return "scoring.parEnergyCapacity must be >= 0";
  if (!NonNegative(s.baseScoreScale) || !NonNegative(s.maxBaseScore) ||
      !NonNegative(s.efficiencyWeight) || !NonNegative(s.masteryBonusPerKind))
    return "scoring weights must be >= 0";
  if (!NonNegative(s.scoreFloor) || !NonNegative(s.partialCreditWeight))
    return "scoring.scoreFloor and partialCreditWeight must be >= 0";
  if (!std::isfinite(s.maxScore) || s.maxScore < s.CompletionFloor())
    return "scoring.maxScore must be >= scoreFloor + partialCreditWeight";
  if (!UnitInterval(s.energyEfficientFraction))
    return "scoring.energyEfficientFraction must be in [0, 1]";
  for (int t = 0; t < kDifficultyTierCount; ++t) {
    const std::string tier = DifficultyTierName(static_cast<DifficultyTier>(t));
    if (!UnitInterval(s.masteryThreshold[t]))
      return "scoring.masteryThreshold." + tier + " must be in [0, 1]";
    if (!NonNegative(s.tierXpMultiplier[t]) ||
        s.tierXpMultiplier[t] > cfg::kMaxTierXpMultiplier)
      return "scoring.tierXpMultiplier." + tier + " out of range";
  }
  if (!NonNegative(s.levelDecay))
    return "scoring.levelDecay must be >= 0";
  if (!NonNegative(s.statDeltaPerCell) || !NonNegative(s.staminaDeltaPerCell))
    return "scoring stat deltas must be >= 0";
  if (!Positive(s.experiencePerLevelBase) || !Positive(s.experienceLevelExponent))
    return "scoring level curve must be > 0";
  if (s.maxLevel < 1 || s.maxLevel > cfg::kLevelCap)
    return "scoring.maxLevel must be in [1, " + std::to_string(cfg::kLevelCap) +
           "]";
  return {};
}

} // namespace

bool ValidateTuning(const CourseTuning &tuning, std::string *outReason) {
  for (const std::string &reason :
       {CheckGeneration(tuning.generation), CheckPlanner(tuning.planner),
        CheckSim(tuning.sim), CheckScoring(tuning.scoring)}) {
    if (!reason.empty()) {
      if (outReason) {
        *outReason = reason;
      }
      return false;
    }
  }
  return true;
}

GenerationConfig::GenerationConfig() {
  tiers[TierIndex(DifficultyTier::Beginner)] =
      MakeTier({0.55f, 0.20f, 0.17f, 0.08f},
               {{{0.30f, 0.85f}, {0.0f, 0.45f}, {0.0f, 0.40f}, {0.0f, 0.20f}}},
               1.0f, 0.0f, 1);
  tiers[TierIndex(DifficultyTier::Intermediate)] =
      MakeTier({0.45f, 0.22f, 0.21f, 0.12f},
               {{{0.20f, 0.80f}, {0.0f, 0.50f}, {0.0f, 0.45f}, {0.0f, 0.25f}}},
               1.1f, 0.05f, 2);
  tiers[TierIndex(DifficultyTier::Advanced)] =
      MakeTier({0.35f, 0.22f, 0.26f, 0.17f},
               {{{0.10f, 0.75f}, {0.0f, 0.50f}, {0.0f, 0.50f}, {0.0f, 0.33f}}},
               1.2f, 0.10f, 2);
  tiers[TierIndex(DifficultyTier::Expert)] =
      MakeTier({0.28f, 0.22f, 0.28f, 0.22f},
               {{{0.05f, 0.70f}, {0.0f, 0.55f}, {0.0f, 0.55f}, {0.05f, 0.40f}}},
               1.3f, 0.18f, 3);
}

const char *PacingStyleName(const PacingStyle style) {
  switch (style) {
  case PacingStyle::Conservative:
    return "conservative";
  case PacingStyle::Balanced:
    return "balanced";
  case PacingStyle::Aggressive:
    return "aggressive";
  }
  return "unknown";
}

std::optional<PacingStyle> ParsePacingStyle(const std::string &name) {
  if (name == "conservative")
    return PacingStyle::Conservative;
  if (name == "balanced")
    return PacingStyle::Balanced;
  if (name == "aggressive")
    return PacingStyle::Aggressive;
  return std::nullopt;
}
