#pragma once

#include <array>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "sim/Terrain.hpp"

// Explicit, immutable-by-convention tuning passed into every pipeline stage.
// Defaults come from core/Config.hpp; LoadTuningFromFile overrides them.

struct DistributionBand {
  float floor = 0.0f;   // minimum fraction of cells
  float ceiling = 1.0f; // maximum fraction of cells
};

struct TierProfile {
  TerrainWeights weights{};
  std::array<DistributionBand, kTerrainKindCount> bands{};
  float costScale = 1.0f;
  float hazardDensity = 0.0f; // chance per non-grass interior cell
  int maxObstacleRun = 2;
};

struct GenerationConfig {
  std::array<TierProfile, kDifficultyTierCount> tiers{};
  std::array<float, kTerrainKindCount> baseCost{
      cfg::kGrassBaseCost, cfg::kWaterBaseCost, cfg::kRockBaseCost,
      cfg::kObstacleBaseCost};
  int shortMin = cfg::kShortCourseMin;
  int shortMax = cfg::kShortCourseMax;
  int mediumMin = cfg::kMediumCourseMin;
  int mediumMax = cfg::kMediumCourseMax;
  int longMin = cfg::kLongCourseMin;
  int longMax = cfg::kLongCourseMax;
  int maxAttempts = cfg::kMaxGenerationAttempts;
  float costJitter = cfg::kCostJitter;
  float hazardCostMultiplier = cfg::kHazardCostMultiplier;
  float overrideTolerance = cfg::kOverrideTolerance;
  bool enforceDistribution = true;
  float recoveryCellChance = cfg::kRecoveryCellChance; // grass cells only

  GenerationConfig();
};

enum class PacingStyle {
  Conservative, // keeps a large energy reserve
  Balanced,
  Aggressive, // spends down to the variance margin
};

struct PlannerConfig {
  PacingStyle style = PacingStyle::Balanced;
  float minPace = cfg::kMinPace;
  float maxPace = cfg::kMaxPace;
  float paceStep = cfg::kPaceStep;
  float minEffectiveSkill = cfg::kMinEffectiveSkill;
  float energyPerCost = cfg::kEnergyPerCost;
  float hazardDrainMultiplier = cfg::kHazardDrainMultiplier;
  float staminaDrainBase = cfg::kStaminaDrainBase;
  std::array<float, 3> reserveFraction{cfg::kReserveConservative,
                                       cfg::kReserveBalanced,
                                       cfg::kReserveAggressive};
  float recoveryAmount = cfg::kRecoveryAmount;

  float ReserveFor(PacingStyle s) const {
    return reserveFraction[static_cast<int>(s)];
  }
};

struct SimConfig {
  std::array<float, kTerrainKindCount> varianceAmplitude{
      cfg::kGrassVariance, cfg::kWaterVariance, cfg::kRockVariance,
      cfg::kObstacleVariance};
  bool applyVariance = true;
};

struct ScoringConfig {
  float parStat = cfg::kParStat;
  float parEnergyCapacity = cfg::kParEnergyCapacity;
  float baseScoreScale = cfg::kBaseScoreScale;
  float maxBaseScore = cfg::kMaxBaseScore;
  float efficiencyWeight = cfg::kEfficiencyWeight;
  float masteryBonusPerKind = cfg::kMasteryBonusPerKind;
  float scoreFloor = cfg::kScoreFloor;
  float partialCreditWeight = cfg::kPartialCreditWeight;
  float maxScore = cfg::kMaxScore;
  float energyEfficientFraction = cfg::kEnergyEfficientFraction;
  std::array<float, kDifficultyTierCount> masteryThreshold{0.60f, 0.65f, 0.70f,
                                                           0.75f};
  std::array<float, kDifficultyTierCount> tierXpMultiplier{1.0f, 1.25f, 1.5f,
                                                           2.0f};
  float levelDecay = cfg::kLevelDecay;
  float statDeltaPerCell = cfg::kStatDeltaPerCell;
  float staminaDeltaPerCell = cfg::kStaminaDeltaPerCell;
  float experiencePerLevelBase = cfg::kExperiencePerLevelBase;
  float experienceLevelExponent = cfg::kExperienceLevelExponent;
  int maxLevel = cfg::kMaxLevel;

  float CompletionFloor() const { return scoreFloor + partialCreditWeight; }
};

struct CourseTuning {
  GenerationConfig generation{};
  PlannerConfig planner{};
  SimConfig sim{};
  ScoringConfig scoring{};
};

const char *PacingStyleName(PacingStyle style);
std::optional<PacingStyle> ParsePacingStyle(const std::string &name);

// Range check over every tuning value the pipeline stages rely on (positive
// paces and costs, reserves in [0, 1), ordered bands, ...). On failure the
// first offending field is written to `outReason` when provided.
bool ValidateTuning(const CourseTuning &tuning, std::string *outReason = nullptr);

// Loads a tuning JSON file on top of the values already in `tuning`. Missing
// keys keep their current value. Returns false and logs on parse failure or
// when the merged tuning fails ValidateTuning; `tuning` is then unchanged.
bool LoadTuningFromFile(CourseTuning &tuning, const char *path);
bool LoadTuningFromString(CourseTuning &tuning, const std::string &text);
