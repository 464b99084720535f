#pragma once

// Compile-time defaults for the course engine. Runtime tuning lives in
// sim/Tuning.hpp and starts from these values.

namespace cfg {

// --- Course lengths (cells, inclusive) ---
constexpr int kShortCourseMin = 10;
constexpr int kShortCourseMax = 16;
constexpr int kMediumCourseMin = 24;
constexpr int kMediumCourseMax = 40;
constexpr int kLongCourseMin = 48;
constexpr int kLongCourseMax = 80;

// --- Generation ---
constexpr int kMaxGenerationAttempts = 32;
constexpr float kCostJitter = 0.10f;      // +/- fraction applied per cell
constexpr float kHazardCostMultiplier = 1.25f;
constexpr float kOverrideTolerance = 0.35f; // band half-width for caller weights

constexpr float kGrassBaseCost = 1.0f;
constexpr float kWaterBaseCost = 1.3f;
constexpr float kRockBaseCost = 1.5f;
constexpr float kObstacleBaseCost = 1.8f;

// --- Recovery cells (off unless enabled in GenerationConfig) ---
constexpr float kRecoveryCellChance = 0.0f;
constexpr float kRecoveryAmount = 4.0f;

// --- Agent ---
constexpr float kDefaultEnergyCapacity = 100.0f;
constexpr float kStaminaDrainBase = 1.5f; // staminaFactor = base - stamina

// --- Planner ---
constexpr float kMinPace = 0.3f;
constexpr float kMaxPace = 1.0f;
constexpr float kPaceStep = 0.05f;
constexpr float kMinEffectiveSkill = 0.1f;
constexpr float kEnergyPerCost = 6.0f;
constexpr float kHazardDrainMultiplier = 1.2f;

constexpr float kReserveConservative = 0.20f;
constexpr float kReserveBalanced = 0.08f;
constexpr float kReserveAggressive = 0.055f;

// --- Simulator ---
// Reserve fractions above must stay >= amplitude / (1 + amplitude).
constexpr float kGrassVariance = 0.02f;
constexpr float kWaterVariance = 0.04f;
constexpr float kRockVariance = 0.04f;
constexpr float kObstacleVariance = 0.05f;

// --- Scoring ---
constexpr float kParStat = 0.5f;
constexpr float kParEnergyCapacity = 100.0f;
constexpr float kBaseScoreScale = 45.0f;
constexpr float kMaxBaseScore = 75.0f;
constexpr float kEfficiencyWeight = 10.0f;
constexpr float kMasteryBonusPerKind = 4.0f;
constexpr float kScoreFloor = 1.0f;
constexpr float kPartialCreditWeight = 20.0f;
constexpr float kMaxScore = 100.0f;
constexpr float kEnergyEfficientFraction = 0.25f;

// --- Progression ---
constexpr float kLevelDecay = 0.15f;
constexpr float kStatDeltaPerCell = 0.004f;
constexpr float kStaminaDeltaPerCell = 0.001f;
constexpr float kExperiencePerLevelBase = 100.0f;
constexpr float kExperienceLevelExponent = 1.5f;
constexpr int kMaxLevel = 99;
constexpr int kLevelCap = 1000; // upper bound for a tuned maxLevel
constexpr int kMaxExperience = 1000000000; // experience saturates here
constexpr float kMaxTierXpMultiplier = 100.0f;

} // namespace cfg
