#include "sim/Tuning.hpp"

#include "core/Log.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T> void Read(const json &j, const char *key, T &out) {
  if (j.contains(key)) {
    out = j[key].get<T>();
  }
}

// Per-kind values may be given as an array in TerrainKind order or as an
// object keyed by kind name.
template <typename T, size_t N>
void ReadPerKind(const json &j, const char *key, std::array<T, N> &out) {
  if (!j.contains(key)) {
    return;
  }
  const auto &val = j[key];
  if (val.is_array()) {
    for (size_t i = 0; i < N && i < val.size(); ++i) {
      out[i] = val[i].get<T>();
    }
  } else if (val.is_object()) {
    for (size_t i = 0; i < N; ++i) {
      const char *name = TerrainKindName(static_cast<TerrainKind>(i));
      if (val.contains(name)) {
        out[i] = val[name].get<T>();
      }
    }
  }
}

void ReadTier(const json &j, TierProfile &tier) {
  ReadPerKind(j, "weights", tier.weights);
  Read(j, "costScale", tier.costScale);
  Read(j, "hazardDensity", tier.hazardDensity);
  Read(j, "maxObstacleRun", tier.maxObstacleRun);
  if (j.contains("bands") && j["bands"].is_object()) {
    const auto &bands = j["bands"];
    for (int i = 0; i < kTerrainKindCount; ++i) {
      const char *name = TerrainKindName(static_cast<TerrainKind>(i));
      if (!bands.contains(name)) {
        continue;
      }
      const auto &b = bands[name];
      tier.bands[i].floor = b.value("floor", tier.bands[i].floor);
      tier.bands[i].ceiling = b.value("ceiling", tier.bands[i].ceiling);
    }
  }
}

void ReadGeneration(const json &j, GenerationConfig &gen) {
  ReadPerKind(j, "baseCost", gen.baseCost);
  Read(j, "shortMin", gen.shortMin);
  Read(j, "shortMax", gen.shortMax);
  Read(j, "mediumMin", gen.mediumMin);
  Read(j, "mediumMax", gen.mediumMax);
  Read(j, "longMin", gen.longMin);
  Read(j, "longMax", gen.longMax);
  Read(j, "maxAttempts", gen.maxAttempts);
  Read(j, "costJitter", gen.costJitter);
  Read(j, "hazardCostMultiplier", gen.hazardCostMultiplier);
  Read(j, "overrideTolerance", gen.overrideTolerance);
  Read(j, "enforceDistribution", gen.enforceDistribution);
  Read(j, "recoveryCellChance", gen.recoveryCellChance);

  if (j.contains("tiers") && j["tiers"].is_object()) {
    const auto &tiers = j["tiers"];
    for (int i = 0; i < kDifficultyTierCount; ++i) {
      const char *name = DifficultyTierName(static_cast<DifficultyTier>(i));
      if (tiers.contains(name)) {
        ReadTier(tiers[name], gen.tiers[i]);
      }
    }
  }
}

void ReadPlanner(const json &j, PlannerConfig &planner) {
  if (j.contains("style") && j["style"].is_string()) {
    const std::string name = j["style"].get<std::string>();
    if (const auto style = ParsePacingStyle(name)) {
      planner.style = *style;
    } else {
      LOG_WARN("Unknown pacing style '{}', keeping {}", name,
               PacingStyleName(planner.style));
    }
  }
  Read(j, "minPace", planner.minPace);
  Read(j, "maxPace", planner.maxPace);
  Read(j, "paceStep", planner.paceStep);
  Read(j, "minEffectiveSkill", planner.minEffectiveSkill);
  Read(j, "energyPerCost", planner.energyPerCost);
  Read(j, "hazardDrainMultiplier", planner.hazardDrainMultiplier);
  Read(j, "staminaDrainBase", planner.staminaDrainBase);
  Read(j, "recoveryAmount", planner.recoveryAmount);
  if (j.contains("reserveFraction") && j["reserveFraction"].is_object()) {
    const auto &r = j["reserveFraction"];
    for (int i = 0; i < 3; ++i) {
      const char *name = PacingStyleName(static_cast<PacingStyle>(i));
      if (r.contains(name)) {
        planner.reserveFraction[i] = r[name].get<float>();
      }
    }
  }
}

void ReadSim(const json &j, SimConfig &sim) {
  ReadPerKind(j, "varianceAmplitude", sim.varianceAmplitude);
  Read(j, "applyVariance", sim.applyVariance);
}

void ReadScoring(const json &j, ScoringConfig &s) {
  Read(j, "parStat", s.parStat);
  Read(j, "parEnergyCapacity", s.parEnergyCapacity);
  Read(j, "baseScoreScale", s.baseScoreScale);
  Read(j, "maxBaseScore", s.maxBaseScore);
  Read(j, "efficiencyWeight", s.efficiencyWeight);
  Read(j, "masteryBonusPerKind", s.masteryBonusPerKind);
  Read(j, "scoreFloor", s.scoreFloor);
  Read(j, "partialCreditWeight", s.partialCreditWeight);
  Read(j, "maxScore", s.maxScore);
  Read(j, "energyEfficientFraction", s.energyEfficientFraction);
  Read(j, "levelDecay", s.levelDecay);
  Read(j, "statDeltaPerCell", s.statDeltaPerCell);
  Read(j, "staminaDeltaPerCell", s.staminaDeltaPerCell);
  Read(j, "experiencePerLevelBase", s.experiencePerLevelBase);
  Read(j, "experienceLevelExponent", s.experienceLevelExponent);
  Read(j, "maxLevel", s.maxLevel);

  for (const char *key : {"masteryThreshold", "tierXpMultiplier"}) {
    if (!j.contains(key) || !j[key].is_object()) {
      continue;
    }
    auto &target = (std::string(key) == "masteryThreshold")
                       ? s.masteryThreshold
                       : s.tierXpMultiplier;
    const auto &val = j[key];
    for (int i = 0; i < kDifficultyTierCount; ++i) {
      const char *name = DifficultyTierName(static_cast<DifficultyTier>(i));
      if (val.contains(name)) {
        target[i] = val[name].get<float>();
      }
    }
  }
}

void ReadTuning(CourseTuning &tuning, const json &data) {
  if (data.contains("generation"))
    ReadGeneration(data["generation"], tuning.generation);
  if (data.contains("planner"))
    ReadPlanner(data["planner"], tuning.planner);
  if (data.contains("sim"))
    ReadSim(data["sim"], tuning.sim);
  if (data.contains("scoring"))
    ReadScoring(data["scoring"], tuning.scoring);
}

bool CheckLoaded(const CourseTuning &loaded, const char *source) {
  std::string reason;
  if (!ValidateTuning(loaded, &reason)) {
    LOG_ERROR("Rejected tuning from {}: {}", source, reason);
    return false;
  }
  return true;
}

} // namespace

bool LoadTuningFromFile(CourseTuning &tuning, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open tuning file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    CourseTuning loaded = tuning;
    ReadTuning(loaded, data);
    if (!CheckLoaded(loaded, path)) {
      return false;
    }
    tuning = loaded;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse tuning file {}: {}", path, e.what());
    return false;
  }

  LOG_INFO("Loaded tuning from {}", path);
  return true;
}

bool LoadTuningFromString(CourseTuning &tuning, const std::string &text) {
  try {
    const json data = json::parse(text);
    CourseTuning loaded = tuning;
    ReadTuning(loaded, data);
    if (!CheckLoaded(loaded, "string")) {
      return false;
    }
    tuning = loaded;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse tuning JSON: {}", e.what());
    return false;
  }
  return true;
}
