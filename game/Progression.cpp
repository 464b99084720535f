#include "game/Progression.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "core/Config.hpp"

int ExperienceAward(const float score, const int agentLevel,
                    const DifficultyTier tier, const ScoringConfig &config) {
  const float levelScale =
      1.0f / (1.0f + config.levelDecay *
                         static_cast<float>(std::max(agentLevel, 1) - 1));
  const float xp = std::max(score, 0.0f) *
                   config.tierXpMultiplier[TierIndex(tier)] * levelScale;
  return static_cast<int>(std::lround(
      std::min(xp, static_cast<float>(cfg::kMaxExperience))));
}

int AddExperience(const int current, const int award) {
  const int64_t total = static_cast<int64_t>(std::max(current, 0)) +
                        static_cast<int64_t>(std::max(award, 0));
  return static_cast<int>(
      std::min<int64_t>(total, static_cast<int64_t>(cfg::kMaxExperience)));
}

int ExperienceForLevel(const int level, const ScoringConfig &config) {
  if (level <= 1) {
    return 0;
  }
  const double steps = static_cast<double>(level - 1);
  const double need = static_cast<double>(config.experiencePerLevelBase) *
                      std::pow(steps, static_cast<double>(config.experienceLevelExponent));
  if (!(need < static_cast<double>(cfg::kMaxExperience))) {
    return cfg::kMaxExperience;
  }
  return static_cast<int>(std::lround(need));
}

int LevelForExperience(const int experience, const ScoringConfig &config) {
  int level = 1;
  while (level < config.maxLevel &&
         ExperienceForLevel(level + 1, config) <= experience) {
    ++level;
  }
  return level;
}

float PlateauDelta(const float current, const int cells, const float perCell) {
  const float headroom = std::max(0.0f, 1.0f - current);
  return perCell * static_cast<float>(std::max(cells, 0)) * headroom;
}

std::map<std::string, float> StatDeltas(const RunResult &result,
                                        const AgentModel &agent,
                                        const ScoringConfig &config) {
  std::map<std::string, float> deltas;
  for (int k = 0; k < kTerrainKindCount; ++k) {
    const int cells = result.mastery[k].cellsTraversed;
    if (cells == 0) {
      continue;
    }
    const AgentStat stat = StatForTerrain(static_cast<TerrainKind>(k));
    deltas[AgentStatName(stat)] +=
        PlateauDelta(GetStat(agent.stats, stat), cells, config.statDeltaPerCell);
  }

  if (result.cellsCompleted > 0) {
    deltas[AgentStatName(AgentStat::Stamina)] +=
        PlateauDelta(agent.stats.stamina, result.cellsCompleted,
                     config.staminaDeltaPerCell);
  }
  return deltas;
}

AgentModel ApplyProgression(const AgentModel &agent, const RunResult &result,
                            const ScoringConfig &config) {
  AgentModel next = agent;
  for (int i = 0; i < kAgentStatCount; ++i) {
    const auto stat = static_cast<AgentStat>(i);
    const auto it = result.statDeltas.find(AgentStatName(stat));
    if (it == result.statDeltas.end()) {
      continue;
    }
    const float value = GetStat(next.stats, stat) + it->second;
    SetStat(next.stats, stat, std::min(1.0f, std::max(0.0f, value)));
  }
  next.experience = AddExperience(agent.experience, result.experience);
  next.level = std::min(config.maxLevel,
                        std::max(agent.level,
                                 LevelForExperience(next.experience, config)));
  return next;
}
