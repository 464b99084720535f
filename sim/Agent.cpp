#include "sim/Agent.hpp"

#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"
#include "sim/Errors.hpp"

using json = nlohmann::json;

namespace {

bool StatInRange(const float v) {
  return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

void ReadAgentJson(AgentModel &agent, const json &data) {
  agent.id = data.value("id", agent.id);
  agent.energyCapacity = data.value("energyCapacity", agent.energyCapacity);
  agent.level = data.value("level", agent.level);
  agent.experience = data.value("experience", agent.experience);

  const json &stats = data.contains("stats") ? data["stats"] : data;
  for (int i = 0; i < kAgentStatCount; ++i) {
    const auto stat = static_cast<AgentStat>(i);
    const char *key = AgentStatName(stat);
    if (stats.contains(key)) {
      SetStat(agent.stats, stat, stats[key].get<float>());
    }
  }
}

} // namespace

const char *AgentStatName(const AgentStat stat) {
  switch (stat) {
  case AgentStat::Speed:
    return "speed";
  case AgentStat::Strength:
    return "strength";
  case AgentStat::Stamina:
    return "stamina";
  case AgentStat::Swim:
    return "swim";
  case AgentStat::Climb:
    return "climb";
  }
  return "unknown";
}

float GetStat(const AgentStats &stats, const AgentStat stat) {
  switch (stat) {
  case AgentStat::Speed:
    return stats.speed;
  case AgentStat::Strength:
    return stats.strength;
  case AgentStat::Stamina:
    return stats.stamina;
  case AgentStat::Swim:
    return stats.swim;
  case AgentStat::Climb:
    return stats.climb;
  }
  return 0.0f;
}

void SetStat(AgentStats &stats, const AgentStat stat, const float value) {
  switch (stat) {
  case AgentStat::Speed:
    stats.speed = value;
    break;
  case AgentStat::Strength:
    stats.strength = value;
    break;
  case AgentStat::Stamina:
    stats.stamina = value;
    break;
  case AgentStat::Swim:
    stats.swim = value;
    break;
  case AgentStat::Climb:
    stats.climb = value;
    break;
  }
}

AgentStat StatForTerrain(const TerrainKind kind) {
  switch (kind) {
  case TerrainKind::Grass:
    return AgentStat::Speed;
  case TerrainKind::Water:
    return AgentStat::Swim;
  case TerrainKind::Rock:
    return AgentStat::Climb;
  case TerrainKind::Obstacle:
    return AgentStat::Strength;
  }
  return AgentStat::Speed;
}

float SkillForTerrain(const AgentStats &stats, const TerrainKind kind) {
  return GetStat(stats, StatForTerrain(kind));
}

void ValidateAgent(const AgentModel &agent) {
  if (agent.id.empty()) {
    throw InvalidAgentModel("agent id is empty");
  }
  for (int i = 0; i < kAgentStatCount; ++i) {
    const auto stat = static_cast<AgentStat>(i);
    const float v = GetStat(agent.stats, stat);
    if (!StatInRange(v)) {
      throw InvalidAgentModel("agent '" + agent.id + "' stat " +
                              AgentStatName(stat) + " out of range [0, 1]: " +
                              std::to_string(v));
    }
  }
  if (!std::isfinite(agent.energyCapacity) || agent.energyCapacity < 0.0f) {
    throw InvalidAgentModel("agent '" + agent.id +
                            "' has invalid energy capacity: " +
                            std::to_string(agent.energyCapacity));
  }
  if (agent.level < 1) {
    throw InvalidAgentModel("agent '" + agent.id + "' level must be >= 1");
  }
  if (agent.experience < 0 || agent.experience > cfg::kMaxExperience) {
    throw InvalidAgentModel("agent '" + agent.id + "' experience must be in [0, " +
                            std::to_string(cfg::kMaxExperience) + "]: " +
                            std::to_string(agent.experience));
  }
}

AgentModel MakeUniformAgent(const std::string &id, const float value,
                            const float energyCapacity) {
  AgentModel agent{};
  agent.id = id;
  for (int i = 0; i < kAgentStatCount; ++i) {
    SetStat(agent.stats, static_cast<AgentStat>(i), value);
  }
  agent.energyCapacity = energyCapacity;
  return agent;
}

bool LoadAgentFromFile(AgentModel &agent, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open agent file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    AgentModel loaded = agent;
    ReadAgentJson(loaded, data);
    agent = loaded;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse agent file {}: {}", path, e.what());
    return false;
  }
  return true;
}

bool LoadAgentFromString(AgentModel &agent, const std::string &text) {
  try {
    const json data = json::parse(text);
    AgentModel loaded = agent;
    ReadAgentJson(loaded, data);
    agent = loaded;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse agent JSON: {}", e.what());
    return false;
  }
  return true;
}
