#pragma once

#include <array>
#include <string>

#include "core/Config.hpp"
#include "sim/Terrain.hpp"

enum class AgentStat : int {
  Speed = 0,
  Strength = 1,
  Stamina = 2,
  Swim = 3,
  Climb = 4
};
constexpr int kAgentStatCount = 5;

struct AgentStats {
  float speed = 0.5f;
  float strength = 0.5f;
  float stamina = 0.5f;
  float swim = 0.5f;
  float climb = 0.5f;
};

// Caller-owned snapshot of the competing agent. The engine only reads it;
// progression changes come back as recommendations in RunResult.
struct AgentModel {
  std::string id;
  AgentStats stats{};
  float energyCapacity = cfg::kDefaultEnergyCapacity;
  int level = 1;
  int experience = 0;
};

const char *AgentStatName(AgentStat stat);

float GetStat(const AgentStats &stats, AgentStat stat);
void SetStat(AgentStats &stats, AgentStat stat, float value);

// Stat that governs traversal of a terrain kind.
AgentStat StatForTerrain(TerrainKind kind);
float SkillForTerrain(const AgentStats &stats, TerrainKind kind);

// Throws InvalidAgentModel when the id is empty, any stat is outside [0, 1]
// or not finite, the energy capacity is negative or not finite, the level is
// below 1 or the experience is outside [0, cfg::kMaxExperience].
void ValidateAgent(const AgentModel &agent);

// Agent with every stat set to `value`.
AgentModel MakeUniformAgent(const std::string &id, float value,
                            float energyCapacity = cfg::kDefaultEnergyCapacity);

// Loads an agent snapshot from JSON. Missing keys keep the values already in
// `agent`. Returns false and logs on failure; does not validate ranges.
bool LoadAgentFromFile(AgentModel &agent, const char *path);
bool LoadAgentFromString(AgentModel &agent, const std::string &text);
