#pragma once

#include <map>
#include <string>

#include "game/Scoring.hpp"
#include "sim/Agent.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

// Experience award for a run score. Shrinks with the agent's level and grows
// with the difficulty tier.
int ExperienceAward(float score, int agentLevel, DifficultyTier tier,
                    const ScoringConfig &config);

// current + award, saturating at cfg::kMaxExperience.
int AddExperience(int current, int award);

// Total experience needed to reach `level` (level 1 needs 0).
int ExperienceForLevel(int level, const ScoringConfig &config);

// Highest level whose threshold is covered by `experience`.
int LevelForExperience(int experience, const ScoringConfig &config);

// Delta for one stat: perCell * cells * (1 - current). Approaches zero as the
// stat approaches 1, without a hard cap.
float PlateauDelta(float current, int cells, float perCell);

// Per-stat training recommendations for a scored run.
std::map<std::string, float> StatDeltas(const RunResult &result,
                                        const AgentModel &agent,
                                        const ScoringConfig &config);

// Returns a new agent snapshot with the result applied: stat deltas
// (clamped to [0, 1]), experience and level. The input is left untouched so
// callers can preview before committing.
AgentModel ApplyProgression(const AgentModel &agent, const RunResult &result,
                            const ScoringConfig &config = ScoringConfig{});
