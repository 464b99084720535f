#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "sim/Agent.hpp"
#include "sim/Sim.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

enum class Milestone {
  CourseCompleted,
  ParBeaten,       // finished faster than the par reference
  EnergyEfficient, // finished with a large share of energy left
  TerrainMaster,   // mastered every terrain kind on the course
  LevelUp,         // the experience award crosses a level threshold
};

struct TerrainMastery {
  int cellsTraversed = 0;
  float averagePace = 0.0f;
  bool mastered = false;
};

struct RunResult {
  float totalTime = 0.0f;
  bool completed = false;
  int cellsCompleted = 0;
  float progress = 0.0f; // fraction of the course completed
  std::array<TerrainMastery, kTerrainKindCount> mastery{};

  float referenceTime = 0.0f;
  float baseScore = 0.0f;
  float efficiencyBonus = 0.0f;
  float masteryBonus = 0.0f;
  float partialCredit = 0.0f;
  float score = 0.0f;

  int experience = 0;
  std::map<std::string, float> statDeltas; // stat name -> non-negative delta
  std::vector<Milestone> milestones;

  uint32_t courseSeed = 0u;
  uint64_t courseFingerprint = 0u;

  bool HasMilestone(Milestone m) const;
};

const char *MilestoneName(Milestone milestone);

// Par time for a course: the planner's predicted total time for an agent with
// every stat at scoring.parStat and energy scoring.parEnergyCapacity.
float ReferenceTime(const TerrainGrid &grid, const ScoringConfig &scoring,
                    const PlannerConfig &planner);

// Scores a finalized timeline. Never mutates the agent; stat changes come
// back as recommendations. Throws EmptyCourseError for an empty grid and
// InvalidAgentModel for an invalid agent.
RunResult ScoreRun(const RunTimeline &timeline, const AgentModel &agent,
                   const TerrainGrid &grid,
                   const ScoringConfig &scoring = ScoringConfig{},
                   const PlannerConfig &planner = PlannerConfig{});
