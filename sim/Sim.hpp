#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sim/Planner.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

enum class RunState { Running, Recovering, Exhausted, Completed };

struct StepRecord {
  int cellIndex = 0;
  float timeDelta = 0.0f;
  float elapsed = 0.0f;
  float energyRemaining = 0.0f;
  float energySpent = 0.0f;
  float pace = 0.0f;
  TerrainKind kind = TerrainKind::Grass;
  RunState state = RunState::Running; // Recovering on recovery cells
};

struct RunTimeline {
  std::vector<StepRecord> steps;
  RunState finalState = RunState::Running;
  bool complete = false; // true only for Completed
  float energyCapacity = 0.0f;
  int courseLength = 0;
  uint32_t courseSeed = 0u;
  std::string agentId;

  int CellsCompleted() const { return static_cast<int>(steps.size()); }
  float TotalTime() const { return steps.empty() ? 0.0f : steps.back().elapsed; }
  float EnergyRemaining() const {
    return steps.empty() ? energyCapacity : steps.back().energyRemaining;
  }
};

const char *RunStateName(RunState state);

// Deterministic per-cell multiplier on planned energy spend, derived from the
// course seed and cell index.
float VarianceFactor(const TerrainGrid &grid, int cellIndex,
                     const SimConfig &config);

// Advances the plan cell by cell. Exhaustion is a terminal state, not an
// error. Throws EmptyCourseError for an empty grid and std::invalid_argument
// when the plan does not cover the grid.
RunTimeline SimulateRun(const TerrainGrid &grid, const NavigationPlan &plan,
                        const SimConfig &config = SimConfig{});
