#pragma once

#include <string>
#include <vector>

#include "sim/Agent.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

// Pacing decision for one cell.
struct PlannedStep {
  int cellIndex = 0;
  float pace = 0.0f;             // fraction of max speed
  float predictedSpend = 0.0f;   // energy
  float predictedTime = 0.0f;
  float baseCost = 0.0f;         // costMultiplier / effective skill
  float skill = 0.0f;            // effective skill, also the pace response exponent
  float predictedRecovery = 0.0f; // energy regained on a recovery cell
};

struct NavigationPlan {
  std::vector<PlannedStep> steps;
  std::string agentId;
  PacingStyle style = PacingStyle::Balanced;
  float energyCapacity = 0.0f;
  float energyBudget = 0.0f; // capacity minus the style's reserve
  float predictedTotalTime = 0.0f;
  float predictedTotalSpend = 0.0f;
  bool energyConstrained = false;
  int budgetExhaustedAt = -1; // first cell whose cumulative spend exceeds capacity
};

// Time to cross a cell: baseCost / pace^skill. Weak skills respond little to
// extra pace, so energy buys less time on them.
float TraversalTime(float baseCost, float skill, float pace);

// Energy to cross a cell at the given pace.
float TraversalEnergy(const TerrainCell &cell, const AgentModel &agent,
                      float pace, const PlannerConfig &config);

// Energy-constrained pacing over a linear course. A linear course is the
// single-path case of a shortest-weighted-path search over a DAG of cell
// transitions, so only the pace selection remains.
//
// Throws EmptyCourseError for an empty grid and InvalidAgentModel for an
// agent that fails ValidateAgent.
NavigationPlan PlanRun(const TerrainGrid &grid, const AgentModel &agent,
                       const PlannerConfig &config = PlannerConfig{});
