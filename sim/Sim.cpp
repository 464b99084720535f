#include "sim/Sim.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/Errors.hpp"

namespace {

void CheckPlanMatchesGrid(const TerrainGrid &grid, const NavigationPlan &plan) {
  if (plan.steps.size() != grid.cells.size()) {
    throw std::invalid_argument(
        "plan has " + std::to_string(plan.steps.size()) +
        " steps for a course of " + std::to_string(grid.cells.size()) +
        " cells");
  }
  for (size_t i = 0; i < plan.steps.size(); ++i) {
    const auto &step = plan.steps[i];
    if (step.cellIndex != grid.cells[i].index) {
      throw std::invalid_argument("plan step " + std::to_string(i) +
                                  " targets cell " +
                                  std::to_string(step.cellIndex));
    }
    if (!(step.pace > 0.0f) || !(step.baseCost > 0.0f)) {
      throw std::invalid_argument("plan step " + std::to_string(i) +
                                  " has non-positive pace or cost");
    }
  }
}

} // namespace

const char *RunStateName(const RunState state) {
  switch (state) {
  case RunState::Running:
    return "running";
  case RunState::Recovering:
    return "recovering";
  case RunState::Exhausted:
    return "exhausted";
  case RunState::Completed:
    return "completed";
  }
  return "unknown";
}

float VarianceFactor(const TerrainGrid &grid, const int cellIndex,
                     const SimConfig &config) {
  if (!config.applyVariance) {
    return 1.0f;
  }
  const TerrainKind kind = grid.cells[cellIndex].kind;
  const float amplitude = config.varianceAmplitude[KindIndex(kind)];
  const float u = core::HashFloat01(grid.generationSeed,
                                    static_cast<uint32_t>(cellIndex));
  return 1.0f + amplitude * (2.0f * u - 1.0f);
}

RunTimeline SimulateRun(const TerrainGrid &grid, const NavigationPlan &plan,
                        const SimConfig &config) {
  if (grid.Empty()) {
    throw EmptyCourseError();
  }
  CheckPlanMatchesGrid(grid, plan);

  RunTimeline timeline{};
  timeline.energyCapacity = plan.energyCapacity;
  timeline.courseLength = grid.Length();
  timeline.courseSeed = grid.seed;
  timeline.agentId = plan.agentId;
  timeline.steps.reserve(grid.cells.size());

  RunState state = RunState::Running;
  float energy = plan.energyCapacity;
  float elapsed = 0.0f;

  for (size_t i = 0; i < grid.cells.size(); ++i) {
    const TerrainCell &cell = grid.cells[i];
    const PlannedStep &step = plan.steps[i];

    const float spent =
        step.predictedSpend * VarianceFactor(grid, static_cast<int>(i), config);
    if (energy - spent < 0.0f) {
      // The agent cannot finish this cell; the timeline ends at the previous
      // one.
      state = RunState::Exhausted;
      break;
    }

    energy -= spent;
    state = RunState::Running;
    if (cell.recovery && step.predictedRecovery > 0.0f) {
      energy = std::min(plan.energyCapacity, energy + step.predictedRecovery);
      state = RunState::Recovering;
    }

    const float dt = TraversalTime(step.baseCost, step.skill, step.pace);
    elapsed += dt;

    StepRecord record{};
    record.cellIndex = cell.index;
    record.timeDelta = dt;
    record.elapsed = elapsed;
    record.energyRemaining = energy;
    record.energySpent = spent;
    record.pace = step.pace;
    record.kind = cell.kind;
    record.state = state;
    timeline.steps.push_back(record);
  }

  if (state != RunState::Exhausted) {
    state = RunState::Completed;
  }
  timeline.finalState = state;
  timeline.complete = (state == RunState::Completed);

  if (!timeline.complete) {
    LOG_DEBUG("Agent '{}' exhausted after {}/{} cells on course seed {}",
              plan.agentId, timeline.CellsCompleted(), grid.Length(),
              grid.seed);
  }
  return timeline;
}
