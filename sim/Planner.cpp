#include "sim/Planner.hpp"

#include <algorithm>
#include <cmath>
#include <queue>

#include "core/Log.hpp"
#include "sim/Errors.hpp"

namespace {

// Candidate pace increment for one cell. Ordered by time saved per unit of
// energy, ties to the lowest cell index.
struct Increment {
  float gain = 0.0f;
  int cell = 0;
};

struct IncrementOrder {
  bool operator()(const Increment &a, const Increment &b) const {
    if (a.gain != b.gain) {
      return a.gain < b.gain;
    }
    return a.cell > b.cell;
  }
};

float PaceAtLevel(const PlannerConfig &config, const int level) {
  return std::min(config.maxPace,
                  config.minPace + static_cast<float>(level) * config.paceStep);
}

int MaxPaceLevel(const PlannerConfig &config) {
  if (config.paceStep <= 0.0f) {
    return 0;
  }
  return static_cast<int>(
      std::ceil((config.maxPace - config.minPace) / config.paceStep - 1e-4f));
}

float StaminaFactor(const AgentModel &agent, const PlannerConfig &config) {
  return std::max(0.0f, config.staminaDrainBase - agent.stats.stamina);
}

} // namespace

float TraversalTime(const float baseCost, const float skill, const float pace) {
  return baseCost / std::pow(pace, skill);
}

float TraversalEnergy(const TerrainCell &cell, const AgentModel &agent,
                      const float pace, const PlannerConfig &config) {
  const float drain = cell.hazard ? config.hazardDrainMultiplier : 1.0f;
  return config.energyPerCost * cell.costMultiplier * drain * pace * pace *
         StaminaFactor(agent, config);
}

NavigationPlan PlanRun(const TerrainGrid &grid, const AgentModel &agent,
                       const PlannerConfig &config) {
  if (grid.Empty()) {
    throw EmptyCourseError();
  }
  ValidateAgent(agent);

  const int n = grid.Length();
  NavigationPlan plan{};
  plan.agentId = agent.id;
  plan.style = config.style;
  plan.energyCapacity = agent.energyCapacity;
  plan.energyBudget =
      agent.energyCapacity * (1.0f - config.ReserveFor(config.style));
  plan.steps.resize(static_cast<size_t>(n));

  std::vector<int> level(static_cast<size_t>(n), 0);
  float spend = 0.0f;
  for (int i = 0; i < n; ++i) {
    const TerrainCell &cell = grid.cells[i];
    PlannedStep &step = plan.steps[i];
    step.cellIndex = cell.index;
    step.skill = std::max(SkillForTerrain(agent.stats, cell.kind),
                          config.minEffectiveSkill);
    step.baseCost = cell.costMultiplier / step.skill;
    step.pace = PaceAtLevel(config, 0);
    step.predictedSpend = TraversalEnergy(cell, agent, step.pace, config);
    step.predictedTime = TraversalTime(step.baseCost, step.skill, step.pace);
    if (cell.recovery) {
      step.predictedRecovery =
          config.recoveryAmount * (0.5f + agent.stats.stamina);
    }
    spend += step.predictedSpend;
  }

  if (spend > agent.energyCapacity) {
    // Even minimum pace overruns capacity. Everything stays at minimum pace
    // and the simulator is left to produce the exhausted run.
    plan.energyConstrained = true;
    float cumulative = 0.0f;
    for (int i = 0; i < n; ++i) {
      cumulative += plan.steps[i].predictedSpend;
      if (cumulative > agent.energyCapacity) {
        plan.budgetExhaustedAt = i;
        break;
      }
    }
    LOG_DEBUG("Plan for '{}' is energy-constrained: min-pace spend {:.2f} > "
              "capacity {:.2f}, budget runs out at cell {}",
              agent.id, spend, agent.energyCapacity, plan.budgetExhaustedAt);
  } else {
    // Greedy surplus allocation. Marginal gain falls as pace rises on every
    // cell, so always taking the best next increment across the whole course
    // is the lookahead.
    const int maxLevel = MaxPaceLevel(config);
    auto nextIncrement = [&](const int i, Increment &out) {
      if (level[i] >= maxLevel) {
        return false;
      }
      const PlannedStep &step = plan.steps[i];
      const float nextPace = PaceAtLevel(config, level[i] + 1);
      const float dTime =
          step.predictedTime - TraversalTime(step.baseCost, step.skill, nextPace);
      const float dEnergy =
          TraversalEnergy(grid.cells[i], agent, nextPace, config) -
          step.predictedSpend;
      out.cell = i;
      out.gain = (dEnergy > 0.0f) ? dTime / dEnergy : dTime * 1e6f;
      return true;
    };

    std::priority_queue<Increment, std::vector<Increment>, IncrementOrder> queue;
    for (int i = 0; i < n; ++i) {
      Increment inc{};
      if (nextIncrement(i, inc)) {
        queue.push(inc);
      }
    }

    while (!queue.empty()) {
      const Increment top = queue.top();
      queue.pop();
      const int i = top.cell;
      PlannedStep &step = plan.steps[i];

      const float nextPace = PaceAtLevel(config, level[i] + 1);
      const float nextSpend =
          TraversalEnergy(grid.cells[i], agent, nextPace, config);
      const float extra = nextSpend - step.predictedSpend;
      if (spend + extra > plan.energyBudget) {
        continue; // this cell is done; cheaper increments elsewhere may fit
      }

      spend += extra;
      ++level[i];
      step.pace = nextPace;
      step.predictedSpend = nextSpend;
      step.predictedTime = TraversalTime(step.baseCost, step.skill, nextPace);

      Increment inc{};
      if (nextIncrement(i, inc)) {
        queue.push(inc);
      }
    }
  }

  for (const auto &step : plan.steps) {
    plan.predictedTotalTime += step.predictedTime;
    plan.predictedTotalSpend += step.predictedSpend;
  }

  LOG_TRACE("Planned {} cells for '{}': time {:.3f}, spend {:.2f} / {:.2f}", n,
            agent.id, plan.predictedTotalTime, plan.predictedTotalSpend,
            plan.energyCapacity);
  return plan;
}
