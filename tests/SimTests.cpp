#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/Agent.hpp"
#include "sim/CourseGenerator.hpp"
#include "sim/Errors.hpp"
#include "sim/Planner.hpp"
#include "sim/Sim.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-5f) {
  return std::fabs(a - b) <= eps;
}

constexpr DifficultyTier kAllTiers[] = {
    DifficultyTier::Beginner, DifficultyTier::Intermediate,
    DifficultyTier::Advanced, DifficultyTier::Expert};

TerrainGrid MakeFlatGrid(const int length, const float cost = 1.0f) {
  TerrainGrid grid{};
  grid.seed = 7u;
  grid.generationSeed = 7u;
  for (int i = 0; i < length; ++i) {
    TerrainCell cell{};
    cell.index = i;
    cell.kind = TerrainKind::Grass;
    cell.costMultiplier = cost;
    grid.cells.push_back(cell);
  }
  return grid;
}

// --- Rng ---

bool TestRngDeterministic() {
  uint32_t a = 12345u;
  uint32_t b = 12345u;
  for (int i = 0; i < 1000; ++i) {
    if (core::NextU32(a) != core::NextU32(b)) {
      return false;
    }
  }
  return true;
}

bool TestRngRanges() {
  uint32_t state = 99u;
  for (int i = 0; i < 10000; ++i) {
    const float f = core::NextFloat01(state);
    if (f < 0.0f || f >= 1.0f) {
      return false;
    }
    const int n = core::NextInt(state, 3, 7);
    if (n < 3 || n > 7) {
      return false;
    }
  }
  uint32_t zero = 0u;
  return core::NextU32(zero) != 0u;
}

// --- Generator ---

bool TestGeneratorDeterministic() {
  for (const DifficultyTier tier : kAllTiers) {
    const TerrainGrid a = GenerateCourse(1234u, LengthCategory::Medium, tier);
    const TerrainGrid b = GenerateCourse(1234u, LengthCategory::Medium, tier);
    if (!SameCourse(a, b) || CourseFingerprint(a) != CourseFingerprint(b)) {
      return false;
    }
  }
  return true;
}

bool TestGeneratorSeedsDiffer() {
  const TerrainGrid a =
      GenerateCourse(1u, LengthCategory::Long, DifficultyTier::Advanced);
  const TerrainGrid b =
      GenerateCourse(2u, LengthCategory::Long, DifficultyTier::Advanced);
  return CourseFingerprint(a) != CourseFingerprint(b);
}

bool TestGeneratorLengthRanges() {
  const GenerationConfig config{};
  for (uint32_t seed = 0u; seed < 200u; ++seed) {
    for (const LengthCategory cat :
         {LengthCategory::Short, LengthCategory::Medium, LengthCategory::Long}) {
      int minLen = 0;
      int maxLen = 0;
      LengthRange(config, cat, minLen, maxLen);
      const TerrainGrid grid =
          GenerateCourse(seed, cat, DifficultyTier::Intermediate);
      if (grid.Length() < minLen || grid.Length() > maxLen ||
          grid.lengthCategory != cat) {
        return false;
      }
    }
  }
  return true;
}

bool TestGeneratorDistributionBands() {
  const GenerationConfig config{};
  for (const DifficultyTier tier : kAllTiers) {
    const CourseConstraints constraints = ConstraintsFor(tier, nullptr, config);
    for (uint32_t seed = 0u; seed < 1000u; ++seed) {
      const TerrainGrid grid =
          GenerateCourse(seed * 7919u, LengthCategory::Medium, tier);
      for (int k = 0; k < kTerrainKindCount; ++k) {
        const float share =
            TerrainFraction(grid, static_cast<TerrainKind>(k));
        const auto &band = constraints.bands[k];
        if (share < band.floor - 1e-4f || share > band.ceiling + 1e-4f) {
          return false;
        }
      }
    }
  }
  return true;
}

bool TestGeneratorObstacleRunsAndEndpoints() {
  const GenerationConfig config{};
  for (const DifficultyTier tier : kAllTiers) {
    const int maxRun = config.tiers[TierIndex(tier)].maxObstacleRun;
    for (uint32_t seed = 0u; seed < 300u; ++seed) {
      const TerrainGrid grid = GenerateCourse(seed, LengthCategory::Long, tier);
      if (LongestObstacleRun(grid) > maxRun) {
        return false;
      }
      if (grid.cells.front().kind == TerrainKind::Obstacle ||
          grid.cells.back().kind == TerrainKind::Obstacle) {
        return false;
      }
      if (!IsCompletable(grid, maxRun)) {
        return false;
      }
    }
  }
  return true;
}

bool TestGeneratorCellInvariants() {
  for (uint32_t seed = 0u; seed < 200u; ++seed) {
    const TerrainGrid grid =
        GenerateCourse(seed, LengthCategory::Medium, DifficultyTier::Expert);
    for (int i = 0; i < grid.Length(); ++i) {
      const TerrainCell &cell = grid.cells[i];
      if (cell.index != i || !(cell.costMultiplier > 0.0f)) {
        return false;
      }
      if (cell.hazard && cell.kind == TerrainKind::Grass) {
        return false;
      }
    }
    if (grid.cells.front().hazard || grid.cells.back().hazard) {
      return false;
    }
  }
  return true;
}

bool TestGeneratorRejectsObstacleOnlyWeights() {
  const TerrainWeights weights{0.0f, 0.0f, 0.0f, 1.0f};
  try {
    GenerateCourse(42u, LengthCategory::Short, DifficultyTier::Beginner,
                   &weights);
  } catch (const GenerationError &e) {
    return e.Seed() == 42u;
  }
  return false;
}

bool TestGeneratorExhaustsAttempts() {
  // A grass ceiling below the grass floor can never be met.
  GenerationConfig config{};
  config.maxAttempts = 4;
  config.tiers[TierIndex(DifficultyTier::Beginner)].bands[0].ceiling = 0.0f;
  bool threw = false;
  try {
    GenerateCourse(5u, LengthCategory::Short, DifficultyTier::Beginner, nullptr,
                   config);
  } catch (const GenerationError &e) {
    threw = (e.Attempts() == 4);
  }
  if (!threw) {
    return false;
  }

  // Explicit all-grass weights replace the tier bands.
  const TerrainWeights weights{1.0f, 0.0f, 0.0f, 0.0f};
  const TerrainGrid grid = GenerateCourse(5u, LengthCategory::Short,
                                          DifficultyTier::Beginner, &weights);
  return TerrainFraction(grid, TerrainKind::Grass) == 1.0f;
}

bool TestThemeShiftsDistribution() {
  const auto wetlands = ThemeWeights(CourseTheme::Wetlands);
  if (!wetlands || ThemeWeights(CourseTheme::Balanced)) {
    return false;
  }
  int wetCells = 0;
  int baseCells = 0;
  for (uint32_t seed = 0u; seed < 100u; ++seed) {
    const TerrainGrid themed = GenerateCourse(
        seed, LengthCategory::Medium, DifficultyTier::Intermediate, &*wetlands);
    const TerrainGrid plain = GenerateCourse(seed, LengthCategory::Medium,
                                             DifficultyTier::Intermediate);
    wetCells += CountTerrain(themed)[KindIndex(TerrainKind::Water)];
    baseCells += CountTerrain(plain)[KindIndex(TerrainKind::Water)];
  }
  return wetCells > baseCells;
}

bool TestRecoveryCellsOnlyOnInteriorGrass() {
  GenerationConfig config{};
  config.recoveryCellChance = 0.5f;
  int recoveryCount = 0;
  for (uint32_t seed = 0u; seed < 50u; ++seed) {
    const TerrainGrid grid = GenerateCourse(
        seed, LengthCategory::Medium, DifficultyTier::Beginner, nullptr, config);
    for (int i = 0; i < grid.Length(); ++i) {
      const TerrainCell &cell = grid.cells[i];
      if (!cell.recovery) {
        continue;
      }
      ++recoveryCount;
      if (cell.kind != TerrainKind::Grass || i == 0 || i == grid.Length() - 1) {
        return false;
      }
    }
  }
  return recoveryCount > 0;
}

bool TestCompletabilityCheck() {
  TerrainGrid grid = MakeFlatGrid(6);
  grid.cells[2].kind = TerrainKind::Obstacle;
  grid.cells[3].kind = TerrainKind::Obstacle;
  if (!IsCompletable(grid, 2) || IsCompletable(grid, 1)) {
    return false;
  }
  grid.cells[5].kind = TerrainKind::Obstacle;
  return !IsCompletable(grid, 3);
}

bool TestRoundTripFromRecordedSeed() {
  const TerrainGrid original =
      GenerateCourse(0xBEEFu, LengthCategory::Long, DifficultyTier::Expert);
  const uint64_t recorded = CourseFingerprint(original);
  const TerrainGrid replay = GenerateCourse(
      original.seed, original.lengthCategory, original.tier);
  return SameCourse(original, replay) && CourseFingerprint(replay) == recorded &&
         replay.attempt == original.attempt;
}

// --- Agent ---

bool TestAgentValidation() {
  AgentModel agent = MakeUniformAgent("a", 0.5f);
  ValidateAgent(agent);

  agent.stats.swim = 1.5f;
  try {
    ValidateAgent(agent);
    return false;
  } catch (const InvalidAgentModel &) {
  }

  agent = MakeUniformAgent("", 0.5f);
  try {
    ValidateAgent(agent);
    return false;
  } catch (const InvalidAgentModel &) {
  }

  agent = MakeUniformAgent("a", 0.5f, -1.0f);
  try {
    ValidateAgent(agent);
    return false;
  } catch (const InvalidAgentModel &) {
  }
  return true;
}

bool TestStatForTerrain() {
  return StatForTerrain(TerrainKind::Grass) == AgentStat::Speed &&
         StatForTerrain(TerrainKind::Water) == AgentStat::Swim &&
         StatForTerrain(TerrainKind::Rock) == AgentStat::Climb &&
         StatForTerrain(TerrainKind::Obstacle) == AgentStat::Strength;
}

// --- Planner ---

bool TestPlannerDeterministic() {
  const TerrainGrid grid =
      GenerateCourse(77u, LengthCategory::Medium, DifficultyTier::Advanced);
  const AgentModel agent = MakeUniformAgent("a", 0.6f);
  const NavigationPlan a = PlanRun(grid, agent);
  const NavigationPlan b = PlanRun(grid, agent);
  if (a.steps.size() != b.steps.size()) {
    return false;
  }
  for (size_t i = 0; i < a.steps.size(); ++i) {
    if (a.steps[i].pace != b.steps[i].pace ||
        a.steps[i].predictedSpend != b.steps[i].predictedSpend) {
      return false;
    }
  }
  return a.predictedTotalTime == b.predictedTotalTime;
}

bool TestPlannerRespectsBudget() {
  const PlannerConfig config{};
  for (uint32_t seed = 0u; seed < 100u; ++seed) {
    const TerrainGrid grid =
        GenerateCourse(seed, LengthCategory::Long, DifficultyTier::Expert);
    const AgentModel agent = MakeUniformAgent("a", 0.5f);
    const NavigationPlan plan = PlanRun(grid, agent, config);
    bool raised = false;
    for (const auto &step : plan.steps) {
      if (step.pace < config.minPace - 1e-5f ||
          step.pace > config.maxPace + 1e-5f) {
        return false;
      }
      raised = raised || step.pace > config.minPace + 1e-5f;
    }
    // Pace is only raised out of the budget; a course whose minimum-pace
    // spend already exceeds it stays at minimum pace.
    if (raised && plan.predictedTotalSpend > plan.energyBudget + 1e-3f) {
      return false;
    }
    if (plan.energyConstrained && raised) {
      return false;
    }
  }
  return true;
}

bool TestPlannerSpendsSurplusOnShortCourse() {
  // Ten cheap cells cannot use up 100 energy even at full pace.
  const TerrainGrid grid = MakeFlatGrid(10, 0.5f);
  const AgentModel agent = MakeUniformAgent("a", 0.5f);
  const NavigationPlan plan = PlanRun(grid, agent);
  for (const auto &step : plan.steps) {
    if (!NearlyEqual(step.pace, cfg::kMaxPace)) {
      return false;
    }
  }
  return !plan.energyConstrained && plan.budgetExhaustedAt == -1;
}

bool TestPlannerEnergyConstrained() {
  const TerrainGrid grid =
      GenerateCourse(42u, LengthCategory::Medium, DifficultyTier::Beginner);
  const AgentModel agent = MakeUniformAgent("tired", 0.5f, 2.0f);
  const NavigationPlan plan = PlanRun(grid, agent);
  if (!plan.energyConstrained || plan.budgetExhaustedAt < 0 ||
      plan.budgetExhaustedAt >= grid.Length()) {
    return false;
  }
  for (const auto &step : plan.steps) {
    if (!NearlyEqual(step.pace, cfg::kMinPace)) {
      return false;
    }
  }
  return true;
}

bool TestPlannerStrongerAgentIsFaster() {
  const TerrainGrid grid =
      GenerateCourse(9u, LengthCategory::Medium, DifficultyTier::Intermediate);
  const NavigationPlan weak = PlanRun(grid, MakeUniformAgent("weak", 0.1f));
  const NavigationPlan strong = PlanRun(grid, MakeUniformAgent("strong", 1.0f));
  return strong.predictedTotalTime < weak.predictedTotalTime;
}

bool TestPlannerStyleReserve() {
  const TerrainGrid grid =
      GenerateCourse(3u, LengthCategory::Long, DifficultyTier::Intermediate);
  const AgentModel agent = MakeUniformAgent("a", 0.5f);
  PlannerConfig conservative{};
  conservative.style = PacingStyle::Conservative;
  PlannerConfig aggressive{};
  aggressive.style = PacingStyle::Aggressive;

  const NavigationPlan c = PlanRun(grid, agent, conservative);
  const NavigationPlan a = PlanRun(grid, agent, aggressive);
  return c.energyBudget < a.energyBudget &&
         c.predictedTotalSpend <= c.energyBudget + 1e-3f &&
         a.predictedTotalTime <= c.predictedTotalTime + 1e-4f;
}

bool TestPlannerRejectsInvalidAgent() {
  const TerrainGrid grid = MakeFlatGrid(5);
  AgentModel agent = MakeUniformAgent("a", 0.5f);
  agent.stats.climb = -0.1f;
  try {
    PlanRun(grid, agent);
  } catch (const InvalidAgentModel &) {
    return true;
  }
  return false;
}

bool TestPlannerRejectsEmptyCourse() {
  const TerrainGrid grid{};
  try {
    PlanRun(grid, MakeUniformAgent("a", 0.5f));
  } catch (const EmptyCourseError &) {
    return true;
  }
  return false;
}

// --- Simulator ---

bool TestSimTimeAndEnergyMonotonic() {
  for (uint32_t seed = 0u; seed < 100u; ++seed) {
    const TerrainGrid grid =
        GenerateCourse(seed, LengthCategory::Medium, DifficultyTier::Advanced);
    const AgentModel agent = MakeUniformAgent("a", 0.5f);
    const RunTimeline timeline = SimulateRun(grid, PlanRun(grid, agent));
    float lastElapsed = 0.0f;
    float lastEnergy = timeline.energyCapacity;
    for (const auto &step : timeline.steps) {
      if (!(step.elapsed > lastElapsed) || step.energyRemaining > lastEnergy ||
          step.energyRemaining < 0.0f) {
        return false;
      }
      lastElapsed = step.elapsed;
      lastEnergy = step.energyRemaining;
    }
  }
  return true;
}

bool TestSimDeterministic() {
  const TerrainGrid grid =
      GenerateCourse(555u, LengthCategory::Long, DifficultyTier::Expert);
  const NavigationPlan plan = PlanRun(grid, MakeUniformAgent("a", 0.4f));
  const RunTimeline a = SimulateRun(grid, plan);
  const RunTimeline b = SimulateRun(grid, plan);
  if (a.steps.size() != b.steps.size() || a.finalState != b.finalState) {
    return false;
  }
  for (size_t i = 0; i < a.steps.size(); ++i) {
    if (a.steps[i].elapsed != b.steps[i].elapsed ||
        a.steps[i].energyRemaining != b.steps[i].energyRemaining) {
      return false;
    }
  }
  return true;
}

bool TestMaxStatAgentCompletes() {
  const AgentModel agent = MakeUniformAgent("max", 1.0f);
  for (const DifficultyTier tier : kAllTiers) {
    int completed = 0;
    for (uint32_t seed = 0u; seed < 1000u; ++seed) {
      const TerrainGrid grid = GenerateCourse(seed, LengthCategory::Medium, tier);
      const RunTimeline timeline = SimulateRun(grid, PlanRun(grid, agent));
      if (timeline.finalState == RunState::Completed) {
        ++completed;
      }
    }
    if (completed < 950) {
      return false;
    }
  }
  return true;
}

bool TestSimExhaustedTimelineTruncated() {
  const TerrainGrid grid =
      GenerateCourse(42u, LengthCategory::Medium, DifficultyTier::Beginner);
  const AgentModel agent = MakeUniformAgent("tired", 0.5f, 8.0f);
  const RunTimeline timeline = SimulateRun(grid, PlanRun(grid, agent));
  return timeline.finalState == RunState::Exhausted && !timeline.complete &&
         timeline.CellsCompleted() < grid.Length() &&
         timeline.CellsCompleted() > 0 && timeline.courseLength == grid.Length();
}

bool TestSimRecoveryRefillsEnergy() {
  GenerationConfig gen{};
  gen.recoveryCellChance = 0.5f;
  const PlannerConfig planner{};
  for (uint32_t seed = 0u; seed < 50u; ++seed) {
    const TerrainGrid grid = GenerateCourse(
        seed, LengthCategory::Medium, DifficultyTier::Beginner, nullptr, gen);
    const AgentModel agent = MakeUniformAgent("a", 0.5f);
    const NavigationPlan plan = PlanRun(grid, agent, planner);
    const RunTimeline timeline = SimulateRun(grid, plan);

    float before = timeline.energyCapacity;
    for (const auto &step : timeline.steps) {
      const bool onRecovery = grid.cells[step.cellIndex].recovery;
      if (onRecovery != (step.state == RunState::Recovering)) {
        return false;
      }
      if (step.energyRemaining > timeline.energyCapacity + 1e-4f) {
        return false;
      }
      if (onRecovery && step.energyRemaining < before - step.energySpent) {
        return false;
      }
      before = step.energyRemaining;
    }
  }
  return true;
}

bool TestSimRejectsMismatchedPlan() {
  const TerrainGrid grid = MakeFlatGrid(5);
  NavigationPlan plan = PlanRun(grid, MakeUniformAgent("a", 0.5f));
  plan.steps.pop_back();
  try {
    SimulateRun(grid, plan);
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

bool TestVarianceWithinAmplitude() {
  const SimConfig config{};
  const TerrainGrid grid =
      GenerateCourse(21u, LengthCategory::Long, DifficultyTier::Expert);
  for (int i = 0; i < grid.Length(); ++i) {
    const float a = config.varianceAmplitude[KindIndex(grid.cells[i].kind)];
    const float v = VarianceFactor(grid, i, config);
    if (v < 1.0f - a - 1e-6f || v > 1.0f + a + 1e-6f) {
      return false;
    }
  }
  SimConfig off{};
  off.applyVariance = false;
  return VarianceFactor(grid, 0, off) == 1.0f;
}

} // namespace

int main() {
  Log::LogOptions options{};
  options.filePath.clear();
  options.level = spdlog::level::warn;
  Log::Init(options);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("rng_deterministic", TestRngDeterministic());
  run("rng_ranges", TestRngRanges());
  run("generator_deterministic", TestGeneratorDeterministic());
  run("generator_seeds_differ", TestGeneratorSeedsDiffer());
  run("generator_length_ranges", TestGeneratorLengthRanges());
  run("generator_distribution_bands", TestGeneratorDistributionBands());
  run("generator_obstacle_runs_and_endpoints",
      TestGeneratorObstacleRunsAndEndpoints());
  run("generator_cell_invariants", TestGeneratorCellInvariants());
  run("generator_rejects_obstacle_only_weights",
      TestGeneratorRejectsObstacleOnlyWeights());
  run("generator_exhausts_attempts", TestGeneratorExhaustsAttempts());
  run("theme_shifts_distribution", TestThemeShiftsDistribution());
  run("recovery_cells_only_on_interior_grass",
      TestRecoveryCellsOnlyOnInteriorGrass());
  run("completability_check", TestCompletabilityCheck());
  run("round_trip_from_recorded_seed", TestRoundTripFromRecordedSeed());
  run("agent_validation", TestAgentValidation());
  run("stat_for_terrain", TestStatForTerrain());
  run("planner_deterministic", TestPlannerDeterministic());
  run("planner_respects_budget", TestPlannerRespectsBudget());
  run("planner_spends_surplus_on_short_course",
      TestPlannerSpendsSurplusOnShortCourse());
  run("planner_energy_constrained", TestPlannerEnergyConstrained());
  run("planner_stronger_agent_is_faster", TestPlannerStrongerAgentIsFaster());
  run("planner_style_reserve", TestPlannerStyleReserve());
  run("planner_rejects_invalid_agent", TestPlannerRejectsInvalidAgent());
  run("planner_rejects_empty_course", TestPlannerRejectsEmptyCourse());
  run("sim_time_and_energy_monotonic", TestSimTimeAndEnergyMonotonic());
  run("sim_deterministic", TestSimDeterministic());
  run("max_stat_agent_completes", TestMaxStatAgentCompletes());
  run("sim_exhausted_timeline_truncated", TestSimExhaustedTimelineTruncated());
  run("sim_recovery_refills_energy", TestSimRecoveryRefillsEnergy());
  run("sim_rejects_mismatched_plan", TestSimRejectsMismatchedPlan());
  run("variance_within_amplitude", TestVarianceWithinAmplitude());

  Log::Shutdown();
  return failed == 0 ? 0 : 1;
}
