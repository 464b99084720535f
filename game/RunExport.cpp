#include "game/RunExport.hpp"

#include <cstdio>

using json = nlohmann::json;

std::string FingerprintHex(const uint64_t fingerprint) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "0x%016llx",
                static_cast<unsigned long long>(fingerprint));
  return std::string(buf);
}

json GridToJson(const TerrainGrid &grid) {
  json cells = json::array();
  for (const auto &cell : grid.cells) {
    cells.push_back({{"index", cell.index},
                     {"kind", TerrainKindName(cell.kind)},
                     {"cost", cell.costMultiplier},
                     {"hazard", cell.hazard},
                     {"recovery", cell.recovery}});
  }
  return {{"seed", grid.seed},
          {"generationSeed", grid.generationSeed},
          {"attempt", grid.attempt},
          {"tier", DifficultyTierName(grid.tier)},
          {"length", LengthCategoryName(grid.lengthCategory)},
          {"fingerprint", FingerprintHex(CourseFingerprint(grid))},
          {"cells", cells}};
}

json PlanToJson(const NavigationPlan &plan) {
  json steps = json::array();
  for (const auto &step : plan.steps) {
    steps.push_back({{"cell", step.cellIndex},
                     {"pace", step.pace},
                     {"spend", step.predictedSpend},
                     {"time", step.predictedTime}});
  }
  return {{"agent", plan.agentId},
          {"style", PacingStyleName(plan.style)},
          {"energyCapacity", plan.energyCapacity},
          {"energyBudget", plan.energyBudget},
          {"predictedTime", plan.predictedTotalTime},
          {"predictedSpend", plan.predictedTotalSpend},
          {"energyConstrained", plan.energyConstrained},
          {"budgetExhaustedAt", plan.budgetExhaustedAt},
          {"steps", steps}};
}

json TimelineToJson(const RunTimeline &timeline) {
  json steps = json::array();
  for (const auto &s : timeline.steps) {
    steps.push_back({{"cell", s.cellIndex},
                     {"dt", s.timeDelta},
                     {"elapsed", s.elapsed},
                     {"energy", s.energyRemaining},
                     {"pace", s.pace},
                     {"kind", TerrainKindName(s.kind)},
                     {"state", RunStateName(s.state)}});
  }
  return {{"finalState", RunStateName(timeline.finalState)},
          {"complete", timeline.complete},
          {"cellsCompleted", timeline.CellsCompleted()},
          {"courseLength", timeline.courseLength},
          {"steps", steps}};
}

json ResultToJson(const RunResult &result) {
  json mastery = json::object();
  for (int k = 0; k < kTerrainKindCount; ++k) {
    const auto &m = result.mastery[k];
    if (m.cellsTraversed == 0) {
      continue;
    }
    mastery[TerrainKindName(static_cast<TerrainKind>(k))] = {
        {"cells", m.cellsTraversed},
        {"averagePace", m.averagePace},
        {"mastered", m.mastered}};
  }

  json milestones = json::array();
  for (const Milestone m : result.milestones) {
    milestones.push_back(MilestoneName(m));
  }

  return {{"completed", result.completed},
          {"totalTime", result.totalTime},
          {"referenceTime", result.referenceTime},
          {"cellsCompleted", result.cellsCompleted},
          {"progress", result.progress},
          {"score", result.score},
          {"baseScore", result.baseScore},
          {"efficiencyBonus", result.efficiencyBonus},
          {"masteryBonus", result.masteryBonus},
          {"partialCredit", result.partialCredit},
          {"experience", result.experience},
          {"statDeltas", result.statDeltas},
          {"mastery", mastery},
          {"milestones", milestones},
          {"courseSeed", result.courseSeed},
          {"courseFingerprint", FingerprintHex(result.courseFingerprint)}};
}

json AgentToJson(const AgentModel &agent) {
  json stats = json::object();
  for (int i = 0; i < kAgentStatCount; ++i) {
    const auto stat = static_cast<AgentStat>(i);
    stats[AgentStatName(stat)] = GetStat(agent.stats, stat);
  }
  return {{"id", agent.id},
          {"stats", stats},
          {"energyCapacity", agent.energyCapacity},
          {"level", agent.level},
          {"experience", agent.experience}};
}

json OutcomeToJson(const RunOutcome &outcome, const bool includeDetail) {
  json doc = {{"status", PipelineStatusName(outcome.status)}};
  if (outcome.status != PipelineStatus::Ok) {
    doc["error"] = outcome.error;
    return doc;
  }
  doc["result"] = ResultToJson(outcome.result);
  if (includeDetail) {
    doc["course"] = GridToJson(outcome.grid);
    doc["plan"] = PlanToJson(outcome.plan);
    doc["timeline"] = TimelineToJson(outcome.timeline);
  }
  return doc;
}
