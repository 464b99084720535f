#include "game/Scoring.hpp"

#include <algorithm>

#include "core/Log.hpp"
#include "game/Progression.hpp"
#include "sim/Errors.hpp"
#include "sim/Planner.hpp"

namespace {

float Clamp(const float value, const float minValue, const float maxValue) {
  if (value < minValue) {
    return minValue;
  }
  if (value > maxValue) {
    return maxValue;
  }
  return value;
}

void TallyMastery(const RunTimeline &timeline, const DifficultyTier tier,
                  const ScoringConfig &scoring, RunResult &result) {
  std::array<float, kTerrainKindCount> paceSum{};
  for (const auto &step : timeline.steps) {
    const int k = KindIndex(step.kind);
    ++result.mastery[k].cellsTraversed;
    paceSum[k] += step.pace;
  }

  const float threshold = scoring.masteryThreshold[TierIndex(tier)];
  for (int k = 0; k < kTerrainKindCount; ++k) {
    auto &m = result.mastery[k];
    if (m.cellsTraversed == 0) {
      continue;
    }
    m.averagePace = paceSum[k] / static_cast<float>(m.cellsTraversed);
    m.mastered = m.averagePace > threshold;
  }
}

} // namespace

bool RunResult::HasMilestone(const Milestone m) const {
  return std::find(milestones.begin(), milestones.end(), m) !=
         milestones.end();
}

const char *MilestoneName(const Milestone milestone) {
  switch (milestone) {
  case Milestone::CourseCompleted:
    return "course_completed";
  case Milestone::ParBeaten:
    return "par_beaten";
  case Milestone::EnergyEfficient:
    return "energy_efficient";
  case Milestone::TerrainMaster:
    return "terrain_master";
  case Milestone::LevelUp:
    return "level_up";
  }
  return "unknown";
}

float ReferenceTime(const TerrainGrid &grid, const ScoringConfig &scoring,
                    const PlannerConfig &planner) {
  const AgentModel par =
      MakeUniformAgent("par", scoring.parStat, scoring.parEnergyCapacity);
  return PlanRun(grid, par, planner).predictedTotalTime;
}

RunResult ScoreRun(const RunTimeline &timeline, const AgentModel &agent,
                   const TerrainGrid &grid, const ScoringConfig &scoring,
                   const PlannerConfig &planner) {
  if (grid.Empty()) {
    throw EmptyCourseError();
  }
  ValidateAgent(agent);

  RunResult result{};
  result.courseSeed = grid.seed;
  result.courseFingerprint = CourseFingerprint(grid);
  result.completed = timeline.complete;
  result.cellsCompleted = timeline.CellsCompleted();
  result.totalTime = timeline.TotalTime();
  result.progress = static_cast<float>(result.cellsCompleted) /
                    static_cast<float>(grid.Length());
  result.referenceTime = ReferenceTime(grid, scoring, planner);

  TallyMastery(timeline, grid.tier, scoring, result);

  if (result.completed && result.totalTime > 0.0f) {
    result.baseScore =
        std::min(scoring.maxBaseScore,
                 scoring.baseScoreScale * result.referenceTime / result.totalTime);

    if (timeline.energyCapacity > 0.0f) {
      result.efficiencyBonus = scoring.efficiencyWeight *
                               Clamp(timeline.EnergyRemaining() /
                                         timeline.energyCapacity,
                                     0.0f, 1.0f);
    }

    int masteredKinds = 0;
    for (const auto &m : result.mastery) {
      if (m.mastered) {
        ++masteredKinds;
      }
    }
    result.masteryBonus =
        scoring.masteryBonusPerKind * static_cast<float>(masteredKinds);

    // A finished run never scores below the best possible unfinished one.
    result.score = Clamp(result.baseScore + result.efficiencyBonus +
                             result.masteryBonus,
                         scoring.CompletionFloor(), scoring.maxScore);
  } else {
    result.partialCredit = scoring.partialCreditWeight * result.progress;
    result.score = scoring.scoreFloor + result.partialCredit;
  }

  result.experience =
      ExperienceAward(result.score, agent.level, grid.tier, scoring);
  result.statDeltas = StatDeltas(result, agent, scoring);

  if (result.completed) {
    result.milestones.push_back(Milestone::CourseCompleted);
    if (result.totalTime < result.referenceTime) {
      result.milestones.push_back(Milestone::ParBeaten);
    }
    if (timeline.energyCapacity > 0.0f &&
        timeline.EnergyRemaining() >=
            scoring.energyEfficientFraction * timeline.energyCapacity) {
      result.milestones.push_back(Milestone::EnergyEfficient);
    }
    bool allMastered = true;
    for (const auto &m : result.mastery) {
      if (m.cellsTraversed > 0 && !m.mastered) {
        allMastered = false;
      }
    }
    if (allMastered) {
      result.milestones.push_back(Milestone::TerrainMaster);
    }
  }
  if (LevelForExperience(AddExperience(agent.experience, result.experience),
                         scoring) >
      agent.level) {
    result.milestones.push_back(Milestone::LevelUp);
  }

  LOG_DEBUG("Scored '{}' on seed {}: {} {:.1f}s (par {:.1f}s) score {:.2f} "
            "xp {}",
            agent.id, grid.seed, result.completed ? "completed" : "exhausted",
            result.totalTime, result.referenceTime, result.score,
            result.experience);
  return result;
}
