#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "game/Scoring.hpp"
#include "sim/Agent.hpp"
#include "sim/Planner.hpp"
#include "sim/Sim.hpp"
#include "sim/Terrain.hpp"
#include "sim/Tuning.hpp"

// One generate -> plan -> simulate -> score request.
struct RunRequest {
  uint32_t seed = 0u;
  LengthCategory length = LengthCategory::Short;
  DifficultyTier tier = DifficultyTier::Beginner;
  std::optional<TerrainWeights> weights;
  AgentModel agent{};
};

enum class PipelineStatus {
  Ok,
  Cancelled,      // abandoned at a stage boundary
  GenerationFailed,
  InvalidAgent,
  EmptyCourse,
  InvalidConfig,  // tuning failed ValidateTuning or a stage rejected its input
};

struct RunOutcome {
  PipelineStatus status = PipelineStatus::Ok;
  std::string error; // message of the error that stopped the pipeline
  TerrainGrid grid{};
  NavigationPlan plan{};
  RunTimeline timeline{};
  RunResult result{};
};

struct BatchProgress {
  int index = 0;
  int total = 0;
  const RunOutcome *outcome = nullptr;
};

using BatchProgressCallback = std::function<void(const BatchProgress &)>;

const char *PipelineStatusName(PipelineStatus status);

// Runs one request. Engine errors, invalid tuning and stage input errors are
// captured in the outcome status instead of propagating so a batch keeps
// going. `cancel` is polled between stages;
// a cancelled pipeline leaves no side effects.
RunOutcome RunPipeline(const RunRequest &request, const CourseTuning &tuning,
                       const std::atomic<bool> *cancel = nullptr);

// Runs independent requests on up to `threads` workers (0 = hardware
// concurrency). Outcomes keep request order; progress callbacks fire in
// index order on the calling thread.
std::vector<RunOutcome> RunBatch(const std::vector<RunRequest> &requests,
                                 const CourseTuning &tuning, int threads = 0,
                                 const BatchProgressCallback &progress = nullptr,
                                 const std::atomic<bool> *cancel = nullptr);
