#include "game/Pipeline.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "core/Log.hpp"
#include "sim/CourseGenerator.hpp"
#include "sim/Errors.hpp"

namespace {

bool Cancelled(const std::atomic<bool> *cancel) {
  return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

} // namespace

const char *PipelineStatusName(const PipelineStatus status) {
  switch (status) {
  case PipelineStatus::Ok:
    return "ok";
  case PipelineStatus::Cancelled:
    return "cancelled";
  case PipelineStatus::GenerationFailed:
    return "generation_failed";
  case PipelineStatus::InvalidAgent:
    return "invalid_agent";
  case PipelineStatus::EmptyCourse:
    return "empty_course";
  case PipelineStatus::InvalidConfig:
    return "invalid_config";
  }
  return "unknown";
}

RunOutcome RunPipeline(const RunRequest &request, const CourseTuning &tuning,
                       const std::atomic<bool> *cancel) {
  RunOutcome out{};
  std::string reason;
  if (!ValidateTuning(tuning, &reason)) {
    out.status = PipelineStatus::InvalidConfig;
    out.error = "invalid tuning: " + reason;
    LOG_WARN("Pipeline for seed {} stopped: {} ({})", request.seed,
             PipelineStatusName(out.status), out.error);
    return out;
  }

  try {
    if (Cancelled(cancel)) {
      out.status = PipelineStatus::Cancelled;
      LOG_DEBUG("Pipeline for seed {} cancelled", request.seed);
      return out;
    }
    out.grid = GenerateCourse(request.seed, request.length, request.tier,
                              request.weights ? &*request.weights : nullptr,
                              tuning.generation);

    if (Cancelled(cancel)) {
      out.status = PipelineStatus::Cancelled;
      LOG_DEBUG("Pipeline for seed {} cancelled", request.seed);
      return out;
    }
    out.plan = PlanRun(out.grid, request.agent, tuning.planner);

    if (Cancelled(cancel)) {
      out.status = PipelineStatus::Cancelled;
      LOG_DEBUG("Pipeline for seed {} cancelled", request.seed);
      return out;
    }
    out.timeline = SimulateRun(out.grid, out.plan, tuning.sim);

    if (Cancelled(cancel)) {
      out.status = PipelineStatus::Cancelled;
      LOG_DEBUG("Pipeline for seed {} cancelled", request.seed);
      return out;
    }
    out.result = ScoreRun(out.timeline, request.agent, out.grid,
                          tuning.scoring, tuning.planner);
  } catch (const GenerationError &e) {
    out.status = PipelineStatus::GenerationFailed;
    out.error = e.what();
  } catch (const InvalidAgentModel &e) {
    out.status = PipelineStatus::InvalidAgent;
    out.error = e.what();
  } catch (const EmptyCourseError &e) {
    out.status = PipelineStatus::EmptyCourse;
    out.error = e.what();
  } catch (const std::invalid_argument &e) {
    out.status = PipelineStatus::InvalidConfig;
    out.error = e.what();
  }

  if (out.status != PipelineStatus::Ok) {
    LOG_WARN("Pipeline for seed {} stopped: {} ({})", request.seed,
             PipelineStatusName(out.status), out.error);
  }
  return out;
}

std::vector<RunOutcome> RunBatch(const std::vector<RunRequest> &requests,
                                 const CourseTuning &tuning, int threads,
                                 const BatchProgressCallback &progress,
                                 const std::atomic<bool> *cancel) {
  const int total = static_cast<int>(requests.size());
  std::vector<RunOutcome> outcomes(requests.size());
  if (total == 0) {
    return outcomes;
  }

  if (threads <= 0)
    threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0)
    threads = 1;
  threads = std::min(threads, total);

  LOG_DEBUG("Running batch of {} pipelines on {} worker(s)", total, threads);

  if (threads == 1) {
    for (int i = 0; i < total; ++i) {
      outcomes[static_cast<size_t>(i)] =
          RunPipeline(requests[static_cast<size_t>(i)], tuning, cancel);
      if (progress) {
        progress(BatchProgress{i, total, &outcomes[static_cast<size_t>(i)]});
      }
    }
    return outcomes;
  }

  // Outcomes land at stable indices; the calling thread reports progress in
  // index order as slots become ready.
  std::atomic<int> nextIndex{0};
  std::mutex readyMutex;
  std::condition_variable readyCv;
  std::vector<unsigned char> ready(requests.size(), 0u);

  auto worker = [&]() {
    for (;;) {
      const int i = nextIndex.fetch_add(1);
      if (i >= total) {
        break;
      }
      RunOutcome outcome =
          RunPipeline(requests[static_cast<size_t>(i)], tuning, cancel);
      {
        std::lock_guard<std::mutex> lock(readyMutex);
        outcomes[static_cast<size_t>(i)] = std::move(outcome);
        ready[static_cast<size_t>(i)] = 1u;
      }
      readyCv.notify_all();
    }
  };

  // Joins the workers on every exit path, including a throwing progress
  // callback.
  struct PoolJoiner {
    std::vector<std::thread> &threads;
    ~PoolJoiner() {
      for (std::thread &th : threads) {
        if (th.joinable())
          th.join();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(threads));
  PoolJoiner joiner{pool};
  for (int t = 0; t < threads; ++t) {
    pool.emplace_back(worker);
  }

  if (progress) {
    for (int i = 0; i < total; ++i) {
      {
        std::unique_lock<std::mutex> lock(readyMutex);
        readyCv.wait(lock, [&]() { return ready[static_cast<size_t>(i)] != 0u; });
      }
      progress(BatchProgress{i, total, &outcomes[static_cast<size_t>(i)]});
    }
  }

  return outcomes;
}
