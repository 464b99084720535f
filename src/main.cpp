#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Pipeline.hpp"
#include "game/Progression.hpp"
#include "game/RunExport.hpp"
#include "sim/Agent.hpp"
#include "sim/Tuning.hpp"

// training_session: runs an agent through a series of courses and feeds each
// result back into the agent before the next run.
//
//   training_session [--agent <file>] [--save <file>] [--sessions <n>]
//                    [--seed <n>] [--tier <tier>] [--length <cat>]
//                    [--tuning <file>]

namespace {

struct SessionArgs {
  std::string agentPath;
  std::string savePath;
  std::string tuningPath;
  int sessions = 5;
  uint32_t seed = 0xC0FFEEu;
  DifficultyTier tier = DifficultyTier::Beginner;
  LengthCategory length = LengthCategory::Short;
  bool ok = true;
};

SessionArgs ParseArgs(int argc, char *argv[]) {
  SessionArgs args{};
  for (int i = 1; i < argc; ++i) {
    const bool hasValue = i + 1 < argc;
    if (std::strcmp(argv[i], "--agent") == 0 && hasValue) {
      args.agentPath = argv[++i];
    } else if (std::strcmp(argv[i], "--save") == 0 && hasValue) {
      args.savePath = argv[++i];
    } else if (std::strcmp(argv[i], "--tuning") == 0 && hasValue) {
      args.tuningPath = argv[++i];
    } else if (std::strcmp(argv[i], "--sessions") == 0 && hasValue) {
      args.sessions = std::max(1, std::atoi(argv[++i]));
    } else if (std::strcmp(argv[i], "--seed") == 0 && hasValue) {
      args.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 0));
    } else if (std::strcmp(argv[i], "--tier") == 0 && hasValue) {
      const auto tier = ParseDifficultyTier(argv[++i]);
      if (!tier) {
        LOG_ERROR("Unknown tier '{}'", argv[i]);
        args.ok = false;
      } else {
        args.tier = *tier;
      }
    } else if (std::strcmp(argv[i], "--length") == 0 && hasValue) {
      const auto length = ParseLengthCategory(argv[++i]);
      if (!length) {
        LOG_ERROR("Unknown length category '{}'", argv[i]);
        args.ok = false;
      } else {
        args.length = *length;
      }
    } else {
      LOG_ERROR("Unknown or incomplete option '{}'", argv[i]);
      args.ok = false;
    }
  }
  return args;
}

bool SaveAgent(const AgentModel &agent, const std::string &path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Failed to open agent file for writing: {}", path);
    return false;
  }
  file << AgentToJson(agent).dump(2) << '\n';
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  Log::Init();
  CrashHandler::Init();

  const SessionArgs args = ParseArgs(argc, argv);
  if (!args.ok) {
    Log::Shutdown();
    return 2;
  }

  CourseTuning tuning{};
  if (!args.tuningPath.empty() &&
      !LoadTuningFromFile(tuning, args.tuningPath.c_str())) {
    Log::Shutdown();
    return 2;
  }

  AgentModel agent = MakeUniformAgent("trainee", cfg::kParStat);
  if (!args.agentPath.empty() &&
      !LoadAgentFromFile(agent, args.agentPath.c_str())) {
    Log::Shutdown();
    return 2;
  }

  LOG_INFO("Training '{}' for {} session(s) on {} {} courses", agent.id,
           args.sessions, DifficultyTierName(args.tier),
           LengthCategoryName(args.length));

  int completed = 0;
  for (int session = 0; session < args.sessions; ++session) {
    RunRequest request{};
    request.seed = args.seed + static_cast<uint32_t>(session);
    request.tier = args.tier;
    request.length = args.length;
    request.agent = agent;

    const RunOutcome outcome = RunPipeline(request, tuning);
    if (outcome.status != PipelineStatus::Ok) {
      LOG_ERROR("Session {} failed: {}", session + 1, outcome.error);
      Log::Shutdown();
      return 1;
    }

    const RunResult &result = outcome.result;
    if (result.completed) {
      ++completed;
    }
    agent = ApplyProgression(agent, result, tuning.scoring);

    std::printf("session %2d  seed=0x%08X  %-9s  cells=%3d/%-3d  score=%6.2f  "
                "xp=+%-4d  level=%d (%d xp)\n",
                session + 1, request.seed,
                RunStateName(outcome.timeline.finalState),
                result.cellsCompleted, outcome.grid.Length(), result.score,
                result.experience, agent.level, agent.experience);
    for (const Milestone m : result.milestones) {
      LOG_INFO("Session {}: milestone {}", session + 1, MilestoneName(m));
    }
  }

  std::printf("completed %d / %d sessions\n", completed, args.sessions);
  std::printf("%s\n", AgentToJson(agent).dump(2).c_str());

  if (!args.savePath.empty() && !SaveAgent(agent, args.savePath)) {
    Log::Shutdown();
    return 1;
  }

  Log::Shutdown();
  return 0;
}
