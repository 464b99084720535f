// course_runner: headless course generator, planner and scorer
//
// Generates one or more courses from consecutive seeds, runs an agent through
// each and prints the results. Useful for tuning and for replay checks.
//
// Usage:
//   course_runner [options]
//     --seed <hex|dec>        First course seed (default: 0xC0FFEE)
//     --runs <n>              Number of consecutive seeds (default: 1)
//     --threads <n>           Worker threads for --runs > 1 (default: hardware)
//     --length <cat>          short|medium|long (default: short)
//     --tier <tier>           beginner|intermediate|advanced|expert (default: beginner)
//     --theme <theme>         balanced|wetlands|highlands|gauntlet (default: balanced)
//     --style <style>         conservative|balanced|aggressive (default: balanced)
//     --agent <file>          Agent snapshot JSON
//     --stat <name=value>     Override one agent stat (repeatable)
//     --energy <value>        Override agent energy capacity
//     --tuning <file>         Tuning JSON applied over the defaults
//     --json                  Output as JSON instead of plain text
//     --detail                Include course, plan and timeline in JSON output
//     --quiet                 Only output one summary line per run
//     --verbose               Debug logging
//     -h, --help              Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Pipeline.hpp"
#include "game/RunExport.hpp"
#include "sim/CourseGenerator.hpp"
#include "sim/Tuning.hpp"

namespace {

struct RunnerArgs {
    uint32_t seed = 0xC0FFEEu;
    int runs = 1;
    int threads = 0;
    LengthCategory length = LengthCategory::Short;
    DifficultyTier tier = DifficultyTier::Beginner;
    CourseTheme theme = CourseTheme::Balanced;
    std::string style;
    std::string agentPath;
    std::vector<std::pair<std::string, float>> statOverrides;
    float energy = -1.0f;
    std::string tuningPath;
    bool json = false;
    bool detail = false;
    bool quiet = false;
    bool verbose = false;
    bool help = false;
    std::string error;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    auto fail = [&](const std::string& msg) {
        if (args.error.empty()) args.error = msg;
    };
    for (int i = 1; i < argc; ++i) {
        const bool hasValue = i + 1 < argc;
        if ((std::strcmp(argv[i], "--seed") == 0) && hasValue) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--runs") == 0) && hasValue) {
            args.runs = std::atoi(argv[++i]);
            if (args.runs < 1) args.runs = 1;
        } else if ((std::strcmp(argv[i], "--threads") == 0) && hasValue) {
            args.threads = std::atoi(argv[++i]);
        } else if ((std::strcmp(argv[i], "--length") == 0) && hasValue) {
            const char* v = argv[++i];
            if (const auto c = ParseLengthCategory(v)) args.length = *c;
            else fail(std::string("unknown length category: ") + v);
        } else if ((std::strcmp(argv[i], "--tier") == 0) && hasValue) {
            const char* v = argv[++i];
            if (const auto t = ParseDifficultyTier(v)) args.tier = *t;
            else fail(std::string("unknown tier: ") + v);
        } else if ((std::strcmp(argv[i], "--theme") == 0) && hasValue) {
            const char* v = argv[++i];
            if (const auto t = ParseCourseTheme(v)) args.theme = *t;
            else fail(std::string("unknown theme: ") + v);
        } else if ((std::strcmp(argv[i], "--style") == 0) && hasValue) {
            args.style = argv[++i];
            if (!ParsePacingStyle(args.style)) fail("unknown pacing style: " + args.style);
        } else if ((std::strcmp(argv[i], "--agent") == 0) && hasValue) {
            args.agentPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--stat") == 0) && hasValue) {
            const std::string kv = argv[++i];
            const size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                fail("--stat expects name=value, got " + kv);
            } else {
                args.statOverrides.emplace_back(kv.substr(0, eq),
                                                std::strtof(kv.c_str() + eq + 1, nullptr));
            }
        } else if ((std::strcmp(argv[i], "--energy") == 0) && hasValue) {
            args.energy = std::strtof(argv[++i], nullptr);
        } else if ((std::strcmp(argv[i], "--tuning") == 0) && hasValue) {
            args.tuningPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--detail") == 0) {
            args.detail = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            args.verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            fail(std::string("unknown or incomplete option: ") + argv[i]);
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "course_runner: headless training course runner\n"
        "\n"
        "Usage: course_runner [options]\n"
        "  --seed <hex|dec>        First course seed (default: 0xC0FFEE)\n"
        "  --runs <n>              Consecutive seeds to run (default: 1)\n"
        "  --threads <n>           Worker threads (default: hardware)\n"
        "  --length <cat>          short|medium|long (default: short)\n"
        "  --tier <tier>           beginner|intermediate|advanced|expert\n"
        "  --theme <theme>         balanced|wetlands|highlands|gauntlet\n"
        "  --style <style>         conservative|balanced|aggressive\n"
        "  --agent <file>          Agent snapshot JSON\n"
        "  --stat <name=value>     Override an agent stat (repeatable)\n"
        "  --energy <value>        Override agent energy capacity\n"
        "  --tuning <file>         Tuning JSON applied over the defaults\n"
        "  --json                  Output as JSON\n"
        "  --detail                Include course, plan and timeline in JSON\n"
        "  --quiet                 One summary line per run\n"
        "  --verbose               Debug logging\n"
        "  -h, --help              This message\n"
    );
}

bool ApplyStatOverride(AgentModel& agent, const std::string& name, const float value) {
    for (int i = 0; i < kAgentStatCount; ++i) {
        const auto stat = static_cast<AgentStat>(i);
        if (name == AgentStatName(stat)) {
            SetStat(agent.stats, stat, value);
            return true;
        }
    }
    return false;
}

void PrintOutcomeText(const RunRequest& req, const RunOutcome& out, const bool quiet) {
    if (out.status != PipelineStatus::Ok) {
        std::printf("seed=0x%08X  status=%s  error=%s\n", req.seed,
                    PipelineStatusName(out.status), out.error.c_str());
        return;
    }
    const RunResult& r = out.result;
    if (quiet) {
        std::printf("seed=0x%08X  status=%-9s  cells=%d/%d  time=%-8.2f  par=%-8.2f  score=%-6.2f  xp=%d\n",
                    req.seed, RunStateName(out.timeline.finalState),
                    r.cellsCompleted, out.grid.Length(), r.totalTime,
                    r.referenceTime, r.score, r.experience);
        return;
    }

    std::printf("=== Training Course Run ===\n");
    std::printf("seed:        0x%08X (attempt %d)\n", req.seed, out.grid.attempt);
    std::printf("course:      %s %s, %d cells, fingerprint %s\n",
                DifficultyTierName(out.grid.tier), LengthCategoryName(out.grid.lengthCategory),
                out.grid.Length(), FingerprintHex(r.courseFingerprint).c_str());
    std::printf("agent:       %s (level %d)\n", req.agent.id.c_str(), req.agent.level);
    std::printf("plan:        %s, predicted %.2f s, spend %.2f / %.2f%s\n",
                PacingStyleName(out.plan.style), out.plan.predictedTotalTime,
                out.plan.predictedTotalSpend, out.plan.energyCapacity,
                out.plan.energyConstrained ? " [energy-constrained]" : "");
    std::printf("status:      %s (%d/%d cells)\n", RunStateName(out.timeline.finalState),
                r.cellsCompleted, out.grid.Length());
    std::printf("time:        %.2f s (par %.2f s)\n", r.totalTime, r.referenceTime);
    std::printf("score:       %.2f (base %.2f, efficiency %.2f, mastery %.2f, partial %.2f)\n",
                r.score, r.baseScore, r.efficiencyBonus, r.masteryBonus, r.partialCredit);
    std::printf("experience:  %d\n", r.experience);
    for (const auto& kv : r.statDeltas) {
        std::printf("delta:       %-9s +%.4f\n", kv.first.c_str(), kv.second);
    }
    for (const Milestone m : r.milestones) {
        std::printf("milestone:   %s\n", MilestoneName(m));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    Log::LogOptions logOptions{};
    logOptions.filePath.clear();
    logOptions.level = args.verbose ? spdlog::level::debug : spdlog::level::warn;
    Log::Init(logOptions);
    CrashHandler::Init();

    if (!args.error.empty()) {
        LOG_ERROR("{}", args.error);
        PrintUsage();
        return 2;
    }

    CourseTuning tuning{};
    if (!args.tuningPath.empty() && !LoadTuningFromFile(tuning, args.tuningPath.c_str())) {
        return 2;
    }
    if (!args.style.empty()) {
        tuning.planner.style = *ParsePacingStyle(args.style);
    }

    AgentModel agent = MakeUniformAgent("runner", cfg::kParStat);
    if (!args.agentPath.empty() && !LoadAgentFromFile(agent, args.agentPath.c_str())) {
        return 2;
    }
    for (const auto& kv : args.statOverrides) {
        if (!ApplyStatOverride(agent, kv.first, kv.second)) {
            LOG_ERROR("Unknown stat '{}'", kv.first);
            return 2;
        }
    }
    if (args.energy >= 0.0f) {
        agent.energyCapacity = args.energy;
    }

    std::vector<RunRequest> requests;
    requests.reserve(static_cast<size_t>(args.runs));
    for (int i = 0; i < args.runs; ++i) {
        RunRequest req{};
        req.seed = args.seed + static_cast<uint32_t>(i);
        req.length = args.length;
        req.tier = args.tier;
        req.weights = ThemeWeights(args.theme);
        req.agent = agent;
        requests.push_back(req);
    }

    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();
    const std::vector<RunOutcome> outcomes = RunBatch(requests, tuning, args.threads);
    const float wallMs =
        std::chrono::duration<float, std::milli>(Clock::now() - wallStart).count();

    int completed = 0;
    for (const auto& out : outcomes) {
        if (out.status == PipelineStatus::Ok && out.result.completed) ++completed;
    }

    if (args.json) {
        nlohmann::json doc = {{"agent", AgentToJson(agent)},
                              {"style", PacingStyleName(tuning.planner.style)},
                              {"theme", CourseThemeName(args.theme)},
                              {"completed", completed},
                              {"wall_ms", wallMs}};
        nlohmann::json runs = nlohmann::json::array();
        for (const auto& out : outcomes) {
            runs.push_back(OutcomeToJson(out, args.detail));
        }
        doc["runs"] = runs;
        std::printf("%s\n", doc.dump(2).c_str());
    } else {
        for (size_t i = 0; i < outcomes.size(); ++i) {
            PrintOutcomeText(requests[i], outcomes[i], args.quiet || args.runs > 1);
        }
        if (args.runs > 1) {
            std::printf("completed %d / %d runs in %.2f ms\n", completed, args.runs, wallMs);
        }
    }

    Log::Shutdown();
    return (completed == args.runs) ? 0 : 1;
}
