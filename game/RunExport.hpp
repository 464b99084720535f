#pragma once

#include <nlohmann/json.hpp>

#include "game/Pipeline.hpp"
#include "game/Scoring.hpp"
#include "sim/Planner.hpp"
#include "sim/Sim.hpp"
#include "sim/Terrain.hpp"

// JSON views of engine outputs for tools and callers that want a ready-made
// document. Field names follow the structs; this is not a save format.

nlohmann::json GridToJson(const TerrainGrid &grid);
nlohmann::json PlanToJson(const NavigationPlan &plan);
nlohmann::json TimelineToJson(const RunTimeline &timeline);
nlohmann::json ResultToJson(const RunResult &result);
nlohmann::json AgentToJson(const AgentModel &agent);

// Combined document. The grid, plan and timeline are included on request.
nlohmann::json OutcomeToJson(const RunOutcome &outcome, bool includeDetail);

// Hex string for a course fingerprint, e.g. "0x00ab...".
std::string FingerprintHex(uint64_t fingerprint);
