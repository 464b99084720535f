#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TerrainKind : int { Grass = 0, Water = 1, Rock = 2, Obstacle = 3 };
constexpr int kTerrainKindCount = 4;

enum class DifficultyTier : int {
  Beginner = 0,
  Intermediate = 1,
  Advanced = 2,
  Expert = 3
};
constexpr int kDifficultyTierCount = 4;

enum class LengthCategory : int { Short = 0, Medium = 1, Long = 2 };

struct TerrainCell {
  int index = 0;
  TerrainKind kind = TerrainKind::Grass;
  float costMultiplier = 1.0f;
  bool hazard = false;
  bool recovery = false; // only generated when recovery cells are enabled
};

struct TerrainGrid {
  std::vector<TerrainCell> cells;
  uint32_t seed = 0u;           // seed requested by the caller
  uint32_t generationSeed = 0u; // sub-seed of the accepted attempt
  int attempt = 0;
  DifficultyTier tier = DifficultyTier::Beginner;
  LengthCategory lengthCategory = LengthCategory::Short;

  int Length() const { return static_cast<int>(cells.size()); }
  bool Empty() const { return cells.empty(); }
};

// Relative weight per terrain kind, indexed by TerrainKind.
using TerrainWeights = std::array<float, kTerrainKindCount>;

// Per-kind cell counts, indexed by TerrainKind.
using TerrainCounts = std::array<int, kTerrainKindCount>;

inline int KindIndex(TerrainKind kind) { return static_cast<int>(kind); }
inline int TierIndex(DifficultyTier tier) { return static_cast<int>(tier); }

const char *TerrainKindName(TerrainKind kind);
const char *DifficultyTierName(DifficultyTier tier);
const char *LengthCategoryName(LengthCategory category);

std::optional<TerrainKind> ParseTerrainKind(const std::string &name);
std::optional<DifficultyTier> ParseDifficultyTier(const std::string &name);
std::optional<LengthCategory> ParseLengthCategory(const std::string &name);

TerrainCounts CountTerrain(const TerrainGrid &grid);

// Fraction of cells of the given kind; 0 for an empty grid.
float TerrainFraction(const TerrainGrid &grid, TerrainKind kind);

// Longest run of consecutive obstacle cells.
int LongestObstacleRun(const TerrainGrid &grid);

// Reachability over non-obstacle cells: an agent standing on a non-obstacle
// cell can cross at most `maxObstacleRun` obstacle cells to land on the next
// one. True when the last cell is reachable from the first.
bool IsCompletable(const TerrainGrid &grid, int maxObstacleRun);

// FNV-1a digest over every cell field, for replay verification.
uint64_t CourseFingerprint(const TerrainGrid &grid);

// Bit-identical comparison of two grids (cells, seed, tier, length category).
bool SameCourse(const TerrainGrid &a, const TerrainGrid &b);
