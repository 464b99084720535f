#include "sim/Terrain.hpp"

#include <algorithm>
#include <cstring>

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

void FnvMix(uint64_t &hash, const void *data, const size_t size) {
  const auto *bytes = static_cast<const unsigned char *>(data);
  for (size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= kFnvPrime;
  }
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
  });
  return s;
}

} // namespace

const char *TerrainKindName(const TerrainKind kind) {
  switch (kind) {
  case TerrainKind::Grass:
    return "grass";
  case TerrainKind::Water:
    return "water";
  case TerrainKind::Rock:
    return "rock";
  case TerrainKind::Obstacle:
    return "obstacle";
  }
  return "unknown";
}

const char *DifficultyTierName(const DifficultyTier tier) {
  switch (tier) {
  case DifficultyTier::Beginner:
    return "beginner";
  case DifficultyTier::Intermediate:
    return "intermediate";
  case DifficultyTier::Advanced:
    return "advanced";
  case DifficultyTier::Expert:
    return "expert";
  }
  return "unknown";
}

const char *LengthCategoryName(const LengthCategory category) {
  switch (category) {
  case LengthCategory::Short:
    return "short";
  case LengthCategory::Medium:
    return "medium";
  case LengthCategory::Long:
    return "long";
  }
  return "unknown";
}

std::optional<TerrainKind> ParseTerrainKind(const std::string &name) {
  const std::string s = Lower(name);
  if (s == "grass")
    return TerrainKind::Grass;
  if (s == "water")
    return TerrainKind::Water;
  if (s == "rock" || s == "rocks")
    return TerrainKind::Rock;
  if (s == "obstacle")
    return TerrainKind::Obstacle;
  return std::nullopt;
}

std::optional<DifficultyTier> ParseDifficultyTier(const std::string &name) {
  const std::string s = Lower(name);
  if (s == "beginner")
    return DifficultyTier::Beginner;
  if (s == "intermediate")
    return DifficultyTier::Intermediate;
  if (s == "advanced")
    return DifficultyTier::Advanced;
  if (s == "expert")
    return DifficultyTier::Expert;
  return std::nullopt;
}

std::optional<LengthCategory> ParseLengthCategory(const std::string &name) {
  const std::string s = Lower(name);
  if (s == "short")
    return LengthCategory::Short;
  if (s == "medium")
    return LengthCategory::Medium;
  if (s == "long")
    return LengthCategory::Long;
  return std::nullopt;
}

TerrainCounts CountTerrain(const TerrainGrid &grid) {
  TerrainCounts counts{};
  for (const auto &cell : grid.cells) {
    ++counts[KindIndex(cell.kind)];
  }
  return counts;
}

float TerrainFraction(const TerrainGrid &grid, const TerrainKind kind) {
  if (grid.Empty()) {
    return 0.0f;
  }
  const TerrainCounts counts = CountTerrain(grid);
  return static_cast<float>(counts[KindIndex(kind)]) /
         static_cast<float>(grid.Length());
}

int LongestObstacleRun(const TerrainGrid &grid) {
  int longest = 0;
  int run = 0;
  for (const auto &cell : grid.cells) {
    if (cell.kind == TerrainKind::Obstacle) {
      longest = std::max(longest, ++run);
    } else {
      run = 0;
    }
  }
  return longest;
}

bool IsCompletable(const TerrainGrid &grid, const int maxObstacleRun) {
  if (grid.Empty()) {
    return false;
  }
  const int n = grid.Length();
  if (grid.cells.front().kind == TerrainKind::Obstacle ||
      grid.cells.back().kind == TerrainKind::Obstacle) {
    return false;
  }

  // Forward sweep; reach marks the furthest index an agent can land on.
  int reach = 0;
  for (int i = 0; i < n && i <= reach; ++i) {
    if (grid.cells[i].kind == TerrainKind::Obstacle) {
      continue;
    }
    reach = std::max(reach, std::min(n - 1, i + maxObstacleRun + 1));
    if (reach == n - 1) {
      // Landing cell must itself be walkable; the last cell always is here.
      return true;
    }
  }
  return false;
}

uint64_t CourseFingerprint(const TerrainGrid &grid) {
  uint64_t hash = kFnvOffset;
  FnvMix(hash, &grid.seed, sizeof(grid.seed));
  const int tier = TierIndex(grid.tier);
  const int category = static_cast<int>(grid.lengthCategory);
  FnvMix(hash, &tier, sizeof(tier));
  FnvMix(hash, &category, sizeof(category));
  for (const auto &cell : grid.cells) {
    const int kind = KindIndex(cell.kind);
    const unsigned char flags = static_cast<unsigned char>(
        (cell.hazard ? 1u : 0u) | (cell.recovery ? 2u : 0u));
    FnvMix(hash, &cell.index, sizeof(cell.index));
    FnvMix(hash, &kind, sizeof(kind));
    FnvMix(hash, &cell.costMultiplier, sizeof(cell.costMultiplier));
    FnvMix(hash, &flags, sizeof(flags));
  }
  return hash;
}

bool SameCourse(const TerrainGrid &a, const TerrainGrid &b) {
  if (a.seed != b.seed || a.generationSeed != b.generationSeed ||
      a.tier != b.tier || a.lengthCategory != b.lengthCategory ||
      a.cells.size() != b.cells.size()) {
    return false;
  }
  for (size_t i = 0; i < a.cells.size(); ++i) {
    const auto &ca = a.cells[i];
    const auto &cb = b.cells[i];
    if (ca.index != cb.index || ca.kind != cb.kind || ca.hazard != cb.hazard ||
        ca.recovery != cb.recovery ||
        std::memcmp(&ca.costMultiplier, &cb.costMultiplier,
                    sizeof(float)) != 0) {
      return false;
    }
  }
  return true;
}
