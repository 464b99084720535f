#pragma once

#include <stdexcept>
#include <string>

// Base for every fatal engine error. Exhausted runs are not errors and are
// reported through RunTimeline/RunResult instead.
class CourseError : public std::runtime_error {
public:
  explicit CourseError(const std::string &what) : std::runtime_error(what) {}
};

// No course satisfying the generation constraints was found within the
// retry bound. The caller may retry with a different seed.
class GenerationError : public CourseError {
public:
  GenerationError(const std::string &what, unsigned int seed, int attempts)
      : CourseError(what), seed_(seed), attempts_(attempts) {}

  unsigned int Seed() const { return seed_; }
  int Attempts() const { return attempts_; }

private:
  unsigned int seed_ = 0u;
  int attempts_ = 0;
};

// Missing or out-of-range agent stats; raised before planning starts.
class InvalidAgentModel : public CourseError {
public:
  using CourseError::CourseError;
};

// A grid of length zero reached the planner, simulator or scorer.
class EmptyCourseError : public CourseError {
public:
  EmptyCourseError() : CourseError("terrain grid has no cells") {}
};
