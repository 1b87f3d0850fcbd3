#include <numeric>
#include <string>

// Local includes
#include "ssd_augmentation/bound_generator.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

BoundGenerator::BoundGenerator(const Config & config)
: config_(config)
{
  if (config_.sample_space.empty()) {
    throw ConfigError("BoundGenerator needs at least one bound pair");
  }

  for (const auto & bounds : config_.sample_space) {
    if (bounds.lower && bounds.upper && *bounds.lower > *bounds.upper) {
      throw ConfigError("Lower bound " + std::to_string(*bounds.lower) +
        " is greater than upper bound " + std::to_string(*bounds.upper));
    }
  }

  if (config_.weights.empty()) {
    return;
  }
  if (config_.weights.size() != config_.sample_space.size()) {
    throw ConfigError("Got " + std::to_string(config_.weights.size()) + " weights for " +
      std::to_string(config_.sample_space.size()) + " bound pairs");
  }
  for (double w : config_.weights) {
    if (w < 0.0) {
      throw ConfigError("Weights must be non-negative, got " + std::to_string(w));
    }
  }
  if (std::accumulate(config_.weights.begin(), config_.weights.end(), 0.0) <= 0.0) {
    throw ConfigError("At least one weight must be positive");
  }
}

BoundPair BoundGenerator::operator()(RandomEngine & rng) const
{
  size_t index = utils::sample_index(config_.sample_space.size(), config_.weights, rng);
  return config_.sample_space[index];
}

} // namespace ssd_augmentation
