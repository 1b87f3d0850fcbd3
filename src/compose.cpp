#include <utility>

// Local includes
#include "ssd_augmentation/compose.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

Compose::Compose(std::vector<Stage> stages)
{
  for (auto & stage : stages) {
    add(std::move(stage));
  }
}

Compose & Compose::add(Stage stage)
{
  if (!stage) {
    throw ConfigError("Cannot add an empty stage to a Compose");
  }
  stages_.push_back(std::move(stage));
  return *this;
}

Sample Compose::operator()(const Sample & sample, RandomEngine & rng) const
{
  Sample current = sample;
  for (const auto & stage : stages_) {
    current = stage(current, rng);
  }
  return current;
}

} // namespace ssd_augmentation
