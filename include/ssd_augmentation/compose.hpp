#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <functional>
#include <vector>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

// Ordered list of augmentation stages applied as one
class Compose
{
public:
  // A stage maps a sample to a new sample. It must not modify its input.
  using Stage = std::function<Sample(const Sample &, RandomEngine &)>;

  Compose() = default;
  explicit Compose(std::vector<Stage> stages);

  // Append a stage at the end of the sequence
  Compose & add(Stage stage);

  /**
   * @brief Thread a sample through every stage in order
   * @param sample Input image and labels
   * @param rng Random source shared by all stages
   * @return Output of the last stage, or the input if there are no stages
   */
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

  size_t size() const { return stages_.size(); }

private:
  std::vector<Stage> stages_;
};

} // namespace ssd_augmentation
