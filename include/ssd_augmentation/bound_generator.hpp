#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <utility>
#include <vector>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

// Draws one overlap bound pair per call from a weighted discrete set
class BoundGenerator
{
public:
  struct Config
  {
    /**
     * @brief Candidate bound pairs
     */
    std::vector<BoundPair> sample_space;

    /**
     * @brief Relative weight of each candidate
     * @details Must be empty (uniform) or have one entry per candidate.
     * The weights do not need to sum to 1.
     */
    std::vector<double> weights;

    Config() = default;
    explicit Config(std::vector<BoundPair> space, std::vector<double> w = {})
    : sample_space(std::move(space)), weights(std::move(w)) {}
  };

  /**
   * @throws ConfigError if the sample space is empty, a pair is inverted or
   *         the weights do not match the sample space
   */
  explicit BoundGenerator(const Config & config);

  BoundPair operator()(RandomEngine & rng) const;

  const Config & config() const { return config_; }

private:
  Config config_;
};

} // namespace ssd_augmentation
