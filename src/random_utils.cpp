// Local includes
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

namespace utils
{

bool sample_bernoulli(double probability, RandomEngine & rng)
{
  if (probability <= 0.0) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }
  std::bernoulli_distribution coin(probability);
  return coin(rng);
}

double sample_uniform(double lower, double upper, RandomEngine & rng)
{
  if (lower >= upper) {
    return lower;
  }
  std::uniform_real_distribution<double> dist(lower, upper);
  return dist(rng);
}

int sample_uniform_int(int lower, int upper, RandomEngine & rng)
{
  if (lower >= upper) {
    return lower;
  }
  std::uniform_int_distribution<int> dist(lower, upper);
  return dist(rng);
}

size_t sample_index(size_t count, const std::vector<double> & weights, RandomEngine & rng)
{
  if (weights.empty()) {
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(rng);
  }
  std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
  return dist(rng);
}

} // namespace utils

} // namespace ssd_augmentation
