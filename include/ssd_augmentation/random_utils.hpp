#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <random>
#include <vector>


namespace ssd_augmentation
{
// Random source threaded through every stochastic call
using RandomEngine = std::mt19937;

namespace utils
{

// True with the given probability. Never draws for probability <= 0 or >= 1.
bool sample_bernoulli(double probability, RandomEngine & rng);

// Uniform real value in [lower, upper)
double sample_uniform(double lower, double upper, RandomEngine & rng);

// Uniform integer in [lower, upper], both inclusive
int sample_uniform_int(int lower, int upper, RandomEngine & rng);

// Index drawn according to weights; uniform over [0, count) if weights is empty
size_t sample_index(size_t count, const std::vector<double> & weights, RandomEngine & rng);

} // namespace utils

} // namespace ssd_augmentation
