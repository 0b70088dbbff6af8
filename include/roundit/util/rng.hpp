#ifndef ROUNDIT_RNG_HPP_
#define ROUNDIT_RNG_HPP_

#include <boost/random/mersenne_twister.hpp>

#include "roundit/common.hpp"

namespace roundit {

typedef boost::mt19937 rng_t;

/**
 * @brief Source of the random draws consumed by stochastic rounding and
 *        bit-flip injection.
 *
 * Every draw advances the stream, so a fixed seed and a fixed traversal
 * order reproduce the same result.
 */
class RandomSource {
 public:
  virtual ~RandomSource() {}
  /// @brief A uniform sample in the open interval (0, 1).
  virtual double Uniform() = 0;
  /// @brief A uniform integer in [low, high], both ends included.
  virtual int UniformInt(int low, int high) = 0;
};

/// @brief RandomSource backed by a seeded Mersenne twister.
class BoostRandomSource : public RandomSource {
 public:
  explicit BoostRandomSource(seed_type seed);

  virtual double Uniform();
  virtual int UniformInt(int low, int high);

  rng_t* generator() { return &rng_; }

 private:
  rng_t rng_;

  DISABLE_COPY_AND_ASSIGN(BoostRandomSource);
};

}  // namespace roundit

#endif  // ROUNDIT_RNG_HPP_
