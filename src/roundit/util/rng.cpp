#include <boost/random/uniform_01.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include "roundit/util/rng.hpp"

namespace roundit {

BoostRandomSource::BoostRandomSource(seed_type seed) : rng_(seed) {}

double BoostRandomSource::Uniform() {
  boost::uniform_01<double> dist;
  double r;
  // uniform_01 may return exactly 0; a probability of 0 must never select.
  do {
    r = dist(rng_);
  } while (r == 0.);
  return r;
}

int BoostRandomSource::UniformInt(int low, int high) {
  CHECK_LE(low, high) << "empty integer range [" << low << ", " << high << "]";
  boost::random::uniform_int_distribution<int> dist(low, high);
  return dist(rng_);
}

}  // namespace roundit
