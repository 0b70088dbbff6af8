#ifndef ROUNDIT_ROUNDING_MATH_FUNCTIONS_HPP_
#define ROUNDIT_ROUNDING_MATH_FUNCTIONS_HPP_

#include <stdint.h>
#include <cmath>  // for std::fabs, std::floor and std::ceil

#include "glog/logging.h"

#include "roundit/common.hpp"
#include "roundit/rounding/round_options.hpp"

namespace roundit {

// sign(x), with sign(0) = 0.
template <typename Dtype>
inline Dtype Sign(Dtype data) {
  return static_cast<Dtype>((Dtype(0) < data) - (data < Dtype(0)));
}

// sign(x), with zero treated as positive.
template <typename Dtype>
inline Dtype SignNonZero(Dtype data) {
  return data < Dtype(0) ? Dtype(-1) : Dtype(1);
}

// Nearest integer, ties to the even neighbour.
template <typename Dtype>
Dtype RoundNearestEven(Dtype data);

template <typename Dtype>
inline Dtype RoundTowardPositive(Dtype data) {
  return std::ceil(data);
}

template <typename Dtype>
inline Dtype RoundTowardNegative(Dtype data) {
  return std::floor(data);
}

template <typename Dtype>
inline Dtype RoundTowardZero(Dtype data) {
  return data >= Dtype(0) ? std::floor(data) : std::ceil(data);
}

// Rounds a non-negative magnitude up when the draw does not exceed the
// threshold, down otherwise.
template <typename Dtype>
inline Dtype StochasticRounding(Dtype magnitude, Dtype threshold, Dtype draw) {
  return draw <= threshold ? std::ceil(magnitude) : std::floor(magnitude);
}

// Flips bit `bit` (0-indexed) of |data| and reapplies the sign of data,
// zero counting as positive.
template <typename Dtype>
Dtype FlipBit(Dtype data, int bit);

// Elementwise rounding with one of the deterministic modes (1 to 4).
template <typename Dtype>
void RoundDeterministic(const int n, const Dtype* x, Dtype* y,
                        const RoundMode mode);

}  // namespace roundit

#endif  // ROUNDIT_ROUNDING_MATH_FUNCTIONS_HPP_
