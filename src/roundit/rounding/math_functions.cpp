#include "roundit/rounding/math_functions.hpp"
#include "roundit/common.hpp"
#include <cmath>   // floor, ceil, round, fmod

namespace roundit {

template <typename Dtype>
Dtype RoundNearestEven(Dtype data) {
  const Dtype magnitude = std::fabs(data);
  // std::round breaks ties away from zero. Halves whose floor is even are
  // moved down by one first, so that they land on the even neighbour.
  const bool even_tie = std::fmod(magnitude, Dtype(2)) == Dtype(0.5);
  Dtype u = std::round(magnitude - (even_tie ? Dtype(1) : Dtype(0)));
  // 0.5 - 1 rounds to -1.
  if (u == Dtype(-1)) {
    u = Dtype(0);
  }
  return Sign(data) * u;
}

template float RoundNearestEven<float>(float data);
template double RoundNearestEven<double>(double data);

template <typename Dtype>
Dtype FlipBit(Dtype data, int bit) {
  CHECK_GE(bit, 0);
  CHECK_LT(bit, 64);
  uint64_t u = static_cast<uint64_t>(std::fabs(data));
  u ^= (uint64_t(1) << bit);
  return SignNonZero(data) * static_cast<Dtype>(u);
}

template float FlipBit<float>(float data, int bit);
template double FlipBit<double>(double data, int bit);

template <typename Dtype>
void RoundDeterministic(const int n, const Dtype* x, Dtype* y,
                        const RoundMode mode) {
  Dtype (*round_fn)(Dtype) = NULL;
  switch (mode) {
  case ROUND_NEAREST_EVEN:
    round_fn = RoundNearestEven<Dtype>;
    break;
  case ROUND_TOWARD_POSITIVE:
    round_fn = RoundTowardPositive<Dtype>;
    break;
  case ROUND_TOWARD_NEGATIVE:
    round_fn = RoundTowardNegative<Dtype>;
    break;
  case ROUND_TOWARD_ZERO:
    round_fn = RoundTowardZero<Dtype>;
    break;
  case ROUND_STOCHASTIC_PROPORTIONAL:
  case ROUND_STOCHASTIC_EQUAL:
    LOG(FATAL) << RoundModeName(mode) << " rounding needs a random source";
    break;
  }
  CHECK(round_fn != NULL) << "Unknown rounding mode " << mode;
  for (int i = 0; i < n; ++i) {
    y[i] = round_fn(x[i]);
  }
}

template void RoundDeterministic<float>(const int n, const float* x, float* y,
                                        const RoundMode mode);
template void RoundDeterministic<double>(const int n, const double* x,
                                         double* y, const RoundMode mode);

}  // namespace roundit
