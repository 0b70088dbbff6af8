#include <cmath>
#include <limits>
#include <vector>

#include "roundit/rounding/bit_flip_injector.hpp"
#include "roundit/rounding/math_functions.hpp"
#include "roundit/rounding/round_options.hpp"

namespace roundit {

template <typename Dtype>
BitFlipInjector<Dtype>::BitFlipInjector(const RoundOptions& options)
    : enabled_(options.flip()), p_(options.p()), t_(0), num_flipped_(0) {
  CheckRoundOptions(options);
  if (!enabled_) {
    return;
  }
  t_ = options.t();
  CHECK_LE(t_, std::numeric_limits<Dtype>::digits)
      << "Bit width t = " << t_ << " exceeds the "
      << std::numeric_limits<Dtype>::digits
      << " significand bits of the working type";
  LOG(INFO) << "Bit flip enabled: p = " << p_ << ", t = " << t_;
  if (p_ == 0.) {
    LOG(WARNING) << "Bit flip enabled with p = 0, no element will change";
  }
}

template <typename Dtype>
void BitFlipInjector<Dtype>::CheckMagnitudes(const int n,
                                             const Dtype* y) const {
  const Dtype limit = std::ldexp(Dtype(1), t_);
  for (int i = 0; i < n; ++i) {
    const Dtype magnitude = std::fabs(y[i]);
    CHECK_EQ(magnitude, std::floor(magnitude))
        << "Element " << i << " = " << y[i] << " is not an integer";
    CHECK_LT(magnitude, limit)
        << "Element " << i << " = " << y[i] << " does not fit in " << t_
        << " bits";
  }
}

template <typename Dtype>
void BitFlipInjector<Dtype>::Inject(Blob<Dtype>* y, RandomSource* rng) {
  CHECK(y != NULL);
  num_flipped_ = 0;
  if (!enabled_) {
    return;
  }
  const int n = y->count();
  if (n == 0) {
    return;
  }
  CHECK(rng != NULL) << "Bit flip needs a random source";
  Dtype* data = y->mutable_cpu_data();
  CheckMagnitudes(n, data);

  selected_.clear();
  for (int i = 0; i < n; ++i) {
    if (rng->Uniform() <= p_) {
      selected_.push_back(i);
    }
  }
  for (int j = 0; j < selected_.size(); ++j) {
    const int b = rng->UniformInt(1, t_ - 1);
    data[selected_[j]] = FlipBit(data[selected_[j]], b - 1);
  }
  num_flipped_ = selected_.size();
  VLOG(1) << "Flipped one bit in " << num_flipped_ << " of " << n
          << " elements";
}

INSTANTIATE_CLASS(BitFlipInjector);

}  // namespace roundit
