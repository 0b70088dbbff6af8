#include <cmath>
#include <vector>

#include "roundit/rounding/math_functions.hpp"
#include "roundit/rounding/round_engine.hpp"

namespace roundit {

template <typename Dtype>
RoundEngine<Dtype>::RoundEngine(const RoundOptions& options,
                                const Quantizer<Dtype>* quantizer)
    : mode_(RoundModeFromOptions(options)),
      accum_(HasAccum(options)),
      quantizer_(quantizer),
      num_draws_(0) {
  if (accum_ && IsStochastic(mode_)) {
    CHECK(quantizer_ != NULL)
        << "accum '" << options.accum() << "' requires a Quantizer";
    accum_param_ = AccumQuantizerParameter(options);
    LOG(INFO) << "Rounding " << RoundModeName(mode_)
              << ", accumulating to format '" << accum_param_.format()
              << "' with " << accum_param_.params_size() << " params";
  } else {
    LOG(INFO) << "Rounding " << RoundModeName(mode_);
  }
}

template <typename Dtype>
void RoundEngine<Dtype>::Round(const Blob<Dtype>& x, Blob<Dtype>* y,
                               RandomSource* rng) {
  CHECK(y != NULL);
  CHECK_NE(&x, y) << "Round does not work in place";
  y->ReshapeLike(x);
  num_draws_ = 0;
  const int n = x.count();
  if (n == 0) {
    return;
  }
  if (IsStochastic(mode_)) {
    CHECK(rng != NULL) << RoundModeName(mode_)
                       << " rounding needs a random source";
    RoundStochastic(n, x.cpu_data(), y->mutable_cpu_data(), rng);
    VLOG(1) << "Stochastic rounding of " << x.shape_string() << " drew "
            << num_draws_ << " samples";
  } else {
    RoundDeterministic(n, x.cpu_data(), y->mutable_cpu_data(), mode_);
  }
}

template <typename Dtype>
void RoundEngine<Dtype>::RoundStochastic(const int n, const Dtype* x,
                                         Dtype* y, RandomSource* rng) {
  frac_.resize(n);
  for (int i = 0; i < n; ++i) {
    y[i] = std::fabs(x[i]);
    frac_[i] = y[i] - std::floor(y[i]);
  }
  if (accum_) {
    quantizer_->Quantize(n, &frac_[0], &frac_[0], accum_param_);
  }

  index_.clear();
  for (int i = 0; i < n; ++i) {
    if (frac_[i] != Dtype(0)) {
      index_.push_back(i);
    }
  }
  if (index_.empty()) {
    for (int i = 0; i < n; ++i) {
      y[i] = accum_ ? SignNonZero(x[i]) * std::floor(y[i]) : x[i];
    }
    return;
  }

  const int k = index_.size();
  draws_.resize(k);
  for (int j = 0; j < k; ++j) {
    draws_[j] = static_cast<Dtype>(rng->Uniform());
  }
  num_draws_ = k;
  if (accum_) {
    quantizer_->Quantize(k, &draws_[0], &draws_[0], accum_param_);
  }

  // Everything outside index_ has an integer magnitude, unless the
  // Quantizer flushed its fraction to 0.
  for (int i = 0; i < n; ++i) {
    y[i] = std::floor(y[i]);
  }
  for (int j = 0; j < k; ++j) {
    const int i = index_[j];
    const Dtype threshold = mode_ == ROUND_STOCHASTIC_PROPORTIONAL
                                ? frac_[i]
                                : Dtype(0.5);
    y[i] = StochasticRounding(std::fabs(x[i]), threshold, draws_[j]);
  }
  for (int i = 0; i < n; ++i) {
    y[i] *= SignNonZero(x[i]);
  }
}

INSTANTIATE_CLASS(RoundEngine);

}  // namespace roundit
