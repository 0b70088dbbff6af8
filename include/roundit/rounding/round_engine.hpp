#ifndef ROUNDIT_ROUNDING_ROUND_ENGINE_HPP_
#define ROUNDIT_ROUNDING_ROUND_ENGINE_HPP_

#include <vector>

#include "roundit/blob.hpp"
#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"
#include "roundit/rounding/quantizer.hpp"
#include "roundit/rounding/round_options.hpp"
#include "roundit/util/rng.hpp"

namespace roundit {

/**
 * @brief Rounds every element of a Blob to an integer, using the mode
 *        selected by RoundOptions::round.
 *
 * Modes 1 to 4 are deterministic. Modes 5 and 6 round the magnitude up or
 * down at random: mode 5 rounds up with probability equal to the
 * fractional part, mode 6 with probability 1/2. Exact integers are copied
 * through and never consume a draw; each other element consumes exactly
 * one RandomSource::Uniform() draw, in traversal order.
 *
 * When RoundOptions::accum is set, the fractional parts and the draws are
 * passed through the Quantizer before they are compared. A fraction the
 * Quantizer maps to 0 is rounded down without a draw.
 */
template <typename Dtype>
class RoundEngine {
 public:
  /// The quantizer is not owned and is only required when accum is set.
  explicit RoundEngine(const RoundOptions& options,
                       const Quantizer<Dtype>* quantizer = NULL);

  /// @brief Writes the rounded x into y, reshaped to x's shape.
  ///        rng may be NULL for the deterministic modes.
  void Round(const Blob<Dtype>& x, Blob<Dtype>* y, RandomSource* rng);

  inline RoundMode mode() const { return mode_; }
  /// Number of uniform draws made by the last call to Round.
  inline int num_draws() const { return num_draws_; }

 protected:
  void RoundStochastic(const int n, const Dtype* x, Dtype* y,
                       RandomSource* rng);

  RoundMode mode_;
  bool accum_;
  QuantizerParameter accum_param_;
  const Quantizer<Dtype>* quantizer_;
  int num_draws_;

  // scratch for the fractional parts, the indices that take part in the
  // draw, and the draws themselves
  vector<Dtype> frac_;
  vector<int> index_;
  vector<Dtype> draws_;

  DISABLE_COPY_AND_ASSIGN(RoundEngine);
};

}  // namespace roundit

#endif  // ROUNDIT_ROUNDING_ROUND_ENGINE_HPP_
