#ifndef ROUNDIT_ROUNDIT_HPP_
#define ROUNDIT_ROUNDIT_HPP_

#include "roundit/blob.hpp"
#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"
#include "roundit/rounding/bit_flip_injector.hpp"
#include "roundit/rounding/math_functions.hpp"
#include "roundit/rounding/quantizer.hpp"
#include "roundit/rounding/round_engine.hpp"
#include "roundit/rounding/round_options.hpp"
#include "roundit/util/io.hpp"
#include "roundit/util/rng.hpp"

namespace roundit {

/**
 * @brief Rounds x to integer entries according to options, then injects
 *        bit flips if options.flip() is set.
 *
 * The options are validated before anything is written to y or drawn from
 * rng. rng may be NULL when neither stochastic rounding nor bit flips are
 * requested; quantizer is only required when options.accum() is set.
 */
template <typename Dtype>
void RoundIt(const Blob<Dtype>& x, const RoundOptions& options,
             RandomSource* rng, const Quantizer<Dtype>* quantizer,
             Blob<Dtype>* y);

/// @brief Same as above, without a Quantizer.
template <typename Dtype>
inline void RoundIt(const Blob<Dtype>& x, const RoundOptions& options,
                    RandomSource* rng, Blob<Dtype>* y) {
  RoundIt<Dtype>(x, options, rng, NULL, y);
}

}  // namespace roundit

#endif  // ROUNDIT_ROUNDIT_HPP_
