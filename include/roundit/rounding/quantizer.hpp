#ifndef ROUNDIT_ROUNDING_QUANTIZER_HPP_
#define ROUNDIT_ROUNDING_QUANTIZER_HPP_

#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"

namespace roundit {

/**
 * @brief Rounds values to a finite target precision.
 *
 * Used by stochastic rounding to model a finite precision accumulator: the
 * fractional parts and the random draws are passed through Quantize before
 * they are compared. Implementations are pure and elementwise; in and out
 * may alias.
 */
template <typename Dtype>
class Quantizer {
 public:
  virtual ~Quantizer() {}
  virtual void Quantize(const int n, const Dtype* in, Dtype* out,
                        const QuantizerParameter& param) const = 0;
};

/// @brief Keeps full working precision, whatever the requested format.
template <typename Dtype>
class IdentityQuantizer : public Quantizer<Dtype> {
 public:
  virtual void Quantize(const int n, const Dtype* in, Dtype* out,
                        const QuantizerParameter& param) const {
    if (in != out) {
      for (int i = 0; i < n; ++i) {
        out[i] = in[i];
      }
    }
  }
};

}  // namespace roundit

#endif  // ROUNDIT_ROUNDING_QUANTIZER_HPP_
