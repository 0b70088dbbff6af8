#ifndef ROUNDIT_ROUNDING_BIT_FLIP_INJECTOR_HPP_
#define ROUNDIT_ROUNDING_BIT_FLIP_INJECTOR_HPP_

#include <vector>

#include "roundit/blob.hpp"
#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"
#include "roundit/util/rng.hpp"

namespace roundit {

/**
 * @brief Emulates single bit faults in integer significands.
 *
 * Each element is selected independently with probability p. A selected
 * element has one bit of its magnitude flipped, the bit position being
 * uniform over bits 0 to t-2 (bit positions 1 to t-1, counted from one).
 * The element keeps its sign, zero counting as positive.
 *
 * Draw order: one Uniform() per element in traversal order, then one
 * UniformInt(1, t-1) per selected element in traversal order.
 *
 * Every magnitude must fit in t bits. This is checked for the whole Blob
 * before anything is drawn or written.
 */
template <typename Dtype>
class BitFlipInjector {
 public:
  explicit BitFlipInjector(const RoundOptions& options);

  /// @brief Perturbs y in place. A no-op when flip is not set.
  void Inject(Blob<Dtype>* y, RandomSource* rng);

  inline bool enabled() const { return enabled_; }
  /// Number of elements perturbed by the last call to Inject.
  inline int num_flipped() const { return num_flipped_; }

 protected:
  void CheckMagnitudes(const int n, const Dtype* y) const;

  bool enabled_;
  double p_;
  int t_;
  int num_flipped_;
  vector<int> selected_;

  DISABLE_COPY_AND_ASSIGN(BitFlipInjector);
};

}  // namespace roundit

#endif  // ROUNDIT_ROUNDING_BIT_FLIP_INJECTOR_HPP_
