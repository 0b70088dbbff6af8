#ifndef ROUNDIT_ROUNDING_ROUND_OPTIONS_HPP_
#define ROUNDIT_ROUNDING_ROUND_OPTIONS_HPP_

#include "roundit/common.hpp"
#include "roundit/proto/roundit.pb.h"

namespace roundit {

enum RoundMode {
  ROUND_NEAREST_EVEN = 1,
  ROUND_TOWARD_POSITIVE = 2,
  ROUND_TOWARD_NEGATIVE = 3,
  ROUND_TOWARD_ZERO = 4,
  ROUND_STOCHASTIC_PROPORTIONAL = 5,
  ROUND_STOCHASTIC_EQUAL = 6
};

const char* RoundModeName(RoundMode mode);

inline bool IsStochastic(RoundMode mode) {
  return mode == ROUND_STOCHASTIC_PROPORTIONAL ||
         mode == ROUND_STOCHASTIC_EQUAL;
}

// Fails (CHECK) on an unsupported round value, p outside [0, 1], or flip
// without a bit width t >= 2.
void CheckRoundOptions(const RoundOptions& options);

// Mode selected by a validated options record.
RoundMode RoundModeFromOptions(const RoundOptions& options);

// Writes every defaulted field explicitly, so the record describes exactly
// what was applied.
void SetRoundDefaults(RoundOptions* options);

// Whether stochastic rounding accumulates to a finite precision.
inline bool HasAccum(const RoundOptions& options) {
  return options.has_accum() && !options.accum().empty();
}

// Builds the request handed to the Quantizer from accum and aparams.
QuantizerParameter AccumQuantizerParameter(const RoundOptions& options);

}  // namespace roundit

#endif  // ROUNDIT_ROUNDING_ROUND_OPTIONS_HPP_
