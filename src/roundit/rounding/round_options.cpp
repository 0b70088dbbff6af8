#include "roundit/rounding/round_options.hpp"

namespace roundit {

const char* RoundModeName(RoundMode mode) {
  switch (mode) {
  case ROUND_NEAREST_EVEN:
    return "nearest-even";
  case ROUND_TOWARD_POSITIVE:
    return "toward-positive";
  case ROUND_TOWARD_NEGATIVE:
    return "toward-negative";
  case ROUND_TOWARD_ZERO:
    return "toward-zero";
  case ROUND_STOCHASTIC_PROPORTIONAL:
    return "stochastic-proportional";
  case ROUND_STOCHASTIC_EQUAL:
    return "stochastic-equal";
  }
  return "unknown";
}

void CheckRoundOptions(const RoundOptions& options) {
  CHECK_GE(options.round(), ROUND_NEAREST_EVEN)
      << "Unsupported value of round: " << options.round();
  CHECK_LE(options.round(), ROUND_STOCHASTIC_EQUAL)
      << "Unsupported value of round: " << options.round();
  CHECK(options.p() >= 0. && options.p() <= 1.)
      << "Flip probability p must lie in [0, 1], got " << options.p();
  if (options.flip()) {
    CHECK(options.has_t()) << "Bit width t is required when flip is set";
    CHECK_GE(options.t(), 2)
        << "Bit width t must leave at least one bit to flip";
  }
}

RoundMode RoundModeFromOptions(const RoundOptions& options) {
  CheckRoundOptions(options);
  return static_cast<RoundMode>(options.round());
}

void SetRoundDefaults(RoundOptions* options) {
  options->set_round(options->round());
  options->set_flip(options->flip());
  options->set_p(options->p());
  if (!options->has_accum()) {
    options->set_accum("");
  }
}

QuantizerParameter AccumQuantizerParameter(const RoundOptions& options) {
  QuantizerParameter param;
  param.set_format(options.accum());
  for (int i = 0; i < options.aparams_size(); ++i) {
    param.add_params(options.aparams(i));
  }
  return param;
}

}  // namespace roundit
