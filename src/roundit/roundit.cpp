#include "roundit/roundit.hpp"

namespace roundit {

template <typename Dtype>
void RoundIt(const Blob<Dtype>& x, const RoundOptions& options,
             RandomSource* rng, const Quantizer<Dtype>* quantizer,
             Blob<Dtype>* y) {
  CheckRoundOptions(options);
  RoundEngine<Dtype> engine(options, quantizer);
  BitFlipInjector<Dtype> injector(options);
  engine.Round(x, y, rng);
  injector.Inject(y, rng);
}

template void RoundIt<float>(const Blob<float>& x, const RoundOptions& options,
                             RandomSource* rng,
                             const Quantizer<float>* quantizer, Blob<float>* y);
template void RoundIt<double>(const Blob<double>& x,
                              const RoundOptions& options, RandomSource* rng,
                              const Quantizer<double>* quantizer,
                              Blob<double>* y);

}  // namespace roundit
