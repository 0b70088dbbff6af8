#include <climits>
#include <vector>

#include "roundit/blob.hpp"
#include "roundit/common.hpp"

namespace roundit {

template <typename Dtype>
Blob<Dtype>::Blob(const vector<int>& shape) : count_(0) {
  Reshape(shape);
}

template <typename Dtype>
void Blob<Dtype>::Reshape(const vector<int>& shape) {
  count_ = 1;
  shape_.resize(shape.size());
  for (int i = 0; i < shape.size(); ++i) {
    CHECK_GE(shape[i], 0);
    if (count_ != 0) {
      CHECK_LE(shape[i], INT_MAX / count_) << "blob size exceeds INT_MAX";
    }
    count_ *= shape[i];
    shape_[i] = shape[i];
  }
  data_.resize(count_);
}

template <typename Dtype>
void Blob<Dtype>::ReshapeLike(const Blob<Dtype>& other) {
  Reshape(other.shape());
}

template <typename Dtype>
const Dtype* Blob<Dtype>::cpu_data() const {
  return data_.empty() ? NULL : &data_[0];
}

template <typename Dtype>
Dtype* Blob<Dtype>::mutable_cpu_data() {
  return data_.empty() ? NULL : &data_[0];
}

template <typename Dtype>
void Blob<Dtype>::CopyFrom(const Blob& source) {
  if (this == &source) {
    return;
  }
  ReshapeLike(source);
  data_.assign(source.data_.begin(), source.data_.end());
}

INSTANTIATE_CLASS(Blob);

}  // namespace roundit
