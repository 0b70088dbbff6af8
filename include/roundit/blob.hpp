#ifndef ROUNDIT_BLOB_HPP_
#define ROUNDIT_BLOB_HPP_

#include <string>
#include <vector>

#include "roundit/common.hpp"

namespace roundit {

/**
 * @brief A contiguous N-d array of real values, the unit the rounding
 *        routines read from and write to.
 *
 * Any shape is allowed, including one with a zero extent, in which case
 * count() is 0.
 */
template <typename Dtype>
class Blob {
 public:
  Blob() : count_(0) {}
  explicit Blob(const vector<int>& shape);

  void Reshape(const vector<int>& shape);
  void ReshapeLike(const Blob& other);
  inline string shape_string() const {
    ostringstream stream;
    for (int i = 0; i < shape_.size(); ++i) {
      stream << shape_[i] << " ";
    }
    stream << "(" << count_ << ")";
    return stream.str();
  }
  inline const vector<int>& shape() const { return shape_; }
  inline int shape(int index) const {
    CHECK_GE(index, 0) << "axis " << index << " out of range";
    CHECK_LT(index, num_axes()) << "axis " << index << " out of range";
    return shape_[index];
  }
  inline int num_axes() const { return shape_.size(); }
  inline int count() const { return count_; }

  /// @brief Copy data from a source Blob, reshaping this one to match.
  void CopyFrom(const Blob<Dtype>& source);

  inline Dtype data_at(int index) const {
    CHECK_GE(index, 0);
    CHECK_LT(index, count_);
    return data_[index];
  }

  const Dtype* cpu_data() const;
  Dtype* mutable_cpu_data();

  bool ShapeEquals(const Blob<Dtype>& other) const {
    return shape_ == other.shape_;
  }

 protected:
  vector<Dtype> data_;
  vector<int> shape_;
  int count_;

  DISABLE_COPY_AND_ASSIGN(Blob);
};  // class Blob

}  // namespace roundit

#endif  // ROUNDIT_BLOB_HPP_
