#include <vector>

#include "gtest/gtest.h"

#include "roundit/blob.hpp"
#include "roundit/common.hpp"

#include "roundit/test/test_roundit_main.hpp"

namespace roundit {

template <typename Dtype>
class BlobSimpleTest : public ::testing::Test {
 protected:
  BlobSimpleTest() {
    vector<int> shape(4);
    shape[0] = 2;
    shape[1] = 3;
    shape[2] = 4;
    shape[3] = 5;
    blob_preshaped_.Reshape(shape);
  }

  Blob<Dtype> blob_;
  Blob<Dtype> blob_preshaped_;
};

TYPED_TEST_SUITE(BlobSimpleTest, TestDtypes);

TYPED_TEST(BlobSimpleTest, TestInitialization) {
  EXPECT_EQ(0, this->blob_.count());
  EXPECT_EQ(0, this->blob_.num_axes());
  EXPECT_TRUE(this->blob_.cpu_data() == NULL);
  EXPECT_EQ(4, this->blob_preshaped_.num_axes());
  EXPECT_EQ(2, this->blob_preshaped_.shape(0));
  EXPECT_EQ(5, this->blob_preshaped_.shape(3));
  EXPECT_EQ(120, this->blob_preshaped_.count());
  EXPECT_EQ("2 3 4 5 (120)", this->blob_preshaped_.shape_string());
}

TYPED_TEST(BlobSimpleTest, TestZeroExtent) {
  vector<int> shape(3, 4);
  shape[1] = 0;
  this->blob_.Reshape(shape);
  EXPECT_EQ(3, this->blob_.num_axes());
  EXPECT_EQ(0, this->blob_.count());
  EXPECT_TRUE(this->blob_.cpu_data() == NULL);
}

TYPED_TEST(BlobSimpleTest, TestCopyFrom) {
  TypeParam* data = this->blob_preshaped_.mutable_cpu_data();
  for (int i = 0; i < this->blob_preshaped_.count(); ++i) {
    data[i] = TypeParam(i) / 8;
  }
  this->blob_.CopyFrom(this->blob_preshaped_);
  EXPECT_TRUE(this->blob_.ShapeEquals(this->blob_preshaped_));
  for (int i = 0; i < this->blob_.count(); ++i) {
    EXPECT_EQ(TypeParam(i) / 8, this->blob_.data_at(i));
  }
}

TYPED_TEST(BlobSimpleTest, TestReshapeLike) {
  this->blob_.ReshapeLike(this->blob_preshaped_);
  EXPECT_EQ(this->blob_preshaped_.shape(), this->blob_.shape());
  EXPECT_EQ(120, this->blob_.count());
}

}  // namespace roundit
