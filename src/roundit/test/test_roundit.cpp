#include <cmath>
#include <vector>

#include "gtest/gtest.h"

#include "roundit/roundit.hpp"

#include "roundit/test/test_roundit_main.hpp"

namespace roundit {

template <typename Dtype>
class RoundItTest : public ::testing::Test {
 protected:
  RoundItTest() {
    vector<int> shape(2);
    shape[0] = 4;
    shape[1] = 5;
    x_.Reshape(shape);
    Dtype* data = x_.mutable_cpu_data();
    for (int i = 0; i < x_.count(); ++i) {
      data[i] = (Dtype(i) - 10) * Dtype(0.75);
    }
  }

  Blob<Dtype> x_;
  Blob<Dtype> y_;
};

TYPED_TEST_SUITE(RoundItTest, TestDtypes);

TYPED_TEST(RoundItTest, DefaultOptions) {
  RoundOptions options;
  RoundIt(this->x_, options, NULL, &this->y_);
  EXPECT_TRUE(this->y_.ShapeEquals(this->x_));
  for (int i = 0; i < this->x_.count(); ++i) {
    EXPECT_EQ(RoundNearestEven(this->x_.cpu_data()[i]),
              this->y_.cpu_data()[i]);
  }
}

TYPED_TEST(RoundItTest, EveryModeGivesIntegers) {
  RoundOptions options;
  BoostRandomSource rng(3);
  for (int mode = 1; mode <= 6; ++mode) {
    options.set_round(mode);
    RoundIt(this->x_, options, &rng, &this->y_);
    EXPECT_TRUE(this->y_.ShapeEquals(this->x_)) << "mode " << mode;
    for (int i = 0; i < this->y_.count(); ++i) {
      const TypeParam y = this->y_.cpu_data()[i];
      EXPECT_EQ(std::floor(y), y) << "mode " << mode;
      EXPECT_LE(std::fabs(y - this->x_.cpu_data()[i]), 1) << "mode " << mode;
    }
  }
}

TYPED_TEST(RoundItTest, RoundThenFlipIsReproducible) {
  RoundOptions options;
  options.set_round(5);
  options.set_flip(true);
  options.set_p(0.5);
  options.set_t(5);
  Blob<TypeParam> other;
  BoostRandomSource rng1(555);
  BoostRandomSource rng2(555);
  RoundIt(this->x_, options, &rng1, &this->y_);
  RoundIt(this->x_, options, &rng2, &other);
  for (int i = 0; i < this->y_.count(); ++i) {
    EXPECT_EQ(this->y_.cpu_data()[i], other.cpu_data()[i]);
    EXPECT_LT(std::fabs(this->y_.cpu_data()[i]), 32);
  }
}

TYPED_TEST(RoundItTest, FlipAfterRounding) {
  TypeParam in[] = {2.5, -1.25};
  FillBlob(vector<TypeParam>(in, in + 2), &this->x_);
  RoundOptions options;
  options.set_flip(true);
  options.set_p(0.3);
  options.set_t(3);
  ScriptedRandomSource rng;
  rng.PushUniform(0.3);
  rng.PushUniform(0.9);
  rng.PushUniformInt(2);
  RoundIt(this->x_, options, &rng, &this->y_);
  // 2.5 rounds to 2, then bit 1 is flipped
  EXPECT_EQ(0, this->y_.cpu_data()[0]);
  EXPECT_EQ(-1, this->y_.cpu_data()[1]);
}

TYPED_TEST(RoundItTest, AccumWithQuantizer) {
  RoundOptions options;
  options.set_round(6);
  options.set_accum("s");
  IdentityQuantizer<TypeParam> quantizer;
  BoostRandomSource rng(8);
  RoundIt(this->x_, options, &rng, &quantizer, &this->y_);
  for (int i = 0; i < this->y_.count(); ++i) {
    EXPECT_EQ(std::floor(this->y_.cpu_data()[i]), this->y_.cpu_data()[i]);
  }
}

TEST(RoundItDeathTest, InvalidModeWritesNothing) {
  RoundOptions options;
  options.set_round(7);
  Blob<float> x(vector<int>(1, 3));
  Blob<float> y;
  EXPECT_DEATH(RoundIt(x, options, NULL, &y), "Unsupported value of round");
  EXPECT_EQ(0, y.count());
}

TEST(RoundItDeathTest, FlipWithoutBitWidth) {
  RoundOptions options;
  options.set_flip(true);
  Blob<double> x(vector<int>(1, 3));
  Blob<double> y;
  BoostRandomSource rng(1);
  EXPECT_DEATH(RoundIt(x, options, &rng, &y), "Bit width t is required");
}

}  // namespace roundit
