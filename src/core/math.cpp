#include "core/math.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>

namespace optray {

Mat3::Mat3() : val_{} {}


Mat3::Mat3(const double* data) : val_{} {
  std::memcpy(val_, data, sizeof(val_));
}


Mat3 Mat3::Identity() {
  const double data[9]{
    1, 0, 0,  //
    0, 1, 0,  //
    0, 0, 1,  //
  };
  return Mat3{ data };
}


double Mat3::operator()(int r, int c) const {
  return val_[r * 3 + c];
}


double& Mat3::operator()(int r, int c) {
  return val_[r * 3 + c];
}


const double* Mat3::val() const {
  return val_;
}


Mat3 Mat3::operator*(const Mat3& other) const {
  Mat3 res;
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 3; j++) {
      double s = 0;
      for (int k = 0; k < 3; k++) {
        s += (*this)(i, k) * other(k, j);
      }
      res(i, j) = s;
    }
  }
  return res;
}


double Mat3::Det() const {
  const double* m = val_;
  return m[0] * (m[4] * m[8] - m[5] * m[7]) -  //
         m[1] * (m[3] * m[8] - m[5] * m[6]) +  //
         m[2] * (m[3] * m[7] - m[4] * m[6]);
}


Mat3 Mat3::Inverse() const {
  double det = Det();
  if (FloatEqualZero(det, 1e-15) || !std::isfinite(det)) {
    throw std::domain_error("matrix is singular!");
  }

  const double* m = val_;
  const double adj[9]{
    m[4] * m[8] - m[5] * m[7], m[2] * m[7] - m[1] * m[8], m[1] * m[5] - m[2] * m[4],  //
    m[5] * m[6] - m[3] * m[8], m[0] * m[8] - m[2] * m[6], m[2] * m[3] - m[0] * m[5],  //
    m[3] * m[7] - m[4] * m[6], m[1] * m[6] - m[0] * m[7], m[0] * m[4] - m[1] * m[3],  //
  };

  Mat3 res;
  for (int i = 0; i < 9; i++) {
    res.val_[i] = adj[i] / det;
  }
  return res;
}


void Mat3::Apply(const double* xy, double* xy_out) const {
  double x = xy[0];
  double y = xy[1];
  xy_out[0] = val_[0] * x + val_[1] * y + val_[2];
  xy_out[1] = val_[3] * x + val_[4] * y + val_[5];
}


Mat3 MakeLocalTransform(double theta, double px, double py) {
  using std::cos;
  using std::sin;

  const double r[9]{
    cos(theta), -sin(theta), 0,  //
    sin(theta), cos(theta),  0,  //
    0,          0,           1,  //
  };
  const double t[9]{
    1, 0, -px,  //
    0, 1, -py,  //
    0, 0, 1,    //
  };
  return Mat3{ r } * Mat3{ t };
}


bool FloatEqual(double a, double b, double threshold) {
  return std::abs(a - b) < threshold;
}


bool FloatEqualZero(double a, double threshold) {
  return a > -threshold && a < threshold;
}


bool MatrixEqual(const Mat3& a, const Mat3& b, double threshold) {
  for (int i = 0; i < 9; i++) {
    if (!FloatEqual(a.val()[i], b.val()[i], threshold)) {
      return false;
    }
  }
  return true;
}


double AngleWrap(double angle) {
  double res = std::remainder(angle, math::k2Pi);  // [-pi, pi]
  if (res <= -math::kPi) {
    res += math::k2Pi;
  }
  return res;
}


double ToRad(double angle, AngleUnit unit) {
  return unit == AngleUnit::kDegree ? angle * math::kDegreeToRad : angle;
}


RandomNumberGenerator::RandomNumberGenerator(uint32_t seed)
    : seed_(seed), generator_(seed), uniform_dist_(0.0, 1.0) {}


double RandomNumberGenerator::GetUniform() {
  return uniform_dist_(generator_);
}


void RandomNumberGenerator::Reset() {
  generator_.seed(seed_);
  uniform_dist_.reset();
}


void RandomNumberGenerator::SetSeed(uint32_t seed) {
  seed_ = seed;
  Reset();
}

}  // namespace optray
