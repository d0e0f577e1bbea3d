#ifndef SRC_CORE_MATH_H_
#define SRC_CORE_MATH_H_

#include <cstddef>
#include <cstdint>
#include <random>

namespace optray {

namespace math {

constexpr double kPi = 3.14159265358979323846;
constexpr double kPi_2 = kPi / 2.0;
constexpr double kPi_3 = kPi / 3.0;
constexpr double kPi_4 = kPi / 4.0;
constexpr double k2Pi = kPi * 2.0;
constexpr double kDoubleEps = 1e-9;
constexpr double kDegreeToRad = kPi / 180.0;

}  // namespace math


enum class AngleUnit {
  kDegree,
  kRad,
};


/**
 * @brief 3x3 matrix in row-major order, used for 2D homogeneous transforms.
 */
class Mat3 {
 public:
  Mat3();
  explicit Mat3(const double* data);

  static Mat3 Identity();

  double operator()(int r, int c) const;
  double& operator()(int r, int c);
  const double* val() const;

  Mat3 operator*(const Mat3& other) const;

  double Det() const;

  /**
   * @brief Exact inverse by adjugate over determinant.
   *
   * @throw std::domain_error if the matrix is singular.
   */
  Mat3 Inverse() const;

  /**
   * @brief Apply to a 2D point in homogeneous form [x, y, 1].
   *
   * @param xy     [input] point. [x, y]
   * @param xy_out [output] transformed point. [x, y]. May alias xy.
   */
  void Apply(const double* xy, double* xy_out) const;

 private:
  double val_[9];
};


/**
 * @brief Build the transform from global coordinates into an element's local frame.
 *
 * H = R * T, where T translates by (-px, -py) and R rotates by theta:
 * ~~~
 *     | cos  -sin  0 |       | 1  0  -px |
 * R = | sin   cos  0 |,  T = | 0  1  -py |
 *     |  0     0   1 |       | 0  0   1  |
 * ~~~
 *
 * @param theta orientation of the element, in rad.
 * @param px    element position x, global.
 * @param py    element position y, global.
 */
Mat3 MakeLocalTransform(double theta, double px, double py);

bool FloatEqual(double a, double b, double threshold = math::kDoubleEps);
bool FloatEqualZero(double a, double threshold = math::kDoubleEps);
bool MatrixEqual(const Mat3& a, const Mat3& b, double threshold = math::kDoubleEps);

/**
 * @brief Wrap an angle into (-pi, pi]. NaN is passed through.
 */
double AngleWrap(double angle);

double ToRad(double angle, AngleUnit unit);


class RandomNumberGenerator {
 public:
  explicit RandomNumberGenerator(uint32_t seed = kDefaultRandomSeed);

  double GetUniform();
  void Reset();
  void SetSeed(uint32_t seed);

 private:
  uint32_t seed_;
  std::mt19937 generator_;
  std::uniform_real_distribution<double> uniform_dist_;

  static constexpr uint32_t kDefaultRandomSeed = 1;
};

}  // namespace optray

#endif  // SRC_CORE_MATH_H_
