#pragma once
#include <cmath>

namespace cl3::core {

// A plain 3-component vector (x, y, z) in double precision.
// Used to spell out the vector-like blocks of a cliffor: the grade-1 part
// (a1, a2, a3) and the bivector read as its dual vector (a23, a31, a12).
struct Vec3 {
  double x, y, z;

  Vec3 operator+(const Vec3 &o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator-(const Vec3 &o) const { return {x - o.x, y - o.y, z - o.z}; }

  Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }

  double dot(const Vec3 &o) const { return x * o.x + y * o.y + z * o.z; }

  // Cross product; for cliffors this is the dual of the wedge u^v.
  Vec3 cross(const Vec3 &o) const {
    return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
  }

  double norm_sq() const { return x * x + y * y + z * z; }

  double norm() const { return std::sqrt(norm_sq()); }
};

} // namespace cl3::core
