#ifndef _TWISTY_GEOMETRY_H
#define _TWISTY_GEOMETRY_H

#include <string>
#include <vector>

#include "yocto_matht.h"

using vec3 = yocto::vec<double, 3>;
using vec4 = yocto::vec<double, 4>;
using quat4 = yocto::quat<double, 4>;
using frame3 = yocto::frame<double, 3>;

// Points closer than this are considered the same point.
inline constexpr double POINT_EPSILON = 1.0e-8;

inline bool ApproxEqual(const vec3 &a, const vec3 &b,
                        double eps = POINT_EPSILON) {
  return distance_squared(a, b) < eps * eps;
}

inline quat4 QuatFromVec(const vec4 &q) {
  return quat4{.x = q.x, .y = q.y, .z = q.z, .w = q.w};
}

// Mean of the points, which must be nonempty.
vec3 Average(const std::vector<vec3> &pts);

// A line through point, parallel to direction. Only the line matters
// for intersection, not the sign or length of the direction.
struct Ray {
  vec3 point;
  vec3 direction;
};

// The normal does not need to be unit length.
struct Plane {
  vec3 point;
  vec3 normal;

  // Point where the line through the ray meets the plane. The ray
  // must not be parallel to the plane.
  vec3 Intersection(const Ray &ray) const;

  // The same plane, moved by the given (signed) distance along its
  // normal.
  Plane Offset(double distance) const;

  // Signed distance from the plane; positive on the side the normal
  // points to.
  double SignedDistance(const vec3 &v) const;
};

// Rigid rotation by angle (radians, right-handed) about the axis
// through the given point.
frame3 RotationAbout(const vec3 &axis, double angle,
                     const vec3 &axis_point = vec3{0.0, 0.0, 0.0});

// Rotation that takes the direction a to the direction b.
quat4 RotationFromAToB(const vec3 &a, const vec3 &b);

// Angle (radians) that rotates a to b about the axis, after
// projecting both onto the plane perpendicular to it.
double SignedAngleAbout(const vec3 &axis, const vec3 &a, const vec3 &b);

// Reflection through the plane containing the origin with the
// given normal.
frame3 ReflectionFrame(const vec3 &normal);

std::string VecString(const vec3 &v);
std::string FrameString(const frame3 &f);

#endif
