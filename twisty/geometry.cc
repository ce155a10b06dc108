#include "geometry.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <vector>

#include "ansi.h"
#include "base/logging.h"
#include "base/stringprintf.h"
#include "yocto_matht.h"

vec3 Average(const std::vector<vec3> &pts) {
  CHECK(!pts.empty()) << "Average of no points.";
  vec3 sum{0.0, 0.0, 0.0};
  for (const vec3 &v : pts) sum += v;
  return sum / (double)pts.size();
}

vec3 Plane::Intersection(const Ray &ray) const {
  const double denom = dot(ray.direction, normal);
  CHECK(denom != 0.0) << "Ray is parallel to the plane: "
                      << VecString(ray.direction);
  const double t = dot(ray.point - point, normal) / denom;
  return ray.point - ray.direction * t;
}

Plane Plane::Offset(double distance) const {
  return Plane{.point = point + normalize(normal) * distance,
               .normal = normal};
}

double Plane::SignedDistance(const vec3 &v) const {
  return dot(v - point, normalize(normal));
}

frame3 RotationAbout(const vec3 &axis, double angle,
                     const vec3 &axis_point) {
  const frame3 rot =
    yocto::rotation_frame(yocto::rotation_quat(normalize(axis), angle));
  return yocto::translation_frame(axis_point) * rot *
    yocto::translation_frame(-axis_point);
}

quat4 RotationFromAToB(const vec3 &a, const vec3 &b) {
  vec3 norma = normalize(a);
  vec3 normb = normalize(b);
  double d = dot(norma, normb);
  vec3 axis = cross(norma, normb);
  if (length_squared(axis) < 1e-10) {
    if (d > 0) {
      return quat4{0, 0, 0, 1};
    } else {
      // Any perpendicular axis.
      vec3 perp_axis = orthogonal(norma);
      return QuatFromVec(yocto::rotation_quat(perp_axis, std::numbers::pi));
    }
  }

  double angle = std::acos(std::clamp(d, -1.0, 1.0));
  return QuatFromVec(yocto::rotation_quat(axis, angle));
}

double SignedAngleAbout(const vec3 &axis, const vec3 &a, const vec3 &b) {
  const vec3 n = normalize(axis);
  const vec3 pa = a - n * dot(a, n);
  const vec3 pb = b - n * dot(b, n);
  return std::atan2(dot(cross(pa, pb), n), dot(pa, pb));
}

frame3 ReflectionFrame(const vec3 &normal) {
  const vec3 n = normalize(normal);
  auto Col = [&n](const vec3 &e, double c) {
      return e - n * (2.0 * c);
    };
  return frame3{.x = Col(vec3{1.0, 0.0, 0.0}, n.x),
                .y = Col(vec3{0.0, 1.0, 0.0}, n.y),
                .z = Col(vec3{0.0, 0.0, 1.0}, n.z),
                .o = vec3{0.0, 0.0, 0.0}};
}

std::string VecString(const vec3 &v) {
  return StringPrintf(
      "(" ARED("%.4f") "," AGREEN("%.4f") "," ABLUE("%.4f") ")",
      v.x, v.y, v.z);
}

std::string FrameString(const frame3 &f) {
  return StringPrintf(
      "frame3{.x = vec3(%.17g, %.17g, %.17g),\n"
      "       .y = vec3(%.17g, %.17g, %.17g),\n"
      "       .z = vec3(%.17g, %.17g, %.17g),\n"
      "       .o = vec3(%.17g, %.17g, %.17g)}",
      f.x.x, f.x.y, f.x.z,
      f.y.x, f.y.y, f.y.z,
      f.z.x, f.z.y, f.z.z,
      f.o.x, f.o.y, f.o.z);
}
