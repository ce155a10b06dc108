#include "polyhedra.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <deque>
#include <map>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "geometry.h"
#include "point-map.h"
#include "yocto_matht.h"

static constexpr bool VERBOSE = false;

vec3 Face::Center() const {
  return Average(vertices);
}

Plane Face::GetPlane() const {
  CHECK(vertices.size() >= 3);
  const vec3 &v0 = vertices[0];
  const vec3 &v1 = vertices[1];
  const vec3 &v2 = vertices[2];
  return Plane{.point = Center(), .normal = cross(v1 - v0, v2 - v1)};
}

Face Face::Transform(const frame3 &f) const {
  Face ret;
  ret.vertices.reserve(vertices.size());
  for (const vec3 &v : vertices)
    ret.vertices.push_back(transform_point(f, v));
  return ret;
}

static bool IsRegular(int p, int q) {
  return p >= 3 && q >= 3 && (p - 2) * (q - 2) < 4;
}

static const char *SolidName(int p, int q) {
  if (p == 3 && q == 3) return "tetrahedron";
  if (p == 4 && q == 3) return "cube";
  if (p == 3 && q == 4) return "octahedron";
  if (p == 5 && q == 3) return "dodecahedron";
  if (p == 3 && q == 5) return "icosahedron";
  return "";
}

std::optional<Polyhedron> Polyhedron::Create(int p, int q) {
  if (!IsRegular(p, q)) return std::nullopt;
  return {Generate(p, q)};
}

namespace {
// An edge of a face whose neighbor across that edge has not been
// generated yet.
struct OpenEdge {
  vec3 a, b;
  int face = 0;
};
}  // namespace

static bool SameEdge(const OpenEdge &e, const vec3 &a, const vec3 &b) {
  return (ApproxEqual(e.a, a) && ApproxEqual(e.b, b)) ||
    (ApproxEqual(e.a, b) && ApproxEqual(e.b, a));
}

Polyhedron Polyhedron::Generate(int p, int q) {
  CHECK(IsRegular(p, q)) << "{" << p << ", " << q << "} is not a "
    "convex regular polyhedron.";

  const double pi = std::numbers::pi;
  const double dihedral =
    2.0 * std::asin(std::cos(pi / q) / std::sin(pi / p));
  const double cosd = std::cos(dihedral);

  Polyhedron poly;
  poly.p = p;
  poly.q = q;
  poly.name = SolidName(p, q);
  poly.inradius = 1.0 / (2.0 * std::tan(pi / p)) *
    std::sqrt((1.0 - cosd) / (1.0 + cosd));

  // The first face is centered on the +z axis.
  const double circumradius = 0.5 / std::sin(pi / p);
  Face base;
  for (int i = 0; i < p; i++) {
    const double angle = 2.0 * pi * i / p;
    base.vertices.push_back(vec3{circumradius * std::cos(angle),
                                 circumradius * std::sin(angle),
                                 poly.inradius});
  }

  PointSet3 seen;
  auto AddVertices = [&](const Face &face) {
      for (const vec3 &v : face.vertices) {
        if (!seen.Contains(v)) {
          seen.Add(v);
          poly.vertices.push_back(v);
        }
      }
    };

  std::deque<OpenEdge> open;
  for (int i = 0; i < p; i++) {
    open.push_back(OpenEdge{.a = base.vertices[i],
                            .b = base.vertices[(i + 1) % p],
                            .face = 0});
  }
  AddVertices(base);
  poly.faces.push_back(std::move(base));

  while (!open.empty()) {
    const OpenEdge edge = open.front();
    open.pop_front();

    // Folding the face over its edge leaves the new face wound the
    // other way, so reverse it.
    const frame3 fold = RotationAbout(edge.a - edge.b, dihedral, edge.a);
    Face face = poly.faces[edge.face].Transform(fold);
    std::reverse(face.vertices.begin(), face.vertices.end());

    const int idx = (int)poly.faces.size();
    for (int i = 0; i < p; i++) {
      const vec3 &a = face.vertices[i];
      const vec3 &b = face.vertices[(i + 1) % p];
      if (SameEdge(edge, a, b)) continue;

      auto it = std::find_if(open.begin(), open.end(),
                             [&](const OpenEdge &e) {
                               return SameEdge(e, a, b);
                             });
      if (it != open.end()) {
        open.erase(it);
      } else {
        open.push_back(OpenEdge{.a = a, .b = b, .face = idx});
      }
    }

    AddVertices(face);
    poly.faces.push_back(std::move(face));

    // The largest has 20 faces; more means we are not closing up.
    CHECK(poly.faces.size() <= 20) << "Runaway generation for {"
                                   << p << ", " << q << "}";
  }

  if (VERBOSE) {
    printf("Generated %s: %d faces, %d vertices, inradius %.6f\n",
           poly.name.c_str(), (int)poly.faces.size(),
           (int)poly.vertices.size(), poly.inradius);
  }

  return poly;
}

std::vector<std::pair<int, int>> Polyhedron::OppositeFacePairs() const {
  std::vector<vec3> normals;
  normals.reserve(faces.size());
  for (const Face &f : faces) normals.push_back(normalize(f.GetPlane().normal));

  std::vector<std::pair<int, int>> pairs;
  for (int i = 0; i < (int)faces.size(); i++) {
    for (int j = i + 1; j < (int)faces.size(); j++) {
      if (length(cross(normals[i], normals[j])) < 1.0e-8 &&
          dot(normals[i], normals[j]) < 0.0) {
        pairs.emplace_back(i, j);
      }
    }
  }
  return pairs;
}

Polyhedron Tetrahedron() { return Polyhedron::Generate(3, 3); }
Polyhedron Cube() { return Polyhedron::Generate(4, 3); }
Polyhedron Octahedron() { return Polyhedron::Generate(3, 4); }
Polyhedron Dodecahedron() { return Polyhedron::Generate(5, 3); }
Polyhedron Icosahedron() { return Polyhedron::Generate(3, 5); }

std::optional<Polyhedron> PolyhedronByName(std::string_view name) {
  if (name == "tetrahedron") return {Tetrahedron()};
  if (name == "cube") return {Cube()};
  if (name == "octahedron") return {Octahedron()};
  if (name == "dodecahedron") return {Dodecahedron()};
  if (name == "icosahedron") return {Icosahedron()};
  return std::nullopt;
}

bool IsClosed(const Polyhedron &poly) {
  PointMap3<int> index;
  for (int i = 0; i < (int)poly.vertices.size(); i++)
    index.Add(poly.vertices[i], i);

  // Directed edge to count.
  std::map<std::pair<int, int>, int> edges;
  for (const Face &face : poly.faces) {
    const int n = (int)face.vertices.size();
    for (int i = 0; i < n; i++) {
      std::optional<int> a = index.Get(face.vertices[i]);
      std::optional<int> b = index.Get(face.vertices[(i + 1) % n]);
      if (!a.has_value() || !b.has_value()) return false;
      edges[std::make_pair(a.value(), b.value())]++;
    }
  }

  for (const auto &[e, count] : edges) {
    if (count != 1) return false;
    auto it = edges.find(std::make_pair(e.second, e.first));
    if (it == edges.end() || it->second != 1) return false;
  }
  return true;
}

double PlanarityError(const Polyhedron &poly) {
  double err = 0.0;
  for (const Face &face : poly.faces) {
    const Plane plane = face.GetPlane();
    for (const vec3 &v : face.vertices)
      err = std::max(err, std::abs(plane.SignedDistance(v)));
  }
  return err;
}
