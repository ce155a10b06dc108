#include "symmetry.h"

#include <cmath>
#include <cstdio>
#include <numbers>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "base/logging.h"
#include "bijection.h"
#include "geometry.h"
#include "point-map.h"
#include "polyhedra.h"
#include "yocto_matht.h"

static constexpr bool VERBOSE = false;

std::vector<frame3> PolyhedronMotions(const Polyhedron &poly,
                                      bool include_reflections) {
  CHECK(!poly.faces.empty());
  const Face &top = poly.faces[0];
  const vec3 top_center = top.Center();
  const vec3 top_axis = normalize(top_center);
  const vec3 top_vertex = top.vertices[0];

  std::vector<frame3> rots;
  for (const Face &face : poly.faces) {
    // Bring the face's center to the top...
    const frame3 to_top =
      yocto::rotation_frame(RotationFromAToB(face.Center(), top_center));
    // ... and then its first vertex to the top face's first vertex.
    const vec3 moved = transform_point(to_top, face.vertices[0]);
    const double angle = SignedAngleAbout(top_axis,
                                          moved - top_center,
                                          top_vertex - top_center);
    const frame3 align = RotationAbout(top_axis, angle) * to_top;

    for (int k = 0; k < poly.p; k++) {
      const double spin = 2.0 * std::numbers::pi * k / poly.p;
      rots.push_back(RotationAbout(top_axis, spin) * align);
    }
  }

  if (include_reflections) {
    // The mirror plane contains the top face's center and first
    // vertex, so it maps the top face to itself.
    const frame3 mirror = ReflectionFrame(cross(top_axis, top_vertex));
    const int num = (int)rots.size();
    for (int i = 0; i < num; i++) rots.push_back(mirror * rots[i]);
  }

  return rots;
}

std::vector<Symmetry> DiscoverSymmetries(
    const Polyhedron &poly,
    const std::vector<vec3> &face_centers,
    const std::vector<Bijection> &turn_face_maps,
    bool include_reflections) {
  const int num_faces = (int)face_centers.size();
  const int num_turns = (int)turn_face_maps.size();

  PointMap3<int> center_index;
  for (int i = 0; i < num_faces; i++) center_index.Add(face_centers[i], i);

  // Turns by face map. Several turns may share a face map.
  std::unordered_map<Bijection, std::vector<int>, BijectionHash> turn_index;
  for (int t = 0; t < num_turns; t++) turn_index[turn_face_maps[t]].push_back(t);

  const std::vector<frame3> motions =
    PolyhedronMotions(poly, include_reflections);
  const int num_rotations = include_reflections ?
    (int)motions.size() / 2 : (int)motions.size();

  std::vector<Symmetry> out;
  std::unordered_set<Bijection, BijectionHash> seen;
  for (int m = 0; m < (int)motions.size(); m++) {
    const frame3 &frame = motions[m];

    std::vector<int> fm(num_faces);
    bool ok = true;
    for (int i = 0; i < num_faces && ok; i++) {
      std::optional<int> j =
        center_index.Get(transform_point(frame, face_centers[i]));
      if (j.has_value()) {
        fm[i] = j.value();
      } else {
        ok = false;
      }
    }
    if (!ok) continue;
    Bijection face_map(std::move(fm));
    if (!face_map.IsValid()) continue;
    if (seen.contains(face_map)) continue;

    const Bijection inv = face_map.Invert();
    std::vector<int> tm(num_turns, -1);
    std::vector<bool> used(num_turns, false);
    for (int t = 0; t < num_turns && ok; t++) {
      const Bijection image = face_map.Apply(turn_face_maps[t]).Apply(inv);
      auto it = turn_index.find(image);
      if (it == turn_index.end()) {
        ok = false;
        break;
      }
      // Prefer t itself, so that the identity maps each turn to
      // itself even when turns share a face map.
      int pick = -1;
      for (int u : it->second) {
        if (u == t && !used[u]) pick = u;
      }
      for (int u : it->second) {
        if (pick < 0 && !used[u]) pick = u;
      }
      if (pick < 0) {
        ok = false;
        break;
      }
      used[pick] = true;
      tm[t] = pick;
    }
    if (!ok) continue;

    seen.insert(face_map);
    out.push_back(Symmetry{.face_map = std::move(face_map),
                           .turn_map = Bijection(std::move(tm)),
                           .frame = frame,
                           .reflection = m >= num_rotations});
  }

  CHECK(!out.empty() && out[0].face_map.IsIdentity()) <<
    "The identity should always be a symmetry.";

  if (VERBOSE) {
    printf("%d of %d motions are symmetries.\n",
           (int)out.size(), (int)motions.size());
  }

  return out;
}
