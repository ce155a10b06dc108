#include "symmetry.h"

#include <cstdio>
#include <unordered_set>
#include <vector>

#include "ansi.h"
#include "base/logging.h"
#include "bijection.h"
#include "geometry.h"
#include "point-map.h"
#include "polyhedra.h"
#include "yocto_matht.h"

// Every motion maps the vertices onto the vertices.
static void CheckMotions(const Polyhedron &poly, bool reflections,
                         int expected) {
  const std::vector<frame3> motions = PolyhedronMotions(poly, reflections);
  CHECK((int)motions.size() == expected)
    << poly.name << ": " << motions.size() << " vs " << expected;

  PointSet3 verts(1.0e-6);
  for (const vec3 &v : poly.vertices) verts.Add(v);

  for (const frame3 &f : motions) {
    for (const vec3 &v : poly.vertices) {
      CHECK(verts.Contains(transform_point(f, v)))
        << poly.name << " " << FrameString(f);
    }
  }
}

static void TestMotions() {
  CheckMotions(Tetrahedron(), false, 12);
  CheckMotions(Tetrahedron(), true, 24);
  CheckMotions(Cube(), false, 24);
  CheckMotions(Cube(), true, 48);
  CheckMotions(Octahedron(), false, 24);
  CheckMotions(Dodecahedron(), false, 60);
  CheckMotions(Icosahedron(), true, 120);
}

static void TestDiscover() {
  const Polyhedron cube = Cube();
  std::vector<vec3> centers;
  for (const Face &face : cube.faces) centers.push_back(face.Center());

  for (bool reflections : {false, true}) {
    const std::vector<Symmetry> syms =
      DiscoverSymmetries(cube, centers, {}, reflections);
    CHECK((int)syms.size() == (reflections ? 48 : 24)) << syms.size();
    CHECK(syms[0].face_map.IsIdentity());
    CHECK(!syms[0].reflection);

    // The face maps are distinct permutations, and the motion really
    // takes each face center to the face it claims.
    std::unordered_set<Bijection, BijectionHash> seen;
    int num_reflections = 0;
    for (const Symmetry &sym : syms) {
      CHECK(sym.face_map.IsValid());
      CHECK(!seen.contains(sym.face_map));
      seen.insert(sym.face_map);
      if (sym.reflection) num_reflections++;
      for (int i = 0; i < (int)centers.size(); i++) {
        CHECK(ApproxEqual(transform_point(sym.frame, centers[i]),
                          centers[sym.face_map[i]], 1.0e-6));
      }
    }
    CHECK(num_reflections == (reflections ? 24 : 0));
  }
}

int main(int argc, char **argv) {
  ANSI::Init();

  TestMotions();
  TestDiscover();

  printf("OK\n");
  return 0;
}
