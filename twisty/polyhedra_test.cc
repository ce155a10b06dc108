#include "polyhedra.h"

#include <cmath>
#include <cstdio>
#include <numbers>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ansi.h"
#include "base/logging.h"
#include "base/stringprintf.h"
#include "geometry.h"
#include "yocto_matht.h"

#define CHECK_NEAR(f, g) do {                                           \
  const double fv = (f);                                                \
  const double gv = (g);                                                \
  const double e = std::abs(fv - gv);                                   \
  CHECK(e < 0.0000001) << "Expected " << #f << " and " << #g <<         \
    " to be close, but got: " <<                                        \
    StringPrintf("%.17g and %.17g, with err %.17g", fv, gv, e);         \
  } while (0)

static void CheckSolid(const Polyhedron &poly, int num_faces,
                       int num_vertices, int num_opposite) {
  CHECK((int)poly.faces.size() == num_faces) << poly.name << ": "
                                             << poly.faces.size();
  CHECK((int)poly.vertices.size() == num_vertices) << poly.name << ": "
                                                   << poly.vertices.size();
  CHECK(IsClosed(poly)) << poly.name;
  CHECK(PlanarityError(poly) < 1.0e-10) << poly.name;

  for (const Face &face : poly.faces) {
    CHECK((int)face.vertices.size() == poly.p);
    for (int i = 0; i < poly.p; i++) {
      const vec3 &a = face.vertices[i];
      const vec3 &b = face.vertices[(i + 1) % poly.p];
      CHECK_NEAR(length(a - b), 1.0);
    }

    // Normals point outward and every face is at the inradius.
    const Plane plane = face.GetPlane();
    CHECK(dot(plane.normal, plane.point) > 0.0) << poly.name;
    CHECK_NEAR(length(plane.point), poly.inradius);
    CHECK_NEAR(plane.SignedDistance(vec3{0, 0, 0}), -poly.inradius);
  }

  // All vertices on the circumscribed sphere.
  const double r = length(poly.vertices[0]);
  for (const vec3 &v : poly.vertices) CHECK_NEAR(length(v), r);

  CHECK((int)poly.OppositeFacePairs().size() == num_opposite) << poly.name;
  for (const auto &[i, j] : poly.OppositeFacePairs()) {
    CHECK(i < j);
    CHECK_NEAR(length(poly.faces[i].Center() + poly.faces[j].Center()), 0.0);
  }
}

static void TestSolids() {
  CheckSolid(Tetrahedron(), 4, 4, 0);
  CheckSolid(Cube(), 6, 8, 3);
  CheckSolid(Octahedron(), 8, 6, 4);
  CheckSolid(Dodecahedron(), 12, 20, 6);
  CheckSolid(Icosahedron(), 20, 12, 10);
}

static void TestInradius() {
  CHECK_NEAR(Cube().inradius, 0.5);
  CHECK_NEAR(Tetrahedron().inradius, 1.0 / (2.0 * std::sqrt(6.0)));
  CHECK_NEAR(Octahedron().inradius, 1.0 / std::sqrt(6.0));
  // The first face is the one on top.
  const Polyhedron cube = Cube();
  const vec3 top = normalize(cube.faces[0].GetPlane().normal);
  CHECK_NEAR(top.z, 1.0);
}

static void TestCreate() {
  CHECK(!Polyhedron::Create(3, 6).has_value());
  CHECK(!Polyhedron::Create(6, 3).has_value());
  CHECK(!Polyhedron::Create(2, 5).has_value());
  CHECK(!Polyhedron::Create(4, 4).has_value());
  std::optional<Polyhedron> d = Polyhedron::Create(5, 3);
  CHECK(d.has_value());
  CHECK(d.value().name == "dodecahedron");

  CHECK(PolyhedronByName("icosahedron").has_value());
  CHECK(!PolyhedronByName("rhombicosidodecahedron").has_value());
}

int main(int argc, char **argv) {
  ANSI::Init();

  TestSolids();
  TestInradius();
  TestCreate();

  printf("OK\n");
  return 0;
}
