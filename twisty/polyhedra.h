#ifndef _TWISTY_POLYHEDRA_H
#define _TWISTY_POLYHEDRA_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "geometry.h"
#include "yocto_matht.h"

struct Face {
  // Counter-clockwise when viewed from outside, so that the normal
  // below points out of the solid.
  std::vector<vec3> vertices;

  vec3 Center() const;

  // Plane through the center. The normal is the cross product of the
  // first two edges, so it is not unit length.
  Plane GetPlane() const;

  Face Transform(const frame3 &f) const;
};

// A convex regular polyhedron, with unit edge length and centered at
// the origin.
struct Polyhedron {
  std::vector<Face> faces;
  // Distinct vertices, in the order they were discovered.
  std::vector<vec3> vertices;
  // Distance from the center to each face.
  double inradius = 0.0;
  // Schläfli symbol {p, q}: faces are p-gons, q of them at each vertex.
  int p = 0, q = 0;
  std::string name;

  // Unfolds the solid from a single face by rotating faces about
  // their edges by the dihedral angle. Aborts if {p, q} is not one of
  // the five convex regular polyhedra.
  static Polyhedron Generate(int p, int q);

  // Same, but returns nullopt for invalid {p, q}.
  static std::optional<Polyhedron> Create(int p, int q);

  // Pairs (i, j), i < j, of faces with antiparallel normals.
  std::vector<std::pair<int, int>> OppositeFacePairs() const;
};

Polyhedron Tetrahedron();
Polyhedron Cube();
Polyhedron Octahedron();
Polyhedron Dodecahedron();
Polyhedron Icosahedron();

// "tetrahedron", "cube", etc.
std::optional<Polyhedron> PolyhedronByName(std::string_view name);

// True if every edge is shared by exactly two faces, which traverse
// it in opposite directions.
bool IsClosed(const Polyhedron &poly);

// Maximum distance of any face vertex from its face's plane.
double PlanarityError(const Polyhedron &poly);

#endif
