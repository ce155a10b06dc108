#ifndef _TWISTY_SYMMETRY_H
#define _TWISTY_SYMMETRY_H

#include <vector>

#include "bijection.h"
#include "geometry.h"
#include "polyhedra.h"

// A rigid motion of space (possibly a reflection) that maps the cut
// puzzle onto itself.
struct Symmetry {
  // Face i moves to the position of face face_map[i]. So a face map f
  // of the puzzle is carried to face_map.Apply(f).Apply(face_map.Invert()).
  Bijection face_map;
  // Turn t corresponds to turn turn_map[t] after the motion.
  Bijection turn_map;
  frame3 frame;
  bool reflection = false;
};

// Finds all of the polyhedron's rotations (and, optionally,
// reflections) that map the puzzle's faces onto faces and its turns
// onto turns. Faces are identified by their centers; turn_face_maps
// are the (pull-form) face maps of the turns, which the motion must
// permute by conjugation. The identity is always first. Symmetries
// with the same face map are only returned once.
std::vector<Symmetry> DiscoverSymmetries(
    const Polyhedron &poly,
    const std::vector<vec3> &face_centers,
    const std::vector<Bijection> &turn_face_maps,
    bool include_reflections);

// All rigid motions of the polyhedron itself: each face is taken to
// the top face in each of its p orientations, so there are
// faces * p rotations (doubled with reflections).
std::vector<frame3> PolyhedronMotions(const Polyhedron &poly,
                                      bool include_reflections);

#endif
