#ifndef _TWISTY_TWISTY_PUZZLE_H
#define _TWISTY_TWISTY_PUZZLE_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arcfour.h"
#include "bijection.h"
#include "geometry.h"
#include "polyhedra.h"
#include "symmetry.h"

// For each face of the puzzle, the color index (i.e., which face of
// the original polyhedron) currently showing there.
using PuzzleState = std::vector<int>;

// A plane that cuts the polyhedron, and the angle that the part on
// the normal's side of it can be turned by.
struct CutDefinition {
  // If absent, turns are named A, B, C, ... in order.
  std::optional<std::string> name;
  Plane plane;
  double rotation_angle = 0.0;

  static CutDefinition Named(std::string name, const Plane &plane,
                             double rotation_angle) {
    return CutDefinition{.name = {std::move(name)}, .plane = plane,
                         .rotation_angle = rotation_angle};
  }

  static CutDefinition Unnamed(const Plane &plane, double rotation_angle) {
    return CutDefinition{.name = std::nullopt, .plane = plane,
                         .rotation_angle = rotation_angle};
  }
};

// A polygon on the puzzle's surface after cutting.
struct PieceFace {
  Face face;
  // The polyhedron face it came from, which is its solved color.
  int color_index = 0;
  // Turns that move this face, ascending.
  std::vector<int> affecting_turns;

  bool AffectedBy(int turn) const;
};

// How a turn looks in space, for animation.
struct PhysicalTurn {
  // Unit length.
  vec3 axis;
  vec3 axis_point;
  // Radians, right-handed about the axis.
  double angle = 0.0;

  // Rotation by the fraction interp of the full angle.
  frame3 Frame(double interp = 1.0) const;
};

struct Turn {
  std::string name;
  // Pull form; the state after the turn is DerivedState(state, face_map).
  Bijection face_map;
  PhysicalTurn physical;
};

// Pieces that can reach each other's positions (corners, edges,
// centers, ...).
struct PieceType {
  std::vector<int> pieces;
  // Over faces; true for the faces of these pieces.
  std::vector<bool> face_mask;
  int faces_per_piece = 0;
  // False if no turn moves these pieces.
  bool movable = false;
};

// Clips the convex polygon to the closed half-space on the normal's
// side of the plane (or the other side, if keep_above is false).
// Vertices within POINT_EPSILON of the plane count as on it. Repeated
// and collinear vertices are removed, so the result may have fewer
// than three vertices.
std::vector<vec3> ClipConvexPolygon(const std::vector<vec3> &poly,
                                    const Plane &plane,
                                    bool keep_above);

struct TwistyPuzzle {
  // Half the gap between the two sides of a cut.
  static constexpr double CUT_PLANE_THICKNESS = 0.005;

  // Cuts the polyhedron with the planes. Each cut gives two turns:
  // the named one (clockwise when looking at the cut from the side
  // the normal points to) at an even index, then its inverse, with
  // a trailing ', at the next odd index. Aborts if a turn does not
  // map faces onto faces.
  TwistyPuzzle(const Polyhedron &poly, const std::vector<CutDefinition> &cuts,
               bool with_reflections = true);

  // Like the constructor, but returns nullopt when the cuts do not
  // make a consistent puzzle.
  static std::optional<TwistyPuzzle> Create(
      const Polyhedron &poly, const std::vector<CutDefinition> &cuts,
      bool with_reflections = true);

  const Polyhedron &Shape() const { return shape; }
  const std::vector<PieceFace> &Faces() const { return faces; }
  // Each piece is a list of face indices, ascending.
  const std::vector<std::vector<int>> &Pieces() const { return pieces; }
  const std::vector<Turn> &Turns() const { return turns; }
  // The identity is first.
  const std::vector<Symmetry> &Symmetries() const { return symmetries; }
  // In descending order of faces per piece.
  const std::vector<PieceType> &PieceTypes() const { return piece_types; }

  int NumFaces() const { return (int)faces.size(); }
  int NumPieces() const { return (int)pieces.size(); }
  int NumTurns() const { return (int)turns.size(); }
  int PieceOfFace(int face) const { return piece_of_face[face]; }
  int TypeOfPiece(int piece) const { return type_of_piece[piece]; }

  PuzzleState InitialState() const;
  bool IsSolved(const PuzzleState &state) const;

  // A piece is solved if each of its faces shows its own color.
  bool PieceSolved(const PuzzleState &state, int piece) const;
  int NumSolvedPieces(const PuzzleState &state) const;
  int NumPiecesOfType(int type) const;
  int NumSolvedPiecesOfType(const PuzzleState &state, int type) const;

  static PuzzleState DerivedState(const PuzzleState &state,
                                  const Bijection &face_map);
  PuzzleState DerivedStateTurn(const PuzzleState &state, int turn) const;
  PuzzleState DerivedStateFromTurns(const PuzzleState &state,
                                    const std::vector<int> &turns) const;

  static int InvertedTurnIndex(int turn) { return turn ^ 1; }
  std::optional<int> TurnIndexByName(std::string_view name) const;
  // Like "U F' R".
  std::string TurnsString(const std::vector<int> &turns) const;

  std::vector<int> ScrambleTurns(ArcFour *rc, int num_turns) const;
  PuzzleState Scramble(ArcFour *rc, const PuzzleState &state,
                       int num_turns) const;

  // The faces' geometry, paired with the color showing on each.
  std::vector<std::pair<Face, int>> ColoredFaces(const PuzzleState &state) const;

  // As ColoredFaces, but with the faces that the turn moves rotated by
  // the fraction interp of the turn.
  std::vector<std::pair<Face, int>> PhysicallyTurnedFaces(
      int turn, const PuzzleState &state, double interp) const;

 private:
  TwistyPuzzle() {}
  bool Init(const Polyhedron &poly, const std::vector<CutDefinition> &cuts,
            bool with_reflections, std::string *error);
  void ComputePieceTypes();

  Polyhedron shape;
  std::vector<PieceFace> faces;
  std::vector<std::vector<int>> pieces;
  std::vector<int> piece_of_face;
  std::vector<Turn> turns;
  std::vector<Symmetry> symmetries;
  std::vector<PieceType> piece_types;
  std::vector<int> type_of_piece;
};

#endif
