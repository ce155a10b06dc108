#include "twisty-puzzle.h"

#include <cstdio>
#include <numbers>
#include <optional>
#include <string>
#include <vector>

#include "ansi.h"
#include "arcfour.h"
#include "base/logging.h"
#include "bijection.h"
#include "geometry.h"
#include "point-map.h"
#include "polyhedra.h"
#include "puzzles.h"
#include "timer.h"

static constexpr double TAU = 2.0 * std::numbers::pi;

static void CheckTurns(const TwistyPuzzle &puzzle, int order) {
  const PuzzleState solved = puzzle.InitialState();
  CHECK(puzzle.IsSolved(solved));
  CHECK(puzzle.NumSolvedPieces(solved) == puzzle.NumPieces());

  for (int t = 0; t < puzzle.NumTurns(); t++) {
    const Turn &turn = puzzle.Turns()[t];
    CHECK(turn.face_map.IsValid());
    CHECK(turn.face_map.Size() == puzzle.NumFaces());
    CHECK(!turn.face_map.IsIdentity()) << turn.name;

    const int inv = TwistyPuzzle::InvertedTurnIndex(t);
    CHECK(TwistyPuzzle::InvertedTurnIndex(inv) == t);
    CHECK(turn.face_map.IsInverseOf(puzzle.Turns()[inv].face_map));
    CHECK(puzzle.DerivedStateFromTurns(solved, {t, inv}) == solved);

    // Turning all the way around does nothing.
    std::vector<int> around(order, t);
    CHECK(puzzle.DerivedStateFromTurns(solved, around) == solved);
    around.pop_back();
    CHECK(puzzle.DerivedStateFromTurns(solved, around) != solved);

    // Only the turn's faces move.
    const PuzzleState after = puzzle.DerivedStateTurn(solved, t);
    for (int f = 0; f < puzzle.NumFaces(); f++) {
      if (!puzzle.Faces()[f].AffectedBy(t)) {
        CHECK(turn.face_map[f] == f);
        CHECK(after[f] == solved[f]);
      }
    }
  }
}

static void CheckSymmetries(const TwistyPuzzle &puzzle) {
  const std::vector<Symmetry> &syms = puzzle.Symmetries();
  CHECK(!syms.empty());
  CHECK(syms[0].face_map.IsIdentity());
  CHECK(syms[0].turn_map.IsIdentity());

  for (const Symmetry &sym : syms) {
    CHECK(sym.face_map.IsValid());
    CHECK(sym.turn_map.IsValid());
    const Bijection inv = sym.face_map.Invert();
    for (int t = 0; t < puzzle.NumTurns(); t++) {
      const Bijection image =
        sym.face_map.Apply(puzzle.Turns()[t].face_map).Apply(inv);
      CHECK(image == puzzle.Turns()[sym.turn_map[t]].face_map);
    }

    // Faces of the same color stay together.
    for (int i = 0; i < puzzle.NumFaces(); i++) {
      for (int j = 0; j < puzzle.NumFaces(); j++) {
        const bool same = puzzle.Faces()[i].color_index ==
          puzzle.Faces()[j].color_index;
        const bool same_after =
          puzzle.Faces()[sym.face_map[i]].color_index ==
          puzzle.Faces()[sym.face_map[j]].color_index;
        CHECK(same == same_after);
      }
    }
  }
}

static void CheckPieceTypes(const TwistyPuzzle &puzzle) {
  std::vector<int> seen(puzzle.NumPieces(), 0);
  int last_faces = 1 << 30;
  for (int t = 0; t < (int)puzzle.PieceTypes().size(); t++) {
    const PieceType &type = puzzle.PieceTypes()[t];
    CHECK(type.faces_per_piece <= last_faces);
    last_faces = type.faces_per_piece;
    CHECK(puzzle.NumPiecesOfType(t) == (int)type.pieces.size());
    for (int p : type.pieces) {
      seen[p]++;
      CHECK(puzzle.TypeOfPiece(p) == t);
      for (int f : puzzle.Pieces()[p]) {
        CHECK(type.face_mask[f]);
        CHECK(puzzle.PieceOfFace(f) == p);
      }
    }
  }
  for (int s : seen) CHECK(s == 1);
}

static void TestRubiks3x3() {
  Timer timer;
  const TwistyPuzzle puzzle = Rubiks3x3();
  printf("Built 3x3 in %s\n", ANSI::Time(timer.Seconds()).c_str());

  CHECK(puzzle.NumFaces() == 54) << puzzle.NumFaces();
  CHECK(puzzle.NumPieces() == 26) << puzzle.NumPieces();
  CHECK(puzzle.NumTurns() == 12);
  CHECK(puzzle.Turns()[0].name == "U");
  CHECK(puzzle.Turns()[1].name == "U'");
  CHECK(puzzle.Turns()[11].name == "D'");
  CHECK(puzzle.TurnIndexByName("F'").value() == 3);
  CHECK(!puzzle.TurnIndexByName("M").has_value());
  CHECK(puzzle.TurnsString({0, 3, 4}) == "U F' R");

  CheckTurns(puzzle, 4);
  CheckSymmetries(puzzle);
  CHECK(puzzle.Symmetries().size() == 48) << puzzle.Symmetries().size();

  CheckPieceTypes(puzzle);
  CHECK(puzzle.PieceTypes().size() == 3);
  CHECK(puzzle.PieceTypes()[0].faces_per_piece == 3);
  CHECK(puzzle.NumPiecesOfType(0) == 8);
  CHECK(puzzle.PieceTypes()[1].faces_per_piece == 2);
  CHECK(puzzle.NumPiecesOfType(1) == 12);
  CHECK(puzzle.NumPiecesOfType(2) == 6);
  for (const PieceType &type : puzzle.PieceTypes()) CHECK(type.movable);

  // A quarter turn moves four corners and four edges.
  const PuzzleState u = puzzle.DerivedStateTurn(puzzle.InitialState(), 0);
  CHECK(puzzle.NumSolvedPieces(u) == 18);
  CHECK(puzzle.NumSolvedPiecesOfType(u, 0) == 4);
  CHECK(puzzle.NumSolvedPiecesOfType(u, 1) == 8);
  CHECK(puzzle.NumSolvedPiecesOfType(u, 2) == 6);
}

static void TestRubiks2x2() {
  const TwistyPuzzle puzzle = Rubiks2x2();
  CHECK(puzzle.NumFaces() == 24) << puzzle.NumFaces();
  CHECK(puzzle.NumPieces() == 8);
  CHECK(puzzle.NumTurns() == 6);
  CheckTurns(puzzle, 4);
  CheckSymmetries(puzzle);
  // Turning the diagonal through the fixed corner, and mirroring
  // through planes that contain it.
  CHECK(puzzle.Symmetries().size() == 6) << puzzle.Symmetries().size();

  CheckPieceTypes(puzzle);
  int movable = 0;
  for (const PieceType &type : puzzle.PieceTypes()) {
    if (type.movable) {
      CHECK(type.pieces.size() == 7);
      movable++;
    } else {
      CHECK(type.pieces.size() == 1);
    }
  }
  CHECK(movable == 1);
}

static void TestPyraminx() {
  const TwistyPuzzle puzzle = Pyraminx();
  CHECK(puzzle.NumFaces() == 28) << puzzle.NumFaces();
  // Four corners, six edges, and the face centers, which never move.
  CHECK(puzzle.NumPieces() == 11) << puzzle.NumPieces();
  CHECK(puzzle.NumTurns() == 8);
  CHECK(puzzle.Turns()[0].name == "A");
  CHECK(puzzle.Turns()[7].name == "D'");
  CheckTurns(puzzle, 3);
  CheckSymmetries(puzzle);
  CHECK(puzzle.Symmetries().size() == 24) << puzzle.Symmetries().size();
  CheckPieceTypes(puzzle);
  CHECK(puzzle.PieceTypes().size() == 3);
  CHECK(!puzzle.PieceTypes()[0].movable);
  CHECK(puzzle.PieceTypes()[0].faces_per_piece == 4);
}

static void TestMegaminx() {
  const TwistyPuzzle puzzle = Megaminx();
  CHECK(puzzle.NumFaces() == 132) << puzzle.NumFaces();
  CHECK(puzzle.NumPieces() == 62) << puzzle.NumPieces();
  CHECK(puzzle.NumTurns() == 24);
  CheckTurns(puzzle, 5);
  CHECK(puzzle.Symmetries().size() == 120) << puzzle.Symmetries().size();
  CheckPieceTypes(puzzle);
}

static void TestPhysicalTurn() {
  const TwistyPuzzle puzzle = Rubiks3x3();
  const PuzzleState solved = puzzle.InitialState();

  PointSet3 centers;
  for (const PieceFace &pf : puzzle.Faces()) centers.Add(pf.face.Center());

  for (int t = 0; t < puzzle.NumTurns(); t++) {
    // A full turn lands faces on faces.
    for (const auto &[face, color_] :
           puzzle.PhysicallyTurnedFaces(t, solved, 1.0)) {
      CHECK(centers.Contains(face.Center()));
    }

    // Halfway, the moved faces are between positions.
    const auto half = puzzle.PhysicallyTurnedFaces(t, solved, 0.5);
    CHECK((int)half.size() == puzzle.NumFaces());
    for (int f = 0; f < puzzle.NumFaces(); f++) {
      CHECK(half[f].second == solved[f]);
      if (puzzle.Faces()[f].AffectedBy(t) &&
          puzzle.Pieces()[puzzle.PieceOfFace(f)].size() > 1) {
        CHECK(!centers.Contains(half[f].first.Center()));
      }
    }
  }

  // The turned geometry agrees with the derived state.
  const PuzzleState scrambled = puzzle.DerivedStateFromTurns(solved, {4, 2});
  const auto colored = puzzle.ColoredFaces(scrambled);
  CHECK((int)colored.size() == puzzle.NumFaces());
  for (int t = 0; t < puzzle.NumTurns(); t++) {
    const PuzzleState after = puzzle.DerivedStateTurn(scrambled, t);
    const auto turned = puzzle.PhysicallyTurnedFaces(t, scrambled, 1.0);
    const Bijection &fm = puzzle.Turns()[t].face_map;
    for (int j = 0; j < puzzle.NumFaces(); j++) {
      CHECK(colored[j].second == scrambled[j]);
      CHECK(ApproxEqual(turned[fm[j]].first.Center(),
                        colored[j].first.Center(), 1.0e-6));
      CHECK(turned[fm[j]].second == after[j]);
    }
  }

  // The named turn is clockwise looking down on U.
  const PhysicalTurn &u = puzzle.Turns()[0].physical;
  CHECK(u.angle < 0.0);
  CHECK(u.axis.z > 0.99);
}

static void TestScramble() {
  const TwistyPuzzle puzzle = Pyraminx();
  ArcFour rc1("scramble");
  ArcFour rc2("scramble");
  const PuzzleState a = puzzle.Scramble(&rc1, puzzle.InitialState(), 20);
  const PuzzleState b = puzzle.Scramble(&rc2, puzzle.InitialState(), 20);
  CHECK(a == b);
  CHECK(a.size() == puzzle.InitialState().size());

  ArcFour rc3("scramble");
  const std::vector<int> turns = puzzle.ScrambleTurns(&rc3, 20);
  CHECK(turns.size() == 20);
  for (int t : turns) CHECK(t >= 0 && t < puzzle.NumTurns());
  CHECK(puzzle.DerivedStateFromTurns(puzzle.InitialState(), turns) == a);

  // Colors are only permuted.
  std::vector<int> count(puzzle.Shape().faces.size(), 0);
  for (int c : a) count[c]++;
  for (int c : count) CHECK(c == 7);
}

static void TestClip() {
  const std::vector<vec3> square = {
    vec3{0, 0, 0}, vec3{1, 0, 0}, vec3{1, 1, 0}, vec3{0, 1, 0},
  };

  // A plane through the middle.
  const Plane mid{.point = vec3{0.5, 0, 0}, .normal = vec3{1, 0, 0}};
  const std::vector<vec3> right = ClipConvexPolygon(square, mid, true);
  CHECK(right.size() == 4);
  CHECK(ApproxEqual(Average(right), vec3{0.75, 0.5, 0}));
  const std::vector<vec3> left = ClipConvexPolygon(square, mid, false);
  CHECK(left.size() == 4);
  CHECK(ApproxEqual(Average(left), vec3{0.25, 0.5, 0}));

  // The right edge lies in this plane, but rounding error puts its
  // endpoints on different sides. It must not be split.
  const Plane edge{.point = vec3{1, 0, 0}, .normal = vec3{1, 1.0e-15, 0}};
  CHECK(edge.SignedDistance(square[1]) == 0.0);
  CHECK(edge.SignedDistance(square[2]) > 0.0);
  const std::vector<vec3> inside = ClipConvexPolygon(square, edge, false);
  CHECK(inside.size() == 4);
  CHECK(ApproxEqual(Average(inside), vec3{0.5, 0.5, 0}));
  CHECK(ClipConvexPolygon(square, edge, true).size() <= 2);

  // A vertex in the middle of an edge is dropped.
  const std::vector<vec3> extra = {
    vec3{0, 0, 0}, vec3{0.3, 0, 0}, vec3{1, 0, 0}, vec3{1, 1, 0},
    vec3{0, 1, 0},
  };
  const Plane away{.point = vec3{-1, 0, 0}, .normal = vec3{1, 0, 0}};
  const std::vector<vec3> clean = ClipConvexPolygon(extra, away, true);
  CHECK(clean.size() == 4);
  CHECK(ApproxEqual(Average(clean), vec3{0.5, 0.5, 0}));
}

// Opposite cuts through the center share a plane, so edges from the
// first cut lie exactly on the second cut's offset planes.
static void TestPentultimate() {
  const TwistyPuzzle puzzle = Pentultimate();
  CHECK(puzzle.NumFaces() == 72) << puzzle.NumFaces();
  CHECK(puzzle.NumPieces() == 32) << puzzle.NumPieces();
  CHECK(puzzle.NumTurns() == 24);
  CheckTurns(puzzle, 5);
  CheckPieceTypes(puzzle);

  const Polyhedron dodeca = Dodecahedron();
  CHECK(TwistyPuzzle::Create(
            dodeca, FaceCuts(dodeca, dodeca.inradius, TAU / 5.0)).has_value());
}

static void TestCreate() {
  const Polyhedron cube = Cube();
  // A fifth of a turn doesn't map the cube onto itself.
  std::optional<TwistyPuzzle> bad =
    TwistyPuzzle::Create(cube, FaceCuts(cube, 0.33, TAU / 5.0));
  CHECK(!bad.has_value());

  std::vector<CutDefinition> zero = {
    CutDefinition::Unnamed(Plane{.point = vec3{0, 0, 0},
                                 .normal = vec3{0, 0, 0}}, TAU / 4.0),
  };
  CHECK(!TwistyPuzzle::Create(cube, zero).has_value());

  std::optional<TwistyPuzzle> good =
    TwistyPuzzle::Create(cube, FaceCuts(cube, 0.33, TAU / 4.0));
  CHECK(good.has_value());
  CHECK(good.value().NumFaces() == 54);
  CHECK(good.value().Turns()[2].name == "B");

  // No cuts: the polyhedron itself, with nothing to turn.
  const TwistyPuzzle plain(cube, {});
  CHECK(plain.NumFaces() == 6);
  CHECK(plain.NumPieces() == 1);
  CHECK(plain.NumTurns() == 0);
}

int main(int argc, char **argv) {
  ANSI::Init();

  TestRubiks3x3();
  TestRubiks2x2();
  TestPyraminx();
  TestMegaminx();
  TestClip();
  TestPentultimate();
  TestPhysicalTurn();
  TestScramble();
  TestCreate();

  printf("OK\n");
  return 0;
}
