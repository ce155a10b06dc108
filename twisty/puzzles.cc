#include "puzzles.h"

#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "base/logging.h"
#include "geometry.h"
#include "polyhedra.h"
#include "twisty-puzzle.h"

static constexpr double TAU = 2.0 * std::numbers::pi;

std::vector<CutDefinition> FaceCuts(const Polyhedron &poly, double depth,
                                    double rotation_angle,
                                    const std::vector<std::string> &names,
                                    int num_faces) {
  if (num_faces < 0) num_faces = (int)poly.faces.size();
  CHECK(num_faces <= (int)poly.faces.size());
  CHECK(names.empty() || (int)names.size() == num_faces);

  std::vector<CutDefinition> cuts;
  for (int i = 0; i < num_faces; i++) {
    const Plane plane = poly.faces[i].GetPlane().Offset(-depth);
    if (names.empty()) {
      cuts.push_back(CutDefinition::Unnamed(plane, rotation_angle));
    } else {
      cuts.push_back(CutDefinition::Named(names[i], plane, rotation_angle));
    }
  }
  return cuts;
}

std::vector<CutDefinition> VertexCuts(const Polyhedron &poly, double depth,
                                      double rotation_angle) {
  std::vector<CutDefinition> cuts;
  for (const vec3 &v : poly.vertices) {
    const Plane plane = Plane{.point = v, .normal = v}.Offset(-depth);
    cuts.push_back(CutDefinition::Unnamed(plane, rotation_angle));
  }
  return cuts;
}

TwistyPuzzle Rubiks3x3() {
  // Faces 1-4 go counterclockwise around the top.
  const Polyhedron cube = Cube();
  return TwistyPuzzle(cube, FaceCuts(cube, 0.33, TAU / 4.0,
                                     {"U", "F", "R", "B", "L", "D"}));
}

TwistyPuzzle Rubiks2x2() {
  const Polyhedron cube = Cube();
  return TwistyPuzzle(cube, FaceCuts(cube, 0.5, TAU / 4.0,
                                     {"U", "F", "R"}, 3));
}

TwistyPuzzle Pyraminx() {
  const Polyhedron tetra = Tetrahedron();
  return TwistyPuzzle(tetra, VertexCuts(tetra, 0.53, TAU / 3.0));
}

TwistyPuzzle Megaminx() {
  const Polyhedron dodeca = Dodecahedron();
  return TwistyPuzzle(dodeca, FaceCuts(dodeca, 0.33, TAU / 5.0));
}

TwistyPuzzle Starminx() {
  const Polyhedron dodeca = Dodecahedron();
  return TwistyPuzzle(dodeca, FaceCuts(dodeca, 0.75, TAU / 5.0));
}

TwistyPuzzle CompyCube() {
  const Polyhedron cube = Cube();
  return TwistyPuzzle(cube, VertexCuts(cube, 0.45, TAU / 3.0));
}

TwistyPuzzle Pentultimate() {
  // Every cut goes through the center.
  const Polyhedron dodeca = Dodecahedron();
  return TwistyPuzzle(dodeca, FaceCuts(dodeca, dodeca.inradius, TAU / 5.0));
}

TwistyPuzzle DinoStarminx() {
  const Polyhedron dodeca = Dodecahedron();
  return TwistyPuzzle(dodeca, VertexCuts(dodeca, 0.3, TAU / 3.0));
}

TwistyPuzzle SkewbDiamond() {
  // Faces 1-3 are the neighbors of face 0, so no two of these four
  // are opposite.
  const Polyhedron octa = Octahedron();
  return TwistyPuzzle(octa, FaceCuts(octa, 0.41, TAU / 3.0, {}, 4));
}

TwistyPuzzle EitansStar() {
  const Polyhedron icosa = Icosahedron();
  return TwistyPuzzle(icosa, FaceCuts(icosa, 0.29, TAU / 3.0));
}

namespace {
struct NamedPuzzle {
  const char *name;
  TwistyPuzzle (*make)();
};
}  // namespace

static constexpr NamedPuzzle NAMED_PUZZLES[] = {
  {"3x3", &Rubiks3x3},
  {"2x2", &Rubiks2x2},
  {"pyraminx", &Pyraminx},
  {"megaminx", &Megaminx},
  {"starminx", &Starminx},
  {"compy_cube", &CompyCube},
  {"pentultimate", &Pentultimate},
  {"dino_starminx", &DinoStarminx},
  {"skewb_diamond", &SkewbDiamond},
  {"eitans_star", &EitansStar},
};

std::vector<std::string> PuzzleNames() {
  std::vector<std::string> names;
  for (const NamedPuzzle &np : NAMED_PUZZLES) names.push_back(np.name);
  return names;
}

std::optional<TwistyPuzzle> PuzzleByName(std::string_view name) {
  for (const NamedPuzzle &np : NAMED_PUZZLES)
    if (name == np.name) return {np.make()};
  return std::nullopt;
}
