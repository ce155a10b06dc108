#ifndef _TWISTY_PUZZLES_H
#define _TWISTY_PUZZLES_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "polyhedra.h"
#include "twisty-puzzle.h"

// Cuts parallel to each face (or the first num_faces of them), moved
// inward by depth. Names may be empty for automatic naming.
std::vector<CutDefinition> FaceCuts(const Polyhedron &poly, double depth,
                                    double rotation_angle,
                                    const std::vector<std::string> &names = {},
                                    int num_faces = -1);

// Cuts perpendicular to the direction of each vertex, moved inward
// from the vertex by depth.
std::vector<CutDefinition> VertexCuts(const Polyhedron &poly, double depth,
                                      double rotation_angle);

// Well-known puzzles. Building one involves some computation.
TwistyPuzzle Rubiks3x3();
// Three cuts through the center, meeting at one corner; the
// opposite corner never moves.
TwistyPuzzle Rubiks2x2();
TwistyPuzzle Pyraminx();
TwistyPuzzle Megaminx();
TwistyPuzzle Starminx();
TwistyPuzzle CompyCube();
TwistyPuzzle Pentultimate();
TwistyPuzzle DinoStarminx();
TwistyPuzzle SkewbDiamond();
TwistyPuzzle EitansStar();

// Names accepted by PuzzleByName, like "3x3".
std::vector<std::string> PuzzleNames();
std::optional<TwistyPuzzle> PuzzleByName(std::string_view name);

#endif
