#include "twisty-puzzle.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arcfour.h"
#include "base/logging.h"
#include "base/stringprintf.h"
#include "bijection.h"
#include "geometry.h"
#include "point-map.h"
#include "polyhedra.h"
#include "randutil.h"
#include "symmetry.h"
#include "util.h"
#include "yocto_matht.h"

static constexpr bool VERBOSE = false;

bool PieceFace::AffectedBy(int turn) const {
  return std::find(affecting_turns.begin(), affecting_turns.end(), turn) !=
    affecting_turns.end();
}

frame3 PhysicalTurn::Frame(double interp) const {
  return RotationAbout(axis, angle * interp, axis_point);
}

namespace {
// Polygon under construction, dropping vertices that coincide with
// the previous one.
struct VertexList {
  void Add(const vec3 &v) {
    if (!vertices.empty() && ApproxEqual(vertices.back(), v)) return;
    vertices.push_back(v);
  }

  // Also drops vertices in the middle of a straight edge, so that the
  // average of the vertices only depends on the polygon's shape.
  std::vector<vec3> Finish() {
    if (vertices.size() > 1 && ApproxEqual(vertices.back(), vertices[0]))
      vertices.pop_back();
    if (vertices.size() < 3) return std::move(vertices);

    std::vector<vec3> out;
    const int n = (int)vertices.size();
    for (int i = 0; i < n; i++) {
      const vec3 &prev = vertices[(i + n - 1) % n];
      const vec3 &cur = vertices[i];
      const vec3 &next = vertices[(i + 1) % n];
      if (length(cross(cur - prev, next - cur)) > POINT_EPSILON)
        out.push_back(cur);
    }
    return out;
  }

  std::vector<vec3> vertices;
};
}  // namespace

std::vector<vec3> ClipConvexPolygon(const std::vector<vec3> &poly,
                                    const Plane &plane,
                                    bool keep_above) {
  const double sign = keep_above ? 1.0 : -1.0;
  // Vertices within epsilon of the plane are on it, so that an edge
  // lying in the plane is kept whole rather than split at a point
  // chosen by rounding error.
  auto Side = [&plane, sign](const vec3 &v) {
      const double d = sign * plane.SignedDistance(v);
      if (d > POINT_EPSILON) return 1;
      if (d < -POINT_EPSILON) return -1;
      return 0;
    };

  const int n = (int)poly.size();
  VertexList out;
  for (int i = 0; i < n; i++) {
    const vec3 &a = poly[i];
    const vec3 &b = poly[(i + 1) % n];
    const int sa = Side(a);
    const int sb = Side(b);
    if (sa >= 0) out.Add(a);
    if (sa * sb < 0) {
      out.Add(plane.Intersection(Ray{.point = a, .direction = a - b}));
    }
  }
  return out.Finish();
}

static std::string AutomaticName(int cut) {
  if (cut < 26) return std::string(1, (char)('A' + cut));
  return StringPrintf("T%d", cut);
}

TwistyPuzzle::TwistyPuzzle(const Polyhedron &poly,
                           const std::vector<CutDefinition> &cuts,
                           bool with_reflections) {
  std::string error;
  CHECK(Init(poly, cuts, with_reflections, &error)) << error;
}

std::optional<TwistyPuzzle> TwistyPuzzle::Create(
    const Polyhedron &poly, const std::vector<CutDefinition> &cuts,
    bool with_reflections) {
  TwistyPuzzle puzzle;
  std::string error;
  if (!puzzle.Init(poly, cuts, with_reflections, &error)) {
    if (VERBOSE) printf("TwistyPuzzle::Create failed: %s\n", error.c_str());
    return std::nullopt;
  }
  return {std::move(puzzle)};
}

bool TwistyPuzzle::Init(const Polyhedron &poly,
                        const std::vector<CutDefinition> &cuts,
                        bool with_reflections,
                        std::string *error) {
  shape = poly;

  for (int i = 0; i < (int)poly.faces.size(); i++) {
    faces.push_back(PieceFace{.face = poly.faces[i], .color_index = i,
                              .affecting_turns = {}});
  }

  for (int c = 0; c < (int)cuts.size(); c++) {
    const CutDefinition &cut = cuts[c];
    if (length_squared(cut.plane.normal) == 0.0) {
      *error = StringPrintf("Cut %d has a zero normal.", c);
      return false;
    }

    const std::string name = cut.name.has_value() ?
      cut.name.value() : AutomaticName(c);
    const vec3 axis = normalize(cut.plane.normal);
    const int fwd = (int)turns.size();
    const int inv = fwd + 1;
    turns.push_back(Turn{.name = name, .face_map = {},
                         .physical = PhysicalTurn{
                           .axis = axis,
                           .axis_point = cut.plane.point,
                           .angle = -cut.rotation_angle}});
    turns.push_back(Turn{.name = name + "'", .face_map = {},
                         .physical = PhysicalTurn{
                           .axis = axis,
                           .axis_point = cut.plane.point,
                           .angle = cut.rotation_angle}});

    // The cut has thickness; faces are clipped to the region above
    // the outer plane and below the inner one.
    const Plane outer = cut.plane.Offset(CUT_PLANE_THICKNESS);
    const Plane inner = cut.plane.Offset(-CUT_PLANE_THICKNESS);

    std::vector<PieceFace> next;
    next.reserve(faces.size() * 2);
    for (PieceFace &pf : faces) {
      std::vector<vec3> above =
        ClipConvexPolygon(pf.face.vertices, outer, true);
      std::vector<vec3> below =
        ClipConvexPolygon(pf.face.vertices, inner, false);

      if (above.size() <= 2 && below.size() <= 2) {
        // Entirely within the gap, which only happens if the face is
        // (nearly) in the cut plane. Leave it alone.
        next.push_back(std::move(pf));
        continue;
      }

      if (above.size() > 2) {
        PieceFace up{.face = Face{.vertices = std::move(above)},
                     .color_index = pf.color_index,
                     .affecting_turns = pf.affecting_turns};
        up.affecting_turns.push_back(fwd);
        up.affecting_turns.push_back(inv);
        next.push_back(std::move(up));
      }

      if (below.size() > 2) {
        next.push_back(PieceFace{.face = Face{.vertices = std::move(below)},
                                 .color_index = pf.color_index,
                                 .affecting_turns = pf.affecting_turns});
      }
    }
    faces = std::move(next);
  }

  // Group faces with the same turns into pieces.
  std::map<std::vector<int>, std::vector<int>> by_turns;
  for (int i = 0; i < (int)faces.size(); i++)
    by_turns[faces[i].affecting_turns].push_back(i);
  piece_of_face.resize(faces.size(), -1);
  for (auto &[turn_set_, face_list] : by_turns) {
    for (int f : face_list) piece_of_face[f] = (int)pieces.size();
    pieces.push_back(std::move(face_list));
  }

  // Find the face maps by rotating the centers of the faces.
  std::vector<vec3> centers;
  centers.reserve(faces.size());
  PointMap3<int> center_index;
  for (int i = 0; i < (int)faces.size(); i++) {
    centers.push_back(faces[i].face.Center());
    center_index.Add(centers.back(), i);
  }

  for (int t = 0; t < (int)turns.size(); t++) {
    const frame3 frame = turns[t].physical.Frame();
    std::vector<int> moved(faces.size());
    for (int i = 0; i < (int)faces.size(); i++) {
      if (faces[i].AffectedBy(t)) {
        const vec3 dest = transform_point(frame, centers[i]);
        std::optional<int> j = center_index.Get(dest);
        if (!j.has_value()) {
          *error = StringPrintf("Turn %s moves face %d to %s, "
                                "where there is no face.",
                                turns[t].name.c_str(), i,
                                VecString(dest).c_str());
          return false;
        }
        moved[i] = j.value();
      } else {
        moved[i] = i;
      }
    }

    Bijection push(std::move(moved));
    if (!push.IsValid()) {
      *error = StringPrintf("Turn %s maps two faces to the same place.",
                            turns[t].name.c_str());
      return false;
    }
    turns[t].face_map = push.Invert();
  }

  std::vector<Bijection> turn_maps;
  turn_maps.reserve(turns.size());
  for (const Turn &turn : turns) turn_maps.push_back(turn.face_map);
  symmetries = DiscoverSymmetries(poly, centers, turn_maps, with_reflections);

  ComputePieceTypes();

  if (VERBOSE) {
    printf("%s puzzle: %d faces, %d pieces, %d turns, %d symmetries, "
           "%d piece types\n",
           poly.name.c_str(), NumFaces(), NumPieces(), NumTurns(),
           (int)symmetries.size(), (int)piece_types.size());
  }
  return true;
}

void TwistyPuzzle::ComputePieceTypes() {
  const int num_pieces = NumPieces();
  std::vector<int> parent(num_pieces);
  std::iota(parent.begin(), parent.end(), 0);
  auto Find = [&parent](int p) {
      while (parent[p] != p) {
        parent[p] = parent[parent[p]];
        p = parent[p];
      }
      return p;
    };

  // Pieces are in the same type if some turn or symmetry takes one
  // to the other.
  auto Merge = [&](const Bijection &b) {
      for (int p = 0; p < num_pieces; p++) {
        const int q = piece_of_face[b[pieces[p][0]]];
        const int rp = Find(p), rq = Find(q);
        if (rp != rq) parent[std::max(rp, rq)] = std::min(rp, rq);
      }
    };
  for (const Turn &turn : turns) Merge(turn.face_map);
  for (const Symmetry &sym : symmetries) Merge(sym.face_map);

  std::map<int, std::vector<int>> by_root;
  for (int p = 0; p < num_pieces; p++) by_root[Find(p)].push_back(p);

  piece_types.clear();
  for (auto &[root_, type_pieces] : by_root) {
    PieceType type;
    type.faces_per_piece = (int)pieces[type_pieces[0]].size();
    type.face_mask.resize(faces.size(), false);
    for (int p : type_pieces) {
      CHECK((int)pieces[p].size() == type.faces_per_piece) <<
        "Pieces of the same type should have the same number of faces.";
      for (int f : pieces[p]) {
        type.face_mask[f] = true;
        if (!faces[f].affecting_turns.empty()) type.movable = true;
      }
    }
    type.pieces = std::move(type_pieces);
    piece_types.push_back(std::move(type));
  }

  std::stable_sort(piece_types.begin(), piece_types.end(),
                   [](const PieceType &a, const PieceType &b) {
                     return a.faces_per_piece > b.faces_per_piece;
                   });

  type_of_piece.resize(num_pieces, -1);
  for (int t = 0; t < (int)piece_types.size(); t++)
    for (int p : piece_types[t].pieces)
      type_of_piece[p] = t;
}

PuzzleState TwistyPuzzle::InitialState() const {
  PuzzleState state;
  state.reserve(faces.size());
  for (const PieceFace &pf : faces) state.push_back(pf.color_index);
  return state;
}

bool TwistyPuzzle::IsSolved(const PuzzleState &state) const {
  for (int i = 0; i < (int)faces.size(); i++)
    if (state[i] != faces[i].color_index) return false;
  return true;
}

bool TwistyPuzzle::PieceSolved(const PuzzleState &state, int piece) const {
  for (int f : pieces[piece])
    if (state[f] != faces[f].color_index) return false;
  return true;
}

int TwistyPuzzle::NumSolvedPieces(const PuzzleState &state) const {
  int count = 0;
  for (int p = 0; p < NumPieces(); p++)
    if (PieceSolved(state, p)) count++;
  return count;
}

int TwistyPuzzle::NumPiecesOfType(int type) const {
  return (int)piece_types[type].pieces.size();
}

int TwistyPuzzle::NumSolvedPiecesOfType(const PuzzleState &state,
                                        int type) const {
  int count = 0;
  for (int p : piece_types[type].pieces)
    if (PieceSolved(state, p)) count++;
  return count;
}

PuzzleState TwistyPuzzle::DerivedState(const PuzzleState &state,
                                       const Bijection &face_map) {
  CHECK_EQ((int)state.size(), face_map.Size());
  PuzzleState out(state.size());
  for (int i = 0; i < (int)state.size(); i++) out[i] = state[face_map[i]];
  return out;
}

PuzzleState TwistyPuzzle::DerivedStateTurn(const PuzzleState &state,
                                           int turn) const {
  CHECK(turn >= 0 && turn < NumTurns()) << turn;
  return DerivedState(state, turns[turn].face_map);
}

PuzzleState TwistyPuzzle::DerivedStateFromTurns(
    const PuzzleState &state, const std::vector<int> &turn_list) const {
  PuzzleState s = state;
  for (int t : turn_list) s = DerivedStateTurn(s, t);
  return s;
}

std::optional<int> TwistyPuzzle::TurnIndexByName(std::string_view name) const {
  for (int t = 0; t < NumTurns(); t++)
    if (turns[t].name == name) return {t};
  return std::nullopt;
}

std::string TwistyPuzzle::TurnsString(const std::vector<int> &turn_list) const {
  std::vector<std::string> names;
  names.reserve(turn_list.size());
  for (int t : turn_list) names.push_back(turns[t].name);
  return Util::Join(names, " ");
}

std::vector<int> TwistyPuzzle::ScrambleTurns(ArcFour *rc, int num_turns) const {
  CHECK(NumTurns() > 0) << "Can't scramble a puzzle without turns.";
  std::vector<int> out;
  out.reserve(num_turns);
  for (int i = 0; i < num_turns; i++) out.push_back((int)RandTo(rc, NumTurns()));
  return out;
}

PuzzleState TwistyPuzzle::Scramble(ArcFour *rc, const PuzzleState &state,
                                   int num_turns) const {
  return DerivedStateFromTurns(state, ScrambleTurns(rc, num_turns));
}

std::vector<std::pair<Face, int>> TwistyPuzzle::ColoredFaces(
    const PuzzleState &state) const {
  std::vector<std::pair<Face, int>> out;
  out.reserve(faces.size());
  for (int i = 0; i < (int)faces.size(); i++)
    out.emplace_back(faces[i].face, state[i]);
  return out;
}

std::vector<std::pair<Face, int>> TwistyPuzzle::PhysicallyTurnedFaces(
    int turn, const PuzzleState &state, double interp) const {
  CHECK(turn >= 0 && turn < NumTurns()) << turn;
  const frame3 frame = turns[turn].physical.Frame(interp);
  std::vector<std::pair<Face, int>> out;
  out.reserve(faces.size());
  for (int i = 0; i < (int)faces.size(); i++) {
    if (faces[i].AffectedBy(turn)) {
      out.emplace_back(faces[i].face.Transform(frame), state[i]);
    } else {
      out.emplace_back(faces[i].face, state[i]);
    }
  }
  return out;
}
