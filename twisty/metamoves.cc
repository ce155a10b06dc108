#include "metamoves.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <numeric>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ansi.h"
#include "base/logging.h"
#include "bijection.h"
#include "periodically.h"
#include "status-bar.h"
#include "symmetry.h"
#include "traverse-combinations.h"
#include "twisty-puzzle.h"

static int NumAffected(const TwistyPuzzle &puzzle, const Bijection &fm) {
  const PuzzleState s =
    TwistyPuzzle::DerivedState(puzzle.InitialState(), fm);
  return puzzle.NumPieces() - puzzle.NumSolvedPieces(s);
}

MetaMove MetaMove::Empty(const TwistyPuzzle &puzzle) {
  return MetaMove{.turns = {},
                  .face_map = Bijection::Identity(puzzle.NumFaces()),
                  .num_affected_pieces = 0};
}

MetaMove MetaMove::FromTurns(const TwistyPuzzle &puzzle,
                             const std::vector<int> &turns) {
  Bijection fm = Bijection::Identity(puzzle.NumFaces());
  for (int t : turns) fm = fm.Apply(puzzle.Turns()[t].face_map);
  const int affected = NumAffected(puzzle, fm);
  return MetaMove{.turns = turns, .face_map = std::move(fm),
                  .num_affected_pieces = affected};
}

MetaMove MetaMove::Apply(const TwistyPuzzle &puzzle,
                         const MetaMove &other) const {
  MetaMove out;
  out.turns = turns;
  out.turns.insert(out.turns.end(), other.turns.begin(), other.turns.end());
  out.face_map = face_map.Apply(other.face_map);
  out.num_affected_pieces = NumAffected(puzzle, out.face_map);
  return out;
}

MetaMove MetaMove::Invert(const TwistyPuzzle &puzzle) const {
  MetaMove out;
  out.turns.reserve(turns.size());
  for (int i = (int)turns.size() - 1; i >= 0; i--)
    out.turns.push_back(TwistyPuzzle::InvertedTurnIndex(turns[i]));
  out.face_map = face_map.Invert();
  // Undoing a move affects the same pieces.
  out.num_affected_pieces = num_affected_pieces;
  return out;
}

int MetaMove::NumAffectedPiecesOfType(const TwistyPuzzle &puzzle,
                                      int type) const {
  const PuzzleState s =
    TwistyPuzzle::DerivedState(puzzle.InitialState(), face_map);
  return puzzle.NumPiecesOfType(type) - puzzle.NumSolvedPiecesOfType(s, type);
}

bool MetaMove::Preserves(const TwistyPuzzle &puzzle,
                         const std::vector<int> &types) const {
  if (types.empty()) return true;
  const PuzzleState s =
    TwistyPuzzle::DerivedState(puzzle.InitialState(), face_map);
  for (int type : types) {
    if (puzzle.NumSolvedPiecesOfType(s, type) != puzzle.NumPiecesOfType(type))
      return false;
  }
  return true;
}

bool MetaMove::operator<(const MetaMove &other) const {
  if (num_affected_pieces != other.num_affected_pieces)
    return num_affected_pieces < other.num_affected_pieces;
  if (turns.size() != other.turns.size())
    return turns.size() < other.turns.size();
  return turns < other.turns;
}

MetaMove Conjugate(const TwistyPuzzle &puzzle, const MetaMove &a,
                   const MetaMove &b) {
  return a.Apply(puzzle, b).Apply(puzzle, a.Invert(puzzle));
}

MetaMove Commutator(const TwistyPuzzle &puzzle, const MetaMove &a,
                    const MetaMove &b) {
  return a.Apply(puzzle, b).Apply(puzzle, a.Invert(puzzle)).
    Apply(puzzle, b.Invert(puzzle));
}

MetaMove ApplySymmetry(const Symmetry &sym, const MetaMove &mm) {
  MetaMove out;
  out.turns.reserve(mm.turns.size());
  for (int t : mm.turns) out.turns.push_back(sym.turn_map[t]);
  out.face_map =
    sym.face_map.Apply(mm.face_map).Apply(sym.face_map.Invert());
  // Symmetries take solved pieces to solved pieces.
  out.num_affected_pieces = mm.num_affected_pieces;
  return out;
}

std::vector<int> TurnOrbitRepresentatives(const TwistyPuzzle &puzzle) {
  const int num_turns = puzzle.NumTurns();
  std::vector<int> rep(num_turns);
  std::iota(rep.begin(), rep.end(), 0);
  // Repeat until stable; every orbit is small.
  for (bool changed = true; changed;) {
    changed = false;
    for (const Symmetry &sym : puzzle.Symmetries()) {
      for (int t = 0; t < num_turns; t++) {
        const int u = sym.turn_map[t];
        const int m = std::min(rep[t], rep[u]);
        if (rep[t] != m || rep[u] != m) {
          rep[t] = rep[u] = m;
          changed = true;
        }
      }
    }
  }

  std::vector<int> out;
  for (int t = 0; t < num_turns; t++)
    if (rep[t] == t) out.push_back(t);
  return out;
}

namespace {
// Keeps the best metamove for each face map.
struct BestByFaceMap {
  void Record(MetaMove mm) {
    auto it = best.find(mm.face_map);
    if (it == best.end()) {
      Bijection key = mm.face_map;
      best.emplace(std::move(key), std::move(mm));
    } else if (mm < it->second) {
      it->second = std::move(mm);
    }
  }

  std::vector<MetaMove> Sorted() {
    std::vector<MetaMove> out;
    out.reserve(best.size());
    for (auto &[k_, mm] : best) out.push_back(std::move(mm));
    best.clear();
    std::sort(out.begin(), out.end());
    return out;
  }

  std::unordered_map<Bijection, MetaMove, BijectionHash> best;
};
}  // namespace

std::vector<MetaMove> DiscoverMetaMoves(const TwistyPuzzle &puzzle,
                                        const MetaMoveFilter &filter,
                                        int max_turns,
                                        StatusBar *status) {
  if (max_turns < 2) return {};

  std::vector<MetaMove> singles;
  singles.reserve(puzzle.NumTurns());
  for (int t = 0; t < puzzle.NumTurns(); t++)
    singles.push_back(MetaMove::FromTurns(puzzle, {t}));

  BestByFaceMap best;
  Periodically status_per(1.0);
  int64_t visited = 0;

  const std::vector<int> reps = TurnOrbitRepresentatives(puzzle);
  for (int r = 0; r < (int)reps.size(); r++) {
    TraverseCombinations(
        singles, max_turns - 1, singles[reps[r]],
        [&puzzle](const MetaMove &prev, const MetaMove &turn) {
          return prev.Apply(puzzle, turn);
        },
        [&](const MetaMove &mm) {
          visited++;
          if (status != nullptr && status_per.ShouldRun()) {
            status->Statusf("Metamoves: start %d/%d, " ACYAN("%lld")
                            " visited, " AGREEN("%d") " kept",
                            r + 1, (int)reps.size(), (long long)visited,
                            (int)best.best.size());
          }

          const int n = (int)mm.turns.size();
          if (n <= 1) return TraverseResult::CONTINUE;

          const Bijection &last = puzzle.Turns()[mm.turns[n - 1]].face_map;
          const Bijection &prev = puzzle.Turns()[mm.turns[n - 2]].face_map;
          if (last.IsInverseOf(prev)) return TraverseResult::SKIP;

          if (mm.num_affected_pieces > 0 && filter(mm)) {
            for (const Symmetry &sym : puzzle.Symmetries())
              best.Record(ApplySymmetry(sym, mm));
          }
          return TraverseResult::CONTINUE;
        });
  }

  return best.Sorted();
}

std::vector<MetaMove> CombineMetaMoves(const TwistyPuzzle &puzzle,
                                       const MetaMoveFilter &filter,
                                       const std::vector<MetaMove> &metamoves,
                                       int depth) {
  BestByFaceMap best;
  TraverseCombinations(
      metamoves, depth, MetaMove::Empty(puzzle),
      [&puzzle](const MetaMove &prev, const MetaMove &mm) {
        return prev.Apply(puzzle, mm);
      },
      [&](const MetaMove &mm) {
        if (!mm.turns.empty() && mm.num_affected_pieces > 0 && filter(mm))
          best.Record(mm);
        return TraverseResult::CONTINUE;
      });
  return best.Sorted();
}
