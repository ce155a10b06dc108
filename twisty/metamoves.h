#ifndef _TWISTY_METAMOVES_H
#define _TWISTY_METAMOVES_H

#include <functional>
#include <vector>

#include "bijection.h"
#include "status-bar.h"
#include "symmetry.h"
#include "twisty-puzzle.h"

// A sequence of turns, along with its net effect on the faces. The
// puzzle is not stored, so the operations take it as an argument.
struct MetaMove {
  std::vector<int> turns;
  // Pull form, as for a Turn.
  Bijection face_map;
  // Pieces that are not solved after applying this to the solved
  // state.
  int num_affected_pieces = 0;

  // Does nothing.
  static MetaMove Empty(const TwistyPuzzle &puzzle);
  static MetaMove FromTurns(const TwistyPuzzle &puzzle,
                            const std::vector<int> &turns);

  // This, then other.
  MetaMove Apply(const TwistyPuzzle &puzzle, const MetaMove &other) const;
  // Undoes this.
  MetaMove Invert(const TwistyPuzzle &puzzle) const;

  int NumAffectedPiecesOfType(const TwistyPuzzle &puzzle, int type) const;
  // True if every piece of these types is solved after applying this
  // to the solved state.
  bool Preserves(const TwistyPuzzle &puzzle, const std::vector<int> &types) const;

  // Cycles of the face map; see Bijection::Cycles.
  std::vector<std::vector<int>> Cycles() const { return face_map.Cycles(); }

  // Metamoves are the same if they have the same turns.
  bool operator==(const MetaMove &other) const { return turns == other.turns; }

  // Better metamoves come first: fewer affected pieces, then fewer
  // turns, then lexicographically smaller turns.
  bool operator<(const MetaMove &other) const;
};

// a, b, a⁻¹.
MetaMove Conjugate(const TwistyPuzzle &puzzle, const MetaMove &a,
                   const MetaMove &b);
// a, b, a⁻¹, b⁻¹.
MetaMove Commutator(const TwistyPuzzle &puzzle, const MetaMove &a,
                    const MetaMove &b);

// The same metamove, seen through the symmetry. Turns are mapped by
// the symmetry's turn map and the face map is conjugated.
MetaMove ApplySymmetry(const Symmetry &sym, const MetaMove &mm);

// The smallest turn of each orbit of turns under the puzzle's
// symmetries.
std::vector<int> TurnOrbitRepresentatives(const TwistyPuzzle &puzzle);

using MetaMoveFilter = std::function<bool(const MetaMove &)>;

// Searches turn sequences of 2 to max_turns turns (never undoing the
// previous turn) and returns those that affect at least one piece and
// pass the filter. The search starts from one turn per symmetry orbit
// and each result is expanded by all of the puzzle's symmetries, so
// the filter must be invariant under symmetry. Only the best metamove
// is kept for each face map. Sorted, best first.
std::vector<MetaMove> DiscoverMetaMoves(const TwistyPuzzle &puzzle,
                                        const MetaMoveFilter &filter,
                                        int max_turns,
                                        StatusBar *status = nullptr);

// Sequences of 1 to depth of the given metamoves, combined, with the
// same recording rules and output as above (but no symmetry expansion).
std::vector<MetaMove> CombineMetaMoves(const TwistyPuzzle &puzzle,
                                       const MetaMoveFilter &filter,
                                       const std::vector<MetaMove> &metamoves,
                                       int depth);

#endif
