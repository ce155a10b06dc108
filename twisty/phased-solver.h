#ifndef _TWISTY_PHASED_SOLVER_H
#define _TWISTY_PHASED_SOLVER_H

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "metamoves.h"
#include "solvers.h"
#include "status-bar.h"
#include "twisty-puzzle.h"

// Solves one movable piece type while keeping the earlier ones
// solved.
struct SolvePhase {
  int target_type = 0;
  std::vector<int> preserve_types;
  // Each preserves preserve_types and affects the target type.
  std::vector<MetaMove> basis;
  // Moves exactly three pieces of the target type.
  std::optional<MetaMove> three_cycle;
  // Flips the permutation parity of the target type's pieces. Only
  // searched for in the first phase.
  std::optional<MetaMove> parity_flipper;
};

// Everything MetaMovePhasedSolver needs that depends only on the
// puzzle. This is expensive, so build it once and share it between
// solves.
struct MetaMovePlan {
  struct Opts {
    // Longest turn sequence for metamove discovery.
    int discovery_turns = 4;
    // How many near neighbors in the trie to try for each metamove
    // when pairing them up into three-cycles and parity flippers.
    int similar_per_metamove = 16;
    // If a phase has no basis, commutators of this many of the best
    // candidates are tried.
    int max_commutator_candidates = 96;
    // Truncate each basis to this many metamoves; 0 means no limit.
    int max_basis = 0;
  };

  // All discovered metamoves, best first.
  std::vector<MetaMove> metamoves;
  // One per movable piece type, in piece type order.
  std::vector<SolvePhase> phases;

  // Fails (fatally) if some phase has an empty basis.
  static std::shared_ptr<const MetaMovePlan> Build(
      const TwistyPuzzle &puzzle, const Opts &opts,
      StatusBar *status = nullptr);
};

// Number of even-length cycles in the permutation of pieces of the
// type that the metamove performs.
int NumEvenPieceCycles(const TwistyPuzzle &puzzle, const MetaMove &mm,
                       int type);

// True if there is exactly one such cycle, so that the metamove
// changes the parity of the permutation of the type's pieces.
bool FlipsParity(const TwistyPuzzle &puzzle, const MetaMove &mm, int type);

// True if the pieces of the type sit in an odd permutation of their
// home positions. Pieces are told apart by their colors, so this is
// false if two pieces of the type have the same colors.
bool PiecePermutationIsOdd(const TwistyPuzzle &puzzle,
                           const PuzzleState &state, int type);

// Bidirectional breadth-first search for a turn sequence that takes
// the state to the solved state, with up to max_depth turns from
// each side. Each side stops growing after max_states states.
std::optional<std::vector<int>> FinishSearch(const TwistyPuzzle &puzzle,
                                             const PuzzleState &state,
                                             int max_depth,
                                             int max_states);

// Solves phase by phase. Each step picks a metamove B from the
// phase's basis and a short setup sequence A, and applies A B A⁻¹
// if that strictly increases the number of solved pieces of the
// target type. Failing that, pairs B1 B2 of basis metamoves are
// tried, then the parity flipper (only when the two unsolved pieces
// are swapped), and finally FinishSearch for the rest of the
// solution. A state seen at the start of an earlier step goes
// straight to FinishSearch.
struct MetaMovePhasedSolver : public ScrambleSolver {
  struct Opts {
    // Longest setup sequence.
    int setup_turns = 2;
    // Pairs are made from this many of the basis metamoves.
    int max_pair_basis = 200;
    // Limits for FinishSearch; 0 depth disables it.
    int finish_depth = 7;
    int finish_states = 250000;
    // Metamoves applied before giving up.
    int max_steps = 1000;
  };

  MetaMovePhasedSolver(const TwistyPuzzle &puzzle,
                       std::shared_ptr<const MetaMovePlan> plan,
                       PuzzleState initial, const Opts &opts);

  std::optional<int> Next() override;

  // Index of the current phase; equal to the number of phases when
  // all of them are done.
  int CurrentPhase() const { return phase_idx; }

 private:
  std::optional<MetaMove> NextMetaMove(const SolvePhase &phase);

  std::shared_ptr<const MetaMovePlan> plan;
  const Opts opts;
  std::vector<MetaMove> setup_turns;
  std::deque<int> queued;
  int phase_idx = 0;
  int steps = 0;
  std::unordered_set<std::string> seen_states;
};

#endif
