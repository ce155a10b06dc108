#ifndef _TWISTY_SOLVERS_H
#define _TWISTY_SOLVERS_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arcfour.h"
#include "status-bar.h"
#include "twisty-puzzle.h"

// Scores a state; higher is better. This is how an external model
// (e.g. a trained network) plugs in.
using StateEvaluator = std::function<double(const PuzzleState &)>;

// Fraction of pieces that are solved, and +infinity for the solved
// state.
StateEvaluator SolvedFractionEvaluator(const TwistyPuzzle &puzzle);

// Produces a solution one turn at a time. The puzzle must outlive
// the solver.
struct ScrambleSolver {
  virtual ~ScrambleSolver() {}

  // The next turn, which has already been applied to State(), or
  // nullopt if the solver is finished (solved or out of ideas).
  virtual std::optional<int> Next() = 0;

  const PuzzleState &State() const { return state; }

 protected:
  ScrambleSolver(const TwistyPuzzle &puzzle, PuzzleState initial) :
    puzzle(puzzle), state(std::move(initial)) {}

  void ApplyTurn(int turn) {
    state = puzzle.DerivedStateTurn(state, turn);
  }

  const TwistyPuzzle &puzzle;
  PuzzleState state;
};

// Calls Next until it returns nullopt or max_turns turns have been
// produced. Returns the turns.
std::vector<int> SolveToEnd(ScrambleSolver *solver, int max_turns);

// Greedy: the single turn that solves the most pieces, as long as
// that is strictly more than now.
struct OneMoveSolver : public ScrambleSolver {
  OneMoveSolver(const TwistyPuzzle &puzzle, PuzzleState initial);
  std::optional<int> Next() override;
};

// Like OneMoveSolver, but scored by the evaluator.
struct EvaluatorSolver : public ScrambleSolver {
  EvaluatorSolver(const TwistyPuzzle &puzzle, PuzzleState initial,
                  StateEvaluator evaluator);
  std::optional<int> Next() override;

 private:
  StateEvaluator evaluator;
};

// Breadth-first search of turn sequences up to a depth, returning
// the first turn of the sequence that solves the most pieces (or
// solves the puzzle). If nothing improves, searches one level deeper
// and then falls back to a random turn, so it never stops on its own
// until solved.
struct LookaheadSolver : public ScrambleSolver {
  struct Opts {
    int depth = 3;
    std::string seed = "lookahead";
  };

  LookaheadSolver(const TwistyPuzzle &puzzle, PuzzleState initial,
                  const Opts &opts);
  std::optional<int> Next() override;

 private:
  const Opts opts;
  ArcFour rc;
};

// Depth-first search of all turn sequences up to the depth, done
// up front. Keeps the best sequence (most pieces solved, then
// fewest turns); after finding a solution, only shorter sequences
// are explored. Next returns the turns of the best sequence.
struct FullSearchSolver : public ScrambleSolver {
  struct Opts {
    int depth = 5;
    StatusBar *status = nullptr;
  };

  FullSearchSolver(const TwistyPuzzle &puzzle, PuzzleState initial,
                   const Opts &opts);
  std::optional<int> Next() override;

  // The whole solution found, including turns already returned.
  const std::vector<int> &Solution() const { return solution; }
  int64_t NodesVisited() const { return nodes_visited; }

 private:
  std::vector<int> solution;
  int next_idx = 0;
  int64_t nodes_visited = 0;
};

#endif
