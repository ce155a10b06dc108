#include "solvers.h"

#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "ansi.h"
#include "arcfour.h"
#include "base/logging.h"
#include "periodically.h"
#include "randutil.h"
#include "status-bar.h"
#include "twisty-puzzle.h"

StateEvaluator SolvedFractionEvaluator(const TwistyPuzzle &puzzle) {
  return [&puzzle](const PuzzleState &state) {
      if (puzzle.IsSolved(state))
        return std::numeric_limits<double>::infinity();
      return puzzle.NumSolvedPieces(state) / (double)puzzle.NumPieces();
    };
}

std::vector<int> SolveToEnd(ScrambleSolver *solver, int max_turns) {
  std::vector<int> turns;
  while ((int)turns.size() < max_turns) {
    std::optional<int> t = solver->Next();
    if (!t.has_value()) break;
    turns.push_back(t.value());
  }
  return turns;
}

OneMoveSolver::OneMoveSolver(const TwistyPuzzle &puzzle, PuzzleState initial) :
  ScrambleSolver(puzzle, std::move(initial)) {}

std::optional<int> OneMoveSolver::Next() {
  if (puzzle.IsSolved(state)) return std::nullopt;

  int best_score = puzzle.NumSolvedPieces(state);
  std::optional<int> best_turn;
  for (int t = 0; t < puzzle.NumTurns(); t++) {
    const int score = puzzle.NumSolvedPieces(puzzle.DerivedStateTurn(state, t));
    if (score > best_score) {
      best_score = score;
      best_turn = {t};
    }
  }

  if (best_turn.has_value()) ApplyTurn(best_turn.value());
  return best_turn;
}

EvaluatorSolver::EvaluatorSolver(const TwistyPuzzle &puzzle,
                                 PuzzleState initial,
                                 StateEvaluator evaluator) :
  ScrambleSolver(puzzle, std::move(initial)),
  evaluator(std::move(evaluator)) {
  CHECK(this->evaluator) << "EvaluatorSolver needs an evaluator.";
}

std::optional<int> EvaluatorSolver::Next() {
  if (puzzle.IsSolved(state)) return std::nullopt;

  double best_score = evaluator(state);
  std::optional<int> best_turn;
  for (int t = 0; t < puzzle.NumTurns(); t++) {
    const double score = evaluator(puzzle.DerivedStateTurn(state, t));
    if (score > best_score) {
      best_score = score;
      best_turn = {t};
    }
  }

  if (best_turn.has_value()) ApplyTurn(best_turn.value());
  return best_turn;
}

LookaheadSolver::LookaheadSolver(const TwistyPuzzle &puzzle,
                                 PuzzleState initial,
                                 const Opts &opts) :
  ScrambleSolver(puzzle, std::move(initial)), opts(opts), rc(opts.seed) {
  CHECK(opts.depth >= 1) << opts.depth;
}

std::optional<int> LookaheadSolver::Next() {
  if (puzzle.IsSolved(state)) return std::nullopt;
  CHECK(puzzle.NumTurns() > 0);

  struct Node {
    PuzzleState state;
    // First turn of the sequence, and the last (-1 for the root).
    int first = -1;
    int last = -1;
  };

  int best_score = puzzle.NumSolvedPieces(state);
  std::optional<int> best_first;

  std::vector<Node> fringe;
  fringe.push_back(Node{.state = state, .first = -1, .last = -1});
  for (int depth = 0;
       depth < opts.depth || (!best_first.has_value() && depth < opts.depth + 1);
       depth++) {
    std::vector<Node> next;
    next.reserve(fringe.size() * puzzle.NumTurns());
    for (const Node &node : fringe) {
      for (int t = 0; t < puzzle.NumTurns(); t++) {
        // Never immediately undo the previous turn.
        if (node.last >= 0 && t == TwistyPuzzle::InvertedTurnIndex(node.last))
          continue;

        PuzzleState s = puzzle.DerivedStateTurn(node.state, t);
        const int first = node.first < 0 ? t : node.first;
        if (puzzle.IsSolved(s)) {
          ApplyTurn(first);
          return {first};
        }

        const int score = puzzle.NumSolvedPieces(s);
        if (score > best_score) {
          best_score = score;
          best_first = {first};
        }
        next.push_back(Node{.state = std::move(s), .first = first, .last = t});
      }
    }
    fringe = std::move(next);
  }

  const int turn = best_first.has_value() ? best_first.value() :
    (int)RandTo(&rc, puzzle.NumTurns());
  ApplyTurn(turn);
  return {turn};
}

FullSearchSolver::FullSearchSolver(const TwistyPuzzle &puzzle,
                                   PuzzleState initial,
                                   const Opts &opts) :
  ScrambleSolver(puzzle, std::move(initial)) {
  if (puzzle.IsSolved(state) || puzzle.NumTurns() == 0 || opts.depth <= 0)
    return;

  const int solved_score = puzzle.NumPieces();
  int best_score = puzzle.NumSolvedPieces(state);
  int best_moves = 0;
  // Sequences longer than this are not explored.
  int max_len = opts.depth;

  struct Frame {
    // The state before turn is applied.
    PuzzleState state;
    int turn = 0;
  };

  std::vector<Frame> stack;
  stack.push_back(Frame{.state = state, .turn = 0});

  auto Advance = [&stack, &puzzle]() {
      while (!stack.empty()) {
        if (stack.back().turn + 1 < puzzle.NumTurns()) {
          stack.back().turn++;
          return;
        }
        stack.pop_back();
      }
    };

  Periodically status_per(1.0);
  while (!stack.empty()) {
    const int len = (int)stack.size();
    const bool undoes = len >= 2 &&
      stack[len - 1].turn ==
      TwistyPuzzle::InvertedTurnIndex(stack[len - 2].turn);

    if (!undoes && len <= max_len) {
      nodes_visited++;
      PuzzleState s = puzzle.DerivedStateTurn(stack.back().state,
                                               stack.back().turn);
      const int score = puzzle.NumSolvedPieces(s);
      if (score > best_score || (score == best_score && len < best_moves)) {
        best_score = score;
        best_moves = len;
        solution.clear();
        for (const Frame &f : stack) solution.push_back(f.turn);
      }

      if (score == solved_score) {
        // Only strictly shorter solutions are interesting now.
        max_len = len - 1;
      } else if (len < max_len) {
        stack.push_back(Frame{.state = std::move(s), .turn = 0});
        continue;
      }
    }

    if (opts.status != nullptr && status_per.ShouldRun()) {
      opts.status->Statusf("Full search: " ACYAN("%lld") " nodes, best "
                           AGREEN("%d") "/%d in %d turns",
                           (long long)nodes_visited, best_score,
                           solved_score, best_moves);
    }
    Advance();
  }
}

std::optional<int> FullSearchSolver::Next() {
  if (next_idx >= (int)solution.size()) return std::nullopt;
  const int t = solution[next_idx++];
  ApplyTurn(t);
  return {t};
}
