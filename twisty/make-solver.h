#ifndef _TWISTY_MAKE_SOLVER_H
#define _TWISTY_MAKE_SOLVER_H

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "phased-solver.h"
#include "solvers.h"
#include "twisty-puzzle.h"

enum class SolverKind {
  ONE_MOVE,
  EVALUATOR,
  LOOKAHEAD,
  FULL_SEARCH,
  METAMOVE,
};

// Short names, as used on the command line: "onemove", "evaluator",
// "lookahead", "fullsearch", "metamove".
const char *SolverKindName(SolverKind kind);
std::optional<SolverKind> SolverKindByName(std::string_view name);
std::vector<SolverKind> AllSolverKinds();

struct SolverOptions {
  LookaheadSolver::Opts lookahead;
  FullSearchSolver::Opts full_search;
  // If empty, SolvedFractionEvaluator is used.
  StateEvaluator evaluator;
  MetaMovePhasedSolver::Opts phased;
  // Must have been built for the same puzzle. If null, MakeSolver
  // builds one with plan_opts.
  std::shared_ptr<const MetaMovePlan> plan;
  MetaMovePlan::Opts plan_opts;
};

std::unique_ptr<ScrambleSolver> MakeSolver(SolverKind kind,
                                           const TwistyPuzzle &puzzle,
                                           PuzzleState initial,
                                           const SolverOptions &options);

#endif
