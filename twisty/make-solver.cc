#include "make-solver.h"

#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "phased-solver.h"
#include "solvers.h"
#include "twisty-puzzle.h"

const char *SolverKindName(SolverKind kind) {
  switch (kind) {
  case SolverKind::ONE_MOVE: return "onemove";
  case SolverKind::EVALUATOR: return "evaluator";
  case SolverKind::LOOKAHEAD: return "lookahead";
  case SolverKind::FULL_SEARCH: return "fullsearch";
  case SolverKind::METAMOVE: return "metamove";
  }
  LOG(FATAL) << "Bad SolverKind " << (int)kind;
  return "";
}

std::vector<SolverKind> AllSolverKinds() {
  return {SolverKind::ONE_MOVE, SolverKind::EVALUATOR, SolverKind::LOOKAHEAD,
          SolverKind::FULL_SEARCH, SolverKind::METAMOVE};
}

std::optional<SolverKind> SolverKindByName(std::string_view name) {
  for (SolverKind kind : AllSolverKinds())
    if (name == SolverKindName(kind)) return {kind};
  return std::nullopt;
}

std::unique_ptr<ScrambleSolver> MakeSolver(SolverKind kind,
                                           const TwistyPuzzle &puzzle,
                                           PuzzleState initial,
                                           const SolverOptions &options) {
  switch (kind) {
  case SolverKind::ONE_MOVE:
    return std::make_unique<OneMoveSolver>(puzzle, std::move(initial));
  case SolverKind::EVALUATOR:
    return std::make_unique<EvaluatorSolver>(
        puzzle, std::move(initial),
        options.evaluator ? options.evaluator :
        SolvedFractionEvaluator(puzzle));
  case SolverKind::LOOKAHEAD:
    return std::make_unique<LookaheadSolver>(
        puzzle, std::move(initial), options.lookahead);
  case SolverKind::FULL_SEARCH:
    return std::make_unique<FullSearchSolver>(
        puzzle, std::move(initial), options.full_search);
  case SolverKind::METAMOVE: {
    std::shared_ptr<const MetaMovePlan> plan = options.plan;
    if (plan == nullptr) plan = MetaMovePlan::Build(puzzle, options.plan_opts);
    return std::make_unique<MetaMovePhasedSolver>(
        puzzle, std::move(plan), std::move(initial), options.phased);
  }
  }
  LOG(FATAL) << "Bad SolverKind " << (int)kind;
  return nullptr;
}
