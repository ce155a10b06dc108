#include "phased-solver.h"

#include <cstdio>
#include <memory>
#include <optional>
#include <vector>

#include "ansi.h"
#include "arcfour.h"
#include "base/logging.h"
#include "base/stringprintf.h"
#include "metamoves.h"
#include "puzzles.h"
#include "solvers.h"
#include "timer.h"
#include "twisty-puzzle.h"

// The type of a piece that the turn moves.
static int MovedType(const TwistyPuzzle &puzzle, int turn) {
  const Bijection &fm = puzzle.Turns()[turn].face_map;
  for (int f = 0; f < fm.Size(); f++)
    if (fm[f] != f) return puzzle.TypeOfPiece(puzzle.PieceOfFace(f));
  LOG(FATAL) << "Turn moves nothing";
  return -1;
}

static void TestParity() {
  const TwistyPuzzle puzzle = Rubiks2x2();
  const int corner = MovedType(puzzle, 0);

  const MetaMove u = MetaMove::FromTurns(puzzle, {0});
  const MetaMove uu = MetaMove::FromTurns(puzzle, {0, 0});
  CHECK(NumEvenPieceCycles(puzzle, u, corner) == 1);
  CHECK(FlipsParity(puzzle, u, corner));
  CHECK(NumEvenPieceCycles(puzzle, uu, corner) == 2);
  CHECK(!FlipsParity(puzzle, uu, corner));

  const MetaMove comm = Commutator(puzzle, u, MetaMove::FromTurns(puzzle, {2}));
  CHECK(!FlipsParity(puzzle, comm, corner));
}

static void CheckPlan(const TwistyPuzzle &puzzle, const MetaMovePlan &plan) {
  CHECK(!plan.metamoves.empty());
  int num_movable = 0;
  for (const PieceType &type : puzzle.PieceTypes())
    if (type.movable) num_movable++;
  CHECK((int)plan.phases.size() == num_movable);

  for (int i = 0; i < (int)plan.phases.size(); i++) {
    const SolvePhase &phase = plan.phases[i];
    CHECK(puzzle.PieceTypes()[phase.target_type].movable);
    CHECK((int)phase.preserve_types.size() == i);
    if (i > 0) {
      CHECK(phase.target_type > plan.phases[i - 1].target_type);
      CHECK(!plan.phases[i].parity_flipper.has_value());
    }
    CHECK(!phase.basis.empty());
    for (const MetaMove &mm : phase.basis) {
      CHECK(mm.NumAffectedPiecesOfType(puzzle, phase.target_type) > 0);
      CHECK(mm.Preserves(puzzle, phase.preserve_types));
    }
    if (phase.three_cycle.has_value()) {
      CHECK(phase.three_cycle.value().NumAffectedPiecesOfType(
                puzzle, phase.target_type) == 3);
    }
    if (phase.parity_flipper.has_value()) {
      CHECK(FlipsParity(puzzle, phase.parity_flipper.value(),
                        phase.target_type));
    }
  }
}

static void TestPlan() {
  {
    const TwistyPuzzle puzzle = Rubiks2x2();
    std::shared_ptr<const MetaMovePlan> plan =
      MetaMovePlan::Build(puzzle, MetaMovePlan::Opts());
    CheckPlan(puzzle, *plan);
    CHECK(plan->phases.size() == 1);
    CHECK(plan->phases[0].parity_flipper.has_value());
  }

  {
    const TwistyPuzzle puzzle = Pyraminx();
    std::shared_ptr<const MetaMovePlan> plan =
      MetaMovePlan::Build(puzzle, MetaMovePlan::Opts{.max_basis = 20});
    CheckPlan(puzzle, *plan);
    // Corners, then edges.
    CHECK(plan->phases.size() == 2);
    CHECK(puzzle.PieceTypes()[plan->phases[0].target_type].faces_per_piece == 3);
    CHECK(puzzle.PieceTypes()[plan->phases[1].target_type].faces_per_piece == 2);
    CHECK(plan->phases[0].basis.size() <= 20);
    // Corners only twist in place.
    CHECK(!plan->phases[0].parity_flipper.has_value());
    CHECK(plan->phases[1].three_cycle.has_value());
  }
}

// The state with two pieces' colors exchanged.
static PuzzleState SwapPieces(const TwistyPuzzle &puzzle,
                              const PuzzleState &state, int a, int b) {
  const std::vector<int> &fa = puzzle.Pieces()[a];
  const std::vector<int> &fb = puzzle.Pieces()[b];
  CHECK(fa.size() == fb.size());
  PuzzleState out = state;
  for (int k = 0; k < (int)fa.size(); k++) {
    out[fa[k]] = state[fb[k]];
    out[fb[k]] = state[fa[k]];
  }
  return out;
}

// The state with the piece's colors rotated among its faces.
static PuzzleState TwistPiece(const TwistyPuzzle &puzzle,
                              const PuzzleState &state, int piece) {
  const std::vector<int> &faces = puzzle.Pieces()[piece];
  PuzzleState out = state;
  for (int k = 0; k < (int)faces.size(); k++)
    out[faces[k]] = state[faces[(k + 1) % faces.size()]];
  return out;
}

static void TestPiecePermutation() {
  const TwistyPuzzle puzzle = Rubiks2x2();
  const int corner = MovedType(puzzle, 0);
  const std::vector<int> &corners = puzzle.PieceTypes()[corner].pieces;
  const PuzzleState solved = puzzle.InitialState();

  CHECK(!PiecePermutationIsOdd(puzzle, solved, corner));
  // A quarter turn is a four-cycle of corners.
  CHECK(PiecePermutationIsOdd(puzzle,
                              puzzle.DerivedStateTurn(solved, 0), corner));
  CHECK(!PiecePermutationIsOdd(puzzle,
                               puzzle.DerivedStateFromTurns(solved, {0, 0}),
                               corner));

  const PuzzleState swapped = SwapPieces(puzzle, solved, corners[0], corners[1]);
  CHECK(puzzle.NumSolvedPiecesOfType(swapped, corner) ==
        puzzle.NumPiecesOfType(corner) - 2);
  CHECK(PiecePermutationIsOdd(puzzle, swapped, corner));

  // Two corners twisted in place are just as unsolved, but not
  // permuted at all.
  const PuzzleState twisted =
    TwistPiece(puzzle, TwistPiece(puzzle, solved, corners[0]), corners[1]);
  CHECK(puzzle.NumSolvedPiecesOfType(twisted, corner) ==
        puzzle.NumPiecesOfType(corner) - 2);
  CHECK(!PiecePermutationIsOdd(puzzle, twisted, corner));
}

static void TestFinishSearch() {
  const TwistyPuzzle puzzle = Rubiks2x2();
  const PuzzleState solved = puzzle.InitialState();

  std::optional<std::vector<int>> none = FinishSearch(puzzle, solved, 3, 1000);
  CHECK(none.has_value() && none.value().empty());

  ArcFour rc("finish");
  for (int i = 0; i < 10; i++) {
    const std::vector<int> turns = puzzle.ScrambleTurns(&rc, 5);
    const PuzzleState s = puzzle.DerivedStateFromTurns(solved, turns);
    std::optional<std::vector<int>> sol = FinishSearch(puzzle, s, 3, 100000);
    CHECK(sol.has_value()) << puzzle.TurnsString(turns);
    CHECK(sol.value().size() <= 6) << puzzle.TurnsString(sol.value());
    CHECK(puzzle.IsSolved(puzzle.DerivedStateFromTurns(s, sol.value())))
      << puzzle.TurnsString(turns) << " -> "
      << puzzle.TurnsString(sol.value());

    // No turns at all.
    if (!puzzle.IsSolved(s)) {
      CHECK(!FinishSearch(puzzle, s, 0, 100000).has_value());
    }
  }
}

static void TestSolve() {
  {
    const TwistyPuzzle puzzle = Pyraminx();
    std::shared_ptr<const MetaMovePlan> plan =
      MetaMovePlan::Build(puzzle, MetaMovePlan::Opts());
    const PuzzleState scrambled =
      puzzle.DerivedStateFromTurns(puzzle.InitialState(), {0});
    MetaMovePhasedSolver solver(puzzle, plan, scrambled,
                                MetaMovePhasedSolver::Opts());
    const std::vector<int> solution = SolveToEnd(&solver, 1000);
    CHECK(puzzle.DerivedStateFromTurns(scrambled, solution) == solver.State());
    CHECK(puzzle.IsSolved(solver.State())) << puzzle.TurnsString(solution);
    CHECK(solver.CurrentPhase() == 2);
  }

  {
    const TwistyPuzzle puzzle = Rubiks2x2();
    std::shared_ptr<const MetaMovePlan> plan =
      MetaMovePlan::Build(puzzle, MetaMovePlan::Opts());
    const PuzzleState scrambled =
      puzzle.DerivedStateFromTurns(puzzle.InitialState(), {3, 1});
    MetaMovePhasedSolver solver(puzzle, plan, scrambled,
                                MetaMovePhasedSolver::Opts());
    const std::vector<int> solution = SolveToEnd(&solver, 1000);
    CHECK(puzzle.DerivedStateFromTurns(scrambled, solution) == solver.State());
    CHECK(puzzle.IsSolved(solver.State())) << puzzle.TurnsString(solution);

    // Undoing any two turns is a single discovered metamove.
    ArcFour rc("phased2x2");
    for (int i = 0; i < 8; i++) {
      const std::vector<int> turns = puzzle.ScrambleTurns(&rc, 2);
      const PuzzleState s =
        puzzle.DerivedStateFromTurns(puzzle.InitialState(), turns);
      MetaMovePhasedSolver rsolver(puzzle, plan, s,
                                   MetaMovePhasedSolver::Opts());
      const std::vector<int> rsolution = SolveToEnd(&rsolver, 1000);
      CHECK(puzzle.IsSolved(puzzle.DerivedStateFromTurns(s, rsolution)))
        << puzzle.TurnsString(turns) << " -> "
        << puzzle.TurnsString(rsolution);
    }
  }
}

// Long random scrambles, solved all the way, with one plan per
// puzzle.
static void TestSolveRandom() {
  for (const char *name : {"2x2", "pyraminx"}) {
    std::optional<TwistyPuzzle> puzzle = PuzzleByName(name);
    CHECK(puzzle.has_value()) << name;
    std::shared_ptr<const MetaMovePlan> plan =
      MetaMovePlan::Build(puzzle.value(), MetaMovePlan::Opts());

    Timer timer;
    ArcFour rc(StringPrintf("random.%s", name));
    int total_turns = 0;
    for (int i = 0; i < 10; i++) {
      const std::vector<int> turns = puzzle->ScrambleTurns(&rc, 20);
      const PuzzleState s =
        puzzle->DerivedStateFromTurns(puzzle->InitialState(), turns);
      MetaMovePhasedSolver solver(puzzle.value(), plan, s,
                                  MetaMovePhasedSolver::Opts());
      const std::vector<int> solution = SolveToEnd(&solver, 100000);
      CHECK(puzzle->DerivedStateFromTurns(s, solution) == solver.State());
      CHECK(puzzle->IsSolved(solver.State()))
        << name << ": " << puzzle->TurnsString(turns) << " -> "
        << puzzle->TurnsString(solution);
      CHECK(solver.CurrentPhase() == (int)plan->phases.size());
      total_turns += (int)solution.size();
    }
    printf("Solved 10 random %s in %s, %d turns total\n", name,
           ANSI::Time(timer.Seconds()).c_str(), total_turns);
  }
}

int main(int argc, char **argv) {
  ANSI::Init();

  TestParity();
  TestPiecePermutation();
  TestFinishSearch();
  TestPlan();
  TestSolve();
  TestSolveRandom();

  printf("OK\n");
  return 0;
}
