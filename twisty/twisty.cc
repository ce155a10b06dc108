// Command-line driver: scramble a puzzle and solve it, or inspect
// puzzles and their metamoves.

#include <cmath>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ansi.h"
#include "arcfour.h"
#include "base/logging.h"
#include "make-solver.h"
#include "metamoves.h"
#include "periodically.h"
#include "puzzles.h"
#include "solvers.h"
#include "status-bar.h"
#include "timer.h"
#include "twisty-puzzle.h"
#include "util.h"

static constexpr int STATUS_LINES = 1;
static constexpr int DEFAULT_SCRAMBLE_TURNS = 20;
static constexpr int MAX_SOLUTION_TURNS = 10000;
static constexpr int METAMOVES_TO_SHOW = 20;

static std::string Usage() {
  std::string solvers;
  for (SolverKind kind : AllSolverKinds()) {
    if (!solvers.empty()) solvers += "|";
    solvers += SolverKindName(kind);
  }
  return "Usage:\n\n"
    "twisty list\n"
    "twisty info puzzle\n"
    "twisty metamoves puzzle [depth]\n"
    "twisty puzzle [" + solvers + "] [scramble-turns] [seed]\n\n"
    "Puzzles: " + Util::Join(PuzzleNames(), ", ") + "\n";
}

static int ParseNonNegative(std::string_view s) {
  std::optional<double> d = Util::ParseDoubleOpt(s);
  CHECK(d.has_value() && d.value() >= 0.0 &&
        std::floor(d.value()) == d.value())
    << "Expected a non-negative integer, got: " << s << "\n" << Usage();
  return (int)d.value();
}

static TwistyPuzzle GetPuzzle(std::string_view name) {
  std::optional<TwistyPuzzle> puzzle = PuzzleByName(name);
  CHECK(puzzle.has_value()) << "Unknown puzzle " << name << "\n" << Usage();
  return std::move(puzzle.value());
}

static void List() {
  for (const std::string &name : PuzzleNames()) {
    Timer timer;
    const TwistyPuzzle puzzle = GetPuzzle(name);
    printf(AWHITE("%s") ": " ACYAN("%d") " faces, " ACYAN("%d")
           " pieces, " ACYAN("%d") " turns, " ACYAN("%d")
           " symmetries (%s)\n",
           name.c_str(), puzzle.NumFaces(), puzzle.NumPieces(),
           puzzle.NumTurns(), (int)puzzle.Symmetries().size(),
           ANSI::Time(timer.Seconds()).c_str());
  }
}

static void Info(std::string_view name) {
  const TwistyPuzzle puzzle = GetPuzzle(name);
  printf(AWHITE("%s") " on the " AYELLOW("%s") "\n",
         std::string(name).c_str(), puzzle.Shape().name.c_str());
  printf("Faces: %d\nPieces: %d\nSymmetries: %d\n",
         puzzle.NumFaces(), puzzle.NumPieces(),
         (int)puzzle.Symmetries().size());

  std::vector<std::string> names;
  for (const Turn &turn : puzzle.Turns()) names.push_back(turn.name);
  printf("Turns (%d): %s\n", puzzle.NumTurns(),
         Util::Join(names, " ").c_str());

  printf("Representative turns: ");
  for (int t : TurnOrbitRepresentatives(puzzle))
    printf("%s ", puzzle.Turns()[t].name.c_str());
  printf("\n");

  for (int t = 0; t < (int)puzzle.PieceTypes().size(); t++) {
    const PieceType &type = puzzle.PieceTypes()[t];
    printf("Type %d: " AGREEN("%d") " pieces with %d faces%s\n",
           t, (int)type.pieces.size(), type.faces_per_piece,
           type.movable ? "" : ARED(" (fixed)"));
  }
}

static void MetaMoves(std::string_view name, int depth) {
  const TwistyPuzzle puzzle = GetPuzzle(name);
  StatusBar status(STATUS_LINES);
  Timer timer;
  const std::vector<MetaMove> mms = DiscoverMetaMoves(
      puzzle, [](const MetaMove &) { return true; }, depth, &status);
  status.Clear();

  printf("Found " AGREEN("%d") " metamoves of up to %d turns in %s.\n",
         (int)mms.size(), depth, ANSI::Time(timer.Seconds()).c_str());
  for (int i = 0; i < (int)mms.size() && i < METAMOVES_TO_SHOW; i++) {
    const MetaMove &mm = mms[i];
    printf("  " ACYAN("%d") " affected, %d cycles: %s\n",
           mm.num_affected_pieces, (int)mm.Cycles().size(),
           puzzle.TurnsString(mm.turns).c_str());
  }
}

static void Solve(std::string_view name, SolverKind kind, int scramble_turns,
                  const std::string &seed) {
  const TwistyPuzzle puzzle = GetPuzzle(name);
  StatusBar status(STATUS_LINES);

  ArcFour rc(seed);
  const std::vector<int> scramble = puzzle.ScrambleTurns(&rc, scramble_turns);
  const PuzzleState scrambled =
    puzzle.DerivedStateFromTurns(puzzle.InitialState(), scramble);
  status.Printf("Scramble: %s\n", puzzle.TurnsString(scramble).c_str());
  status.Printf("Solved pieces: %d/%d\n",
                puzzle.NumSolvedPieces(scrambled), puzzle.NumPieces());

  SolverOptions options;
  options.lookahead.seed = seed;
  options.full_search.status = &status;
  if (kind == SolverKind::METAMOVE) {
    Timer plan_timer;
    options.plan = MetaMovePlan::Build(puzzle, options.plan_opts, &status);
    status.Printf("Planned in %s\n",
                  ANSI::Time(plan_timer.Seconds()).c_str());
  }

  Timer timer;
  std::unique_ptr<ScrambleSolver> solver =
    MakeSolver(kind, puzzle, scrambled, options);

  std::vector<int> solution;
  Periodically status_per(1.0);
  while ((int)solution.size() < MAX_SOLUTION_TURNS) {
    std::optional<int> t = solver->Next();
    if (!t.has_value()) break;
    solution.push_back(t.value());
    if (status_per.ShouldRun()) {
      const int solved = puzzle.NumSolvedPieces(solver->State());
      status.Progressf(solved, puzzle.NumPieces(), "%d turns",
                       (int)solution.size());
    }
  }
  status.Clear();

  const bool solved = puzzle.IsSolved(solver->State());
  printf("Solution (%d turns): %s\n", (int)solution.size(),
         puzzle.TurnsString(solution).c_str());
  printf("%s with " AWHITE("%s") " in %s: %d/%d pieces\n",
         solved ? AGREEN("Solved") : ARED("Not solved"),
         SolverKindName(kind), ANSI::Time(timer.Seconds()).c_str(),
         puzzle.NumSolvedPieces(solver->State()), puzzle.NumPieces());
}

int main(int argc, char **argv) {
  ANSI::Init();

  CHECK(argc >= 2) << Usage();
  const std::string cmd = argv[1];

  if (cmd == "list") {
    List();
    return 0;
  }

  if (cmd == "info") {
    CHECK(argc == 3) << Usage();
    Info(argv[2]);
    return 0;
  }

  if (cmd == "metamoves") {
    CHECK(argc == 3 || argc == 4) << Usage();
    MetaMoves(argv[2], argc == 4 ? ParseNonNegative(argv[3]) : 4);
    return 0;
  }

  CHECK(argc <= 5) << Usage();
  SolverKind kind = SolverKind::LOOKAHEAD;
  if (argc > 2) {
    std::optional<SolverKind> k = SolverKindByName(argv[2]);
    CHECK(k.has_value()) << "Unknown solver " << argv[2] << "\n" << Usage();
    kind = k.value();
  }
  const int scramble_turns =
    argc > 3 ? ParseNonNegative(argv[3]) : DEFAULT_SCRAMBLE_TURNS;
  const std::string seed = argc > 4 ? argv[4] : "twisty";

  Solve(cmd, kind, scramble_turns, seed);
  return 0;
}
