#include "phased-solver.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ansi.h"
#include "base/logging.h"
#include "bijection-trie.h"
#include "bijection.h"
#include "metamoves.h"
#include "status-bar.h"
#include "timer.h"
#include "traverse-combinations.h"
#include "twisty-puzzle.h"

static constexpr bool VERBOSE = false;

int NumEvenPieceCycles(const TwistyPuzzle &puzzle, const MetaMove &mm,
                       int type) {
  // Permutation of pieces, in pull form like the face map. Pieces
  // move as a block, so any face of the piece will do.
  std::vector<int> perm(puzzle.NumPieces());
  std::iota(perm.begin(), perm.end(), 0);
  for (int p : puzzle.PieceTypes()[type].pieces) {
    const int face = puzzle.Pieces()[p][0];
    perm[p] = puzzle.PieceOfFace(mm.face_map[face]);
  }
  Bijection piece_map(std::move(perm));
  CHECK(piece_map.IsValid()) << piece_map.ToString();

  int even = 0;
  for (const std::vector<int> &cycle : piece_map.Cycles())
    if (cycle.size() % 2 == 0) even++;
  return even;
}

bool FlipsParity(const TwistyPuzzle &puzzle, const MetaMove &mm, int type) {
  return NumEvenPieceCycles(puzzle, mm, type) == 1;
}

// Colors are polyhedron faces, so each fits in a byte.
static std::string StateKey(const PuzzleState &state) {
  std::string key(state.size(), '\0');
  for (int i = 0; i < (int)state.size(); i++) key[i] = (char)state[i];
  return key;
}

bool PiecePermutationIsOdd(const TwistyPuzzle &puzzle,
                           const PuzzleState &state, int type) {
  auto Colors = [&puzzle](const PuzzleState &s, int piece) {
      std::vector<int> colors;
      for (int f : puzzle.Pieces()[piece]) colors.push_back(s[f]);
      std::sort(colors.begin(), colors.end());
      return colors;
    };

  const PuzzleState solved = puzzle.InitialState();
  const std::vector<int> &pieces = puzzle.PieceTypes()[type].pieces;
  std::map<std::vector<int>, int> home;
  for (int i = 0; i < (int)pieces.size(); i++) {
    if (!home.emplace(Colors(solved, pieces[i]), i).second) return false;
  }

  // The index of the piece now at each position.
  std::vector<int> perm;
  perm.reserve(pieces.size());
  for (int p : pieces) {
    auto it = home.find(Colors(state, p));
    if (it == home.end()) return false;
    perm.push_back(it->second);
  }
  Bijection piece_map(std::move(perm));
  if (!piece_map.IsValid()) return false;

  int even = 0;
  for (const std::vector<int> &cycle : piece_map.Cycles())
    if (cycle.size() % 2 == 0) even++;
  return even % 2 == 1;
}

std::optional<std::vector<int>> FinishSearch(const TwistyPuzzle &puzzle,
                                             const PuzzleState &state,
                                             int max_depth,
                                             int max_states) {
  if (puzzle.IsSolved(state)) return {std::vector<int>{}};

  // Each state on a side maps to the turn that first reached it, or
  // -1 for where the side started.
  using Side = std::unordered_map<std::string, int>;
  const PuzzleState solved = puzzle.InitialState();
  Side fwd = {{StateKey(state), -1}};
  Side bwd = {{StateKey(solved), -1}};
  std::vector<PuzzleState> fwd_frontier = {state};
  std::vector<PuzzleState> bwd_frontier = {solved};

  // Adds the next layer, returning a state that the other side
  // already has.
  auto Expand = [&puzzle, max_states](
      Side *side, std::vector<PuzzleState> *frontier,
      const Side &other) -> std::optional<PuzzleState> {
      std::vector<PuzzleState> next;
      for (const PuzzleState &s : *frontier) {
        for (int t = 0; t < puzzle.NumTurns(); t++) {
          PuzzleState d = puzzle.DerivedStateTurn(s, t);
          std::string key = StateKey(d);
          if (other.contains(key)) {
            side->emplace(std::move(key), t);
            return {std::move(d)};
          }
          // Full sides still look for a meeting point.
          if ((int)side->size() >= max_states) continue;
          if (side->emplace(std::move(key), t).second)
            next.push_back(std::move(d));
        }
      }
      *frontier = std::move(next);
      return std::nullopt;
    };

  // Turns that take the state back to where the side started.
  auto PathBack = [&puzzle](const Side &side, PuzzleState s) {
      std::vector<int> turns;
      for (;;) {
        auto it = side.find(StateKey(s));
        CHECK(it != side.end());
        if (it->second < 0) return turns;
        const int undo = TwistyPuzzle::InvertedTurnIndex(it->second);
        turns.push_back(undo);
        s = puzzle.DerivedStateTurn(s, undo);
      }
    };

  auto Solution = [&](const PuzzleState &meet) {
      std::vector<int> turns = PathBack(fwd, meet);
      std::reverse(turns.begin(), turns.end());
      for (int &t : turns) t = TwistyPuzzle::InvertedTurnIndex(t);
      for (int t : PathBack(bwd, meet)) turns.push_back(t);
      return turns;
    };

  for (int depth = 0; depth < max_depth; depth++) {
    if (fwd_frontier.empty() && bwd_frontier.empty()) break;
    if (std::optional<PuzzleState> meet =
        Expand(&fwd, &fwd_frontier, bwd)) {
      return {Solution(meet.value())};
    }
    if (std::optional<PuzzleState> meet =
        Expand(&bwd, &bwd_frontier, fwd)) {
      return {Solution(meet.value())};
    }
  }

  if (VERBOSE) {
    printf("FinishSearch: nothing within %d turns (%d + %d states)\n",
           2 * max_depth, (int)fwd.size(), (int)bwd.size());
  }
  return std::nullopt;
}

// Pairs up metamoves that are close on the masked faces; m1 m2⁻¹ then
// does little outside the differences. Returns the first such
// combination that satisfies the predicate.
template<class Pred>
static std::optional<MetaMove> PairSearch(const TwistyPuzzle &puzzle,
                                          const MetaMovePlan::Opts &opts,
                                          const std::vector<MetaMove> &pool,
                                          const std::vector<bool> &mask,
                                          const Pred &pred) {
  BijectionTrie<int> trie;
  std::vector<Bijection> masked;
  masked.reserve(pool.size());
  for (int i = 0; i < (int)pool.size(); i++) {
    masked.push_back(pool[i].face_map.Mask(mask));
    trie.Insert(masked.back(), i);
  }

  for (int i = 0; i < (int)pool.size(); i++) {
    BijectionTrie<int>::Similar similar = trie.FindMostSimilar(masked[i]);
    for (int n = 0; n < opts.similar_per_metamove; n++) {
      std::optional<std::pair<int, const int *>> next = similar.Next();
      if (!next.has_value()) break;
      const auto &[differences, j] = next.value();
      if (differences == 0) continue;
      MetaMove combined = pool[i].Apply(puzzle, pool[*j].Invert(puzzle));
      if (pred(combined)) return {std::move(combined)};
    }
  }
  return std::nullopt;
}

static SolvePhase MakePhase(const TwistyPuzzle &puzzle,
                            const MetaMovePlan::Opts &opts,
                            const std::vector<MetaMove> &metamoves,
                            int target_type,
                            const std::vector<int> &preserve_types,
                            bool solve_parity) {
  SolvePhase phase;
  phase.target_type = target_type;
  phase.preserve_types = preserve_types;

  auto Useful = [&](const MetaMove &mm) {
      return mm.NumAffectedPiecesOfType(puzzle, target_type) > 0 &&
        mm.Preserves(puzzle, preserve_types);
    };

  // Single turns can only help when nothing needs to be preserved.
  std::vector<MetaMove> pool;
  if (preserve_types.empty()) {
    for (int t = 0; t < puzzle.NumTurns(); t++)
      pool.push_back(MetaMove::FromTurns(puzzle, {t}));
  }
  pool.insert(pool.end(), metamoves.begin(), metamoves.end());
  std::sort(pool.begin(), pool.end());

  std::unordered_set<Bijection, BijectionHash> seen;
  std::vector<MetaMove> basis;
  for (const MetaMove &mm : pool) {
    if (Useful(mm) && seen.insert(mm.face_map).second)
      basis.push_back(mm);
  }

  if (basis.empty()) {
    // Commutators of moves whose supports barely overlap can leave
    // the earlier types alone.
    const int num = std::min((int)pool.size(), opts.max_commutator_candidates);
    std::vector<MetaMove> comms;
    for (int i = 0; i < num; i++) {
      for (int j = 0; j < num; j++) {
        if (i == j) continue;
        MetaMove comm = Commutator(puzzle, pool[i], pool[j]);
        if (Useful(comm) && seen.insert(comm.face_map).second)
          comms.push_back(std::move(comm));
      }
    }
    std::sort(comms.begin(), comms.end());
    basis = std::move(comms);
  }

  // Faces whose behavior matters when pairing metamoves up.
  std::vector<bool> mask = puzzle.PieceTypes()[target_type].face_mask;
  for (int type : preserve_types) {
    const std::vector<bool> &m = puzzle.PieceTypes()[type].face_mask;
    for (int f = 0; f < (int)mask.size(); f++) mask[f] = mask[f] || m[f];
  }

  auto IsThreeCycle = [&](const MetaMove &mm) {
      return mm.NumAffectedPiecesOfType(puzzle, target_type) == 3 &&
        mm.Preserves(puzzle, preserve_types);
    };

  for (const MetaMove &mm : basis) {
    if (IsThreeCycle(mm)) {
      phase.three_cycle = {mm};
      break;
    }
  }
  if (!phase.three_cycle.has_value())
    phase.three_cycle = PairSearch(puzzle, opts, pool, mask, IsThreeCycle);

  if (solve_parity) {
    auto IsFlipper = [&](const MetaMove &mm) {
        return Useful(mm) && FlipsParity(puzzle, mm, target_type);
      };
    for (const MetaMove &mm : basis) {
      if (IsFlipper(mm)) {
        phase.parity_flipper = {mm};
        break;
      }
    }
    if (!phase.parity_flipper.has_value())
      phase.parity_flipper = PairSearch(puzzle, opts, pool, mask, IsFlipper);
  }

  // The special moves go first, if they are not already there.
  std::vector<MetaMove> special;
  for (const std::optional<MetaMove> &mm :
         {phase.three_cycle, phase.parity_flipper}) {
    if (mm.has_value() && seen.insert(mm.value().face_map).second)
      special.push_back(mm.value());
  }
  basis.insert(basis.begin(), special.begin(), special.end());

  if (opts.max_basis > 0 && (int)basis.size() > opts.max_basis)
    basis.resize(opts.max_basis);

  phase.basis = std::move(basis);
  return phase;
}

std::shared_ptr<const MetaMovePlan> MetaMovePlan::Build(
    const TwistyPuzzle &puzzle, const Opts &opts, StatusBar *status) {
  Timer timer;
  auto plan = std::make_shared<MetaMovePlan>();
  plan->metamoves = DiscoverMetaMoves(
      puzzle, [](const MetaMove &) { return true; },
      opts.discovery_turns, status);

  std::vector<int> preserve;
  for (int type = 0; type < (int)puzzle.PieceTypes().size(); type++) {
    if (!puzzle.PieceTypes()[type].movable) continue;

    SolvePhase phase = MakePhase(puzzle, opts, plan->metamoves, type,
                                 preserve, preserve.empty());
    if (phase.basis.empty()) {
      LOG(FATAL) << "No metamove moves piece type " << type
                 << " while preserving the " << preserve.size()
                 << " earlier type(s). Try more discovery turns.";
    }

    if (status != nullptr) {
      status->Printf("Phase " AWHITE("%d") ": type " ACYAN("%d")
                     " (%d faces/piece), basis " AGREEN("%d") "%s%s\n",
                     (int)plan->phases.size(), type,
                     puzzle.PieceTypes()[type].faces_per_piece,
                     (int)phase.basis.size(),
                     phase.three_cycle.has_value() ? ", three-cycle" : "",
                     phase.parity_flipper.has_value() ? ", parity" : "");
    }

    plan->phases.push_back(std::move(phase));
    preserve.push_back(type);
  }

  if (VERBOSE) {
    printf("Plan: %d metamoves, %d phases in %s\n",
           (int)plan->metamoves.size(), (int)plan->phases.size(),
           ANSI::Time(timer.Seconds()).c_str());
  }
  return plan;
}

MetaMovePhasedSolver::MetaMovePhasedSolver(
    const TwistyPuzzle &puzzle,
    std::shared_ptr<const MetaMovePlan> plan_in,
    PuzzleState initial, const Opts &opts) :
  ScrambleSolver(puzzle, std::move(initial)),
  plan(std::move(plan_in)), opts(opts) {
  CHECK(plan != nullptr);
  for (int t = 0; t < puzzle.NumTurns(); t++)
    setup_turns.push_back(MetaMove::FromTurns(puzzle, {t}));
}

std::optional<MetaMove> MetaMovePhasedSolver::NextMetaMove(
    const SolvePhase &phase) {
  const int target = phase.target_type;
  const int total = puzzle.NumPiecesOfType(target);
  const int current = puzzle.NumSolvedPiecesOfType(state, target);

  std::optional<MetaMove> best;
  int best_score = current;

  // Returns true if the target type is completely solved.
  auto Consider = [&](const MetaMove &mm) {
      const PuzzleState s = TwistyPuzzle::DerivedState(state, mm.face_map);
      const int score = puzzle.NumSolvedPiecesOfType(s, target);
      if (score <= current) return false;
      for (int type : phase.preserve_types) {
        if (puzzle.NumSolvedPiecesOfType(s, type) !=
            puzzle.NumPiecesOfType(type))
          return false;
      }

      if (!best.has_value() || score > best_score ||
          (score == best_score &&
           (mm.turns.size() < best->turns.size() ||
            (mm.turns.size() == best->turns.size() &&
             mm.turns < best->turns)))) {
        best = {mm};
        best_score = score;
      }
      return score == total;
    };

  // Coming back to a state means the steps below are going in
  // circles.
  if (seen_states.insert(StateKey(state)).second) {
    TraverseCombinations(
        setup_turns, opts.setup_turns, MetaMove::Empty(puzzle),
        [this](const MetaMove &a, const MetaMove &b) {
          return a.Apply(puzzle, b);
        },
        [&](const MetaMove &setup) {
          const int n = (int)setup.turns.size();
          if (n >= 2 &&
              setup.turns[n - 1] ==
              TwistyPuzzle::InvertedTurnIndex(setup.turns[n - 2]))
            return TraverseResult::SKIP;

          const MetaMove undo = setup.Invert(puzzle);
          for (const MetaMove &b : phase.basis) {
            const bool done = n == 0 ? Consider(b) :
              Consider(setup.Apply(puzzle, b).Apply(puzzle, undo));
            if (done) return TraverseResult::BREAK;
          }
          return TraverseResult::CONTINUE;
        });

    if (!best.has_value()) {
      const int num = std::min((int)phase.basis.size(), opts.max_pair_basis);
      bool done = false;
      for (int i = 0; i < num && !done; i++) {
        for (int j = 0; j < num && !done; j++) {
          done = Consider(phase.basis[i].Apply(puzzle, phase.basis[j]));
        }
      }
    }

    if (best.has_value()) return best;

    // Two swapped pieces are an odd permutation, which no even
    // metamove fixes.
    if (phase.parity_flipper.has_value() && total - current == 2 &&
        PiecePermutationIsOdd(puzzle, state, target)) {
      return phase.parity_flipper;
    }
  }

  if (opts.finish_depth > 0) {
    std::optional<std::vector<int>> turns =
      FinishSearch(puzzle, state, opts.finish_depth, opts.finish_states);
    if (turns.has_value()) {
      MetaMove mm = MetaMove::FromTurns(puzzle, turns.value());
      CHECK(puzzle.IsSolved(TwistyPuzzle::DerivedState(state, mm.face_map)))
        << puzzle.TurnsString(mm.turns);
      return {std::move(mm)};
    }
  }

  return std::nullopt;
}

std::optional<int> MetaMovePhasedSolver::Next() {
  while (queued.empty()) {
    if (phase_idx >= (int)plan->phases.size()) return std::nullopt;

    const SolvePhase &phase = plan->phases[phase_idx];
    if (puzzle.NumSolvedPiecesOfType(state, phase.target_type) ==
        puzzle.NumPiecesOfType(phase.target_type)) {
      phase_idx++;
      continue;
    }

    if (steps >= opts.max_steps) return std::nullopt;
    std::optional<MetaMove> mm = NextMetaMove(phase);
    if (!mm.has_value()) return std::nullopt;
    steps++;

    if (VERBOSE) {
      printf("Phase %d step %d: %s\n", phase_idx, steps,
             puzzle.TurnsString(mm.value().turns).c_str());
    }

    for (int t : mm.value().turns) queued.push_back(t);
  }

  const int t = queued.front();
  queued.pop_front();
  ApplyTurn(t);
  return {t};
}
