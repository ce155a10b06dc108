#ifndef _TWISTY_TRAVERSE_COMBINATIONS_H
#define _TWISTY_TRAVERSE_COMBINATIONS_H

#include <utility>
#include <vector>

enum class TraverseResult {
  // Visit the extensions of this value.
  CONTINUE,
  // Don't extend this value, but keep going.
  SKIP,
  // Stop the whole traversal.
  BREAK,
};

// Depth-first traversal of all sequences of up to depth_limit items
// (with repetition), folded from the initial value with combine. The
// visitor sees the initial value first, and then every combination
// in lexicographic order of item index, so for items a, b, c and
// depth 2:
//
//   "", a, aa, ab, ac, b, ba, bb, bc, c, ca, cb, cc
//
// The visitor returns a TraverseResult for each value. A SKIP or BREAK
// for the initial value ends the traversal, since it has no siblings.
//
// Uses an explicit stack, so the depth is not limited by the
// call stack.
//
//   Combine: Combined(const Combined &, const Item &)
//   Visit: TraverseResult(const Combined &)
template<class Item, class Combined, class Combine, class Visit>
void TraverseCombinations(const std::vector<Item> &items,
                          int depth_limit,
                          Combined initial,
                          const Combine &combine,
                          Visit &&visit) {
  if (visit(initial) != TraverseResult::CONTINUE) return;
  if (depth_limit <= 0 || items.empty()) return;

  struct Frame {
    // Value before the item at idx is combined in.
    Combined prev;
    int idx = 0;
  };

  const int num_items = (int)items.size();
  std::vector<Frame> stack;
  stack.reserve(depth_limit);
  stack.push_back(Frame{.prev = std::move(initial), .idx = 0});

  // Move to the next sibling, popping exhausted frames.
  auto Advance = [&stack, num_items]() {
      while (!stack.empty()) {
        Frame &top = stack.back();
        if (top.idx + 1 < num_items) {
          top.idx++;
          return;
        }
        stack.pop_back();
      }
    };

  while (!stack.empty()) {
    Combined combined = combine(stack.back().prev, items[stack.back().idx]);
    const TraverseResult r = visit(combined);
    if (r == TraverseResult::BREAK) return;

    if (r == TraverseResult::CONTINUE && (int)stack.size() < depth_limit) {
      stack.push_back(Frame{.prev = std::move(combined), .idx = 0});
    } else {
      Advance();
    }
  }
}

#endif
