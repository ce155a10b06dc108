#ifndef _TWISTY_BIJECTION_TRIE_H
#define _TWISTY_BIJECTION_TRIE_H

#include <cstdint>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "bijection.h"

// Stores values keyed by bijections (all of the same size), with
// lookup of the stored bijections ordered by how many positions
// differ from a query. Each level of the trie is one position of
// the bijection.
template<class T>
struct BijectionTrie {
  BijectionTrie() : nodes(1) {}

  // Replaces any existing value for the same key.
  void Insert(const Bijection &key, T value) {
    int node = 0;
    for (int x : key.v) {
      int child = FindChild(node, x);
      if (child < 0) {
        child = (int)nodes.size();
        nodes[node].children.emplace_back(x, child);
        // Invalidates references into nodes.
        nodes.emplace_back();
      }
      node = child;
    }
    if (!nodes[node].data.has_value()) num_values++;
    nodes[node].data = {std::move(value)};
  }

  const T *FindExact(const Bijection &key) const {
    int node = 0;
    for (int x : key.v) {
      node = FindChild(node, x);
      if (node < 0) return nullptr;
    }
    const std::optional<T> &data = nodes[node].data;
    return data.has_value() ? &data.value() : nullptr;
  }

  size_t Size() const { return num_values; }

  // Best-first enumeration of the stored values, in ascending order
  // of the number of positions where their key differs from the
  // query. Ties come out in insertion order of the trie branches.
  // The trie must outlive this, and must not be modified meanwhile.
  struct Similar {
    // Next (differences, value), or nullopt when exhausted.
    std::optional<std::pair<int, const T *>> Next() {
      while (!heap.empty()) {
        const Entry e = heap.top();
        heap.pop();

        const Node &node = trie->nodes[e.node];
        if (e.depth == (int)query.v.size()) {
          if (node.data.has_value())
            return {std::make_pair(e.differences, &node.data.value())};
          continue;
        }

        for (const auto &[x, child] : node.children) {
          const int d = e.differences + (x == query.v[e.depth] ? 0 : 1);
          heap.push(Entry{.differences = d, .seq = seq++,
                          .node = child, .depth = e.depth + 1});
        }
      }
      return std::nullopt;
    }

   private:
    friend struct BijectionTrie<T>;
    struct Entry {
      int differences = 0;
      int64_t seq = 0;
      int node = 0;
      int depth = 0;
    };
    // Smallest differences first, then first pushed.
    struct Later {
      bool operator()(const Entry &a, const Entry &b) const {
        if (a.differences != b.differences)
          return a.differences > b.differences;
        return a.seq > b.seq;
      }
    };

    Similar(const BijectionTrie<T> *trie, Bijection query) :
      trie(trie), query(std::move(query)) {
      heap.push(Entry{.differences = 0, .seq = seq++,
                      .node = 0, .depth = 0});
    }

    const BijectionTrie<T> *trie = nullptr;
    Bijection query;
    int64_t seq = 0;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap;
  };

  Similar FindMostSimilar(const Bijection &query) const {
    return Similar(this, query);
  }

 private:
  struct Node {
    // (value at this position, node index), in insertion order.
    std::vector<std::pair<int, int>> children;
    std::optional<T> data;
  };

  int FindChild(int node, int x) const {
    for (const auto &[cx, child] : nodes[node].children)
      if (cx == x) return child;
    return -1;
  }

  // The root is node 0.
  std::vector<Node> nodes;
  size_t num_values = 0;
};

#endif
