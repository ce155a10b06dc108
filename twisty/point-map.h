#ifndef _TWISTY_POINT_MAP_H
#define _TWISTY_POINT_MAP_H

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "geometry.h"
#include "yocto_matht.h"

// Map from points in space to values, where lookup is up to a small
// distance. Below there is also PointSet3, which is a simple wrapper
// for the common case that you don't need interesting values.
//
// Points are bucketed in a grid whose cells are a few times larger
// than the lookup distance, and lookups check the 27 cells around
// the query point. So two points within the distance are always
// found, even if they straddle a cell boundary.
//
// Note that "within the distance" is not an equivalence relation!
// When several stored points are close to the query, the closest
// one wins.
//
// Value is copied willy-nilly, so it should be something cheap
// like an int.
template<typename Value>
struct PointMap3 {
  PointMap3() : PointMap3(POINT_EPSILON) {}
  explicit PointMap3(double dist) :
    sqdist(dist * dist), cell_size(dist * 4.0) {}

  // Note that this does *not* deduplicate points if you use Add.
  // It's just the number of elements that have been inserted.
  size_t Size() const {
    return num_points;
  }

  bool Contains(const vec3 &p) const {
    return Find(p) != nullptr;
  }

  std::optional<Value> Get(const vec3 &p) const {
    const auto *e = Find(p);
    if (e == nullptr) return std::nullopt;
    return {e->second};
  }

  // This allows points to overlap (or even be exactly coincident),
  // so check Contains() before inserting if you do not want to insert
  // such points. (But then the contents will be order-dependent!)
  void Add(const vec3 &q, const Value &v) {
    cells[CellOf(q)].emplace_back(q, v);
    num_points++;
  }

  // Insert, or replace the value of the closest existing point within
  // the distance. The stored position of a replaced point is kept.
  void Set(const vec3 &q, const Value &v) {
    std::pair<vec3, Value> *e = Find(q);
    if (e != nullptr) {
      e->second = v;
    } else {
      Add(q, v);
    }
  }

  // In an unspecified order.
  std::vector<vec3> Points() const {
    std::vector<vec3> ret;
    ret.reserve(num_points);
    for (const auto &[c_, pts] : cells)
      for (const auto &[p, v_] : pts)
        ret.push_back(p);
    return ret;
  }

 private:
  using Cell = std::array<int64_t, 3>;
  struct CellHash {
    size_t operator()(const Cell &c) const {
      uint64_t h = 0xCAFEBABE;
      for (int64_t x : c) {
        h ^= (uint64_t)x + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
      }
      return (size_t)h;
    }
  };

  Cell CellOf(const vec3 &p) const {
    return Cell{(int64_t)std::floor(p.x / cell_size),
                (int64_t)std::floor(p.y / cell_size),
                (int64_t)std::floor(p.z / cell_size)};
  }

  // Cell and index of the closest point within the distance.
  std::optional<std::pair<Cell, size_t>> Locate(const vec3 &p) const {
    const Cell c = CellOf(p);
    std::optional<std::pair<Cell, size_t>> best;
    double best_sqdist = sqdist;
    for (int dx = -1; dx <= 1; dx++) {
      for (int dy = -1; dy <= 1; dy++) {
        for (int dz = -1; dz <= 1; dz++) {
          const Cell n{c[0] + dx, c[1] + dy, c[2] + dz};
          auto it = cells.find(n);
          if (it == cells.end()) continue;
          for (size_t i = 0; i < it->second.size(); i++) {
            const double d = distance_squared(p, it->second[i].first);
            if (d < best_sqdist) {
              best_sqdist = d;
              best = {std::make_pair(n, i)};
            }
          }
        }
      }
    }
    return best;
  }

  const std::pair<vec3, Value> *Find(const vec3 &p) const {
    const auto loc = Locate(p);
    if (!loc.has_value()) return nullptr;
    return &cells.find(loc->first)->second[loc->second];
  }

  std::pair<vec3, Value> *Find(const vec3 &p) {
    const auto loc = Locate(p);
    if (!loc.has_value()) return nullptr;
    return &cells.find(loc->first)->second[loc->second];
  }

  double sqdist = 0.0;
  double cell_size = 0.0;
  size_t num_points = 0;
  std::unordered_map<Cell, std::vector<std::pair<vec3, Value>>,
                     CellHash> cells;
};

struct PointSet3 {
  PointSet3() {}
  explicit PointSet3(double dist) : m(dist) {}

  // Note that this does *not* deduplicate points! It's just
  // the number of elements that have been inserted.
  size_t Size() const {
    return m.Size();
  }

  bool Contains(const vec3 &p) const {
    return m.Contains(p);
  }

  // As in PointMap3::Add.
  void Add(const vec3 &q) {
    m.Add(q, Unit{});
  }

  std::vector<vec3> Points() const {
    return m.Points();
  }

 private:
  struct Unit { };
  PointMap3<Unit> m;
};

#endif
