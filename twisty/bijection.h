#ifndef _TWISTY_BIJECTION_H
#define _TWISTY_BIJECTION_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// A permutation of 0..n-1, in "pull" form: position i of the result
// of applying it takes its value from position v[i]. So composition
// and action on states read right to left:
//
//   a.Apply(b)[i] = a[b[i]]
//   DerivedState(s, b)[i] = s[b[i]]
struct Bijection {
  std::vector<int> v;

  Bijection() {}
  explicit Bijection(std::vector<int> v) : v(std::move(v)) {}

  static Bijection Identity(int n);

  int Size() const { return (int)v.size(); }
  int operator[](int i) const { return v[i]; }

  // Composition; the sizes must match.
  Bijection Apply(const Bijection &other) const;
  Bijection Invert() const;
  bool IsInverseOf(const Bijection &other) const;
  bool IsIdentity() const;

  // True if this is actually a permutation of 0..n-1.
  bool IsValid() const;

  // Restrict to the masked positions; everything else maps to
  // itself. The mask must be the same size.
  Bijection Mask(const std::vector<bool> &mask) const;

  // Disjoint cycles of length at least two, each starting from its
  // smallest element, in ascending order of that element. A cycle
  // lists i, v[i], v[v[i]], ...
  std::vector<std::vector<int>> Cycles() const;

  // Number of positions where the two differ.
  int Differences(const Bijection &other) const;

  std::string ToString() const;

  bool operator==(const Bijection &other) const = default;
  bool operator<(const Bijection &other) const { return v < other.v; }
};

struct BijectionHash {
  size_t operator()(const Bijection &b) const;
};

#endif
