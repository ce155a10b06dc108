#include "bijection.h"

#include <cstdint>
#include <string>
#include <vector>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "util.h"

Bijection Bijection::Identity(int n) {
  std::vector<int> v(n);
  for (int i = 0; i < n; i++) v[i] = i;
  return Bijection(std::move(v));
}

Bijection Bijection::Apply(const Bijection &other) const {
  CHECK_EQ(v.size(), other.v.size());
  std::vector<int> out(v.size());
  for (int i = 0; i < (int)v.size(); i++) out[i] = v[other.v[i]];
  return Bijection(std::move(out));
}

Bijection Bijection::Invert() const {
  std::vector<int> out(v.size());
  for (int i = 0; i < (int)v.size(); i++) out[v[i]] = i;
  return Bijection(std::move(out));
}

bool Bijection::IsInverseOf(const Bijection &other) const {
  if (v.size() != other.v.size()) return false;
  for (int i = 0; i < (int)v.size(); i++)
    if (other.v[v[i]] != i) return false;
  return true;
}

bool Bijection::IsIdentity() const {
  for (int i = 0; i < (int)v.size(); i++)
    if (v[i] != i) return false;
  return true;
}

bool Bijection::IsValid() const {
  std::vector<bool> seen(v.size(), false);
  for (int x : v) {
    if (x < 0 || x >= (int)v.size() || seen[x]) return false;
    seen[x] = true;
  }
  return true;
}

Bijection Bijection::Mask(const std::vector<bool> &mask) const {
  CHECK_EQ(mask.size(), v.size());
  std::vector<int> out(v.size());
  for (int i = 0; i < (int)v.size(); i++) out[i] = mask[i] ? v[i] : i;
  return Bijection(std::move(out));
}

std::vector<std::vector<int>> Bijection::Cycles() const {
  std::vector<std::vector<int>> cycles;
  std::vector<bool> done(v.size(), false);
  for (int i = 0; i < (int)v.size(); i++) {
    if (done[i]) continue;
    std::vector<int> cycle;
    int j = i;
    do {
      done[j] = true;
      cycle.push_back(j);
      j = v[j];
    } while (j != i);
    if (cycle.size() >= 2) cycles.push_back(std::move(cycle));
  }
  return cycles;
}

int Bijection::Differences(const Bijection &other) const {
  CHECK_EQ(v.size(), other.v.size());
  int d = 0;
  for (int i = 0; i < (int)v.size(); i++)
    if (v[i] != other.v[i]) d++;
  return d;
}

std::string Bijection::ToString() const {
  std::vector<std::string> s;
  s.reserve(v.size());
  for (int x : v) s.push_back(StringPrintf("%d", x));
  return "[" + Util::Join(s, ",") + "]";
}

size_t BijectionHash::operator()(const Bijection &b) const {
  uint64_t h = 0xCBF29CE484222325ULL;
  for (int x : b.v) {
    h ^= (uint64_t)(uint32_t)x;
    h *= 0x100000001B3ULL;
  }
  return (size_t)h;
}
