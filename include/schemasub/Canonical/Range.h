#ifndef _SCHEMASUB_CANONICAL_RANGE_H_
#define _SCHEMASUB_CANONICAL_RANGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace schemasub {

/// \brief One end of a numeric interval.
///
/// A bound is either unbounded (NegInf / PosInf) or a finite value that may be
/// open (exclusive) or closed (inclusive). Comparisons are total, so callers
/// never compare raw doubles against infinities.
struct Bound {
  enum BoundKind { NegInf, Finite, PosInf };
  BoundKind Kind = NegInf;
  double Value = 0;
  bool Open = false;

  static Bound negInf() { return Bound{NegInf, 0, false}; }
  static Bound posInf() { return Bound{PosInf, 0, false}; }
  static Bound closed(double V) { return Bound{Finite, V, false}; }
  static Bound open(double V) { return Bound{Finite, V, true}; }

  bool isFinite() const { return Kind == Finite; }
  bool operator==(const Bound &rhs) const {
    if (Kind != rhs.Kind) {
      return false;
    }
    return Kind != Finite ||
           std::tie(Value, Open) == std::tie(rhs.Value, rhs.Open);
  }
  bool operator!=(const Bound &rhs) const { return !(*this == rhs); }
};

/// Order lower bounds by the smallest value they admit: returns <0 if \p A
/// admits more than \p B.
int compareLower(const Bound &A, const Bound &B);
/// Order upper bounds by the largest value they admit: returns <0 if \p A
/// admits less than \p B.
int compareUpper(const Bound &A, const Bound &B);

inline const Bound &tighterLower(const Bound &A, const Bound &B) {
  return compareLower(A, B) >= 0 ? A : B;
}
inline const Bound &looserLower(const Bound &A, const Bound &B) {
  return compareLower(A, B) <= 0 ? A : B;
}
inline const Bound &tighterUpper(const Bound &A, const Bound &B) {
  return compareUpper(A, B) <= 0 ? A : B;
}
inline const Bound &looserUpper(const Bound &A, const Bound &B) {
  return compareUpper(A, B) >= 0 ? A : B;
}

/// True if no real number lies between the two bounds.
bool isEmptyInterval(const Bound &Lower, const Bound &Upper);
bool admitsValue(const Bound &Lower, const Bound &Upper, double V);

/// \brief A closed range of non-negative counts, e.g. string length or
/// number of array items. No Max means unbounded.
struct SizeRange {
  uint64_t Min = 0;
  std::optional<uint64_t> Max;

  bool empty() const { return Max && *Max < Min; }
  bool isAny() const { return Min == 0 && !Max; }
  bool contains(uint64_t N) const { return N >= Min && (!Max || N <= *Max); }
  bool includedIn(const SizeRange &Other) const;
  SizeRange meet(const SizeRange &Other) const;
  SizeRange join(const SizeRange &Other) const;

  bool operator==(const SizeRange &rhs) const {
    return std::tie(Min, Max) == std::tie(rhs.Min, rhs.Max);
  }
  bool operator!=(const SizeRange &rhs) const { return !(*this == rhs); }
  std::string toString() const;
};

} // namespace schemasub

#endif
