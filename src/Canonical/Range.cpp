#include "Canonical/Range.h"

#include <algorithm>

namespace schemasub {

int compareLower(const Bound &A, const Bound &B) {
  if (A.Kind != B.Kind) {
    return A.Kind < B.Kind ? -1 : 1;
  }
  if (!A.isFinite()) {
    return 0;
  }
  if (A.Value != B.Value) {
    return A.Value < B.Value ? -1 : 1;
  }
  // (v, closed) admits v, (v, open) does not.
  if (A.Open != B.Open) {
    return A.Open ? 1 : -1;
  }
  return 0;
}

int compareUpper(const Bound &A, const Bound &B) {
  if (A.Kind != B.Kind) {
    return A.Kind < B.Kind ? -1 : 1;
  }
  if (!A.isFinite()) {
    return 0;
  }
  if (A.Value != B.Value) {
    return A.Value < B.Value ? -1 : 1;
  }
  if (A.Open != B.Open) {
    return A.Open ? -1 : 1;
  }
  return 0;
}

bool isEmptyInterval(const Bound &Lower, const Bound &Upper) {
  if (Lower.Kind == Bound::PosInf || Upper.Kind == Bound::NegInf) {
    return true;
  }
  if (!Lower.isFinite() || !Upper.isFinite()) {
    return false;
  }
  if (Lower.Value != Upper.Value) {
    return Lower.Value > Upper.Value;
  }
  return Lower.Open || Upper.Open;
}

bool admitsValue(const Bound &Lower, const Bound &Upper, double V) {
  return compareLower(Lower, Bound::closed(V)) <= 0 &&
         compareUpper(Bound::closed(V), Upper) <= 0;
}

bool SizeRange::includedIn(const SizeRange &Other) const {
  if (empty()) {
    return true;
  }
  if (Min < Other.Min) {
    return false;
  }
  if (!Other.Max) {
    return true;
  }
  return Max && *Max <= *Other.Max;
}

SizeRange SizeRange::meet(const SizeRange &Other) const {
  SizeRange Ret;
  Ret.Min = std::max(Min, Other.Min);
  if (Max && Other.Max) {
    Ret.Max = std::min(*Max, *Other.Max);
  } else {
    Ret.Max = Max ? Max : Other.Max;
  }
  return Ret;
}

SizeRange SizeRange::join(const SizeRange &Other) const {
  if (empty()) {
    return Other;
  }
  if (Other.empty()) {
    return *this;
  }
  SizeRange Ret;
  Ret.Min = std::min(Min, Other.Min);
  if (Max && Other.Max) {
    Ret.Max = std::max(*Max, *Other.Max);
  }
  return Ret;
}

std::string SizeRange::toString() const {
  return "[" + std::to_string(Min) + ", " +
         (Max ? std::to_string(*Max) : std::string("inf")) + "]";
}

} // namespace schemasub
