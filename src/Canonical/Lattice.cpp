#include "Canonical/Lattice.h"

#include <algorithm>
#include <boost/range/join.hpp>
#include <cmath>
#include <cstdlib>
#include <llvm/ADT/SmallBitVector.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <numeric>

#define DEBUG_TYPE "schemasub-lattice"

namespace schemasub {

using automata::DFA;
using automata::PDFA;

Annotation PlainAnnotations::meet(const Annotation &A, const Annotation &B) {
  if (!A) {
    return B;
  }
  if (!B || *A == *B) {
    return A;
  }
  return std::nullopt;
}

Annotation PlainAnnotations::join(const Annotation &A, const Annotation &B) {
  if (A && B && *A == *B) {
    return A;
  }
  return std::nullopt;
}

// ===== Numeric helpers =====

static constexpr double Epsilon = 1e-9;

bool isMultipleOf(double Value, double Step) {
  if (Step == 0) {
    return Value == 0;
  }
  double R = Value / Step;
  return std::fabs(R - std::round(R)) <= Epsilon * std::max(1.0, std::fabs(R));
}

/// Approximate a positive double by P/Q with a bounded denominator.
static bool toFraction(double X, int64_t &P, int64_t &Q) {
  const int64_t MaxDen = 1000000;
  if (!(X > 0) || X > 1e12) {
    return false;
  }
  // continued fraction expansion
  int64_t H0 = 0, H1 = 1, K0 = 1, K1 = 0;
  double F = X;
  for (int I = 0; I < 64; ++I) {
    double A = std::floor(F);
    int64_t Ai = static_cast<int64_t>(A);
    int64_t H2 = Ai * H1 + H0;
    int64_t K2 = Ai * K1 + K0;
    if (K2 > MaxDen) {
      break;
    }
    H0 = H1;
    H1 = H2;
    K0 = K1;
    K1 = K2;
    double Approx = static_cast<double>(H1) / static_cast<double>(K1);
    if (std::fabs(Approx - X) <= Epsilon * X) {
      P = H1;
      Q = K1;
      return true;
    }
    double Frac = F - A;
    if (Frac < 1e-15) {
      break;
    }
    F = 1.0 / Frac;
  }
  return false;
}

std::optional<double> gcdReal(double A, double B) {
  int64_t P1, Q1, P2, Q2;
  if (!toFraction(A, P1, Q1) || !toFraction(B, P2, Q2)) {
    return std::nullopt;
  }
  // gcd(p1/q1, p2/q2) = gcd(p1*q2, p2*q1) / (q1*q2)
  int64_t G = std::gcd(P1 * Q2, P2 * Q1);
  return static_cast<double>(G) / static_cast<double>(Q1 * Q2);
}

std::optional<double> lcmReal(double A, double B) {
  auto G = gcdReal(A, B);
  if (!G || *G == 0) {
    return std::nullopt;
  }
  return A / *G * B;
}

// ===== Unions of atoms =====

/// A number atom without a grid: an interval or a single value.
static bool isInterval(const NumberTy &N) {
  return N.isPoint() || (!N.Step && !N.Integer);
}

static bool admitsPoint(const NumberTy &N, double V) {
  return admitsValue(N.Lower, N.Upper, V) &&
         (!N.Integer || isMultipleOf(V, 1)) &&
         (!N.Step || isMultipleOf(V, *N.Step));
}

/// The parts of [Lower, Upper] left over once every interval atom of \p B is
/// removed, as plain intervals. Gridded atoms are ignored.
static std::vector<NumberTy> uncovered(const Bound &Lower, const Bound &Upper,
                                       const std::vector<NumberTy> &B) {
  NumberTy Whole;
  Whole.Lower = Lower;
  Whole.Upper = Upper;
  std::vector<NumberTy> Pieces;
  if (!isEmptyInterval(Lower, Upper)) {
    Pieces.push_back(Whole);
  }
  for (auto &X : B) {
    if (!isInterval(X)) {
      continue;
    }
    std::vector<NumberTy> Next;
    for (auto &P : Pieces) {
      if (X.Lower.isFinite()) {
        NumberTy Left = P;
        Left.Upper = tighterUpper(
            P.Upper, Bound{Bound::Finite, X.Lower.Value, !X.Lower.Open});
        if (!isEmptyInterval(Left.Lower, Left.Upper)) {
          Next.push_back(Left);
        }
      }
      if (X.Upper.isFinite()) {
        NumberTy Right = P;
        Right.Lower = tighterLower(
            P.Lower, Bound{Bound::Finite, X.Upper.Value, !X.Upper.Open});
        if (!isEmptyInterval(Right.Lower, Right.Upper)) {
          Next.push_back(Right);
        }
      }
    }
    Pieces = std::move(Next);
  }
  return Pieces;
}

/// Two intervals, \p X starting first, whose union is one interval.
static bool touches(const NumberTy &X, const NumberTy &Y) {
  if (!X.Upper.isFinite() || !Y.Lower.isFinite()) {
    return true;
  }
  if (Y.Lower.Value != X.Upper.Value) {
    return Y.Lower.Value < X.Upper.Value;
  }
  return !X.Upper.Open || !Y.Lower.Open;
}

template <typename AtomT>
std::vector<AtomT> SchemaLattice::pruneSubsumed(std::vector<AtomT> Atoms) {
  std::vector<AtomT> Kept;
  for (auto &A : Atoms) {
    if (auto N = normalize(std::move(A))) {
      Kept.push_back(std::move(*N));
    }
  }
  if (Kept.size() < 2) {
    return Kept;
  }
  std::vector<bool> Redundant(Kept.size(), false);
  for (size_t I = 0; I < Kept.size(); ++I) {
    for (size_t J = 0; J < Kept.size() && !Redundant[I]; ++J) {
      if (I == J || Redundant[J] || !isSubtype(Kept[I], Kept[J])) {
        continue;
      }
      // of two equivalent atoms the first one stays.
      Redundant[I] = J < I || !isSubtype(Kept[J], Kept[I]);
    }
  }
  std::vector<AtomT> Ret;
  for (size_t I = 0; I < Kept.size(); ++I) {
    if (!Redundant[I]) {
      Ret.push_back(std::move(Kept[I]));
    }
  }
  return Ret;
}

template <typename AtomT>
std::vector<AtomT> SchemaLattice::meetUnion(const std::vector<AtomT> &A,
                                            const std::vector<AtomT> &B) {
  std::vector<AtomT> Ret;
  for (auto &X : A) {
    for (auto &Y : B) {
      if (auto M = meet(X, Y)) {
        Ret.push_back(std::move(*M));
      }
    }
  }
  return Ret;
}

template <typename AtomT>
bool SchemaLattice::covers(const std::vector<AtomT> &B, const AtomT &A,
                           llvm::StringRef What) {
  for (auto &X : B) {
    if (isSubtype(A, X)) {
      return true;
    }
  }
  if (B.size() < 2) {
    return false;
  }
  // the atom join admits at least the union, so missing it is final.
  AtomT Hull = B[0];
  for (size_t I = 1; I < B.size(); ++I) {
    Hull = join(Hull, B[I]);
  }
  if (!isSubtype(A, Hull)) {
    return false;
  }
  fail(("cannot decide whether an " + What +
        " schema is covered by a union of " + What + " schemas")
           .str());
  return false;
}

// ===== Schema level =====

static PSchema withSType(const PSchema &S, const Annotation &SType) {
  if (S->SType == SType || S->isBottom()) {
    return S;
  }
  auto Ret = std::make_shared<Schema>(*S);
  Ret->SType = SType;
  return Ret;
}

PSchema SchemaLattice::normalize(Schema S) {
  if (S.Boolean && !S.Boolean->AllowFalse && !S.Boolean->AllowTrue) {
    S.Boolean.reset();
  }
  S.Numbers = normalize(std::move(S.Numbers));
  if (S.String) {
    S.String = normalize(std::move(*S.String));
  }
  S.Arrays = pruneSubsumed(std::move(S.Arrays));
  S.Objects = pruneSubsumed(std::move(S.Objects));
  if (S.isBottom()) {
    return Schema::bottom();
  }
  if (!S.SType && S.isTop()) {
    return Schema::top();
  }
  return std::make_shared<Schema>(std::move(S));
}

bool SchemaLattice::isSubtype(const PSchema &A, const PSchema &B) {
  if (A == B || A->isBottom() || B->isTop()) {
    return true;
  }
  if (A->Null && !B->Null) {
    return false;
  }
  if (A->Boolean && (!B->Boolean || !isSubtype(*A->Boolean, *B->Boolean))) {
    return false;
  }
  if (!isSubtype(A->Numbers, B->Numbers)) {
    return false;
  }
  if (A->String && (!B->String || !isSubtype(*A->String, *B->String))) {
    return false;
  }
  for (auto &X : A->Arrays) {
    if (!covers(B->Arrays, X, "array")) {
      return false;
    }
  }
  for (auto &X : A->Objects) {
    if (!covers(B->Objects, X, "object")) {
      return false;
    }
  }
  return true;
}

PSchema SchemaLattice::meet(const PSchema &A, const PSchema &B) {
  if (A->isBottom() || B->isBottom()) {
    return Schema::bottom();
  }
  if (A->isTop() || A == B) {
    return withSType(B, Ann.meet(A->SType, B->SType));
  }
  if (B->isTop()) {
    return withSType(A, Ann.meet(A->SType, B->SType));
  }
  Schema R;
  if (A->Null && B->Null) {
    R.Null = NullTy{};
  }
  if (A->Boolean && B->Boolean) {
    R.Boolean = meet(*A->Boolean, *B->Boolean);
  }
  R.Numbers = meetUnion(A->Numbers, B->Numbers);
  if (A->String && B->String) {
    R.String = meet(*A->String, *B->String);
  }
  R.Arrays = meetUnion(A->Arrays, B->Arrays);
  R.Objects = meetUnion(A->Objects, B->Objects);
  R.SType = Ann.meet(A->SType, B->SType);
  return normalize(std::move(R));
}

PSchema SchemaLattice::join(const PSchema &A, const PSchema &B) {
  // Bottom is the identity of join, its missing annotation is vacuous.
  if (A->isBottom()) {
    return B;
  }
  if (B->isBottom()) {
    return A;
  }
  if (A->isTop() || B->isTop()) {
    return withSType(Schema::top(), Ann.join(A->SType, B->SType));
  }
  if (A == B) {
    return withSType(A, Ann.join(A->SType, B->SType));
  }
  Schema R;
  if (A->Null || B->Null) {
    R.Null = NullTy{};
  }
  if (A->Boolean && B->Boolean) {
    R.Boolean = join(*A->Boolean, *B->Boolean);
  } else {
    R.Boolean = A->Boolean ? A->Boolean : B->Boolean;
  }
  // unions of atoms stay exact, normalize drops the redundant ones.
  R.Numbers = A->Numbers;
  R.Numbers.insert(R.Numbers.end(), B->Numbers.begin(), B->Numbers.end());
  if (A->String && B->String) {
    R.String = join(*A->String, *B->String);
  } else {
    R.String = A->String ? A->String : B->String;
  }
  R.Arrays = A->Arrays;
  R.Arrays.insert(R.Arrays.end(), B->Arrays.begin(), B->Arrays.end());
  R.Objects = A->Objects;
  R.Objects.insert(R.Objects.end(), B->Objects.begin(), B->Objects.end());
  R.SType = Ann.join(A->SType, B->SType);
  return normalize(std::move(R));
}

PSchema SchemaLattice::complement(const PSchema &A) {
  if (A->isBottom()) {
    return Schema::top();
  }
  if (A->isTop()) {
    return Schema::bottom();
  }
  Schema R;
  if (!A->Null) {
    R.Null = NullTy{};
  }
  if (!A->Boolean) {
    R.Boolean = BooleanTy{};
  } else {
    R.Boolean = BooleanTy{!A->Boolean->AllowFalse, !A->Boolean->AllowTrue};
  }
  if (std::all_of(A->Numbers.begin(), A->Numbers.end(), isInterval)) {
    R.Numbers = uncovered(Bound::negInf(), Bound::posInf(), A->Numbers);
  } else {
    fail("the complement of an integer or multipleOf number constraint is "
         "not a union of intervals");
  }
  if (!A->String) {
    R.String = StringTy{};
  } else if (!A->String->isAny()) {
    PDFA F = folded(*A->String);
    StringTy C;
    C.Lang = std::make_shared<DFA>(F->complement());
    R.String = C;
  }
  if (A->Arrays.empty()) {
    R.Arrays.push_back(ArrayTy::any());
  } else if (!A->array() || !A->array()->isAny()) {
    fail("the complement of a constrained array is not representable");
  }
  if (A->Objects.empty()) {
    R.Objects.push_back(ObjectTy::any());
  } else if (!A->object() || !A->object()->isAny()) {
    fail("the complement of a constrained object is not representable");
  }
  return normalize(std::move(R));
}

// ===== Boolean =====

bool SchemaLattice::isSubtype(const BooleanTy &A, const BooleanTy &B) {
  return (!A.AllowFalse || B.AllowFalse) && (!A.AllowTrue || B.AllowTrue);
}

std::optional<BooleanTy> SchemaLattice::meet(const BooleanTy &A,
                                             const BooleanTy &B) {
  BooleanTy R{A.AllowFalse && B.AllowFalse, A.AllowTrue && B.AllowTrue};
  if (!R.AllowFalse && !R.AllowTrue) {
    return std::nullopt;
  }
  return R;
}

BooleanTy SchemaLattice::join(const BooleanTy &A, const BooleanTy &B) {
  return BooleanTy{A.AllowFalse || B.AllowFalse, A.AllowTrue || B.AllowTrue};
}

// ===== Number =====

std::optional<NumberTy> SchemaLattice::normalize(NumberTy N) {
  if (N.Step && isMultipleOf(*N.Step, 1)) {
    N.Integer = true;
    N.Step = std::round(*N.Step);
  }
  if (N.Integer && N.Step && !isMultipleOf(*N.Step, 1)) {
    // integers that are multiples of a fraction p/q are the multiples of p.
    auto L = lcmReal(*N.Step, 1);
    if (!L) {
      fail("multipleOf " + std::to_string(*N.Step) +
           " is not a usable rational step");
    } else {
      N.Step = std::round(*L);
    }
  }
  if (N.Integer && N.Step && *N.Step == 1) {
    N.Step.reset();
  }
  double Grid = N.Step ? *N.Step : (N.Integer ? 1 : 0);
  if (Grid > 0) {
    if (N.Lower.isFinite()) {
      double K = N.Lower.Value / Grid;
      double C = std::ceil(K - Epsilon);
      if (N.Lower.Open && isMultipleOf(N.Lower.Value, Grid)) {
        C = std::round(K) + 1;
      }
      N.Lower = Bound::closed(C * Grid);
    }
    if (N.Upper.isFinite()) {
      double K = N.Upper.Value / Grid;
      double F = std::floor(K + Epsilon);
      if (N.Upper.Open && isMultipleOf(N.Upper.Value, Grid)) {
        F = std::round(K) - 1;
      }
      N.Upper = Bound::closed(F * Grid);
    }
  }
  if (isEmptyInterval(N.Lower, N.Upper)) {
    return std::nullopt;
  }
  if (N.isPoint()) {
    N.Step.reset();
    N.Integer = false;
  }
  return N;
}

bool SchemaLattice::isSubtype(const NumberTy &A, const NumberTy &B) {
  if (A.isPoint()) {
    return admitsPoint(B, A.Lower.Value);
  }
  if (compareLower(B.Lower, A.Lower) > 0 ||
      compareUpper(A.Upper, B.Upper) > 0) {
    return false;
  }
  if (B.Integer && !A.Integer) {
    return false;
  }
  if (B.Step) {
    double AGrid = A.Step ? *A.Step : (A.Integer ? 1 : 0);
    if (AGrid == 0 || !isMultipleOf(AGrid, *B.Step)) {
      return false;
    }
  }
  return true;
}

std::optional<NumberTy> SchemaLattice::meet(const NumberTy &A,
                                            const NumberTy &B) {
  NumberTy R;
  R.Lower = tighterLower(A.Lower, B.Lower);
  R.Upper = tighterUpper(A.Upper, B.Upper);
  R.Integer = A.Integer || B.Integer;
  if (A.Step && B.Step) {
    auto L = lcmReal(*A.Step, *B.Step);
    if (!L) {
      fail("cannot combine multipleOf " + std::to_string(*A.Step) + " and " +
           std::to_string(*B.Step));
      R.Step = *A.Step * *B.Step;
    } else {
      R.Step = *L;
    }
  } else {
    R.Step = A.Step ? A.Step : B.Step;
  }
  return normalize(R);
}

std::vector<NumberTy> SchemaLattice::normalize(std::vector<NumberTy> Ns) {
  std::vector<NumberTy> Intervals, Atoms;
  for (auto &N : Ns) {
    if (auto R = normalize(N)) {
      (isInterval(*R) ? Intervals : Atoms).push_back(*R);
    }
  }
  std::sort(Intervals.begin(), Intervals.end(),
            [](const NumberTy &X, const NumberTy &Y) {
              return compareLower(X.Lower, Y.Lower) < 0;
            });
  std::vector<NumberTy> Merged;
  for (auto &I : Intervals) {
    if (!Merged.empty() && touches(Merged.back(), I)) {
      Merged.back().Upper = looserUpper(Merged.back().Upper, I.Upper);
      continue;
    }
    Merged.push_back(I);
  }
  Merged.insert(Merged.end(), Atoms.begin(), Atoms.end());
  auto Ret = pruneSubsumed(std::move(Merged));
  std::stable_sort(Ret.begin(), Ret.end(),
                   [](const NumberTy &X, const NumberTy &Y) {
                     if (int C = compareLower(X.Lower, Y.Lower)) {
                       return C < 0;
                     }
                     return compareUpper(X.Upper, Y.Upper) < 0;
                   });
  return Ret;
}

bool SchemaLattice::isSubtype(const std::vector<NumberTy> &A,
                              const std::vector<NumberTy> &B) {
  for (auto &N : A) {
    if (!covers(B, N)) {
      return false;
    }
  }
  return true;
}

bool SchemaLattice::covers(const std::vector<NumberTy> &B,
                           const NumberTy &A) {
  for (auto &X : B) {
    if (isSubtype(A, X)) {
      return true;
    }
  }
  if (A.isPoint() || B.size() < 2) {
    return false;
  }
  double Grid = A.Step ? *A.Step : (A.Integer ? 1 : 0);
  for (auto &Piece : uncovered(A.Lower, A.Upper, B)) {
    if (Grid == 0) {
      // gridded atoms only fill isolated values of a continuous range.
      double V = Piece.Lower.Value;
      if (!Piece.isPoint() ||
          std::none_of(B.begin(), B.end(), [V](const NumberTy &X) {
            return admitsPoint(X, V);
          })) {
        return false;
      }
      continue;
    }
    auto R = gridCovered(Piece, Grid, B);
    if (!R) {
      fail("cannot decide whether a multipleOf range is covered by a union "
           "of numeric ranges");
      return false;
    }
    if (!*R) {
      return false;
    }
  }
  return true;
}

std::optional<bool>
SchemaLattice::gridCovered(const NumberTy &Piece, double Grid,
                           const std::vector<NumberTy> &B) {
  const double MaxGridPoints = 1 << 16;
  // Past every finite bound, membership repeats with the lcm of all grids.
  double Period = Grid;
  double Far = 0;
  auto reach = [&Far](const Bound &X) {
    if (X.isFinite()) {
      Far = std::max(Far, std::fabs(X.Value));
    }
  };
  reach(Piece.Lower);
  reach(Piece.Upper);
  for (auto &X : B) {
    reach(X.Lower);
    reach(X.Upper);
    if (X.isPoint()) {
      continue;
    }
    double G = X.Step ? *X.Step : (X.Integer ? 1 : 0);
    if (G > 0) {
      auto L = lcmReal(Period, G);
      if (!L) {
        return std::nullopt;
      }
      Period = *L;
    }
  }
  double Lo = Piece.Lower.isFinite() ? Piece.Lower.Value : -(Far + Period);
  double Hi = Piece.Upper.isFinite() ? Piece.Upper.Value : Far + Period;
  double First = std::ceil(Lo / Grid - Epsilon);
  double Last = std::floor(Hi / Grid + Epsilon);
  if (Last - First + 1 > MaxGridPoints) {
    return std::nullopt;
  }
  LLVM_DEBUG(llvm::dbgs() << "grid cover: checking " << (Last - First + 1)
                          << " values, period " << Period << "\n");
  for (double K = First; K <= Last; ++K) {
    double V = K * Grid;
    if (!admitsValue(Piece.Lower, Piece.Upper, V)) {
      continue;
    }
    if (std::none_of(B.begin(), B.end(),
                     [V](const NumberTy &X) { return admitsPoint(X, V); })) {
      LLVM_DEBUG(llvm::dbgs() << "grid cover: " << V << " is missing\n");
      return false;
    }
  }
  return true;
}

// ===== String =====

static bool withinFoldLimit(const SizeRange &Len) {
  return Len.Min <= automata::MaxFoldedLength &&
         (!Len.Max || *Len.Max <= automata::MaxFoldedLength);
}

PDFA SchemaLattice::folded(const StringTy &S) {
  if (S.Length.isAny()) {
    return S.Lang ? S.Lang : std::make_shared<DFA>(DFA::anyString());
  }
  if (!withinFoldLimit(S.Length)) {
    fail("string length bounds above " +
         std::to_string(automata::MaxFoldedLength) +
         " cannot be combined with a pattern");
    return S.Lang ? S.Lang : std::make_shared<DFA>(DFA::anyString());
  }
  auto Len = DFA::lengthBetween(S.Length.Min, S.Length.Max);
  if (!S.Lang) {
    return std::make_shared<DFA>(std::move(Len));
  }
  return std::make_shared<DFA>(S.Lang->intersect(Len));
}

std::optional<StringTy> SchemaLattice::normalize(StringTy S) {
  if (S.Length.empty()) {
    return std::nullopt;
  }
  if (!S.Lang) {
    S.Source.reset();
    return S;
  }
  if (S.Lang->isEmpty()) {
    return std::nullopt;
  }
  if (S.Lang->acceptsEverything()) {
    S.Lang.reset();
    S.Source.reset();
    return S;
  }
  // lengths the language can produce must meet the length range.
  SizeRange LangLen{*S.Lang->minLength(), S.Lang->maxLength()};
  if (LangLen.meet(S.Length).empty()) {
    return std::nullopt;
  }
  if (!S.Length.isAny() && withinFoldLimit(S.Length)) {
    auto Len = DFA::lengthBetween(S.Length.Min, S.Length.Max);
    if (Len.includedIn(*S.Lang)) {
      // the pattern adds nothing over the length range.
      S.Lang.reset();
      S.Source.reset();
      return S;
    }
    if (S.Lang->intersect(Len).isEmpty()) {
      return std::nullopt;
    }
  }
  return S;
}

bool SchemaLattice::isSubtype(const StringTy &A, const StringTy &B) {
  if (!B.Lang) {
    if (A.Length.includedIn(B.Length)) {
      return true;
    }
    if (!A.Lang) {
      return false;
    }
    PDFA F = folded(A);
    auto Min = F->minLength();
    if (!Min) {
      return true;
    }
    SizeRange Eff{*Min, F->maxLength()};
    return Eff.includedIn(B.Length);
  }
  PDFA FA = folded(A);
  PDFA FB = folded(B);
  return FA->includedIn(*FB);
}

std::optional<StringTy> SchemaLattice::meet(const StringTy &A,
                                            const StringTy &B) {
  StringTy R;
  R.Length = A.Length.meet(B.Length);
  if (A.Lang && B.Lang) {
    R.Lang = std::make_shared<DFA>(A.Lang->intersect(*B.Lang));
    // keep the original pattern text when one side already implies the other.
    if (R.Lang->equivalent(*A.Lang)) {
      R.Lang = A.Lang;
      R.Source = A.Source;
    } else if (R.Lang->equivalent(*B.Lang)) {
      R.Lang = B.Lang;
      R.Source = B.Source;
    }
  } else if (A.Lang) {
    R.Lang = A.Lang;
    R.Source = A.Source;
  } else if (B.Lang) {
    R.Lang = B.Lang;
    R.Source = B.Source;
  }
  return normalize(std::move(R));
}

StringTy SchemaLattice::join(const StringTy &A, const StringTy &B) {
  if (isSubtype(A, B)) {
    return B;
  }
  if (isSubtype(B, A)) {
    return A;
  }
  StringTy R;
  R.Length = A.Length.join(B.Length);
  uint64_t Lo = std::max(A.Length.Min, B.Length.Min);
  bool Contiguous = !A.Length.Max || !B.Length.Max ||
                    Lo <= std::min(*A.Length.Max, *B.Length.Max) + 1;
  if (!A.Lang && !B.Lang) {
    if (Contiguous) {
      return R;
    }
    if (!withinFoldLimit(A.Length) || !withinFoldLimit(B.Length)) {
      fail("disjoint string length ranges above " +
           std::to_string(automata::MaxFoldedLength) +
           " have no exact union");
      return R;
    }
  }
  PDFA FA = folded(A);
  PDFA FB = folded(B);
  R.Lang = std::make_shared<DFA>(FA->unionWith(*FB));
  auto Ret = normalize(R);
  return Ret ? *Ret : R;
}

// ===== Array =====

std::optional<ArrayTy> SchemaLattice::normalize(ArrayTy A) {
  std::optional<uint64_t> Cap;
  for (size_t I = 0; I < A.Prefix.size(); ++I) {
    if (A.Prefix[I]->isBottom()) {
      Cap = I;
      break;
    }
  }
  if (!Cap && A.Rest->isBottom()) {
    Cap = A.Prefix.size();
  }
  if (Cap && (!A.Length.Max || *Cap < *A.Length.Max)) {
    A.Length.Max = Cap;
  }
  if (A.Length.empty()) {
    return std::nullopt;
  }
  if (A.Length.Max && *A.Length.Max <= A.Prefix.size()) {
    // positions at or after the maximum length never exist.
    A.Prefix.resize(*A.Length.Max);
    A.Rest = Schema::top();
  }
  while (!A.Prefix.empty() && A.Prefix.back() == A.Rest) {
    A.Prefix.pop_back();
  }
  if (A.Length.Max && *A.Length.Max <= 1) {
    A.Unique = false;
  }
  return A;
}

bool SchemaLattice::isSubtype(const ArrayTy &A, const ArrayTy &B) {
  if (!A.Length.includedIn(B.Length)) {
    return false;
  }
  size_t N = std::max(A.Prefix.size(), B.Prefix.size());
  // index N compares the two rests.
  for (size_t I = 0; I <= N; ++I) {
    if (A.Length.Max && I >= *A.Length.Max) {
      break;
    }
    if (!isSubtype(A.at(I), B.at(I))) {
      return false;
    }
  }
  if (B.Unique && !A.Unique && (!A.Length.Max || *A.Length.Max > 1)) {
    return false;
  }
  return true;
}

std::optional<ArrayTy> SchemaLattice::meet(const ArrayTy &A,
                                           const ArrayTy &B) {
  ArrayTy R;
  R.Length = A.Length.meet(B.Length);
  R.Unique = A.Unique || B.Unique;
  size_t N = std::max(A.Prefix.size(), B.Prefix.size());
  for (size_t I = 0; I < N; ++I) {
    R.Prefix.push_back(meet(A.at(I), B.at(I)));
  }
  R.Rest = meet(A.Rest, B.Rest);
  return normalize(std::move(R));
}

ArrayTy SchemaLattice::join(const ArrayTy &A, const ArrayTy &B) {
  if (isSubtype(A, B)) {
    return B;
  }
  if (isSubtype(B, A)) {
    return A;
  }
  // Unroll positions up to the largest finite maximum so that a shorter
  // side contributes nothing past its end. Very long unrolls are widened.
  const uint64_t MaxUnroll = 256;
  size_t N = std::max(A.Prefix.size(), B.Prefix.size());
  bool Exact = true;
  for (auto *X : {&A, &B}) {
    if (X->Length.Max && *X->Length.Max > N) {
      if (*X->Length.Max > MaxUnroll) {
        Exact = false;
        continue;
      }
      N = *X->Length.Max;
    }
  }
  auto effective = [&](const ArrayTy &X, size_t I) -> PSchema {
    if (Exact && X.Length.Max && I >= *X.Length.Max) {
      return Schema::bottom();
    }
    return X.at(I);
  };
  ArrayTy R;
  R.Length = A.Length.join(B.Length);
  R.Unique = A.Unique && B.Unique;
  for (size_t I = 0; I < N; ++I) {
    R.Prefix.push_back(join(effective(A, I), effective(B, I)));
  }
  R.Rest = join(effective(A, N), effective(B, N));
  auto Ret = normalize(R);
  return Ret ? *Ret : R;
}

// ===== Object =====

PSchema SchemaLattice::lookup(const ObjectTy &O, llvm::StringRef Name) {
  std::vector<PSchema> Matches;
  for (auto &P : O.Patterns) {
    if (P.Lang->accepts(Name)) {
      Matches.push_back(P.Value);
    }
  }
  PSchema Ret;
  auto It = O.Properties.find(Name.str());
  if (It != O.Properties.end()) {
    Ret = It->second;
  } else if (Matches.empty()) {
    return O.Additional;
  } else {
    Ret = Schema::top();
  }
  for (auto &M : Matches) {
    Ret = meet(Ret, M);
  }
  return Ret;
}

/// A set of undeclared property names, all matched by the same patterns of
/// both operands.
struct SchemaLattice::Region {
  PDFA Lang;
  llvm::SmallBitVector InA;
  llvm::SmallBitVector InB;
};

std::vector<SchemaLattice::Region>
SchemaLattice::regions(const ObjectTy &A, const ObjectTy &B) {
  std::vector<automata::rexp::PRExp> Names;
  for (auto &Ent : boost::range::join(A.Properties, B.Properties)) {
    std::vector<automata::CodePoint> Points;
    if (automata::decodeUTF8(Ent.first, Points)) {
      Names.push_back(automata::rexp::createLiteral(Points));
    }
  }
  DFA Declared = DFA::fromRExp(automata::rexp::createOr(std::move(Names)));
  std::vector<Region> Cur;
  Cur.push_back({std::make_shared<DFA>(Declared.complement()),
                 llvm::SmallBitVector(A.Patterns.size()),
                 llvm::SmallBitVector(B.Patterns.size())});
  auto split = [&](const PDFA &PatternLang, bool FromA, unsigned Index) {
    std::vector<Region> Next;
    for (auto &R : Cur) {
      DFA In = R.Lang->intersect(*PatternLang);
      DFA Out = R.Lang->subtract(*PatternLang);
      if (!In.isEmpty()) {
        Region NR{std::make_shared<DFA>(std::move(In)), R.InA, R.InB};
        (FromA ? NR.InA : NR.InB).set(Index);
        Next.push_back(std::move(NR));
      }
      if (!Out.isEmpty()) {
        Next.push_back({std::make_shared<DFA>(std::move(Out)), R.InA, R.InB});
      }
    }
    Cur = std::move(Next);
  };
  for (unsigned I = 0; I < A.Patterns.size(); ++I) {
    split(A.Patterns[I].Lang, true, I);
  }
  for (unsigned I = 0; I < B.Patterns.size(); ++I) {
    split(B.Patterns[I].Lang, false, I);
  }
  LLVM_DEBUG(llvm::dbgs() << "object regions: " << Cur.size() << "\n");
  return Cur;
}

template <typename CombineFn>
ObjectTy SchemaLattice::combineObjects(const ObjectTy &A, const ObjectTy &B,
                                       CombineFn Combine) {
  ObjectTy R = ObjectTy::any();
  for (auto &Ent : boost::range::join(A.Properties, B.Properties)) {
    if (R.Properties.count(Ent.first)) {
      continue;
    }
    R.Properties[Ent.first] =
        Combine(lookup(A, Ent.first), lookup(B, Ent.first));
  }
  R.Additional = Combine(A.Additional, B.Additional);
  if (A.Patterns.empty() && B.Patterns.empty()) {
    return R;
  }
  auto regionValue = [&](const ObjectTy &O,
                         const llvm::SmallBitVector &In) -> PSchema {
    if (In.none()) {
      return O.Additional;
    }
    PSchema V = Schema::top();
    for (unsigned I : In.set_bits()) {
      V = meet(V, O.Patterns[I].Value);
    }
    return V;
  };
  for (auto &Reg : regions(A, B)) {
    PSchema V = Combine(regionValue(A, Reg.InA), regionValue(B, Reg.InB));
    if (Reg.InA.none() && Reg.InB.none()) {
      R.Additional = V;
      continue;
    }
    std::optional<std::string> Source;
    for (unsigned I : Reg.InA.set_bits()) {
      if (!Source && Reg.Lang->equivalent(*A.Patterns[I].Lang)) {
        Source = A.Patterns[I].Source;
      }
    }
    for (unsigned I : Reg.InB.set_bits()) {
      if (!Source && Reg.Lang->equivalent(*B.Patterns[I].Lang)) {
        Source = B.Patterns[I].Source;
      }
    }
    if (!Source) {
      Source = Reg.Lang->toPattern();
    }
    R.Patterns.push_back({*Source, Reg.Lang, V});
  }
  return R;
}

std::optional<ObjectTy> SchemaLattice::normalize(ObjectTy O) {
  if (O.Count.empty()) {
    return std::nullopt;
  }
  if (O.Count.Max && O.Required.size() > *O.Count.Max) {
    return std::nullopt;
  }
  for (auto &Name : O.Required) {
    if (lookup(O, Name)->isBottom()) {
      return std::nullopt;
    }
  }
  if (O.Patterns.empty() && O.Additional->isBottom()) {
    uint64_t Possible = 0;
    for (auto &Ent : O.Properties) {
      Possible += !Ent.second->isBottom();
    }
    if (O.Count.Min > Possible) {
      return std::nullopt;
    }
  }
  return O;
}

bool SchemaLattice::isSubtype(const ObjectTy &A, const ObjectTy &B) {
  for (auto &Name : B.Required) {
    if (!A.Required.count(Name)) {
      return false;
    }
  }
  if (!A.Count.includedIn(B.Count)) {
    return false;
  }
  for (auto &Ent : boost::range::join(A.Properties, B.Properties)) {
    if (!isSubtype(lookup(A, Ent.first), lookup(B, Ent.first))) {
      LLVM_DEBUG(llvm::dbgs() << "object subtype fails at property "
                              << Ent.first << "\n");
      return false;
    }
  }
  if (A.Patterns.empty() && B.Patterns.empty()) {
    return isSubtype(A.Additional, B.Additional);
  }
  for (auto &Reg : regions(A, B)) {
    PSchema VA = A.Additional, VB = B.Additional;
    if (Reg.InA.any()) {
      VA = Schema::top();
      for (unsigned I : Reg.InA.set_bits()) {
        VA = meet(VA, A.Patterns[I].Value);
      }
    }
    if (Reg.InB.any()) {
      VB = Schema::top();
      for (unsigned I : Reg.InB.set_bits()) {
        VB = meet(VB, B.Patterns[I].Value);
      }
    }
    if (!isSubtype(VA, VB)) {
      return false;
    }
  }
  return true;
}

std::optional<ObjectTy> SchemaLattice::meet(const ObjectTy &A,
                                            const ObjectTy &B) {
  ObjectTy R = combineObjects(
      A, B, [this](const PSchema &X, const PSchema &Y) { return meet(X, Y); });
  R.Required = A.Required;
  R.Required.insert(B.Required.begin(), B.Required.end());
  R.Count = A.Count.meet(B.Count);
  return normalize(std::move(R));
}

ObjectTy SchemaLattice::join(const ObjectTy &A, const ObjectTy &B) {
  if (isSubtype(A, B)) {
    return B;
  }
  if (isSubtype(B, A)) {
    return A;
  }
  ObjectTy R = combineObjects(
      A, B, [this](const PSchema &X, const PSchema &Y) { return join(X, Y); });
  for (auto &Name : A.Required) {
    if (B.Required.count(Name)) {
      R.Required.insert(Name);
    }
  }
  R.Count = A.Count.join(B.Count);
  auto Ret = normalize(R);
  return Ret ? *Ret : R;
}

bool isStructuralSubtype(const PSchema &A, const PSchema &B) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  return L.isSubtype(A, B);
}

} // namespace schemasub
