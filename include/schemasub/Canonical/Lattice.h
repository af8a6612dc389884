#ifndef _SCHEMASUB_CANONICAL_LATTICE_H_
#define _SCHEMASUB_CANONICAL_LATTICE_H_

#include "Canonical/Schema.h"
#include "utils.h"
#include <optional>
#include <string>
#include <vector>

namespace schemasub {

using Annotation = std::optional<std::string>;

/// \brief How semantic annotations combine under meet and join.
///
/// The structural algebra only carries annotations around. Deciding which of
/// two annotations is more specific is left to the subclass.
class AnnotationLattice {
public:
  enum AnnotationLatticeKind {
    AK_Drop,
    AK_Plain,
    AK_Semantic,
  };

protected:
  AnnotationLatticeKind kind;

public:
  AnnotationLattice(AnnotationLatticeKind Kind) : kind(Kind) {}
  virtual ~AnnotationLattice() = default;
  AnnotationLatticeKind getKind() const { return kind; }

  virtual Annotation meet(const Annotation &A, const Annotation &B) = 0;
  virtual Annotation join(const Annotation &A, const Annotation &B) = 0;
  /// Normalize an annotation read from a schema document.
  virtual Annotation attach(llvm::StringRef STypeValue) = 0;
};

/// Semantic reasoning disabled: annotations are discarded.
class DropAnnotations : public AnnotationLattice {
public:
  DropAnnotations() : AnnotationLattice(AK_Drop) {}
  static bool classof(const AnnotationLattice *S) {
    return S->getKind() == AK_Drop;
  }
  Annotation meet(const Annotation &, const Annotation &) override {
    return std::nullopt;
  }
  Annotation join(const Annotation &, const Annotation &) override {
    return std::nullopt;
  }
  Annotation attach(llvm::StringRef) override { return std::nullopt; }
};

/// Annotations compared by identity only. Meet keeps a one sided annotation,
/// join keeps an annotation only when both sides agree.
class PlainAnnotations : public AnnotationLattice {
public:
  PlainAnnotations() : AnnotationLattice(AK_Plain) {}
  static bool classof(const AnnotationLattice *S) {
    return S->getKind() == AK_Plain;
  }
  Annotation meet(const Annotation &A, const Annotation &B) override;
  Annotation join(const Annotation &A, const Annotation &B) override;
  Annotation attach(llvm::StringRef STypeValue) override {
    return STypeValue.str();
  }
};

/// \brief The per-kind algebra: subtyping, meet, join and complement over
/// canonical schemas.
///
/// All results are normalized: a kind whose descriptor admits no value is
/// removed, so Bottom is exactly the schema with no kinds. Constructs that
/// cannot be represented exactly record a failure, checked with failed().
class SchemaLattice {
public:
  explicit SchemaLattice(AnnotationLattice &Ann) : Ann(Ann) {}

  bool isSubtype(const PSchema &A, const PSchema &B);
  PSchema meet(const PSchema &A, const PSchema &B);
  PSchema join(const PSchema &A, const PSchema &B);
  /// Every value not accepted by \p A. Annotations are dropped.
  PSchema complement(const PSchema &A);
  bool isEquivalent(const PSchema &A, const PSchema &B) {
    return isSubtype(A, B) && isSubtype(B, A);
  }

  /// Normalize a freshly built schema.
  PSchema normalize(Schema S);

  // Per kind operations. meet returns none when the result is empty.
  bool isSubtype(const BooleanTy &A, const BooleanTy &B);
  std::optional<BooleanTy> meet(const BooleanTy &A, const BooleanTy &B);
  BooleanTy join(const BooleanTy &A, const BooleanTy &B);

  bool isSubtype(const NumberTy &A, const NumberTy &B);
  std::optional<NumberTy> meet(const NumberTy &A, const NumberTy &B);
  std::optional<NumberTy> normalize(NumberTy N);
  /// Normalize a union of number atoms: touching intervals are merged and
  /// atoms covered by another atom are dropped.
  std::vector<NumberTy> normalize(std::vector<NumberTy> Ns);
  /// Exact inclusion of one union of number atoms in another.
  bool isSubtype(const std::vector<NumberTy> &A,
                 const std::vector<NumberTy> &B);

  bool isSubtype(const StringTy &A, const StringTy &B);
  std::optional<StringTy> meet(const StringTy &A, const StringTy &B);
  StringTy join(const StringTy &A, const StringTy &B);
  std::optional<StringTy> normalize(StringTy S);

  // The array and object joins return one atom that may admit more than
  // the union of their operands.
  bool isSubtype(const ArrayTy &A, const ArrayTy &B);
  std::optional<ArrayTy> meet(const ArrayTy &A, const ArrayTy &B);
  ArrayTy join(const ArrayTy &A, const ArrayTy &B);
  std::optional<ArrayTy> normalize(ArrayTy A);

  bool isSubtype(const ObjectTy &A, const ObjectTy &B);
  std::optional<ObjectTy> meet(const ObjectTy &A, const ObjectTy &B);
  ObjectTy join(const ObjectTy &A, const ObjectTy &B);
  std::optional<ObjectTy> normalize(ObjectTy O);

  /// The schema an object applies to the value of property \p Name.
  PSchema lookup(const ObjectTy &O, llvm::StringRef Name);

  AnnotationLattice &annotations() { return Ann; }

  bool failed() const { return !Failure.empty(); }
  const std::string &failure() const { return Failure; }
  void clearFailure() { Failure.clear(); }

private:
  AnnotationLattice &Ann;
  std::string Failure;

  void fail(const std::string &Msg) {
    if (Failure.empty()) {
      Failure = Msg;
    }
  }

  /// The string language with the length range folded in. Null if every
  /// string is accepted.
  automata::PDFA folded(const StringTy &S);

  /// Whether the union \p B admits every number of \p A.
  bool covers(const std::vector<NumberTy> &B, const NumberTy &A);
  /// Whether every multiple of \p Grid inside \p Piece is admitted by \p B.
  /// None when that takes too many values to check.
  std::optional<bool> gridCovered(const NumberTy &Piece, double Grid,
                                  const std::vector<NumberTy> &B);
  template <typename AtomT>
  bool covers(const std::vector<AtomT> &B, const AtomT &A,
              llvm::StringRef What);
  template <typename AtomT>
  std::vector<AtomT> meetUnion(const std::vector<AtomT> &A,
                               const std::vector<AtomT> &B);
  template <typename AtomT>
  std::vector<AtomT> pruneSubsumed(std::vector<AtomT> Atoms);

  struct Region;
  std::vector<Region> regions(const ObjectTy &A, const ObjectTy &B);
  template <typename CombineFn>
  ObjectTy combineObjects(const ObjectTy &A, const ObjectTy &B,
                          CombineFn Combine);
};

/// Convenience wrapper around a lattice with plain annotations.
bool isStructuralSubtype(const PSchema &A, const PSchema &B);

// Numeric helpers, exposed for tests.
bool isMultipleOf(double Value, double Step);
std::optional<double> gcdReal(double A, double B);
std::optional<double> lcmReal(double A, double B);

} // namespace schemasub

#endif
