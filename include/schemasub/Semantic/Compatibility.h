#ifndef _SCHEMASUB_SEMANTIC_COMPATIBILITY_H_
#define _SCHEMASUB_SEMANTIC_COMPATIBILITY_H_

#include "Canonical/Lattice.h"
#include "Semantic/Resolver.h"
#include <llvm/Support/JSON.h>

namespace schemasub::semantic {

/// \brief Whether \p A may be treated as semantically no more general than
/// \p B.
///
/// Compares the `stype` of two raw schema documents node by node: common
/// properties, array items, `additionalProperties`, pattern properties with
/// identical patterns and the `allOf` / `anyOf` / `oneOf` branches. Local
/// `$ref`s are followed within their own document, at most \p MaxRefDepth
/// deep; a cyclic reference ends the comparison along that path.
/// Diagnostics go to \p Debug.
bool isSemanticallyCompatible(const llvm::json::Value &A,
                              const llvm::json::Value &B, Resolver &R,
                              llvm::raw_ostream &Debug = llvm::nulls(),
                              unsigned MaxRefDepth = 512);

/// Annotations ordered by the concept hierarchy. Meet keeps the narrower
/// concept, join the broader one; incomparable concepts are dropped with a
/// warning.
class SemanticAnnotations : public AnnotationLattice {
public:
  SemanticAnnotations(Resolver &R, log_level LogLevel)
      : AnnotationLattice(AK_Semantic), R(R), LogLevel(LogLevel) {}
  static bool classof(const AnnotationLattice *S) {
    return S->getKind() == AK_Semantic;
  }

  Annotation meet(const Annotation &A, const Annotation &B) override;
  Annotation join(const Annotation &A, const Annotation &B) override;
  Annotation attach(llvm::StringRef STypeValue) override {
    return normalizeIRI(STypeValue);
  }

private:
  Resolver &R;
  log_level LogLevel;
};

} // namespace schemasub::semantic

#endif
