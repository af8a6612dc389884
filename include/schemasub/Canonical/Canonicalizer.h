#ifndef _SCHEMASUB_CANONICAL_CANONICALIZER_H_
#define _SCHEMASUB_CANONICAL_CANONICALIZER_H_

#include "Canonical/Lattice.h"
#include "Errors.h"
#include "SchemaContext.h"
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <string>
#include <vector>

namespace schemasub {

/// \brief Rewrites a JSON Schema document into canonical form.
///
/// Boolean connectives are pushed down into the per-kind algebra: `allOf` is
/// an iterated meet, `anyOf` / `oneOf` an iterated join, `not` a complement.
/// Local `$ref`s are expanded on demand; a reference cycle or an expansion
/// deeper than Options::MaxRefDepth fails with UnsupportedRecursiveRef.
class Canonicalizer {
public:
  Canonicalizer(SchemaLattice &L, const Options &Opt) : L(L), Opt(Opt) {}

  llvm::Expected<PSchema> canonicalize(const llvm::json::Value &Root);

private:
  SchemaLattice &L;
  const Options &Opt;
  const llvm::json::Value *Root = nullptr;
  /// References being expanded, innermost last.
  std::vector<std::string> RefStack;

  llvm::Expected<PSchema> visit(const llvm::json::Value &V);
  llvm::Expected<PSchema> visitObject(const llvm::json::Object &O,
                                      const llvm::json::Value &V);
  llvm::Expected<PSchema> visitRef(llvm::StringRef Ref,
                                   const llvm::json::Value &V);
  /// The schema described by `type` and the per-kind keywords.
  llvm::Expected<PSchema> visitAtoms(const llvm::json::Object &O,
                                     const llvm::json::Value &V);
  llvm::Expected<PSchema> visitEnum(const llvm::json::Array &Values,
                                    const llvm::json::Value &V);
  llvm::Expected<PSchema> visitList(const llvm::json::Object &O,
                                    llvm::StringRef Keyword,
                                    const llvm::json::Value &V, PSchema Cur);

  llvm::Error buildNumber(const llvm::json::Object &O,
                          const llvm::json::Value &V, NumberTy &N);
  llvm::Error buildString(const llvm::json::Object &O,
                          const llvm::json::Value &V, StringTy &S);
  llvm::Error buildArray(const llvm::json::Object &O,
                         const llvm::json::Value &V, ArrayTy &A);
  llvm::Error buildObject(const llvm::json::Object &O,
                          const llvm::json::Value &V, ObjectTy &Obj);

  /// Turn a failure recorded by the lattice into an error at \p V.
  llvm::Error checkLattice(const llvm::json::Value &V);
};

/// Resolve a JSON pointer fragment (`#/a/b`) against \p Root.
const llvm::json::Value *resolvePointer(const llvm::json::Value &Root,
                                        llvm::StringRef Fragment);

} // namespace schemasub

#endif
