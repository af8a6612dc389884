#ifndef _SCHEMASUB_SCHEMASUB_H_
#define _SCHEMASUB_SCHEMASUB_H_

#include "Canonical/Schema.h"
#include "Errors.h"
#include "SchemaContext.h"
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

namespace schemasub {

/// Canonicalize one schema document. Errors name \p Which.
llvm::Expected<PSchema> canonicalize(const llvm::json::Value &S,
                                     SchemaContext &Ctx,
                                     Side Which = Side::None);

/// Whether every instance accepted by \p A is accepted by \p B. With semantic
/// reasoning enabled, \p A must also be semantically compatible with \p B,
/// unless \p A accepts no instance at all.
llvm::Expected<bool> isSubschema(const llvm::json::Value &A,
                                 const llvm::json::Value &B,
                                 SchemaContext &Ctx);

/// The most restrictive schema accepting the instances of both operands.
/// Semantically incompatible operands meet to `{"not": {}}`.
llvm::Expected<llvm::json::Value> meet(const llvm::json::Value &A,
                                       const llvm::json::Value &B,
                                       SchemaContext &Ctx);

/// The most permissive schema accepting the instances of either operand.
llvm::Expected<llvm::json::Value> join(const llvm::json::Value &A,
                                       const llvm::json::Value &B,
                                       SchemaContext &Ctx);

llvm::Expected<bool> isEquivalent(const llvm::json::Value &A,
                                  const llvm::json::Value &B,
                                  SchemaContext &Ctx);

} // namespace schemasub

#endif
