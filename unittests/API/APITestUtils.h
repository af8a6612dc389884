#ifndef _SCHEMASUB_UNITTESTS_APITESTUTILS_H_
#define _SCHEMASUB_UNITTESTS_APITESTUTILS_H_

#include "SchemaSub.h"
#include "Semantic/Resolver.h"
#include <gtest/gtest.h>
#include <iostream>
#include <llvm/Support/JSON.h>
#include <string>

namespace schemasub {

inline llvm::json::Value doc(llvm::StringRef Text) {
  auto V = llvm::json::parse(Text);
  if (!V) {
    ADD_FAILURE() << "bad test json: " << llvm::toString(V.takeError());
    return nullptr;
  }
  return std::move(*V);
}

inline std::string dump(const llvm::json::Value &V) {
  std::string Buf;
  llvm::raw_string_ostream OS(Buf);
  OS << V;
  return OS.str();
}

/// isSubschema that must not fail.
inline bool subJSON(SchemaContext &Ctx, const llvm::json::Value &A,
                    const llvm::json::Value &B) {
  auto R = isSubschema(A, B, Ctx);
  if (!R) {
    ADD_FAILURE() << dump(A) << " <: " << dump(B) << ": "
                  << llvm::toString(R.takeError());
    return false;
  }
  return *R;
}

inline bool sub(SchemaContext &Ctx, llvm::StringRef A, llvm::StringRef B) {
  return subJSON(Ctx, doc(A), doc(B));
}

inline bool equiv(SchemaContext &Ctx, llvm::StringRef A, llvm::StringRef B) {
  auto R = isEquivalent(doc(A), doc(B), Ctx);
  if (!R) {
    ADD_FAILURE() << A.str() << " == " << B.str() << ": "
                  << llvm::toString(R.takeError());
    return false;
  }
  return *R;
}

/// A context whose resolver knows a small people and quantity hierarchy.
inline SchemaContext hierarchyContext() {
  SchemaContext Ctx;
  auto R = std::make_shared<semantic::Resolver>();
  R->addRelationship("ex:Employee", "foaf:Person");
  R->addRelationship("ex:Manager", "ex:Employee");
  R->addRelationship("quantitykind:Width", "quantitykind:Length");
  Ctx.setResolver(R);
  return Ctx;
}

} // namespace schemasub

#endif
