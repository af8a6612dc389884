#ifndef _SCHEMASUB_UNITTESTS_CANONICALTESTUTILS_H_
#define _SCHEMASUB_UNITTESTS_CANONICALTESTUTILS_H_

#include "Canonical/Canonicalizer.h"
#include "Canonical/Lattice.h"
#include "Canonical/Serializer.h"
#include <gtest/gtest.h>
#include <iostream>
#include <llvm/Support/JSON.h>
#include <string>

namespace schemasub {

inline llvm::json::Value parseJSON(llvm::StringRef Text) {
  auto V = llvm::json::parse(Text);
  if (!V) {
    ADD_FAILURE() << "bad test json: " << llvm::toString(V.takeError());
    return nullptr;
  }
  return std::move(*V);
}

inline std::string render(const llvm::json::Value &V) {
  std::string Buf;
  llvm::raw_string_ostream OS(Buf);
  OS << V;
  return OS.str();
}

/// Canonicalize a schema document that is expected to be supported.
inline PSchema canon(SchemaLattice &L, llvm::StringRef Text,
                     const Options &Opt = Options()) {
  llvm::json::Value V = parseJSON(Text);
  Canonicalizer C(L, Opt);
  auto R = C.canonicalize(V);
  if (!R) {
    ADD_FAILURE() << Text.str() << ": " << llvm::toString(R.takeError());
    return Schema::bottom();
  }
  std::cerr << Text.str() << " => " << toString(*R) << "\n";
  return *R;
}

/// Canonicalize a schema that must be rejected, and return the error.
inline llvm::Error canonError(SchemaLattice &L, llvm::StringRef Text,
                              const Options &Opt = Options()) {
  llvm::json::Value V = parseJSON(Text);
  Canonicalizer C(L, Opt);
  auto R = C.canonicalize(V);
  if (R) {
    ADD_FAILURE() << Text.str() << " was accepted as " << toString(*R);
    return llvm::Error::success();
  }
  return R.takeError();
}

/// Structural subtyping between two schema documents.
inline bool sub(llvm::StringRef A, llvm::StringRef B) {
  PlainAnnotations Ann;
  SchemaLattice L(Ann);
  return L.isSubtype(canon(L, A), canon(L, B));
}

} // namespace schemasub

#endif
