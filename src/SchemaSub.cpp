#include "SchemaSub.h"

#include "Canonical/Canonicalizer.h"
#include "Canonical/Serializer.h"
#include "Semantic/Compatibility.h"
#include <llvm/Support/Debug.h>

#define DEBUG_TYPE "schemasub"

namespace schemasub {

using llvm::json::Value;

namespace {

/// One operation: the annotation lattice chosen by the options, and the
/// schema lattice over it.
class Session {
public:
  explicit Session(SchemaContext &Ctx) : Ctx(Ctx) {
    if (Ctx.isSemanticReasoning()) {
      Sem = std::make_unique<semantic::SemanticAnnotations>(
          Ctx.getResolver(), Ctx.options().LogLevel);
      L = std::make_unique<SchemaLattice>(*Sem);
    } else {
      L = std::make_unique<SchemaLattice>(Drop);
    }
  }

  SchemaLattice &lattice() { return *L; }

  llvm::Expected<PSchema> canonicalize(const Value &V, Side Which) {
    Canonicalizer C(*L, Ctx.options());
    auto R = C.canonicalize(V);
    if (!R) {
      return withSide(R.takeError(), Which);
    }
    Ctx.debug() << toString(Which) << " canonicalized: " << toString(*R)
                << "\n";
    if (Ctx.isWarnUninhabited() && (*R)->isBottom()) {
      Ctx.log(level_warning) << toString(Which) << " is uninhabited\n";
    }
    return R;
  }

  /// Surface a failure the lattice recorded while combining two operands.
  llvm::Error check(const Value &A, const Value &B) {
    if (!L->failed()) {
      return llvm::Error::success();
    }
    std::string Msg = L->failure();
    L->clearFailure();
    return makeUnsupported(Msg, llvm::json::Array{A, B});
  }

  bool compatible(const Value &A, const Value &B) {
    if (!Ctx.isSemanticReasoning()) {
      return true;
    }
    bool R = semantic::isSemanticallyCompatible(
        A, B, Ctx.getResolver(), Ctx.debug(), Ctx.options().MaxRefDepth);
    Ctx.debug() << "semantic compatibility: " << (R ? "true" : "false")
                << "\n";
    return R;
  }

private:
  SchemaContext &Ctx;
  DropAnnotations Drop;
  std::unique_ptr<semantic::SemanticAnnotations> Sem;
  std::unique_ptr<SchemaLattice> L;
};

} // namespace

llvm::Expected<PSchema> canonicalize(const Value &S, SchemaContext &Ctx,
                                     Side Which) {
  Session Sess(Ctx);
  return Sess.canonicalize(S, Which);
}

llvm::Expected<bool> isSubschema(const Value &A, const Value &B,
                                 SchemaContext &Ctx) {
  Session Sess(Ctx);
  auto CA = Sess.canonicalize(A, Side::LHS);
  if (!CA) {
    return CA.takeError();
  }
  auto CB = Sess.canonicalize(B, Side::RHS);
  if (!CB) {
    return CB.takeError();
  }
  // no value to contradict an annotation.
  if ((*CA)->isBottom()) {
    Ctx.debug() << "left schema is uninhabited\n";
    return true;
  }
  if (!Sess.compatible(A, B)) {
    return false;
  }
  bool Result = Sess.lattice().isSubtype(*CA, *CB);
  if (auto E = Sess.check(A, B)) {
    return std::move(E);
  }
  Ctx.debug() << "structural subtype: " << (Result ? "true" : "false")
              << "\n";
  return Result;
}

llvm::Expected<Value> meet(const Value &A, const Value &B,
                           SchemaContext &Ctx) {
  Session Sess(Ctx);
  auto CA = Sess.canonicalize(A, Side::LHS);
  if (!CA) {
    return CA.takeError();
  }
  auto CB = Sess.canonicalize(B, Side::RHS);
  if (!CB) {
    return CB.takeError();
  }
  if (!Sess.compatible(A, B)) {
    Ctx.debug() << "semantically incompatible, meet is bottom\n";
    return toJSON(Schema::bottom());
  }
  PSchema R = Sess.lattice().meet(*CA, *CB);
  if (auto E = Sess.check(A, B)) {
    return std::move(E);
  }
  if (Ctx.isWarnUninhabited() && R->isBottom()) {
    Ctx.log(level_warning) << "meet is uninhabited\n";
  }
  LLVM_DEBUG(llvm::dbgs() << "meet: " << toString(R) << "\n");
  return toJSON(R);
}

llvm::Expected<Value> join(const Value &A, const Value &B,
                           SchemaContext &Ctx) {
  Session Sess(Ctx);
  auto CA = Sess.canonicalize(A, Side::LHS);
  if (!CA) {
    return CA.takeError();
  }
  auto CB = Sess.canonicalize(B, Side::RHS);
  if (!CB) {
    return CB.takeError();
  }
  PSchema R = Sess.lattice().join(*CA, *CB);
  if (auto E = Sess.check(A, B)) {
    return std::move(E);
  }
  LLVM_DEBUG(llvm::dbgs() << "join: " << toString(R) << "\n");
  return toJSON(R);
}

llvm::Expected<bool> isEquivalent(const Value &A, const Value &B,
                                  SchemaContext &Ctx) {
  if (Ctx.isSemanticReasoning()) {
    llvm::Optional<llvm::StringRef> SA, SB;
    if (auto *OA = A.getAsObject()) {
      SA = OA->getString("stype");
    }
    if (auto *OB = B.getAsObject()) {
      SB = OB->getString("stype");
    }
    if (SA.hasValue() != SB.hasValue()) {
      return false;
    }
    if (SA) {
      auto &R = Ctx.getResolver();
      if (!R.isSubtypeOf(*SA, *SB) || !R.isSubtypeOf(*SB, *SA)) {
        return false;
      }
    }
  }
  auto Forward = isSubschema(A, B, Ctx);
  if (!Forward) {
    return Forward.takeError();
  }
  if (!*Forward) {
    return false;
  }
  return isSubschema(B, A, Ctx);
}

} // namespace schemasub
