#include "Errors.h"

#include "utils.h"

namespace schemasub {

char UnsupportedSchema::ID = 0;
char UnsupportedRecursiveRef::ID = 0;
char GraphLoadFailure::ID = 0;

const char *toString(Side S) {
  switch (S) {
  case Side::None:
    return "schema";
  case Side::LHS:
    return "left schema";
  case Side::RHS:
    return "right schema";
  }
  return "schema";
}

static std::string subtreeText(const llvm::json::Value &V) {
  std::string Buf;
  llvm::raw_string_ostream OS(Buf);
  OS << V;
  return escapeForDiag(OS.str(), 120);
}

void UnsupportedSchema::log(llvm::raw_ostream &OS) const {
  OS << "unsupported " << toString(S) << ": " << Reason << " at "
     << subtreeText(Subtree);
}

void UnsupportedRecursiveRef::log(llvm::raw_ostream &OS) const {
  OS << "recursive reference in " << toString(S) << ": " << Reason << " at "
     << subtreeText(Subtree);
}

void GraphLoadFailure::log(llvm::raw_ostream &OS) const {
  OS << "failed to load semantic graph '" << Source << "': " << Reason;
}

llvm::Error makeUnsupported(const llvm::Twine &Reason,
                            const llvm::json::Value &Subtree) {
  return llvm::make_error<UnsupportedSchema>(Reason.str(), Subtree);
}

llvm::Error makeRecursiveRef(const llvm::Twine &Reason,
                             const llvm::json::Value &Subtree) {
  return llvm::make_error<UnsupportedRecursiveRef>(Reason.str(), Subtree);
}

llvm::Error withSide(llvm::Error E, Side S) {
  return llvm::handleErrors(
      std::move(E), [S](std::unique_ptr<UnsupportedSchema> U) -> llvm::Error {
        U->setSide(S);
        return llvm::Error(std::move(U));
      });
}

} // namespace schemasub
