#ifndef _SCHEMASUB_ERRORS_H_
#define _SCHEMASUB_ERRORS_H_

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <string>

namespace schemasub {

/// Which operand of a binary operation an error belongs to.
enum class Side { None, LHS, RHS };

const char *toString(Side S);

/// A schema that is malformed or uses a construct that cannot be represented
/// exactly in canonical form.
class UnsupportedSchema : public llvm::ErrorInfo<UnsupportedSchema> {
public:
  static char ID;

  UnsupportedSchema(std::string Reason, llvm::json::Value Subtree,
                    Side S = Side::None)
      : Reason(std::move(Reason)), Subtree(std::move(Subtree)), S(S) {}

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }

  const std::string &getReason() const { return Reason; }
  const llvm::json::Value &getSubtree() const { return Subtree; }
  Side getSide() const { return S; }
  void setSide(Side NewSide) { S = NewSide; }

protected:
  std::string Reason;
  llvm::json::Value Subtree;
  Side S;
};

/// The schema reference graph contains a cycle, or expanding it exceeds the
/// configured reference depth.
class UnsupportedRecursiveRef
    : public llvm::ErrorInfo<UnsupportedRecursiveRef, UnsupportedSchema> {
public:
  static char ID;
  using llvm::ErrorInfo<UnsupportedRecursiveRef,
                        UnsupportedSchema>::ErrorInfo;

  void log(llvm::raw_ostream &OS) const override;
};

/// Loading an ontology source failed. Consumed by the Resolver.
class GraphLoadFailure : public llvm::ErrorInfo<GraphLoadFailure> {
public:
  static char ID;

  GraphLoadFailure(std::string Source, std::string Reason)
      : Source(std::move(Source)), Reason(std::move(Reason)) {}

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }

  const std::string &getSource() const { return Source; }

private:
  std::string Source;
  std::string Reason;
};

llvm::Error makeUnsupported(const llvm::Twine &Reason,
                            const llvm::json::Value &Subtree);
llvm::Error makeRecursiveRef(const llvm::Twine &Reason,
                             const llvm::json::Value &Subtree);

/// Attach the operand side to any UnsupportedSchema carried by \p E.
llvm::Error withSide(llvm::Error E, Side S);

} // namespace schemasub

#endif
