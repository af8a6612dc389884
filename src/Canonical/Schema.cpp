#include "Canonical/Schema.h"
#include "Canonical/Serializer.h"

namespace schemasub {

const char *toString(Kind K) {
  switch (K) {
  case Kind::Null:
    return "null";
  case Kind::Boolean:
    return "boolean";
  case Kind::Number:
    return "number";
  case Kind::String:
    return "string";
  case Kind::Array:
    return "array";
  case Kind::Object:
    return "object";
  }
  return "unknown";
}

ArrayTy ArrayTy::any() {
  ArrayTy Ret;
  Ret.Rest = Schema::top();
  return Ret;
}

bool ArrayTy::isAny() const {
  return Prefix.empty() && Rest->isTop() && !Rest->SType && Length.isAny() &&
         !Unique;
}

ObjectTy ObjectTy::any() {
  ObjectTy Ret;
  Ret.Additional = Schema::top();
  return Ret;
}

bool ObjectTy::isAny() const {
  return Properties.empty() && Required.empty() && Patterns.empty() &&
         Additional->isTop() && !Additional->SType && Count.isAny();
}

PSchema Schema::top() {
  static PSchema Instance = [] {
    auto S = std::make_shared<Schema>();
    S->Null = NullTy{};
    S->Boolean = BooleanTy{};
    S->Numbers.push_back(NumberTy{});
    S->String = StringTy{};
    // children of the shared Top refer back to it.
    ArrayTy A;
    A.Rest = S;
    ObjectTy O;
    O.Additional = S;
    S->Arrays.push_back(std::move(A));
    S->Objects.push_back(std::move(O));
    return PSchema(S);
  }();
  return Instance;
}

PSchema Schema::bottom() {
  static PSchema Instance = std::make_shared<Schema>();
  return Instance;
}

bool Schema::hasKind(Kind K) const {
  switch (K) {
  case Kind::Null:
    return Null.has_value();
  case Kind::Boolean:
    return Boolean.has_value();
  case Kind::Number:
    return !Numbers.empty();
  case Kind::String:
    return String.has_value();
  case Kind::Array:
    return !Arrays.empty();
  case Kind::Object:
    return !Objects.empty();
  }
  return false;
}

bool Schema::isBottom() const { return numKinds() == 0; }

bool Schema::isTop() const {
  if (this == top().get()) {
    return true;
  }
  return Null && Boolean && Boolean->isAny() && number() &&
         number()->isAny() && String && String->isAny() && array() &&
         array()->isAny() && object() && object()->isAny();
}

unsigned Schema::numKinds() const {
  return Null.has_value() + Boolean.has_value() + !Numbers.empty() +
         String.has_value() + !Arrays.empty() + !Objects.empty();
}

std::optional<Kind> Schema::singleKind() const {
  if (numKinds() != 1) {
    return std::nullopt;
  }
  for (unsigned I = 0; I < NumKinds; ++I) {
    if (hasKind(static_cast<Kind>(I))) {
      return static_cast<Kind>(I);
    }
  }
  return std::nullopt;
}

std::string toString(const PSchema &S) {
  std::string Buf;
  llvm::raw_string_ostream OS(Buf);
  OS << toJSON(S);
  return OS.str();
}

} // namespace schemasub
