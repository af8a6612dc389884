#include "Canonical/Canonicalizer.h"

#include "Automata/RegexParser.h"
#include <algorithm>
#include <cmath>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Debug.h>

#define DEBUG_TYPE "schemasub-canonicalizer"

namespace schemasub {

using automata::DFA;
using llvm::json::Array;
using llvm::json::Object;
using llvm::json::Value;

namespace {

const llvm::StringSet<> &annotationKeywords() {
  static const llvm::StringSet<> Set = {
      "$schema",     "$id",      "id",         "title",
      "description", "default",  "examples",   "definitions",
      "$defs",       "$comment", "readOnly",   "writeOnly",
      "deprecated",  "contentMediaType",       "contentEncoding"};
  return Set;
}

const llvm::StringSet<> &handledKeywords() {
  static const llvm::StringSet<> Set = {
      "type",          "enum",         "const",
      "minimum",       "maximum",      "exclusiveMinimum",
      "exclusiveMaximum", "multipleOf", "minLength",
      "maxLength",     "pattern",      "format",
      "items",         "additionalItems", "minItems",
      "maxItems",      "uniqueItems",  "properties",
      "patternProperties", "additionalProperties", "required",
      "minProperties", "maxProperties", "allOf",
      "anyOf",         "oneOf",        "not",
      "$ref",          "stype"};
  return Set;
}

/// A number keyword, none if absent.
llvm::Expected<std::optional<double>>
numberKeyword(const Object &O, llvm::StringRef Key, const Value &V) {
  const Value *K = O.get(Key);
  if (!K) {
    return std::nullopt;
  }
  auto N = K->getAsNumber();
  if (!N) {
    return makeUnsupported("'" + Key + "' must be a number", V);
  }
  return std::optional<double>(*N);
}

/// A non-negative integer keyword, none if absent.
llvm::Expected<std::optional<uint64_t>>
sizeKeyword(const Object &O, llvm::StringRef Key, const Value &V) {
  const Value *K = O.get(Key);
  if (!K) {
    return std::nullopt;
  }
  auto N = K->getAsNumber();
  if (!N || *N < 0 || std::floor(*N) != *N) {
    return makeUnsupported("'" + Key + "' must be a non-negative integer", V);
  }
  return std::optional<uint64_t>(static_cast<uint64_t>(*N));
}

llvm::Expected<automata::PDFA> patternLanguage(llvm::StringRef Pattern,
                                               const Value &V) {
  auto R = automata::parseRegex(Pattern);
  if (R.isErr()) {
    return makeUnsupported("pattern '" + Pattern + "': " + R.msg(), V);
  }
  return std::make_shared<DFA>(DFA::fromRExp(*R));
}

} // namespace

const Value *resolvePointer(const Value &Root, llvm::StringRef Fragment) {
  const Value *Cur = &Root;
  if (Fragment.empty() || Fragment == "/") {
    return Cur;
  }
  if (!Fragment.consume_front("/")) {
    return nullptr;
  }
  llvm::SmallVector<llvm::StringRef, 4> Parts;
  Fragment.split(Parts, '/');
  for (auto Part : Parts) {
    std::string Token;
    for (size_t I = 0; I < Part.size(); ++I) {
      if (Part[I] == '~' && I + 1 < Part.size() &&
          (Part[I + 1] == '0' || Part[I + 1] == '1')) {
        Token += Part[I + 1] == '0' ? '~' : '/';
        ++I;
      } else {
        Token += Part[I];
      }
    }
    if (auto *O = Cur->getAsObject()) {
      Cur = O->get(Token);
    } else if (auto *A = Cur->getAsArray()) {
      unsigned Index;
      if (llvm::StringRef(Token).getAsInteger(10, Index) ||
          Index >= A->size()) {
        return nullptr;
      }
      Cur = &(*A)[Index];
    } else {
      return nullptr;
    }
    if (!Cur) {
      return nullptr;
    }
  }
  return Cur;
}

llvm::Error Canonicalizer::checkLattice(const Value &V) {
  if (!L.failed()) {
    return llvm::Error::success();
  }
  std::string Msg = L.failure();
  L.clearFailure();
  return makeUnsupported(Msg, V);
}

llvm::Expected<PSchema> Canonicalizer::canonicalize(const Value &RootV) {
  Root = &RootV;
  RefStack.clear();
  L.clearFailure();
  auto R = visit(RootV);
  if (R) {
    LLVM_DEBUG(llvm::dbgs() << "canonicalize: " << toString(*R) << "\n");
  }
  return R;
}

llvm::Expected<PSchema> Canonicalizer::visit(const Value &V) {
  if (auto B = V.getAsBoolean()) {
    return *B ? Schema::top() : Schema::bottom();
  }
  if (auto *O = V.getAsObject()) {
    return visitObject(*O, V);
  }
  return makeUnsupported("a schema must be an object or a boolean", V);
}

llvm::Expected<PSchema> Canonicalizer::visitRef(llvm::StringRef Ref,
                                                const Value &V) {
  if (!Ref.startswith("#") ||
      (Ref.size() > 1 && !Ref.startswith("#/"))) {
    return makeUnsupported("only local JSON pointer references are "
                           "supported, got '" +
                               Ref + "'",
                           V);
  }
  if (std::find(RefStack.begin(), RefStack.end(), Ref) != RefStack.end()) {
    return makeRecursiveRef("reference cycle through '" + Ref + "'", V);
  }
  if (RefStack.size() >= Opt.MaxRefDepth) {
    return makeRecursiveRef("reference expansion deeper than " +
                                llvm::Twine(Opt.MaxRefDepth),
                            V);
  }
  const Value *Target = resolvePointer(*Root, Ref.drop_front());
  if (!Target) {
    return makeUnsupported("unresolvable reference '" + Ref + "'", V);
  }
  RefStack.push_back(Ref.str());
  auto R = visit(*Target);
  RefStack.pop_back();
  return R;
}

llvm::Expected<PSchema> Canonicalizer::visitObject(const Object &O,
                                                   const Value &V) {
  if (const Value *Ref = O.get("$ref")) {
    // siblings of $ref are ignored.
    auto RefStr = Ref->getAsString();
    if (!RefStr) {
      return makeUnsupported("'$ref' must be a string", V);
    }
    return visitRef(*RefStr, V);
  }
  for (auto &Ent : O) {
    llvm::StringRef Key = Ent.first;
    if (!handledKeywords().count(Key) && !annotationKeywords().count(Key)) {
      return makeUnsupported("unknown keyword '" + Key + "'", V);
    }
  }
  auto Atoms = visitAtoms(O, V);
  if (!Atoms) {
    return Atoms.takeError();
  }
  PSchema Cur = *Atoms;

  const Value *Enum = O.get("enum");
  if (Enum) {
    auto *Values = Enum->getAsArray();
    if (!Values) {
      return makeUnsupported("'enum' must be an array", V);
    }
    auto E = visitEnum(*Values, V);
    if (!E) {
      return E.takeError();
    }
    Cur = L.meet(Cur, *E);
  }
  if (const Value *Const = O.get("const")) {
    Array Single;
    Single.push_back(*Const);
    auto E = visitEnum(Single, V);
    if (!E) {
      return E.takeError();
    }
    Cur = L.meet(Cur, *E);
  }
  for (llvm::StringRef Keyword : {"allOf", "anyOf", "oneOf"}) {
    if (!O.get(Keyword)) {
      continue;
    }
    auto R = visitList(O, Keyword, V, Cur);
    if (!R) {
      return R.takeError();
    }
    Cur = *R;
  }
  if (const Value *Not = O.get("not")) {
    auto Inner = visit(*Not);
    if (!Inner) {
      return Inner.takeError();
    }
    PSchema C = L.complement(*Inner);
    if (auto E = checkLattice(V)) {
      return std::move(E);
    }
    Cur = L.meet(Cur, C);
  }
  if (const Value *SType = O.get("stype")) {
    auto Str = SType->getAsString();
    if (!Str) {
      return makeUnsupported("'stype' must be a string", V);
    }
    Annotation A = L.annotations().meet(
        Cur->SType, L.annotations().attach(*Str));
    if (!Cur->isBottom() && A != Cur->SType) {
      auto Copy = std::make_shared<Schema>(*Cur);
      Copy->SType = A;
      Cur = Copy;
    }
  }
  if (auto E = checkLattice(V)) {
    return std::move(E);
  }
  return Cur;
}

llvm::Expected<PSchema> Canonicalizer::visitList(const Object &O,
                                                 llvm::StringRef Keyword,
                                                 const Value &V, PSchema Cur) {
  auto *List = O.get(Keyword)->getAsArray();
  if (!List || List->empty()) {
    return makeUnsupported("'" + Keyword + "' must be a non-empty array", V);
  }
  std::vector<PSchema> Branches;
  for (auto &Item : *List) {
    auto R = visit(Item);
    if (!R) {
      return R.takeError();
    }
    Branches.push_back(*R);
  }
  if (Keyword == "allOf") {
    for (auto &B : Branches) {
      Cur = L.meet(Cur, B);
    }
    return Cur;
  }
  if (Keyword == "oneOf") {
    // disjoint branches make the union exact.
    bool Overlap = false;
    for (size_t I = 0; I < Branches.size() && !Overlap; ++I) {
      for (size_t J = I + 1; J < Branches.size(); ++J) {
        if (!L.meet(Branches[I], Branches[J])->isBottom()) {
          Overlap = true;
          break;
        }
      }
    }
    if (Overlap) {
      log(Opt.LogLevel, level_warning)
          << "oneOf branches overlap, treating oneOf as anyOf\n";
    }
  }
  PSchema Union = Schema::bottom();
  for (auto &B : Branches) {
    Union = L.join(Union, B);
  }
  return L.meet(Cur, Union);
}

llvm::Expected<PSchema> Canonicalizer::visitAtoms(const Object &O,
                                                  const Value &V) {
  bool Kinds[NumKinds] = {true, true, true, true, true, true};
  bool IntegerOnly = false;
  if (const Value *Type = O.get("type")) {
    std::vector<llvm::StringRef> Names;
    if (auto Str = Type->getAsString()) {
      Names.push_back(*Str);
    } else if (auto *Arr = Type->getAsArray()) {
      for (auto &Item : *Arr) {
        auto S = Item.getAsString();
        if (!S) {
          return makeUnsupported("'type' entries must be strings", V);
        }
        Names.push_back(*S);
      }
    } else {
      return makeUnsupported("'type' must be a string or an array", V);
    }
    std::fill(std::begin(Kinds), std::end(Kinds), false);
    bool SawNumber = false, SawInteger = false;
    for (auto Name : Names) {
      if (Name == "null") {
        Kinds[(unsigned)Kind::Null] = true;
      } else if (Name == "boolean") {
        Kinds[(unsigned)Kind::Boolean] = true;
      } else if (Name == "number") {
        Kinds[(unsigned)Kind::Number] = true;
        SawNumber = true;
      } else if (Name == "integer") {
        Kinds[(unsigned)Kind::Number] = true;
        SawInteger = true;
      } else if (Name == "string") {
        Kinds[(unsigned)Kind::String] = true;
      } else if (Name == "array") {
        Kinds[(unsigned)Kind::Array] = true;
      } else if (Name == "object") {
        Kinds[(unsigned)Kind::Object] = true;
      } else {
        return makeUnsupported("unknown type '" + Name + "'", V);
      }
    }
    IntegerOnly = SawInteger && !SawNumber;
  }

  Schema S;
  if (Kinds[(unsigned)Kind::Null]) {
    S.Null = NullTy{};
  }
  if (Kinds[(unsigned)Kind::Boolean]) {
    S.Boolean = BooleanTy{};
  }
  if (Kinds[(unsigned)Kind::Number]) {
    NumberTy N;
    N.Integer = IntegerOnly;
    if (auto E = buildNumber(O, V, N)) {
      return std::move(E);
    }
    S.Numbers.push_back(N);
  }
  if (Kinds[(unsigned)Kind::String]) {
    StringTy Str;
    if (auto E = buildString(O, V, Str)) {
      return std::move(E);
    }
    S.String = std::move(Str);
  }
  if (Kinds[(unsigned)Kind::Array]) {
    ArrayTy A = ArrayTy::any();
    if (auto E = buildArray(O, V, A)) {
      return std::move(E);
    }
    S.Arrays.push_back(std::move(A));
  }
  if (Kinds[(unsigned)Kind::Object]) {
    ObjectTy Obj = ObjectTy::any();
    if (auto E = buildObject(O, V, Obj)) {
      return std::move(E);
    }
    S.Objects.push_back(std::move(Obj));
  }
  PSchema Ret = L.normalize(std::move(S));
  if (auto E = checkLattice(V)) {
    return std::move(E);
  }
  return Ret;
}

llvm::Error Canonicalizer::buildNumber(const Object &O, const Value &V,
                                       NumberTy &N) {
  auto Min = numberKeyword(O, "minimum", V);
  if (!Min) {
    return Min.takeError();
  }
  auto Max = numberKeyword(O, "maximum", V);
  if (!Max) {
    return Max.takeError();
  }
  if (*Min) {
    N.Lower = Bound::closed(**Min);
  }
  if (*Max) {
    N.Upper = Bound::closed(**Max);
  }
  // draft 4 uses booleans, later drafts numbers.
  if (const Value *EMin = O.get("exclusiveMinimum")) {
    if (auto B = EMin->getAsBoolean()) {
      if (*B && N.Lower.isFinite()) {
        N.Lower.Open = true;
      }
    } else if (auto D = EMin->getAsNumber()) {
      N.Lower = tighterLower(N.Lower, Bound::open(*D));
    } else {
      return makeUnsupported("'exclusiveMinimum' must be a number or a "
                             "boolean",
                             V);
    }
  }
  if (const Value *EMax = O.get("exclusiveMaximum")) {
    if (auto B = EMax->getAsBoolean()) {
      if (*B && N.Upper.isFinite()) {
        N.Upper.Open = true;
      }
    } else if (auto D = EMax->getAsNumber()) {
      N.Upper = tighterUpper(N.Upper, Bound::open(*D));
    } else {
      return makeUnsupported("'exclusiveMaximum' must be a number or a "
                             "boolean",
                             V);
    }
  }
  auto Step = numberKeyword(O, "multipleOf", V);
  if (!Step) {
    return Step.takeError();
  }
  if (*Step) {
    if (**Step <= 0) {
      return makeUnsupported("'multipleOf' must be positive", V);
    }
    N.Step = **Step;
  }
  return llvm::Error::success();
}

llvm::Error Canonicalizer::buildString(const Object &O, const Value &V,
                                       StringTy &S) {
  auto Min = sizeKeyword(O, "minLength", V);
  if (!Min) {
    return Min.takeError();
  }
  auto Max = sizeKeyword(O, "maxLength", V);
  if (!Max) {
    return Max.takeError();
  }
  S.Length.Min = Min->value_or(0);
  S.Length.Max = *Max;
  if (const Value *P = O.get("pattern")) {
    auto Str = P->getAsString();
    if (!Str) {
      return makeUnsupported("'pattern' must be a string", V);
    }
    auto Lang = patternLanguage(*Str, V);
    if (!Lang) {
      return Lang.takeError();
    }
    S.Lang = *Lang;
    S.Source = Str->str();
  }
  if (const Value *F = O.get("format")) {
    auto Str = F->getAsString();
    if (!Str) {
      return makeUnsupported("'format' must be a string", V);
    }
    auto R = automata::formatLanguage(*Str);
    if (R.isErr()) {
      return makeUnsupported(R.msg(), V);
    }
    auto Lang = std::make_shared<DFA>(DFA::fromRExp(*R));
    if (S.Lang) {
      // pattern and format both apply.
      S.Lang = std::make_shared<DFA>(S.Lang->intersect(*Lang));
      S.Source.reset();
    } else {
      S.Lang = Lang;
    }
  }
  return llvm::Error::success();
}

llvm::Error Canonicalizer::buildArray(const Object &O, const Value &V,
                                      ArrayTy &A) {
  if (const Value *Items = O.get("items")) {
    if (auto *Tuple = Items->getAsArray()) {
      for (auto &Item : *Tuple) {
        auto R = visit(Item);
        if (!R) {
          return R.takeError();
        }
        A.Prefix.push_back(*R);
      }
      if (const Value *Additional = O.get("additionalItems")) {
        auto R = visit(*Additional);
        if (!R) {
          return R.takeError();
        }
        A.Rest = *R;
      }
    } else {
      auto R = visit(*Items);
      if (!R) {
        return R.takeError();
      }
      A.Rest = *R;
    }
  }
  auto Min = sizeKeyword(O, "minItems", V);
  if (!Min) {
    return Min.takeError();
  }
  auto Max = sizeKeyword(O, "maxItems", V);
  if (!Max) {
    return Max.takeError();
  }
  A.Length.Min = Min->value_or(0);
  A.Length.Max = *Max;
  if (const Value *U = O.get("uniqueItems")) {
    auto B = U->getAsBoolean();
    if (!B) {
      return makeUnsupported("'uniqueItems' must be a boolean", V);
    }
    A.Unique = *B;
  }
  return llvm::Error::success();
}

llvm::Error Canonicalizer::buildObject(const Object &O, const Value &V,
                                       ObjectTy &Obj) {
  if (const Value *Props = O.get("properties")) {
    auto *PO = Props->getAsObject();
    if (!PO) {
      return makeUnsupported("'properties' must be an object", V);
    }
    for (auto &Ent : *PO) {
      auto R = visit(Ent.second);
      if (!R) {
        return R.takeError();
      }
      Obj.Properties[Ent.first.str()] = *R;
    }
  }
  if (const Value *Req = O.get("required")) {
    auto *RA = Req->getAsArray();
    if (!RA) {
      return makeUnsupported("'required' must be an array", V);
    }
    for (auto &Item : *RA) {
      auto S = Item.getAsString();
      if (!S) {
        return makeUnsupported("'required' entries must be strings", V);
      }
      Obj.Required.insert(S->str());
    }
  }
  if (const Value *Pats = O.get("patternProperties")) {
    auto *PO = Pats->getAsObject();
    if (!PO) {
      return makeUnsupported("'patternProperties' must be an object", V);
    }
    // keep a stable order for serialization.
    std::vector<std::string> Keys;
    for (auto &Ent : *PO) {
      Keys.push_back(Ent.first.str());
    }
    std::sort(Keys.begin(), Keys.end());
    for (auto &Key : Keys) {
      auto Lang = patternLanguage(Key, V);
      if (!Lang) {
        return Lang.takeError();
      }
      auto R = visit(*PO->get(Key));
      if (!R) {
        return R.takeError();
      }
      Obj.Patterns.push_back({Key, *Lang, *R});
    }
  }
  if (const Value *Additional = O.get("additionalProperties")) {
    auto R = visit(*Additional);
    if (!R) {
      return R.takeError();
    }
    Obj.Additional = *R;
  }
  auto Min = sizeKeyword(O, "minProperties", V);
  if (!Min) {
    return Min.takeError();
  }
  auto Max = sizeKeyword(O, "maxProperties", V);
  if (!Max) {
    return Max.takeError();
  }
  Obj.Count.Min = Min->value_or(0);
  Obj.Count.Max = *Max;
  return llvm::Error::success();
}

llvm::Expected<PSchema> Canonicalizer::visitEnum(const Array &Values,
                                                 const Value &V) {
  Schema S;
  std::vector<double> Numbers;
  std::vector<automata::rexp::PRExp> Strings;
  for (auto &Item : Values) {
    switch (Item.kind()) {
    case Value::Null:
      S.Null = NullTy{};
      break;
    case Value::Boolean: {
      bool B = *Item.getAsBoolean();
      if (!S.Boolean) {
        S.Boolean = BooleanTy{false, false};
      }
      (B ? S.Boolean->AllowTrue : S.Boolean->AllowFalse) = true;
      break;
    }
    case Value::Number:
      Numbers.push_back(*Item.getAsNumber());
      break;
    case Value::String: {
      std::vector<automata::CodePoint> Points;
      if (!automata::decodeUTF8(*Item.getAsString(), Points)) {
        return makeUnsupported("enum string is not valid UTF-8", V);
      }
      Strings.push_back(automata::rexp::createLiteral(Points));
      break;
    }
    case Value::Array:
    case Value::Object:
      return makeUnsupported("array and object values in enum or const are "
                             "not supported",
                             V);
    }
  }
  if (!Numbers.empty()) {
    std::sort(Numbers.begin(), Numbers.end());
    Numbers.erase(std::unique(Numbers.begin(), Numbers.end()), Numbers.end());
    // an arithmetic progression anchored at a multiple of its difference is
    // one stepped range, anything else a union of single values.
    bool Progression = Numbers.size() > 2;
    double D = Progression ? Numbers[1] - Numbers[0] : 0;
    Progression = Progression && isMultipleOf(Numbers[0], D);
    for (size_t I = 2; I < Numbers.size() && Progression; ++I) {
      Progression = std::fabs((Numbers[I] - Numbers[I - 1]) - D) <=
                    1e-9 * std::max(1.0, std::fabs(D));
    }
    if (Progression) {
      NumberTy N;
      N.Lower = Bound::closed(Numbers.front());
      N.Upper = Bound::closed(Numbers.back());
      N.Step = D;
      S.Numbers.push_back(N);
    } else {
      for (double X : Numbers) {
        NumberTy N;
        N.Lower = N.Upper = Bound::closed(X);
        S.Numbers.push_back(N);
      }
    }
  }
  if (!Strings.empty()) {
    StringTy Str;
    Str.Lang = std::make_shared<DFA>(
        DFA::fromRExp(automata::rexp::createOr(std::move(Strings))));
    S.String = std::move(Str);
  }
  PSchema Ret = L.normalize(std::move(S));
  if (auto E = checkLattice(V)) {
    return std::move(E);
  }
  return Ret;
}

} // namespace schemasub
