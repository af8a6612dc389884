#include "Canonical/Serializer.h"

#include <cmath>
#include <limits>

namespace schemasub {

using llvm::json::Array;
using llvm::json::Object;
using llvm::json::Value;

namespace {

Value numberValue(double V) {
  if (std::floor(V) == V && std::fabs(V) < 9.0e15) {
    return static_cast<int64_t>(V);
  }
  return V;
}

Value bottomJSON() { return Object{{"not", Object{}}}; }

Object numberJSON(const NumberTy &N) {
  Object O{{"type", N.Integer ? "integer" : "number"}};
  if (N.isPoint()) {
    O["const"] = numberValue(N.Lower.Value);
    return O;
  }
  if (N.Lower.isFinite()) {
    O[N.Lower.Open ? "exclusiveMinimum" : "minimum"] =
        numberValue(N.Lower.Value);
  }
  if (N.Upper.isFinite()) {
    O[N.Upper.Open ? "exclusiveMaximum" : "maximum"] =
        numberValue(N.Upper.Value);
  }
  if (N.Step) {
    O["multipleOf"] = numberValue(*N.Step);
  }
  return O;
}

Object stringJSON(const StringTy &S) {
  Object O{{"type", "string"}};
  if (S.Lang) {
    if (auto Single = S.Lang->singleString()) {
      size_t Points = 0;
      for (char C : *Single) {
        Points += (C & 0xC0) != 0x80;
      }
      if (S.Length.contains(Points)) {
        O["const"] = *Single;
        return O;
      }
    }
    O["pattern"] = S.Source ? *S.Source : S.Lang->toPattern();
  }
  if (S.Length.Min > 0) {
    O["minLength"] = static_cast<int64_t>(S.Length.Min);
  }
  if (S.Length.Max) {
    O["maxLength"] = static_cast<int64_t>(*S.Length.Max);
  }
  return O;
}

Object arrayJSON(const ArrayTy &A) {
  Object O{{"type", "array"}};
  if (A.Prefix.empty()) {
    if (!A.Rest->isTop() || A.Rest->SType) {
      O["items"] = toJSON(A.Rest);
    }
  } else {
    Array Items;
    for (auto &P : A.Prefix) {
      Items.push_back(toJSON(P));
    }
    O["items"] = std::move(Items);
    if (A.Rest->isBottom()) {
      O["additionalItems"] = false;
    } else if (!A.Rest->isTop() || A.Rest->SType) {
      O["additionalItems"] = toJSON(A.Rest);
    }
  }
  if (A.Length.Min > 0) {
    O["minItems"] = static_cast<int64_t>(A.Length.Min);
  }
  if (A.Length.Max) {
    O["maxItems"] = static_cast<int64_t>(*A.Length.Max);
  }
  if (A.Unique) {
    O["uniqueItems"] = true;
  }
  return O;
}

Object objectJSON(const ObjectTy &Obj) {
  Object O{{"type", "object"}};
  if (!Obj.Properties.empty()) {
    Object Props;
    for (auto &Ent : Obj.Properties) {
      Props[Ent.first] = toJSON(Ent.second);
    }
    O["properties"] = std::move(Props);
  }
  if (!Obj.Required.empty()) {
    Array Req;
    for (auto &Name : Obj.Required) {
      Req.push_back(Name);
    }
    O["required"] = std::move(Req);
  }
  if (!Obj.Patterns.empty()) {
    Object Pats;
    for (auto &P : Obj.Patterns) {
      Pats[P.Source] = toJSON(P.Value);
    }
    O["patternProperties"] = std::move(Pats);
  }
  if (Obj.Additional->isBottom()) {
    O["additionalProperties"] = false;
  } else if (!Obj.Additional->isTop() || Obj.Additional->SType) {
    O["additionalProperties"] = toJSON(Obj.Additional);
  }
  if (Obj.Count.Min > 0) {
    O["minProperties"] = static_cast<int64_t>(Obj.Count.Min);
  }
  if (Obj.Count.Max) {
    O["maxProperties"] = static_cast<int64_t>(*Obj.Count.Max);
  }
  return O;
}

} // namespace

Value toJSON(const PSchema &S) {
  if (S->isBottom()) {
    return bottomJSON();
  }
  if (S->isTop()) {
    Object O;
    if (S->SType) {
      O["stype"] = *S->SType;
    }
    return O;
  }
  std::vector<Object> Atoms;
  std::vector<std::string> Names;
  bool AllPlain = true;
  if (S->Null) {
    Atoms.push_back(Object{{"type", "null"}});
    Names.push_back("null");
  }
  if (S->Boolean) {
    Object O{{"type", "boolean"}};
    if (!S->Boolean->isAny()) {
      O["const"] = S->Boolean->AllowTrue;
      AllPlain = false;
    }
    Atoms.push_back(std::move(O));
    Names.push_back("boolean");
  }
  bool AllPoints = S->Numbers.size() > 1;
  for (auto &N : S->Numbers) {
    AllPoints &= N.isPoint();
  }
  if (AllPoints) {
    Array Values;
    for (auto &N : S->Numbers) {
      Values.push_back(numberValue(N.Lower.Value));
    }
    Atoms.push_back(Object{{"type", "number"}, {"enum", std::move(Values)}});
    Names.push_back("number");
    AllPlain = false;
  } else {
    for (auto &N : S->Numbers) {
      AllPlain &= S->Numbers.size() == 1 &&
                  (N.isAny() || (N.Integer && !N.Step && !N.Lower.isFinite() &&
                                 !N.Upper.isFinite()));
      Atoms.push_back(numberJSON(N));
      Names.push_back(N.Integer ? "integer" : "number");
    }
  }
  if (S->String) {
    AllPlain &= S->String->isAny();
    Atoms.push_back(stringJSON(*S->String));
    Names.push_back("string");
  }
  for (auto &A : S->Arrays) {
    AllPlain &= S->Arrays.size() == 1 && A.isAny();
    Atoms.push_back(arrayJSON(A));
    Names.push_back("array");
  }
  for (auto &O : S->Objects) {
    AllPlain &= S->Objects.size() == 1 && O.isAny();
    Atoms.push_back(objectJSON(O));
    Names.push_back("object");
  }
  Object Ret;
  if (Atoms.size() == 1) {
    Ret = std::move(Atoms[0]);
  } else if (AllPlain) {
    Array Types;
    for (auto &N : Names) {
      Types.push_back(N);
    }
    Ret["type"] = std::move(Types);
  } else {
    Array Any;
    for (auto &A : Atoms) {
      Any.push_back(std::move(A));
    }
    Ret["anyOf"] = std::move(Any);
  }
  if (S->SType) {
    Ret["stype"] = *S->SType;
  }
  return Ret;
}

} // namespace schemasub
