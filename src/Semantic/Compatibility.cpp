#include "Semantic/Compatibility.h"

#include "Canonical/Canonicalizer.h"
#include <algorithm>
#include <string>
#include <vector>

namespace schemasub::semantic {

using llvm::json::Array;
using llvm::json::Object;
using llvm::json::Value;

namespace {

class Checker {
public:
  Checker(const Value &RootA, const Value &RootB, Resolver &R,
          unsigned MaxRefDepth, llvm::raw_ostream &Debug)
      : LHS{&RootA, {}}, RHS{&RootB, {}}, R(R), MaxRefDepth(MaxRefDepth),
        Debug(Debug) {}

  bool check(const Value &A, const Value &B) {
    size_t DepthA = LHS.Refs.size();
    size_t DepthB = RHS.Refs.size();
    const Value *TA = &A;
    const Value *TB = &B;
    // a cyclic or too deep reference is rejected by canonicalization.
    bool Ret = !follow(LHS, TA) || !follow(RHS, TB) || checkTargets(*TA, *TB);
    LHS.Refs.resize(DepthA);
    RHS.Refs.resize(DepthB);
    return Ret;
  }

private:
  /// One operand document and the references expanded on the current path.
  struct Operand {
    const Value *Root;
    std::vector<std::string> Refs;
  };

  Operand LHS, RHS;
  Resolver &R;
  unsigned MaxRefDepth;
  llvm::raw_ostream &Debug;

  /// Replace \p V by the target of its local `$ref`, repeatedly. Returns false
  /// on a reference cycle or when the expansion gets too deep.
  bool follow(Operand &Op, const Value *&V) {
    while (auto *O = V->getAsObject()) {
      auto Ref = O->getString("$ref");
      if (!Ref || !Ref->startswith("#")) {
        return true;
      }
      if (std::find(Op.Refs.begin(), Op.Refs.end(), *Ref) != Op.Refs.end() ||
          Op.Refs.size() >= MaxRefDepth) {
        Debug << "semantic check stops at reference '" << *Ref << "'\n";
        return false;
      }
      const Value *Target = resolvePointer(*Op.Root, Ref->drop_front());
      if (!Target) {
        return true;
      }
      Op.Refs.push_back(Ref->str());
      V = Target;
    }
    return true;
  }

  bool checkTargets(const Value &A, const Value &B) {
    auto *OA = A.getAsObject();
    auto *OB = B.getAsObject();
    // boolean schemas carry no annotations.
    if (!OA || !OB) {
      return true;
    }
    return checkNode(*OA, *OB) && checkProperties(*OA, *OB) &&
           checkItems(*OA, *OB) && checkAdditional(*OA, *OB) &&
           checkPatterns(*OA, *OB) && checkConnectives(*OA, *OB);
  }

  bool checkNode(const Object &A, const Object &B) {
    auto SA = A.getString("stype");
    auto SB = B.getString("stype");
    if (!SB) {
      return true;
    }
    if (!SA) {
      Debug << "semantic incompatibility: no stype, but " << *SB
            << " required\n";
      return false;
    }
    if (!R.isSubtypeOf(*SA, *SB)) {
      Debug << "semantic incompatibility: " << *SA << " is not a subtype of "
            << *SB << "\n";
      return false;
    }
    return true;
  }

  bool checkProperties(const Object &A, const Object &B) {
    auto *PA = A.getObject("properties");
    auto *PB = B.getObject("properties");
    if (!PA || !PB) {
      return true;
    }
    for (auto &Ent : *PA) {
      const Value *Other = PB->get(Ent.first);
      if (Other && !check(Ent.second, *Other)) {
        Debug << "semantic incompatibility in property '" << Ent.first
              << "'\n";
        return false;
      }
    }
    return true;
  }

  static bool hasSType(const Value &V) {
    auto *O = V.getAsObject();
    return O && O->get("stype");
  }

  /// An stype at the items schema or one level below it.
  static bool itemsHaveSType(const Value &Items) {
    if (auto *Tuple = Items.getAsArray()) {
      for (auto &Item : *Tuple) {
        if (hasSType(Item)) {
          return true;
        }
      }
      return false;
    }
    auto *O = Items.getAsObject();
    if (!O) {
      return false;
    }
    if (O->get("stype")) {
      return true;
    }
    for (auto &Ent : *O) {
      if (hasSType(Ent.second)) {
        return true;
      }
    }
    return false;
  }

  bool checkItems(const Object &A, const Object &B) {
    const Value *IA = A.get("items");
    const Value *IB = B.get("items");
    if (!IA || !IB) {
      return true;
    }
    auto *TA = IA->getAsArray();
    auto *TB = IB->getAsArray();
    if (TA && TB) {
      for (size_t I = 0; I < std::min(TA->size(), TB->size()); ++I) {
        if (!check((*TA)[I], (*TB)[I])) {
          Debug << "semantic incompatibility in array items at position " << I
                << "\n";
          return false;
        }
      }
      return true;
    }
    if (!TA && !TB) {
      if (!check(*IA, *IB)) {
        Debug << "semantic incompatibility in array items\n";
        return false;
      }
      return true;
    }
    // a tuple against a homogeneous list.
    if (itemsHaveSType(*IA) || itemsHaveSType(*IB)) {
      Debug << "semantic incompatibility: tuple and list items with "
               "semantic constraints\n";
      return false;
    }
    return true;
  }

  bool checkAdditional(const Object &A, const Object &B) {
    const Value *AA = A.get("additionalProperties");
    const Value *AB = B.get("additionalProperties");
    if (!AA || !AB || !AA->getAsObject() || !AB->getAsObject()) {
      return true;
    }
    if (!check(*AA, *AB)) {
      Debug << "semantic incompatibility in additionalProperties\n";
      return false;
    }
    return true;
  }

  bool checkPatterns(const Object &A, const Object &B) {
    auto *PA = A.getObject("patternProperties");
    auto *PB = B.getObject("patternProperties");
    if (!PA || !PB) {
      return true;
    }
    for (auto &Ent : *PA) {
      const Value *Other = PB->get(Ent.first);
      if (Other && !check(Ent.second, *Other)) {
        Debug << "semantic incompatibility in patternProperty '" << Ent.first
              << "'\n";
        return false;
      }
    }
    return true;
  }

  bool compatibleWithAny(const Value &V, const Array &Branches) {
    for (auto &B : Branches) {
      if (check(V, B)) {
        return true;
      }
    }
    return false;
  }

  bool checkConnectives(const Object &A, const Object &B) {
    const Array *AllA = A.getArray("allOf");
    const Array *AllB = B.getArray("allOf");
    if (AllA && AllB && !AllA->empty() && !AllB->empty()) {
      for (auto &Branch : *AllA) {
        if (!compatibleWithAny(Branch, *AllB)) {
          Debug << "semantic incompatibility in allOf\n";
          return false;
        }
      }
    }
    // oneOf is checked like anyOf.
    for (llvm::StringRef Keyword : {"anyOf", "oneOf"}) {
      const Array *BrA = A.getArray(Keyword);
      const Array *BrB = B.getArray(Keyword);
      if (!BrA || !BrB || BrA->empty() || BrB->empty()) {
        continue;
      }
      bool Found = false;
      for (auto &Branch : *BrA) {
        if (compatibleWithAny(Branch, *BrB)) {
          Found = true;
          break;
        }
      }
      if (!Found) {
        Debug << "semantic incompatibility in " << Keyword << "\n";
        return false;
      }
    }
    return true;
  }
};

} // namespace

bool isSemanticallyCompatible(const Value &A, const Value &B, Resolver &R,
                              llvm::raw_ostream &Debug, unsigned MaxRefDepth) {
  return Checker(A, B, R, MaxRefDepth, Debug).check(A, B);
}

Annotation SemanticAnnotations::meet(const Annotation &A,
                                     const Annotation &B) {
  if (!A || !B) {
    return A ? A : B;
  }
  if (*A == *B) {
    return A;
  }
  if (R.isSubtypeOf(*A, *B)) {
    return A;
  }
  if (R.isSubtypeOf(*B, *A)) {
    return B;
  }
  log(LogLevel, level_warning) << "incomparable stypes " << *A << " and " << *B
                               << " in meet, dropping the annotation\n";
  return std::nullopt;
}

Annotation SemanticAnnotations::join(const Annotation &A,
                                     const Annotation &B) {
  if (!A || !B) {
    return std::nullopt;
  }
  if (*A == *B) {
    return A;
  }
  if (R.isSubtypeOf(*A, *B)) {
    return B;
  }
  if (R.isSubtypeOf(*B, *A)) {
    return A;
  }
  log(LogLevel, level_warning) << "incomparable stypes " << *A << " and " << *B
                               << " in join, dropping the annotation\n";
  return std::nullopt;
}

} // namespace schemasub::semantic
