#include <algorithm>
#include <map>
#include <memory>
#include <set>
#include <variant>
#include <vector>

#include "Automata/RExp.h"

namespace schemasub::automata::rexp {

// the two constant languages are shared.
PRExp createNull() {
  static const PRExp Shared = std::make_shared<RExp>(Null{});
  return Shared;
}

PRExp createEmpty() {
  static const PRExp Shared = std::make_shared<RExp>(Empty{});
  return Shared;
}

PRExp createOr(std::vector<PRExp> E) {
  return std::make_shared<RExp>(Or{std::move(E)});
}
PRExp createAnd(std::vector<PRExp> E) {
  return std::make_shared<RExp>(And{std::move(E)});
}
PRExp createStar(const PRExp &E) { return std::make_shared<RExp>(Star{E}); }
PRExp createOptional(const PRExp &E) {
  return simplifyOnce(createOr({createEmpty(), E}));
}

PRExp create(const CharSet &CS) {
  if (CS.empty()) {
    return createNull();
  }
  return std::make_shared<RExp>(Node{CS});
}

PRExp createLiteral(const std::vector<CodePoint> &Str) {
  std::vector<PRExp> Elems;
  for (auto C : Str) {
    Elems.push_back(create(CharSet(C)));
  }
  return simplifyOnce(createAnd(std::move(Elems)));
}

namespace {

// Binding strength: 0 alternation, 1 concatenation, 2 quantified atom.
std::string render(const PRExp &R, int Prec);

std::string wrap(const std::string &S, bool Need) {
  return Need ? "(?:" + S + ")" : S;
}

std::string renderOr(const Or &O, int Prec) {
  bool HasEmpty = false;
  std::vector<std::string> Alts;
  for (auto &E : O.E) {
    if (isEmpty(E)) {
      HasEmpty = true;
      continue;
    }
    Alts.push_back(render(E, 0));
  }
  if (Alts.empty()) {
    return "";
  }
  if (HasEmpty) {
    if (Alts.size() == 1) {
      // re-render the single alternative as an atom.
      for (auto &E : O.E) {
        if (!isEmpty(E)) {
          return render(E, 2) + "?";
        }
      }
    }
    std::string Inner;
    for (auto &A : Alts) {
      Inner += (Inner.empty() ? "" : "|") + A;
    }
    return "(?:" + Inner + ")?";
  }
  std::string Inner;
  for (size_t I = 0; I < Alts.size(); ++I) {
    if (I != 0) {
      Inner += "|";
    }
    Inner += Alts[I];
  }
  return wrap(Inner, Prec > 0 && Alts.size() > 1);
}

std::string renderAnd(const And &A, int Prec) {
  std::string Ret;
  for (size_t I = 0; I < A.E.size(); ++I) {
    const PRExp &Cur = A.E[I];
    // X X* is printed as X+.
    if (I + 1 < A.E.size() && std::holds_alternative<Star>(*A.E[I + 1]) &&
        toString(std::get<Star>(*A.E[I + 1]).E) == toString(Cur)) {
      Ret += render(Cur, 2) + "+";
      ++I;
      continue;
    }
    Ret += render(Cur, 1);
  }
  return wrap(Ret, Prec > 1 && A.E.size() > 1);
}

std::string render(const PRExp &R, int Prec) {
  if (std::holds_alternative<Null>(*R)) {
    return "[]";
  } else if (std::holds_alternative<Empty>(*R)) {
    return "";
  } else if (std::holds_alternative<Star>(*R)) {
    auto &Inner = std::get<Star>(*R).E;
    if (isEmpty(Inner) || isNull(Inner)) {
      return "";
    }
    return render(Inner, 2) + "*";
  } else if (std::holds_alternative<Or>(*R)) {
    return renderOr(std::get<Or>(*R), Prec);
  } else if (std::holds_alternative<And>(*R)) {
    return renderAnd(std::get<And>(*R), Prec);
  }
  return std::get<Node>(*R).E.toRegex();
}

} // namespace

std::string toString(const PRExp &rexp) { return render(rexp, 0); }

std::string toPattern(const PRExp &rexp) {
  // anchors bind tighter than '|', so a top level alternation is grouped.
  return "^" + render(simplifyOnce(rexp), 1) + "$";
}

/// Rewrites only the top node. Nested Or / And lists are spliced in and Null /
/// Empty operands folded away; a Star over Star, Empty or Null collapses.
PRExp simplifyOnce(const PRExp &Original) {
  if (std::holds_alternative<Or>(*Original)) {
    auto &E = std::get<Or>(*Original).E;
    std::vector<PRExp> Flat;
    std::set<std::string> Seen;
    CharSet Merged;
    bool HasNode = false;
    auto push = [&](const PRExp &Child) {
      if (isNull(Child)) {
        return;
      }
      // Single code point sets are merged into one class.
      if (std::holds_alternative<Node>(*Child)) {
        Merged.add(std::get<Node>(*Child).E);
        HasNode = true;
        return;
      }
      if (Seen.insert(toString(Child)).second) {
        Flat.push_back(Child);
      }
    };
    for (auto &Child : E) {
      if (std::holds_alternative<Or>(*Child)) {
        for (auto &Inner : std::get<Or>(*Child).E) {
          push(Inner);
        }
      } else {
        push(Child);
      }
    }
    if (HasNode) {
      Flat.push_back(create(Merged));
    }
    // a starred alternative already contains the empty string.
    bool HasStar = false;
    for (auto &F : Flat) {
      HasStar |= std::holds_alternative<Star>(*F);
    }
    if (HasStar) {
      Flat.erase(std::remove_if(Flat.begin(), Flat.end(),
                                [](const PRExp &F) { return isEmpty(F); }),
                 Flat.end());
    }
    if (Flat.empty()) {
      return createNull();
    } else if (Flat.size() == 1) {
      return Flat[0];
    }
    // keep Empty first
    std::stable_partition(Flat.begin(), Flat.end(),
                          [](const PRExp &F) { return isEmpty(F); });
    return createOr(std::move(Flat));
  } else if (std::holds_alternative<And>(*Original)) {
    auto &E = std::get<And>(*Original).E;
    std::vector<PRExp> Flat;
    for (auto &Child : E) {
      if (isNull(Child)) {
        return createNull();
      }
      if (isEmpty(Child)) {
        continue;
      }
      if (std::holds_alternative<And>(*Child)) {
        for (auto &Inner : std::get<And>(*Child).E) {
          Flat.push_back(Inner);
        }
      } else {
        Flat.push_back(Child);
      }
    }
    if (Flat.empty()) {
      return createEmpty();
    } else if (Flat.size() == 1) {
      return Flat[0];
    }
    return createAnd(std::move(Flat));
  } else if (std::holds_alternative<Star>(*Original)) {
    auto &Inner = std::get<Star>(*Original).E;
    if (isNull(Inner) || isEmpty(Inner)) {
      return createEmpty();
    }
    if (std::holds_alternative<Star>(*Inner)) {
      return Inner;
    }
    // (ε | X)* is X*
    if (std::holds_alternative<Or>(*Inner)) {
      auto &Alts = std::get<Or>(*Inner).E;
      if (!Alts.empty() && isEmpty(Alts[0])) {
        std::vector<PRExp> Rest(Alts.begin() + 1, Alts.end());
        return createStar(simplifyOnce(createOr(std::move(Rest))));
      }
    }
    return Original;
  }
  return Original;
}

PRExp operator&(const PRExp &A, const PRExp &B) {
  return simplifyOnce(createAnd({A, B}));
}

PRExp operator|(const PRExp &A, const PRExp &B) {
  return simplifyOnce(createOr({A, B}));
}

PRExp eliminate(std::map<std::pair<unsigned, unsigned>, PRExp> P,
                const std::vector<unsigned> &Nodes, unsigned Start,
                unsigned Final) {
  // default to Null path (no path).
  auto getMap = [&](unsigned N1, unsigned N2) -> PRExp {
    auto It = P.find({N1, N2});
    if (It == P.end()) {
      return createNull();
    }
    return It->second;
  };

  std::set<unsigned> Alive(Nodes.begin(), Nodes.end());
  Alive.insert(Start);
  Alive.insert(Final);
  for (unsigned V : Nodes) {
    if (V == Start || V == Final) {
      continue;
    }
    auto VV = getMap(V, V);
    PRExp Loop = isNull(VV) ? createEmpty() : simplifyOnce(createStar(VV));
    Alive.erase(V);
    for (unsigned U : Alive) {
      auto UV = getMap(U, V);
      if (isNull(UV)) {
        continue;
      }
      for (unsigned W : Alive) {
        auto VW = getMap(V, W);
        if (isNull(VW)) {
          continue;
        }
        auto UW = getMap(U, W);
        UW = UW | simplifyOnce(createAnd({UV, Loop, VW}));
        P.insert_or_assign({U, W}, UW);
      }
    }
    // drop all edges of V
    for (auto It = P.begin(); It != P.end();) {
      if (It->first.first == V || It->first.second == V) {
        It = P.erase(It);
      } else {
        ++It;
      }
    }
  }
  auto SS = getMap(Start, Start);
  auto SF = getMap(Start, Final);
  auto FF = getMap(Final, Final);
  auto FS = getMap(Final, Start);
  if (Start == Final) {
    return isNull(SS) ? createEmpty() : simplifyOnce(createStar(SS));
  }
  // (SS | SF FF* FS)* SF FF*
  auto FLoop = isNull(FF) ? createEmpty() : simplifyOnce(createStar(FF));
  auto Back = simplifyOnce(createAnd({SF, FLoop, FS}));
  auto SLoopBody = SS | Back;
  auto SLoop =
      isNull(SLoopBody) ? createEmpty() : simplifyOnce(createStar(SLoopBody));
  return simplifyOnce(createAnd({SLoop, SF, FLoop}));
}

} // namespace schemasub::automata::rexp
