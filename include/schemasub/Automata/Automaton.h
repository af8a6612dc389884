#ifndef _SCHEMASUB_AUTOMATA_AUTOMATON_H_
#define _SCHEMASUB_AUTOMATA_AUTOMATON_H_

#include "Automata/CharSet.h"
#include "Automata/RExp.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace schemasub::automata {

/// Length bounds above this are not folded into a language automaton.
constexpr uint64_t MaxFoldedLength = 10000;

/// Thompson NFA with epsilon moves and code point set labels.
struct NFA {
  struct State {
    std::vector<std::pair<CharSet, unsigned>> Edges;
    std::vector<unsigned> Eps;
  };
  std::vector<State> States;
  unsigned Start = 0;
  std::set<unsigned> Accepting;

  unsigned addState() {
    States.emplace_back();
    return States.size() - 1;
  }

  static NFA fromRExp(const rexp::PRExp &R);

  std::set<unsigned> countClosure(const std::set<unsigned> &N) const;
  std::set<unsigned> move(const std::set<unsigned> &N, CodePoint C) const;
};

/// Complete deterministic automaton. Every state has transitions covering
/// the whole code point range, stored as sorted disjoint ranges.
class DFA {
public:
  struct Transition {
    CodePoint Lo;
    CodePoint Hi;
    unsigned Target;
  };
  struct State {
    std::vector<Transition> Trans;
    bool Accepting = false;
  };

  enum class ProductKind { Intersect, Union, Difference };

  /// Accepts nothing.
  static DFA emptyLanguage();
  /// Accepts every string.
  static DFA anyString();
  static DFA literal(llvm::StringRef Str);
  /// Strings whose length in code points lies in [Min, Max].
  static DFA lengthBetween(uint64_t Min, std::optional<uint64_t> Max);
  static DFA fromNFA(const NFA &N);
  static DFA fromRExp(const rexp::PRExp &R);

  static DFA product(const DFA &A, const DFA &B, ProductKind K);

  DFA intersect(const DFA &Other) const {
    return product(*this, Other, ProductKind::Intersect).minimize();
  }
  DFA unionWith(const DFA &Other) const {
    return product(*this, Other, ProductKind::Union).minimize();
  }
  DFA subtract(const DFA &Other) const {
    return product(*this, Other, ProductKind::Difference).minimize();
  }
  DFA complement() const;
  /// Brzozowski minimization: determinize the reverse twice.
  DFA minimize() const;

  bool isEmpty() const;
  bool acceptsEverything() const { return complement().isEmpty(); }
  /// L(this) ⊆ L(Other), decided on the fly without building the product.
  bool includedIn(const DFA &Other) const;
  bool equivalent(const DFA &Other) const {
    return includedIn(Other) && Other.includedIn(*this);
  }
  bool accepts(llvm::StringRef Str) const;
  /// Returns the single string accepted, if the language has exactly one.
  std::optional<std::string> singleString() const;
  /// Length of the shortest accepted string, none if the language is empty.
  std::optional<uint64_t> minLength() const;
  /// Length of the longest accepted string, none if unbounded or empty.
  std::optional<uint64_t> maxLength() const;

  unsigned size() const { return States.size(); }
  unsigned getStart() const { return Start; }
  const State &getState(unsigned I) const { return States[I]; }
  unsigned step(unsigned S, CodePoint C) const;

  rexp::PRExp toRExp() const;
  /// Anchored ECMA-262 pattern for the language.
  std::string toPattern() const { return rexp::toPattern(toRExp()); }

  std::string dump() const;

private:
  std::vector<State> States;
  unsigned Start = 0;

  NFA reverse() const;
  std::vector<bool> coReachable() const;
};

using PDFA = std::shared_ptr<const DFA>;

} // namespace schemasub::automata

#endif
