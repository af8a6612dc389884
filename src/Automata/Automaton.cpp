#include "Automata/Automaton.h"

#include <algorithm>
#include <cassert>
#include <functional>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>
#include <queue>
#include <variant>

#define DEBUG_TYPE "schemasub-automaton"

namespace schemasub::automata {

using namespace rexp;

namespace {

struct Fragment {
  unsigned Start;
  unsigned End;
};

Fragment build(NFA &N, const PRExp &R) {
  unsigned S = N.addState();
  unsigned E = N.addState();
  if (std::holds_alternative<Null>(*R)) {
    // no path
  } else if (std::holds_alternative<Empty>(*R)) {
    N.States[S].Eps.push_back(E);
  } else if (std::holds_alternative<Node>(*R)) {
    N.States[S].Edges.push_back({std::get<Node>(*R).E, E});
  } else if (std::holds_alternative<Star>(*R)) {
    auto Inner = build(N, std::get<Star>(*R).E);
    N.States[S].Eps.push_back(Inner.Start);
    N.States[S].Eps.push_back(E);
    N.States[Inner.End].Eps.push_back(Inner.Start);
    N.States[Inner.End].Eps.push_back(E);
  } else if (std::holds_alternative<Or>(*R)) {
    for (auto &Child : std::get<Or>(*R).E) {
      auto Inner = build(N, Child);
      N.States[S].Eps.push_back(Inner.Start);
      N.States[Inner.End].Eps.push_back(E);
    }
  } else {
    unsigned Cur = S;
    for (auto &Child : std::get<And>(*R).E) {
      auto Inner = build(N, Child);
      N.States[Cur].Eps.push_back(Inner.Start);
      Cur = Inner.End;
    }
    N.States[Cur].Eps.push_back(E);
  }
  return {S, E};
}

/// Merge adjacent transitions with the same target.
void compact(std::vector<DFA::Transition> &Trans) {
  std::vector<DFA::Transition> Out;
  for (auto &T : Trans) {
    if (!Out.empty() && Out.back().Target == T.Target &&
        Out.back().Hi + 1 == T.Lo) {
      Out.back().Hi = T.Hi;
      continue;
    }
    Out.push_back(T);
  }
  Trans = std::move(Out);
}

} // namespace

NFA NFA::fromRExp(const PRExp &R) {
  NFA N;
  auto F = build(N, R);
  N.Start = F.Start;
  N.Accepting.insert(F.End);
  return N;
}

std::set<unsigned> NFA::countClosure(const std::set<unsigned> &N) const {
  // initialize with N
  std::set<unsigned> Ret = N;
  std::queue<unsigned> Worklist;
  for (auto Node : N) {
    Worklist.push(Node);
  }
  while (!Worklist.empty()) {
    auto Node = Worklist.front();
    Worklist.pop();
    for (auto Target : States[Node].Eps) {
      if (Ret.count(Target) == 0) {
        Ret.insert(Target);
        Worklist.push(Target);
      }
    }
  }
  return Ret;
}

std::set<unsigned> NFA::move(const std::set<unsigned> &N, CodePoint C) const {
  std::set<unsigned> Ret;
  for (auto Node : N) {
    for (auto &Edge : States[Node].Edges) {
      if (Edge.first.contains(C)) {
        Ret.insert(Edge.second);
      }
    }
  }
  return Ret;
}

DFA DFA::fromNFA(const NFA &N) {
  DFA Ret;
  std::map<std::set<unsigned>, unsigned> DTrans;
  using EntryTy = std::map<std::set<unsigned>, unsigned>::iterator;
  std::queue<EntryTy> Worklist;
  auto getOrSetNewNode = [&](const std::set<unsigned> &S) -> unsigned {
    auto It = DTrans.find(S);
    if (It != DTrans.end()) {
      return It->second;
    }
    unsigned Id = Ret.States.size();
    Ret.States.emplace_back();
    for (auto Node : S) {
      if (N.Accepting.count(Node)) {
        Ret.States[Id].Accepting = true;
        break;
      }
    }
    Worklist.push(DTrans.emplace(S, Id).first);
    return Id;
  };

  Ret.Start = getOrSetNewNode(N.countClosure({N.Start}));
  while (!Worklist.empty()) {
    auto It = Worklist.front();
    Worklist.pop();
    const std::set<unsigned> Current = It->first;
    unsigned From = It->second;
    std::vector<CharSet> Labels;
    for (auto Node : Current) {
      for (auto &Edge : N.States[Node].Edges) {
        Labels.push_back(Edge.first);
      }
    }
    std::vector<Transition> Trans;
    uint64_t Next = 0;
    // uncovered code points lead to the dead state.
    auto fillGap = [&](uint64_t Upto) {
      if (Next < Upto) {
        unsigned Dead = getOrSetNewNode({});
        Trans.push_back({static_cast<CodePoint>(Next),
                         static_cast<CodePoint>(Upto - 1), Dead});
      }
    };
    for (auto &R : partition(Labels)) {
      fillGap(R.first);
      unsigned To = getOrSetNewNode(N.countClosure(N.move(Current, R.first)));
      Trans.push_back({R.first, R.second, To});
      Next = static_cast<uint64_t>(R.second) + 1;
    }
    fillGap(static_cast<uint64_t>(MaxCodePoint) + 1);
    compact(Trans);
    Ret.States[From].Trans = std::move(Trans);
  }
  return Ret;
}

DFA DFA::fromRExp(const PRExp &R) {
  return fromNFA(NFA::fromRExp(R)).minimize();
}

DFA DFA::emptyLanguage() {
  DFA Ret;
  Ret.States.push_back({{{0, MaxCodePoint, 0}}, false});
  return Ret;
}

DFA DFA::anyString() {
  DFA Ret;
  Ret.States.push_back({{{0, MaxCodePoint, 0}}, true});
  return Ret;
}

DFA DFA::literal(llvm::StringRef Str) {
  std::vector<CodePoint> Points;
  if (!decodeUTF8(Str, Points)) {
    return emptyLanguage();
  }
  DFA Ret;
  unsigned N = Points.size();
  unsigned Dead = N + 1;
  Ret.States.resize(N + 2);
  for (unsigned I = 0; I < N; ++I) {
    CodePoint C = Points[I];
    auto &T = Ret.States[I].Trans;
    if (C > 0) {
      T.push_back({0, C - 1, Dead});
    }
    T.push_back({C, C, I + 1});
    if (C < MaxCodePoint) {
      T.push_back({C + 1, MaxCodePoint, Dead});
    }
  }
  Ret.States[N].Trans.push_back({0, MaxCodePoint, Dead});
  Ret.States[N].Accepting = true;
  Ret.States[Dead].Trans.push_back({0, MaxCodePoint, Dead});
  return Ret;
}

DFA DFA::lengthBetween(uint64_t Min, std::optional<uint64_t> Max) {
  assert(Min <= MaxFoldedLength && (!Max || *Max <= MaxFoldedLength));
  DFA Ret;
  if (Max && *Max < Min) {
    return emptyLanguage();
  }
  if (!Max) {
    Ret.States.resize(Min + 1);
    for (unsigned I = 0; I < Min; ++I) {
      Ret.States[I].Trans.push_back({0, MaxCodePoint, I + 1});
    }
    Ret.States[Min].Trans.push_back(
        {0, MaxCodePoint, static_cast<unsigned>(Min)});
    Ret.States[Min].Accepting = true;
    return Ret;
  }
  unsigned Dead = *Max + 1;
  Ret.States.resize(*Max + 2);
  for (unsigned I = 0; I <= *Max; ++I) {
    Ret.States[I].Trans.push_back({0, MaxCodePoint, I == *Max ? Dead : I + 1});
    Ret.States[I].Accepting = I >= Min;
  }
  Ret.States[Dead].Trans.push_back({0, MaxCodePoint, Dead});
  return Ret;
}

unsigned DFA::step(unsigned S, CodePoint C) const {
  auto &Trans = States[S].Trans;
  auto It = std::upper_bound(
      Trans.begin(), Trans.end(), C,
      [](CodePoint V, const Transition &T) { return V < T.Lo; });
  assert(It != Trans.begin() && "DFA must be complete");
  --It;
  return It->Target;
}

DFA DFA::product(const DFA &A, const DFA &B, ProductKind K) {
  DFA Ret;
  std::map<std::pair<unsigned, unsigned>, unsigned> DTrans;
  std::queue<std::pair<unsigned, unsigned>> Worklist;
  auto getOrSetNewNode = [&](std::pair<unsigned, unsigned> P) -> unsigned {
    auto It = DTrans.find(P);
    if (It != DTrans.end()) {
      return It->second;
    }
    unsigned Id = Ret.States.size();
    Ret.States.emplace_back();
    bool AA = A.States[P.first].Accepting;
    bool BA = B.States[P.second].Accepting;
    switch (K) {
    case ProductKind::Intersect:
      Ret.States[Id].Accepting = AA && BA;
      break;
    case ProductKind::Union:
      Ret.States[Id].Accepting = AA || BA;
      break;
    case ProductKind::Difference:
      Ret.States[Id].Accepting = AA && !BA;
      break;
    }
    DTrans.emplace(P, Id);
    Worklist.push(P);
    return Id;
  };
  Ret.Start = getOrSetNewNode({A.Start, B.Start});
  while (!Worklist.empty()) {
    auto P = Worklist.front();
    Worklist.pop();
    unsigned From = DTrans[P];
    auto &TA = A.States[P.first].Trans;
    auto &TB = B.States[P.second].Trans;
    std::vector<Transition> Trans;
    size_t I = 0, J = 0;
    CodePoint Lo = 0;
    while (I < TA.size() && J < TB.size()) {
      CodePoint Hi = std::min(TA[I].Hi, TB[J].Hi);
      unsigned To = getOrSetNewNode({TA[I].Target, TB[J].Target});
      Trans.push_back({Lo, Hi, To});
      if (TA[I].Hi == Hi) {
        ++I;
      }
      if (TB[J].Hi == Hi) {
        ++J;
      }
      if (Hi == MaxCodePoint) {
        break;
      }
      Lo = Hi + 1;
    }
    compact(Trans);
    Ret.States[From].Trans = std::move(Trans);
  }
  return Ret;
}

DFA DFA::complement() const {
  DFA Ret = *this;
  for (auto &S : Ret.States) {
    S.Accepting = !S.Accepting;
  }
  return Ret;
}

NFA DFA::reverse() const {
  NFA Ret;
  Ret.States.resize(States.size() + 1);
  unsigned NewStart = States.size();
  for (unsigned S = 0; S < States.size(); ++S) {
    for (auto &T : States[S].Trans) {
      Ret.States[T.Target].Edges.push_back({CharSet(T.Lo, T.Hi), S});
    }
    if (States[S].Accepting) {
      Ret.States[NewStart].Eps.push_back(S);
    }
  }
  Ret.Start = NewStart;
  Ret.Accepting.insert(Start);
  return Ret;
}

DFA DFA::minimize() const {
  DFA D1 = fromNFA(reverse());
  return fromNFA(D1.reverse());
}

bool DFA::isEmpty() const {
  std::vector<bool> Seen(States.size());
  std::queue<unsigned> Worklist;
  Worklist.push(Start);
  Seen[Start] = true;
  while (!Worklist.empty()) {
    unsigned S = Worklist.front();
    Worklist.pop();
    if (States[S].Accepting) {
      return false;
    }
    for (auto &T : States[S].Trans) {
      if (!Seen[T.Target]) {
        Seen[T.Target] = true;
        Worklist.push(T.Target);
      }
    }
  }
  return true;
}

bool DFA::includedIn(const DFA &Other) const {
  std::set<std::pair<unsigned, unsigned>> Seen;
  std::queue<std::pair<unsigned, unsigned>> Worklist;
  Worklist.push({Start, Other.Start});
  Seen.insert({Start, Other.Start});
  while (!Worklist.empty()) {
    auto P = Worklist.front();
    Worklist.pop();
    if (States[P.first].Accepting && !Other.States[P.second].Accepting) {
      LLVM_DEBUG(llvm::dbgs() << "includedIn: counterexample state pair ("
                              << P.first << ", " << P.second << ")\n");
      return false;
    }
    auto &TA = States[P.first].Trans;
    auto &TB = Other.States[P.second].Trans;
    size_t I = 0, J = 0;
    while (I < TA.size() && J < TB.size()) {
      CodePoint Hi = std::min(TA[I].Hi, TB[J].Hi);
      std::pair<unsigned, unsigned> Next{TA[I].Target, TB[J].Target};
      if (Seen.insert(Next).second) {
        Worklist.push(Next);
      }
      if (TA[I].Hi == Hi) {
        ++I;
      }
      if (TB[J].Hi == Hi) {
        ++J;
      }
    }
  }
  return true;
}

bool DFA::accepts(llvm::StringRef Str) const {
  std::vector<CodePoint> Points;
  if (!decodeUTF8(Str, Points)) {
    return false;
  }
  unsigned S = Start;
  for (auto C : Points) {
    S = step(S, C);
  }
  return States[S].Accepting;
}

std::vector<bool> DFA::coReachable() const {
  std::vector<std::vector<unsigned>> Preds(States.size());
  for (unsigned S = 0; S < States.size(); ++S) {
    for (auto &T : States[S].Trans) {
      Preds[T.Target].push_back(S);
    }
  }
  std::vector<bool> Ret(States.size());
  std::queue<unsigned> Worklist;
  for (unsigned S = 0; S < States.size(); ++S) {
    if (States[S].Accepting) {
      Ret[S] = true;
      Worklist.push(S);
    }
  }
  while (!Worklist.empty()) {
    unsigned S = Worklist.front();
    Worklist.pop();
    for (auto P : Preds[S]) {
      if (!Ret[P]) {
        Ret[P] = true;
        Worklist.push(P);
      }
    }
  }
  return Ret;
}

std::optional<std::string> DFA::singleString() const {
  auto Useful = coReachable();
  if (!Useful[Start]) {
    return std::nullopt;
  }
  std::string Ret;
  unsigned S = Start;
  for (unsigned Steps = 0; Steps <= States.size(); ++Steps) {
    const Transition *Only = nullptr;
    unsigned Count = 0;
    for (auto &T : States[S].Trans) {
      if (Useful[T.Target]) {
        Only = &T;
        ++Count;
      }
    }
    if (States[S].Accepting) {
      if (Count == 0) {
        return Ret;
      }
      return std::nullopt;
    }
    if (Count != 1 || Only->Lo != Only->Hi) {
      return std::nullopt;
    }
    Ret += encodeUTF8(Only->Lo);
    S = Only->Target;
  }
  return std::nullopt;
}

std::optional<uint64_t> DFA::minLength() const {
  std::vector<int64_t> Dist(States.size(), -1);
  std::queue<unsigned> Worklist;
  Dist[Start] = 0;
  Worklist.push(Start);
  while (!Worklist.empty()) {
    unsigned S = Worklist.front();
    Worklist.pop();
    if (States[S].Accepting) {
      return Dist[S];
    }
    for (auto &T : States[S].Trans) {
      if (Dist[T.Target] < 0) {
        Dist[T.Target] = Dist[S] + 1;
        Worklist.push(T.Target);
      }
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> DFA::maxLength() const {
  auto Useful = coReachable();
  if (!Useful[Start]) {
    return std::nullopt;
  }
  // Longest path over useful states, none if a useful cycle is reachable.
  enum Color { White, Grey, Black };
  std::vector<Color> Colors(States.size(), White);
  std::vector<uint64_t> Longest(States.size(), 0);
  bool Cyclic = false;
  std::function<void(unsigned)> visit = [&](unsigned S) {
    Colors[S] = Grey;
    uint64_t Best = 0;
    for (auto &T : States[S].Trans) {
      if (Cyclic || !Useful[T.Target]) {
        continue;
      }
      if (Colors[T.Target] == Grey) {
        Cyclic = true;
        return;
      }
      if (Colors[T.Target] == White) {
        visit(T.Target);
      }
      Best = std::max(Best, Longest[T.Target] + 1);
    }
    Longest[S] = Best;
    Colors[S] = Black;
  };
  visit(Start);
  if (Cyclic) {
    return std::nullopt;
  }
  return Longest[Start];
}

PRExp DFA::toRExp() const {
  auto Useful = coReachable();
  if (!Useful[Start]) {
    return createNull();
  }
  unsigned NewStart = States.size();
  unsigned NewFinal = States.size() + 1;
  std::map<std::pair<unsigned, unsigned>, CharSet> Labels;
  std::vector<unsigned> Nodes;
  std::vector<unsigned> Degree(States.size(), 0);
  for (unsigned S = 0; S < States.size(); ++S) {
    if (!Useful[S]) {
      continue;
    }
    Nodes.push_back(S);
    for (auto &T : States[S].Trans) {
      if (!Useful[T.Target]) {
        continue;
      }
      Labels[{S, T.Target}].addRange(T.Lo, T.Hi);
      ++Degree[S];
      ++Degree[T.Target];
    }
  }
  std::map<std::pair<unsigned, unsigned>, PRExp> P;
  for (auto &Ent : Labels) {
    P[Ent.first] = create(Ent.second);
  }
  P[{NewStart, Start}] = createEmpty();
  for (auto S : Nodes) {
    if (States[S].Accepting) {
      P[{S, NewFinal}] = createEmpty();
    }
  }
  // eliminate low degree states first to keep expressions small.
  std::stable_sort(Nodes.begin(), Nodes.end(), [&](unsigned A, unsigned B) {
    return Degree[A] < Degree[B];
  });
  return eliminate(std::move(P), Nodes, NewStart, NewFinal);
}

std::string DFA::dump() const {
  std::string Buf;
  llvm::raw_string_ostream OS(Buf);
  OS << "DFA start=" << Start << "\n";
  for (unsigned S = 0; S < States.size(); ++S) {
    OS << "  " << S << (States[S].Accepting ? " (accept)" : "") << ":";
    for (auto &T : States[S].Trans) {
      OS << " [" << T.Lo << "-" << T.Hi << "]->" << T.Target;
    }
    OS << "\n";
  }
  return OS.str();
}

} // namespace schemasub::automata
