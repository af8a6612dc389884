#include "Semantic/ConceptGraph.h"

#include <llvm/ADT/Twine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "schemasub-concept-graph"

namespace schemasub::semantic {

namespace {

struct PrefixEntry {
  const char *Prefix;
  const char *Namespace;
};

const PrefixEntry KnownPrefixes[] = {
    {"quantitykind", "http://qudt.org/vocab/quantitykind/"},
    {"qudt", "http://qudt.org/schema/qudt/"},
    {"skos", "http://www.w3.org/2004/02/skos/core#"},
    {"ex", "http://example.org/"},
    {"foaf", "http://xmlns.com/foaf/0.1/"},
    {"rdfs", "http://www.w3.org/2000/01/rdf-schema#"},
};

} // namespace

std::string normalizeIRI(llvm::StringRef Value) {
  if (Value.startswith("http://") || Value.startswith("https://")) {
    return Value.str();
  }
  auto [Prefix, Local] = Value.split(':');
  if (Prefix.size() == Value.size()) {
    return Value.str();
  }
  for (auto &Ent : KnownPrefixes) {
    if (Prefix == Ent.Prefix) {
      return (llvm::Twine(Ent.Namespace) + Local).str();
    }
  }
  return Value.str();
}

std::string namespaceOf(llvm::StringRef IRI) {
  size_t Pos = IRI.find_last_of("#/");
  if (Pos == llvm::StringRef::npos) {
    return std::string();
  }
  return IRI.substr(0, Pos + 1).str();
}

void TripleStore::add(const Triple &T) {
  if (!All.insert(T).second) {
    return;
  }
  Forward[T.Subject][T.Predicate].push_back(T.Object);
  Backward[T.Object][T.Predicate].push_back(T.Subject);
  Closure.clear();
}

std::vector<std::string> TripleStore::objects(llvm::StringRef Subject,
                                              llvm::StringRef Predicate) const {
  auto It = Forward.find(Subject);
  if (It == Forward.end()) {
    return {};
  }
  auto PIt = It->second.find(Predicate);
  if (PIt == It->second.end()) {
    return {};
  }
  return PIt->second;
}

std::vector<std::string> TripleStore::subjects(llvm::StringRef Predicate,
                                               llvm::StringRef Object) const {
  auto It = Backward.find(Object);
  if (It == Backward.end()) {
    return {};
  }
  auto PIt = It->second.find(Predicate);
  if (PIt == It->second.end()) {
    return {};
  }
  return PIt->second;
}

const llvm::StringSet<> &TripleStore::closureOf(llvm::StringRef From) {
  auto It = Closure.find(From);
  if (It != Closure.end()) {
    return It->second;
  }
  llvm::StringSet<> Reached;
  std::vector<std::string> Worklist{From.str()};
  while (!Worklist.empty()) {
    std::string Cur = std::move(Worklist.back());
    Worklist.pop_back();
    auto Visit = [&](const std::vector<std::string> &Next) {
      for (auto &N : Next) {
        if (Reached.insert(N).second) {
          Worklist.push_back(N);
        }
      }
    };
    Visit(objects(Cur, vocab::SkosBroader));
    Visit(objects(Cur, vocab::RdfsSubClassOf));
    Visit(subjects(vocab::SkosNarrower, Cur));
  }
  LLVM_DEBUG(llvm::dbgs() << "closure of " << From << ": " << Reached.size()
                          << " concepts\n");
  return Closure.try_emplace(From, std::move(Reached)).first->second;
}

std::optional<bool> TripleStore::queryPath(llvm::StringRef From,
                                           llvm::StringRef To) {
  if (From == To) {
    return true;
  }
  return closureOf(From).contains(To);
}

} // namespace schemasub::semantic
