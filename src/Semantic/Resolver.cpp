#include "Semantic/Resolver.h"

#include "Errors.h"
#include <deque>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Debug.h>

#define DEBUG_TYPE "schemasub-resolver"

namespace schemasub::semantic {

void Resolver::setFetcher(std::unique_ptr<OntologyFetcher> F) {
  std::lock_guard<std::mutex> Lock(Mu);
  Fetcher = std::move(F);
}

void Resolver::setLazyLoad(bool V) {
  std::lock_guard<std::mutex> Lock(Mu);
  LazyLoad = V;
}

void Resolver::setLogLevel(log_level Level) {
  std::lock_guard<std::mutex> Lock(Mu);
  LogLevel = Level;
}

ConceptGraph &Resolver::graph() {
  if (!Graph) {
    Graph = std::make_shared<TripleStore>();
  }
  return *Graph;
}

void Resolver::invalidate() {
  Cache.clear();
  PathQuerySupported.reset();
}

void Resolver::merge(const std::vector<Triple> &Triples) {
  if (Triples.empty()) {
    return;
  }
  auto &G = graph();
  for (auto &T : Triples) {
    G.add(T);
  }
  invalidate();
}

void Resolver::addRelationship(llvm::StringRef Narrower,
                               llvm::StringRef Broader) {
  std::lock_guard<std::mutex> Lock(Mu);
  merge({Triple{normalizeIRI(Narrower), vocab::SkosBroader,
                normalizeIRI(Broader)}});
}

void Resolver::mergeTriples(const std::vector<Triple> &Triples) {
  std::lock_guard<std::mutex> Lock(Mu);
  merge(Triples);
}

bool Resolver::loadSource(llvm::StringRef Source) {
  std::lock_guard<std::mutex> Lock(Mu);
  auto Load = [&]() -> llvm::Expected<std::vector<Triple>> {
    auto NS = wellKnownOntology(Source);
    if (!NS) {
      return loadTurtleFile(Source);
    }
    Fetched.insert(*NS);
    if (!Fetcher) {
      return llvm::make_error<GraphLoadFailure>(
          Source.str(), "no ontology fetcher configured");
    }
    return Fetcher->fetch(*NS);
  };
  auto Triples = Load();
  if (!Triples) {
    reportLoadFailure(Triples.takeError(), "continuing without ontology");
    return false;
  }
  log(LogLevel, level_info) << "loaded " << Triples->size()
                            << " triples from " << Source << "\n";
  merge(*Triples);
  return true;
}

void Resolver::reportLoadFailure(llvm::Error E, llvm::StringRef What) {
  llvm::handleAllErrors(
      std::move(E),
      [&](const GraphLoadFailure &F) {
        log(LogLevel, level_warning) << What << ": " << F.message() << "\n";
      },
      [&](const llvm::ErrorInfoBase &Other) {
        log(LogLevel, level_warning)
            << What << ": " << Other.message() << "\n";
      });
}

void Resolver::fetchNamespace(const std::string &IRI) {
  std::string NS = namespaceOf(IRI);
  if (NS.empty() || !Fetched.insert(NS).second) {
    return;
  }
  // a failed fetch is not retried.
  auto Triples = Fetcher->fetch(NS);
  if (!Triples) {
    reportLoadFailure(Triples.takeError(), "lazy load failed");
    return;
  }
  LLVM_DEBUG(llvm::dbgs() << "lazy load " << NS << ": " << Triples->size()
                          << " triples\n");
  merge(*Triples);
}

bool Resolver::traverse(const std::string &From, const std::string &To) {
  std::set<std::string> Visited{From};
  std::deque<std::string> Queue{From};
  while (!Queue.empty()) {
    std::string Cur = std::move(Queue.front());
    Queue.pop_front();
    std::vector<std::string> Next = Graph->objects(Cur, vocab::SkosBroader);
    auto Sub = Graph->objects(Cur, vocab::RdfsSubClassOf);
    Next.insert(Next.end(), Sub.begin(), Sub.end());
    auto Inv = Graph->subjects(vocab::SkosNarrower, Cur);
    Next.insert(Next.end(), Inv.begin(), Inv.end());
    for (auto &N : Next) {
      if (N == To) {
        return true;
      }
      if (Visited.insert(N).second) {
        Queue.push_back(N);
      }
    }
  }
  return false;
}

bool Resolver::query(const std::string &From, const std::string &To) {
  if (!PathQuerySupported.has_value() || *PathQuerySupported) {
    std::optional<bool> R = Graph->queryPath(From, To);
    if (!PathQuerySupported.has_value()) {
      PathQuerySupported = R.has_value();
      log(LogLevel, level_info)
          << (*PathQuerySupported ? "graph answers transitive path queries\n"
                                  : "graph has no transitive path query, "
                                    "falling back to traversal\n");
    }
    if (R) {
      return *R;
    }
  }
  return traverse(From, To);
}

bool Resolver::isSubtypeOf(llvm::StringRef NarrowerV,
                           llvm::StringRef BroaderV) {
  std::string Narrower = normalizeIRI(NarrowerV);
  std::string Broader = normalizeIRI(BroaderV);
  if (Narrower == Broader) {
    return true;
  }
  std::lock_guard<std::mutex> Lock(Mu);
  if (LazyLoad && Fetcher) {
    fetchNamespace(Narrower);
    fetchNamespace(Broader);
  }
  auto Key = std::make_pair(Narrower, Broader);
  auto It = Cache.find(Key);
  if (It != Cache.end()) {
    return It->second;
  }
  bool Result = Graph ? query(Narrower, Broader) : false;
  LLVM_DEBUG(llvm::dbgs() << Narrower << " <: " << Broader << " = "
                          << (Result ? "true" : "false") << "\n");
  Cache.emplace(std::move(Key), Result);
  return Result;
}

Resolver::State Resolver::getState() const {
  std::lock_guard<std::mutex> Lock(Mu);
  if (!Graph) {
    return State::Uninitialized;
  }
  return PathQuerySupported ? State::Tested : State::Ready;
}

std::optional<bool> Resolver::supportsPathQuery() const {
  std::lock_guard<std::mutex> Lock(Mu);
  return PathQuerySupported;
}

size_t Resolver::cacheSize() const {
  std::lock_guard<std::mutex> Lock(Mu);
  return Cache.size();
}

size_t Resolver::graphSize() const {
  std::lock_guard<std::mutex> Lock(Mu);
  return Graph ? Graph->size() : 0;
}

bool Resolver::hasFetched(llvm::StringRef Namespace) const {
  std::lock_guard<std::mutex> Lock(Mu);
  return Fetched.count(Namespace.str()) != 0;
}

} // namespace schemasub::semantic
