#ifndef _SCHEMASUB_SEMANTIC_RESOLVER_H_
#define _SCHEMASUB_SEMANTIC_RESOLVER_H_

#include "Semantic/ConceptGraph.h"
#include "Semantic/OntologyLoader.h"
#include "utils.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace schemasub::semantic {

/// \brief Cached `isSubtypeOf(narrower, broader)` queries over a concept
/// graph.
///
/// Without a graph every query degrades to identity. With a graph the first
/// query tests whether the backend answers transitive path queries, and the
/// answer is kept until the graph changes. Queries fall back to a breadth
/// first traversal otherwise. All public members are serialized by one lock.
class Resolver {
public:
  enum class State { Uninitialized, Ready, Tested };

  Resolver() = default;
  explicit Resolver(std::shared_ptr<ConceptGraph> Graph)
      : Graph(std::move(Graph)) {}

  void setFetcher(std::unique_ptr<OntologyFetcher> F);
  void setLazyLoad(bool V);
  void setLogLevel(log_level Level);

  bool isSubtypeOf(llvm::StringRef Narrower, llvm::StringRef Broader);

  /// Record `Narrower skos:broader Broader`.
  void addRelationship(llvm::StringRef Narrower, llvm::StringRef Broader);
  void mergeTriples(const std::vector<Triple> &Triples);
  /// Load a well-known ontology id through the fetcher, or a turtle file.
  /// Failures are logged and leave the graph unchanged.
  bool loadSource(llvm::StringRef Source);

  State getState() const;
  std::optional<bool> supportsPathQuery() const;
  size_t cacheSize() const;
  size_t graphSize() const;
  bool hasFetched(llvm::StringRef Namespace) const;

private:
  mutable std::mutex Mu;
  std::shared_ptr<ConceptGraph> Graph;
  std::unique_ptr<OntologyFetcher> Fetcher;
  bool LazyLoad = false;
  log_level LogLevel = level_notice;
  std::optional<bool> PathQuerySupported;
  std::map<std::pair<std::string, std::string>, bool> Cache;
  std::set<std::string> Fetched;

  // Callers hold Mu.
  ConceptGraph &graph();
  void invalidate();
  void merge(const std::vector<Triple> &Triples);
  void fetchNamespace(const std::string &IRI);
  bool traverse(const std::string &From, const std::string &To);
  bool query(const std::string &From, const std::string &To);
  void reportLoadFailure(llvm::Error E, llvm::StringRef What);
};

} // namespace schemasub::semantic

#endif
