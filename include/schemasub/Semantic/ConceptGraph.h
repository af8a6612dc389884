#ifndef _SCHEMASUB_SEMANTIC_CONCEPTGRAPH_H_
#define _SCHEMASUB_SEMANTIC_CONCEPTGRAPH_H_

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/StringSet.h>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace schemasub::semantic {

namespace vocab {
constexpr const char *SkosBroader =
    "http://www.w3.org/2004/02/skos/core#broader";
constexpr const char *SkosNarrower =
    "http://www.w3.org/2004/02/skos/core#narrower";
constexpr const char *RdfsSubClassOf =
    "http://www.w3.org/2000/01/rdf-schema#subClassOf";
constexpr const char *RdfType =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
constexpr const char *RdfFirst =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#first";
constexpr const char *RdfRest =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest";
constexpr const char *RdfNil =
    "http://www.w3.org/1999/02/22-rdf-syntax-ns#nil";
} // namespace vocab

/// One RDF statement. Literal objects keep their lexical form prefixed with
/// a double quote, blank nodes are written `_:name`.
struct Triple {
  std::string Subject;
  std::string Predicate;
  std::string Object;

  bool operator<(const Triple &rhs) const {
    return std::tie(Subject, Predicate, Object) <
           std::tie(rhs.Subject, rhs.Predicate, rhs.Object);
  }
  bool operator==(const Triple &rhs) const {
    return std::tie(Subject, Predicate, Object) ==
           std::tie(rhs.Subject, rhs.Predicate, rhs.Object);
  }
};

/// Expand a compact `prefix:local` concept identifier against the known
/// prefix table. Full http(s) IRIs and unknown prefixes pass through.
std::string normalizeIRI(llvm::StringRef Value);
/// The namespace of an IRI: everything up to and including the last `#` or
/// `/`. Empty if the IRI has neither.
std::string namespaceOf(llvm::StringRef IRI);

/// \brief The reachability oracle behind the semantic resolver.
///
/// A concept `N` is narrower than `B` when `B` is reachable from `N` along
/// skos:broader and rdfs:subClassOf edges, or along skos:narrower edges taken
/// backwards.
class ConceptGraph {
public:
  virtual ~ConceptGraph() = default;

  virtual void add(const Triple &T) = 0;
  virtual size_t size() const = 0;
  virtual std::vector<std::string> objects(llvm::StringRef Subject,
                                           llvm::StringRef Predicate) const = 0;
  virtual std::vector<std::string>
  subjects(llvm::StringRef Predicate, llvm::StringRef Object) const = 0;

  /// Transitive path query. None if the backend cannot answer it, in which
  /// case callers traverse the graph themselves.
  virtual std::optional<bool> queryPath(llvm::StringRef From,
                                        llvm::StringRef To) {
    return std::nullopt;
  }
};

/// In-memory triple store with a memoized transitive path query.
class TripleStore : public ConceptGraph {
public:
  void add(const Triple &T) override;
  size_t size() const override { return All.size(); }
  std::vector<std::string> objects(llvm::StringRef Subject,
                                   llvm::StringRef Predicate) const override;
  std::vector<std::string> subjects(llvm::StringRef Predicate,
                                    llvm::StringRef Object) const override;
  std::optional<bool> queryPath(llvm::StringRef From,
                                llvm::StringRef To) override;

  bool contains(const Triple &T) const { return All.count(T) != 0; }

protected:
  std::set<Triple> All;
  // subject -> predicate -> objects
  llvm::StringMap<llvm::StringMap<std::vector<std::string>>> Forward;
  // object -> predicate -> subjects
  llvm::StringMap<llvm::StringMap<std::vector<std::string>>> Backward;
  /// Concepts reachable from a source concept, filled on demand and dropped
  /// whenever a triple is added.
  llvm::StringMap<llvm::StringSet<>> Closure;

  const llvm::StringSet<> &closureOf(llvm::StringRef From);
};

} // namespace schemasub::semantic

#endif
