#ifndef _SCHEMASUB_SEMANTIC_ONTOLOGYLOADER_H_
#define _SCHEMASUB_SEMANTIC_ONTOLOGYLOADER_H_

#include "Semantic/ConceptGraph.h"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <optional>
#include <string>
#include <vector>

namespace schemasub::semantic {

/// Parse N-Triples or the common subset of Turtle: `@prefix` / `PREFIX`,
/// `@base` / `BASE`, IRIs, prefixed names, `a`, predicate (`;`) and object
/// (`,`) lists, blank nodes, collections and literals. Errors are
/// GraphLoadFailure naming \p SourceName.
llvm::Expected<std::vector<Triple>> parseTurtle(llvm::StringRef Text,
                                                llvm::StringRef SourceName,
                                                llvm::StringRef Base = "");

llvm::Expected<std::vector<Triple>> loadTurtleFile(llvm::StringRef Path);

/// Namespace IRI of a well-known ontology id (`qudt`, `foaf`, `skos`).
std::optional<std::string> wellKnownOntology(llvm::StringRef Id);

/// File name stem used to cache the ontology of namespace \p NS.
std::string sanitizeNamespace(llvm::StringRef NS);

/// Source of ontology triples for a namespace.
class OntologyFetcher {
public:
  virtual ~OntologyFetcher() = default;
  virtual llvm::Expected<std::vector<Triple>>
  fetch(llvm::StringRef Namespace) = 0;
};

/// Reads `<Dir>/<sanitizeNamespace(NS)>.ttl`. Never touches the network.
class CacheDirFetcher : public OntologyFetcher {
public:
  explicit CacheDirFetcher(std::string Dir) : Dir(std::move(Dir)) {}
  llvm::Expected<std::vector<Triple>>
  fetch(llvm::StringRef Namespace) override;

  std::string pathFor(llvm::StringRef Namespace) const;

private:
  std::string Dir;
};

} // namespace schemasub::semantic

#endif
