#ifndef _SCHEMASUB_CONTEXT_H_
#define _SCHEMASUB_CONTEXT_H_

#include "utils.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace schemasub {

namespace semantic {
class Resolver;
} // namespace semantic

// sync with cmdline default value.
struct Options {
  /// Compare `stype` annotations against the concept hierarchy.
  bool SemanticReasoning = true;
  /// Print canonical forms and semantic decisions to stderr.
  bool Debug = false;
  /// Warn when an operand or a meet result accepts no value.
  bool WarnUninhabited = false;
  /// Directory holding cached ontology files, `<namespace>.ttl`.
  std::string SemanticCacheDir;
  /// Ontology sources loaded into the resolver: well-known ids (qudt, foaf,
  /// skos) or turtle / n-triples file paths. Duplicates are ignored.
  std::vector<std::string> GraphSources = {"qudt"};
  /// Fetch the ontology of an unseen namespace on first use.
  bool LazyLoad = false;
  /// Maximum number of nested `$ref` expansions.
  unsigned MaxRefDepth = 512;
  log_level LogLevel = level_notice;
};

/// \brief Configuration plus the semantic resolver shared by all operations
/// that run with this context.
///
/// The resolver is built on first use from the options. Changing the cache
/// directory or the lazy loading policy drops it; adding a graph source loads
/// the source into the existing resolver. Operations running on several
/// threads may share one context; its setters must not race with them.
class SchemaContext {
public:
  explicit SchemaContext(Options Opt = Options());
  ~SchemaContext();
  SchemaContext(SchemaContext &&) = default;
  SchemaContext &operator=(SchemaContext &&) = default;

  const Options &options() const { return Opt; }

  bool isSemanticReasoning() const { return Opt.SemanticReasoning; }
  void setSemanticReasoning(bool V) { Opt.SemanticReasoning = V; }
  bool isDebug() const { return Opt.Debug; }
  void setDebug(bool V) { Opt.Debug = V; }
  bool isWarnUninhabited() const { return Opt.WarnUninhabited; }
  void setWarnUninhabited(bool V) { Opt.WarnUninhabited = V; }
  const std::string &getSemanticCacheDir() const {
    return Opt.SemanticCacheDir;
  }
  void setSemanticCacheDir(std::string Dir);
  const std::vector<std::string> &getSemanticGraphSources() const {
    return Opt.GraphSources;
  }
  void addSemanticGraphSource(const std::string &Source);
  bool isLazyLoad() const { return Opt.LazyLoad; }
  void setLazyLoad(bool V);
  void setMaxRefDepth(unsigned Depth) { Opt.MaxRefDepth = Depth; }
  void setLogLevel(log_level Level) { Opt.LogLevel = Level; }

  /// The resolver, built from the options on first use.
  semantic::Resolver &getResolver();
  /// Replace the resolver, e.g. with one over a prepared graph.
  void setResolver(std::shared_ptr<semantic::Resolver> R);

  llvm::raw_ostream &log(log_level Level) const {
    return schemasub::log(Opt.LogLevel, Level);
  }
  /// Stream for debug-print output, nulls() unless Debug is set.
  llvm::raw_ostream &debug() const;

private:
  Options Opt;
  std::shared_ptr<semantic::Resolver> Res;
  /// Guards Res. Held in a unique_ptr so the context stays movable.
  std::unique_ptr<std::mutex> ResMu = std::make_unique<std::mutex>();
};

} // namespace schemasub

#endif
