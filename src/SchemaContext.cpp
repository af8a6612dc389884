#include "SchemaContext.h"

#include "Semantic/Resolver.h"
#include <algorithm>

namespace schemasub {

SchemaContext::SchemaContext(Options O) : Opt(std::move(O)) {}

SchemaContext::~SchemaContext() = default;

void SchemaContext::setSemanticCacheDir(std::string Dir) {
  Opt.SemanticCacheDir = std::move(Dir);
  std::lock_guard<std::mutex> Lock(*ResMu);
  Res.reset();
}

void SchemaContext::addSemanticGraphSource(const std::string &Source) {
  auto &Sources = Opt.GraphSources;
  if (std::find(Sources.begin(), Sources.end(), Source) != Sources.end()) {
    return;
  }
  Sources.push_back(Source);
  std::lock_guard<std::mutex> Lock(*ResMu);
  if (Res) {
    Res->loadSource(Source);
  }
}

void SchemaContext::setLazyLoad(bool V) {
  Opt.LazyLoad = V;
  std::lock_guard<std::mutex> Lock(*ResMu);
  Res.reset();
}

semantic::Resolver &SchemaContext::getResolver() {
  std::lock_guard<std::mutex> Lock(*ResMu);
  if (Res) {
    return *Res;
  }
  Res = std::make_shared<semantic::Resolver>();
  Res->setLogLevel(Opt.LogLevel);
  if (!Opt.SemanticCacheDir.empty()) {
    Res->setFetcher(
        std::make_unique<semantic::CacheDirFetcher>(Opt.SemanticCacheDir));
  }
  Res->setLazyLoad(Opt.LazyLoad);
  for (auto &Source : Opt.GraphSources) {
    Res->loadSource(Source);
  }
  return *Res;
}

void SchemaContext::setResolver(std::shared_ptr<semantic::Resolver> R) {
  std::lock_guard<std::mutex> Lock(*ResMu);
  Res = std::move(R);
}

llvm::raw_ostream &SchemaContext::debug() const {
  return Opt.Debug ? llvm::errs() : llvm::nulls();
}

} // namespace schemasub
