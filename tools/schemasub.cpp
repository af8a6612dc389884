#include "SchemaSub.h"
#include "utils.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>
#include <string>

using namespace llvm;

enum Operation { OpSub, OpEquiv, OpMeet, OpJoin };

// https://llvm.org/docs/CommandLine.html
static cl::opt<std::string> lhsFilename(cl::Positional, cl::desc("<lhs.json>"),
                                        cl::Required);
static cl::opt<std::string> rhsFilename(cl::Positional, cl::desc("<rhs.json>"),
                                        cl::Required);
static cl::opt<Operation>
    op("op", cl::desc("Operation:"),
       cl::values(clEnumValN(OpSub, "sub", "is lhs a subschema of rhs"),
                  clEnumValN(OpEquiv, "equiv", "are lhs and rhs equivalent"),
                  clEnumValN(OpMeet, "meet", "meet of lhs and rhs"),
                  clEnumValN(OpJoin, "join", "join of lhs and rhs")),
       cl::init(OpSub));
static cl::opt<bool> noSemantic("no-semantic",
                                cl::desc("Ignore stype annotations"),
                                cl::init(false));
static cl::list<std::string>
    ontologies("ontology",
               cl::desc("Well-known ontology to load: qudt, foaf or skos"),
               cl::value_desc("id"));
static cl::list<std::string> graphs("graph",
                                    cl::desc("Turtle or N-Triples file to load"),
                                    cl::value_desc("file"));
static cl::opt<bool>
    lazyLoad("lazy-load",
             cl::desc("Load the ontology of a namespace on first use"),
             cl::init(false));
static cl::opt<std::string>
    cacheDir("cache-dir",
             cl::desc("Directory holding cached ontologies <namespace>.ttl"),
             cl::value_desc("dir"), cl::init(""));
static cl::opt<bool> printDebug("print-debug",
                                cl::desc("Print canonical forms and semantic "
                                         "decisions"),
                                cl::init(false));
static cl::opt<bool>
    warnUninhabited("warn-uninhabited",
                    cl::desc("Warn when an operand or result accepts nothing"),
                    cl::init(false));

cl::opt<log_level>
    logLevel("log-level", cl::desc("Log level:"),
             cl::values(clEnumValN(level_emergent, "emergent", "emergent"),
                        clEnumValN(level_alert, "alert", "alert"),
                        clEnumValN(level_critical, "critical", "critical"),
                        clEnumValN(level_error, "error", "error"),
                        clEnumValN(level_warning, "warning", "warning"),
                        clEnumValN(level_notice, "notice", "notice"),
                        clEnumValN(level_info, "info", "info"),
                        clEnumValN(level_debug, "debug", "debug")),
             cl::init(level_notice));

static Expected<json::Value> readSchema(StringRef Path) {
  auto Buf = MemoryBuffer::getFile(Path);
  if (!Buf) {
    return createStringError(Buf.getError(), "cannot read %s",
                             Path.str().c_str());
  }
  return json::parse((*Buf)->getBuffer());
}

static int report(Error E) {
  errs() << "error: " << toString(std::move(E)) << "\n";
  return 1;
}

int main(int argc, char *argv[]) {
  cl::ParseCommandLineOptions(argc, argv, "JSON Schema subtyping\n");

  // if log level is debug, also enable debug flag
  if (logLevel == level_debug) {
    DebugFlag = true;
  }

  schemasub::Options Opt;
  Opt.SemanticReasoning = !noSemantic;
  Opt.Debug = printDebug;
  Opt.WarnUninhabited = warnUninhabited;
  Opt.SemanticCacheDir = cacheDir;
  Opt.LazyLoad = lazyLoad;
  Opt.LogLevel = logLevel;
  schemasub::SchemaContext Ctx(Opt);
  for (auto &Id : ontologies) {
    Ctx.addSemanticGraphSource(Id);
  }
  for (auto &File : graphs) {
    Ctx.addSemanticGraphSource(File);
  }

  auto LHS = readSchema(lhsFilename);
  if (!LHS) {
    return report(LHS.takeError());
  }
  auto RHS = readSchema(rhsFilename);
  if (!RHS) {
    return report(RHS.takeError());
  }

  switch (op) {
  case OpSub:
  case OpEquiv: {
    auto R = op == OpSub ? schemasub::isSubschema(*LHS, *RHS, Ctx)
                         : schemasub::isEquivalent(*LHS, *RHS, Ctx);
    if (!R) {
      return report(R.takeError());
    }
    outs() << (*R ? "true" : "false") << "\n";
    break;
  }
  case OpMeet:
  case OpJoin: {
    auto R = op == OpMeet ? schemasub::meet(*LHS, *RHS, Ctx)
                          : schemasub::join(*LHS, *RHS, Ctx);
    if (!R) {
      return report(R.takeError());
    }
    outs() << formatv("{0:2}", *R) << "\n";
    break;
  }
  }
  return 0;
}
