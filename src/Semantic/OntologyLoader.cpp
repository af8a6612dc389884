#include "Semantic/OntologyLoader.h"

#include "Errors.h"
#include "utils.h"
#include <boost/algorithm/string/trim.hpp>
#include <cctype>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>

#define DEBUG_TYPE "schemasub-ontology"

namespace schemasub::semantic {

namespace {

bool isNameEnd(char C) {
  return std::isspace(static_cast<unsigned char>(C)) || C == ';' ||
         C == ',' || C == '(' || C == ')' || C == '[' || C == ']' ||
         C == '<' || C == '"' || C == '\'' || C == '#';
}

/// A parsed term: an IRI, a blank node label or a literal.
struct Node {
  std::string Id;
};

/// Recursive descent reader. Terms are returned as Result so the message of
/// the innermost failure reaches the caller; statements stop at the first
/// error recorded by fail().
class TurtleParser {
public:
  TurtleParser(llvm::StringRef Text, llvm::StringRef SourceName,
               llvm::StringRef Base)
      : Text(Text), Rest(Text), SourceName(SourceName.str()),
        Base(Base.str()) {}

  llvm::Expected<std::vector<Triple>> run() {
    while (true) {
      skip();
      if (Rest.empty()) {
        break;
      }
      if (!statement()) {
        return llvm::make_error<GraphLoadFailure>(SourceName, Err);
      }
    }
    return std::move(Out);
  }

private:
  llvm::StringRef Text;
  llvm::StringRef Rest;
  std::string SourceName;
  std::string Base;
  llvm::StringMap<std::string> Prefixes;
  std::vector<Triple> Out;
  unsigned BlankCounter = 0;
  std::string Err;

  unsigned line() const {
    llvm::StringRef Done = Text.substr(0, Text.size() - Rest.size());
    return Done.count('\n') + 1;
  }

  bool fail(const llvm::Twine &Msg) {
    if (Err.empty()) {
      Err = ("line " + llvm::Twine(line()) + ": " + Msg + " near '" +
             escapeForDiag(Rest, 20) + "'")
                .str();
    }
    return false;
  }

  // whitespace and comments.
  void skip() {
    while (!Rest.empty()) {
      Rest = Rest.ltrim();
      if (Rest.startswith("#")) {
        Rest = Rest.drop_until([](char C) { return C == '\n'; });
        continue;
      }
      break;
    }
  }

  bool consume(llvm::StringRef Tok) {
    skip();
    return Rest.consume_front(Tok);
  }

  bool expect(llvm::StringRef Tok) {
    if (consume(Tok)) {
      return true;
    }
    return fail("expected '" + Tok + "'");
  }

  std::string freshBlank() { return "_:b" + std::to_string(BlankCounter++); }

  void emit(const std::string &S, const std::string &P, const std::string &O) {
    Out.push_back(Triple{S, P, O});
  }

  std::string resolve(llvm::StringRef IRI) const {
    size_t Colon = IRI.find(':');
    size_t Sep = IRI.find_first_of("/?#");
    if (Colon != llvm::StringRef::npos &&
        (Sep == llvm::StringRef::npos || Colon < Sep)) {
      return IRI.str();
    }
    if (Base.empty()) {
      return IRI.str();
    }
    llvm::StringRef B(Base);
    if (IRI.empty() || IRI.startswith("#")) {
      return (B.substr(0, B.find('#')) + IRI).str();
    }
    return (B.substr(0, B.rfind('/') + 1) + IRI).str();
  }

  bool keyword(llvm::StringRef KW) {
    skip();
    if (Rest.size() < KW.size() ||
        !Rest.substr(0, KW.size()).equals_insensitive(KW)) {
      return false;
    }
    if (Rest.size() > KW.size() && !isNameEnd(Rest[KW.size()])) {
      return false;
    }
    Rest = Rest.drop_front(KW.size());
    return true;
  }

  bool statement() {
    skip();
    if (Rest.startswith("@prefix")) {
      Rest = Rest.drop_front(7);
      return prefixDecl() && expect(".");
    }
    if (Rest.startswith("@base")) {
      Rest = Rest.drop_front(5);
      return baseDecl() && expect(".");
    }
    if (keyword("PREFIX")) {
      return prefixDecl();
    }
    if (keyword("BASE")) {
      return baseDecl();
    }
    return triples() && expect(".");
  }

  bool prefixDecl() {
    skip();
    size_t Colon = Rest.find(':');
    if (Colon == llvm::StringRef::npos) {
      return fail("expected a prefix name");
    }
    llvm::StringRef Name = Rest.substr(0, Colon).trim();
    Rest = Rest.drop_front(Colon + 1);
    auto IRI = iriRef();
    if (IRI.isErr()) {
      return fail(IRI.msg());
    }
    Prefixes[Name] = IRI.get().Id;
    return true;
  }

  bool baseDecl() {
    auto IRI = iriRef();
    if (IRI.isErr()) {
      return fail(IRI.msg());
    }
    Base = IRI.get().Id;
    return true;
  }

  bool triples() {
    skip();
    if (Rest.startswith("[")) {
      auto Blank = blankPropertyList();
      if (Blank.isErr()) {
        return fail(Blank.msg());
      }
      skip();
      // `[ ... ] .` alone is a complete statement.
      if (Rest.startswith(".")) {
        return true;
      }
      return predicateObjectList(Blank.get().Id);
    }
    auto Subject = term(/*AllowLiteral=*/false);
    if (Subject.isErr()) {
      return fail(Subject.msg());
    }
    return predicateObjectList(Subject.get().Id);
  }

  bool predicateObjectList(const std::string &Subject) {
    while (true) {
      skip();
      std::string Pred;
      if (keyword("a")) {
        Pred = vocab::RdfType;
      } else {
        auto P = iri();
        if (P.isErr()) {
          return fail(P.msg());
        }
        Pred = P.get().Id;
      }
      if (!objectList(Subject, Pred)) {
        return false;
      }
      if (!consume(";")) {
        return true;
      }
      // repeated and trailing semicolons are allowed.
      while (consume(";")) {
      }
      skip();
      if (Rest.startswith(".") || Rest.startswith("]") || Rest.empty()) {
        return true;
      }
    }
  }

  bool objectList(const std::string &Subject, const std::string &Pred) {
    do {
      auto Obj = term(/*AllowLiteral=*/true);
      if (Obj.isErr()) {
        return fail(Obj.msg());
      }
      emit(Subject, Pred, Obj.get().Id);
    } while (consume(","));
    return true;
  }

  Result<Node> term(bool AllowLiteral) {
    skip();
    if (Rest.empty()) {
      return "unexpected end of input";
    }
    char C = Rest.front();
    if (C == '<') {
      return iriRef();
    }
    if (Rest.startswith("_:")) {
      Rest = Rest.drop_front(2);
      llvm::StringRef Label = Rest.take_until(isNameEnd);
      Label = Label.rtrim('.');
      Rest = Rest.drop_front(Label.size());
      return Node{"_:" + Label.str()};
    }
    if (C == '[') {
      return blankPropertyList();
    }
    if (C == '(') {
      return collection();
    }
    if (C == '"' || C == '\'' || C == '+' || C == '-' ||
        std::isdigit(static_cast<unsigned char>(C))) {
      if (!AllowLiteral) {
        return "a literal cannot be a subject";
      }
      return literal();
    }
    if (AllowLiteral) {
      if (keyword("true")) {
        return Node{"\"true"};
      }
      if (keyword("false")) {
        return Node{"\"false"};
      }
    }
    return prefixedName();
  }

  Result<Node> iri() {
    skip();
    if (Rest.startswith("<")) {
      return iriRef();
    }
    return prefixedName();
  }

  Result<Node> iriRef() {
    skip();
    if (!Rest.consume_front("<")) {
      return "expected '<'";
    }
    size_t End = Rest.find('>');
    if (End == llvm::StringRef::npos) {
      return "unterminated IRI";
    }
    Node IRI{resolve(Rest.substr(0, End))};
    Rest = Rest.drop_front(End + 1);
    return IRI;
  }

  Result<Node> prefixedName() {
    skip();
    llvm::StringRef Name = Rest.take_until(isNameEnd);
    // a trailing dot ends the statement.
    Name = Name.rtrim('.');
    size_t Colon = Name.find(':');
    if (Name.empty() || Colon == llvm::StringRef::npos) {
      return "expected an IRI or a prefixed name";
    }
    auto It = Prefixes.find(Name.substr(0, Colon));
    if (It == Prefixes.end()) {
      return "undefined prefix '" + Name.substr(0, Colon).str() + "'";
    }
    Rest = Rest.drop_front(Name.size());
    std::string Local;
    for (char Ch : Name.drop_front(Colon + 1)) {
      if (Ch != '\\') {
        Local += Ch;
      }
    }
    return Node{It->second + Local};
  }

  Result<Node> literal() {
    std::string Value;
    char Q = Rest.front();
    if (Q == '"' || Q == '\'') {
      std::string Long(3, Q);
      bool IsLong = Rest.startswith(Long);
      Rest = Rest.drop_front(IsLong ? 3 : 1);
      while (true) {
        if (Rest.empty()) {
          return "unterminated string literal";
        }
        if (IsLong ? Rest.startswith(Long) : Rest.front() == Q) {
          Rest = Rest.drop_front(IsLong ? 3 : 1);
          break;
        }
        if (!IsLong && Rest.front() == '\n') {
          return "newline in string literal";
        }
        if (Rest.front() == '\\' && Rest.size() > 1) {
          char E = Rest[1];
          Value += llvm::StringSwitch<char>(llvm::StringRef(&E, 1))
                       .Case("n", '\n')
                       .Case("t", '\t')
                       .Case("r", '\r')
                       .Default(E);
          Rest = Rest.drop_front(2);
          continue;
        }
        Value += Rest.front();
        Rest = Rest.drop_front();
      }
      if (Rest.consume_front("@")) {
        Rest = Rest.drop_while([](char C) {
          return std::isalnum(static_cast<unsigned char>(C)) || C == '-';
        });
      } else if (Rest.consume_front("^^")) {
        auto Type = iri();
        if (Type.isErr()) {
          return Type.msg();
        }
      }
    } else {
      llvm::StringRef Num = Rest.take_while([](char C) {
        return std::isdigit(static_cast<unsigned char>(C)) || C == '+' ||
               C == '-' || C == '.' || C == 'e' || C == 'E';
      });
      Num = Num.rtrim('.');
      if (Num.empty()) {
        return "expected a literal";
      }
      Value = Num.str();
      Rest = Rest.drop_front(Num.size());
    }
    return Node{"\"" + Value};
  }

  Result<Node> blankPropertyList() {
    Rest = Rest.drop_front(); // '['
    Node Blank{freshBlank()};
    skip();
    if (Rest.consume_front("]")) {
      return Blank;
    }
    if (!predicateObjectList(Blank.Id)) {
      return Err;
    }
    if (!consume("]")) {
      return "expected ']'";
    }
    return Blank;
  }

  Result<Node> collection() {
    Rest = Rest.drop_front(); // '('
    std::string Head = vocab::RdfNil;
    std::string Prev;
    while (!consume(")")) {
      if (Rest.empty()) {
        return "unterminated collection";
      }
      auto Item = term(/*AllowLiteral=*/true);
      if (Item.isErr()) {
        return Item.msg();
      }
      std::string Cell = freshBlank();
      if (Prev.empty()) {
        Head = Cell;
      } else {
        emit(Prev, vocab::RdfRest, Cell);
      }
      emit(Cell, vocab::RdfFirst, Item.get().Id);
      Prev = Cell;
    }
    if (!Prev.empty()) {
      emit(Prev, vocab::RdfRest, vocab::RdfNil);
    }
    return Node{Head};
  }
};

} // namespace

llvm::Expected<std::vector<Triple>> parseTurtle(llvm::StringRef Text,
                                                llvm::StringRef SourceName,
                                                llvm::StringRef Base) {
  TurtleParser P(Text, SourceName, Base);
  auto Triples = P.run();
  if (Triples) {
    LLVM_DEBUG(llvm::dbgs() << "parsed " << Triples->size() << " triples from "
                            << SourceName << "\n");
  }
  return Triples;
}

llvm::Expected<std::vector<Triple>> loadTurtleFile(llvm::StringRef Path) {
  auto Buf = llvm::MemoryBuffer::getFile(Path);
  if (!Buf) {
    return llvm::make_error<GraphLoadFailure>(Path.str(),
                                              Buf.getError().message());
  }
  return parseTurtle((*Buf)->getBuffer(), Path);
}

std::optional<std::string> wellKnownOntology(llvm::StringRef Id) {
  auto NS = llvm::StringSwitch<const char *>(Id.lower())
                .Case("qudt", "http://qudt.org/vocab/quantitykind/")
                .Case("foaf", "http://xmlns.com/foaf/0.1/")
                .Case("skos", "http://www.w3.org/2004/02/skos/core#")
                .Default(nullptr);
  if (!NS) {
    return std::nullopt;
  }
  return std::string(NS);
}

std::string sanitizeNamespace(llvm::StringRef NS) {
  if (!NS.consume_front("https://")) {
    NS.consume_front("http://");
  }
  std::string Out;
  for (char C : NS) {
    Out += std::isalnum(static_cast<unsigned char>(C)) || C == '.' || C == '-'
               ? C
               : '_';
  }
  boost::algorithm::trim_if(Out, [](char C) { return C == '_' || C == '.'; });
  return Out;
}

std::string CacheDirFetcher::pathFor(llvm::StringRef Namespace) const {
  llvm::SmallString<128> Path(Dir);
  llvm::sys::path::append(Path, sanitizeNamespace(Namespace) + ".ttl");
  return std::string(Path.str());
}

llvm::Expected<std::vector<Triple>>
CacheDirFetcher::fetch(llvm::StringRef Namespace) {
  if (Dir.empty()) {
    return llvm::make_error<GraphLoadFailure>(Namespace.str(),
                                              "no cache directory configured");
  }
  std::string Path = pathFor(Namespace);
  auto Buf = llvm::MemoryBuffer::getFile(Path);
  if (!Buf) {
    return llvm::make_error<GraphLoadFailure>(
        Namespace.str(), Path + ": " + Buf.getError().message());
  }
  // relative IRIs in a cached file resolve against the namespace.
  return parseTurtle((*Buf)->getBuffer(), Path, Namespace);
}

} // namespace schemasub::semantic
