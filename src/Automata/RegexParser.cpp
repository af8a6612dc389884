#include "Automata/RegexParser.h"

#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/Debug.h>
#include <optional>

#define DEBUG_TYPE "schemasub-regex"

namespace schemasub::automata {

using namespace rexp;

namespace {

bool isDigit(CodePoint C) { return C >= '0' && C <= '9'; }

int hexValue(CodePoint C) {
  if (C >= '0' && C <= '9')
    return C - '0';
  if (C >= 'a' && C <= 'f')
    return C - 'a' + 10;
  if (C >= 'A' && C <= 'F')
    return C - 'A' + 10;
  return -1;
}

/// Recursive descent over the decoded code points of one pattern.
class RegexParser {
  const std::vector<CodePoint> &P;
  size_t Pos = 0;

public:
  explicit RegexParser(const std::vector<CodePoint> &P) : P(P) {}

  bool atEnd() const { return Pos >= P.size(); }
  CodePoint peek(size_t Off = 0) const {
    return Pos + Off < P.size() ? P[Pos + Off] : 0;
  }
  bool lookingAt(CodePoint C, size_t Off = 0) const {
    return Pos + Off < P.size() && P[Pos + Off] == C;
  }

  Result<PRExp> parseTop();

private:
  Result<PRExp> parseAlternation();
  Result<PRExp> parseSequence(bool TopLevel, bool &StartAnchor,
                              bool &EndAnchor);
  Result<PRExp> parseAtom();
  Result<PRExp> parseQuantifier(const PRExp &Atom);
  std::optional<std::pair<unsigned, std::optional<unsigned>>>
  tryParseBraces(size_t &End) const;
  Result<CharSet> parseClass();
  Result<CharSet> parseEscape(bool InClass, bool &IsClassEscape);
  std::string where() const { return " at offset " + std::to_string(Pos); }
};

Result<PRExp> RegexParser::parseTop() {
  std::vector<PRExp> Alts;
  auto AnyStar = createStar(create(CharSet::any()));
  while (true) {
    bool StartAnchor = false, EndAnchor = false;
    auto R = parseSequence(true, StartAnchor, EndAnchor);
    if (R.isErr()) {
      return R;
    }
    std::vector<PRExp> Parts;
    if (!StartAnchor) {
      Parts.push_back(AnyStar);
    }
    Parts.push_back(*R);
    if (!EndAnchor) {
      Parts.push_back(AnyStar);
    }
    Alts.push_back(simplifyOnce(createAnd(std::move(Parts))));
    if (atEnd()) {
      break;
    }
    if (lookingAt('|')) {
      ++Pos;
      continue;
    }
    return std::string("unbalanced ')'") + where();
  }
  return simplifyOnce(createOr(std::move(Alts)));
}

Result<PRExp> RegexParser::parseAlternation() {
  std::vector<PRExp> Alts;
  while (true) {
    bool StartAnchor = false, EndAnchor = false;
    auto R = parseSequence(false, StartAnchor, EndAnchor);
    if (R.isErr()) {
      return R;
    }
    Alts.push_back(*R);
    if (!lookingAt('|')) {
      break;
    }
    ++Pos;
  }
  return simplifyOnce(createOr(std::move(Alts)));
}

Result<PRExp> RegexParser::parseSequence(bool TopLevel, bool &StartAnchor,
                                         bool &EndAnchor) {
  std::vector<PRExp> Items;
  bool First = true;
  while (!atEnd() && !lookingAt('|') && !lookingAt(')')) {
    if (lookingAt('^')) {
      if (!TopLevel || !First) {
        return std::string("'^' is only supported at the start of a "
                           "top-level alternative") +
               where();
      }
      StartAnchor = true;
      ++Pos;
      First = false;
      continue;
    }
    First = false;
    if (lookingAt('$')) {
      ++Pos;
      if (TopLevel && (atEnd() || lookingAt('|'))) {
        EndAnchor = true;
        break;
      }
      return std::string("'$' is only supported at the end of a top-level "
                         "alternative") +
             where();
    }
    auto Atom = parseAtom();
    if (Atom.isErr()) {
      return Atom;
    }
    auto Q = parseQuantifier(*Atom);
    if (Q.isErr()) {
      return Q;
    }
    Items.push_back(*Q);
  }
  return simplifyOnce(createAnd(std::move(Items)));
}

std::optional<std::pair<unsigned, std::optional<unsigned>>>
RegexParser::tryParseBraces(size_t &End) const {
  size_t I = Pos;
  if (I >= P.size() || P[I] != '{') {
    return std::nullopt;
  }
  ++I;
  auto readNum = [&](uint64_t &Out) {
    size_t Begin = I;
    Out = 0;
    while (I < P.size() && isDigit(P[I])) {
      Out = std::min<uint64_t>(Out * 10 + (P[I] - '0'), UINT32_MAX);
      ++I;
    }
    return I != Begin;
  };
  uint64_t Min, Max;
  if (!readNum(Min)) {
    return std::nullopt;
  }
  std::optional<unsigned> MaxOpt = static_cast<unsigned>(Min);
  if (I < P.size() && P[I] == ',') {
    ++I;
    if (readNum(Max)) {
      MaxOpt = static_cast<unsigned>(Max);
    } else {
      MaxOpt = std::nullopt;
    }
  }
  if (I >= P.size() || P[I] != '}') {
    return std::nullopt;
  }
  End = I + 1;
  return std::make_pair(static_cast<unsigned>(Min), MaxOpt);
}

Result<PRExp> RegexParser::parseQuantifier(const PRExp &Atom) {
  unsigned Min = 1;
  std::optional<unsigned> Max = 1;
  if (lookingAt('*')) {
    Min = 0;
    Max = std::nullopt;
    ++Pos;
  } else if (lookingAt('+')) {
    Min = 1;
    Max = std::nullopt;
    ++Pos;
  } else if (lookingAt('?')) {
    Min = 0;
    Max = 1;
    ++Pos;
  } else {
    size_t End;
    auto B = tryParseBraces(End);
    if (!B) {
      return Atom;
    }
    Min = B->first;
    Max = B->second;
    Pos = End;
    if (Max && *Max < Min) {
      return std::string("numbers out of order in {} quantifier") + where();
    }
    if (Min > MaxRepeat || (Max && *Max > MaxRepeat)) {
      return std::string("repetition bound too large") + where();
    }
  }
  // lazy and greedy quantifiers accept the same strings.
  if (lookingAt('?')) {
    ++Pos;
  }
  size_t BraceEnd;
  if (lookingAt('*') || lookingAt('+') || lookingAt('?') ||
      tryParseBraces(BraceEnd)) {
    return std::string("nothing to repeat") + where();
  }
  std::vector<PRExp> Parts;
  for (unsigned I = 0; I < Min; ++I) {
    Parts.push_back(Atom);
  }
  if (!Max) {
    Parts.push_back(simplifyOnce(createStar(Atom)));
  } else {
    // X{0,k} as (X(X(...)?)?)?
    PRExp Tail = createEmpty();
    for (unsigned I = Min; I < *Max; ++I) {
      Tail = createOptional(Atom & Tail);
    }
    Parts.push_back(Tail);
  }
  return simplifyOnce(createAnd(std::move(Parts)));
}

Result<PRExp> RegexParser::parseAtom() {
  CodePoint C = peek();
  switch (C) {
  case '(': {
    ++Pos;
    if (lookingAt('?')) {
      if (lookingAt(':', 1)) {
        Pos += 2;
      } else if (lookingAt('=', 1) || lookingAt('!', 1) ||
                 (lookingAt('<', 1) && (lookingAt('=', 2) || lookingAt('!', 2)))) {
        return std::string("lookaround assertions are not supported") +
               where();
      } else if (lookingAt('<', 1)) {
        // named group
        Pos += 2;
        while (!atEnd() && !lookingAt('>')) {
          ++Pos;
        }
        if (atEnd()) {
          return std::string("unterminated group name") + where();
        }
        ++Pos;
      } else {
        return std::string("invalid group") + where();
      }
    }
    auto Inner = parseAlternation();
    if (Inner.isErr()) {
      return Inner;
    }
    if (!lookingAt(')')) {
      return std::string("missing ')'") + where();
    }
    ++Pos;
    return Inner;
  }
  case '[': {
    auto CS = parseClass();
    if (CS.isErr()) {
      return CS.msg();
    }
    return create(*CS);
  }
  case '.':
    ++Pos;
    return create(CharSet::dot());
  case '\\': {
    bool IsClassEscape = false;
    auto CS = parseEscape(false, IsClassEscape);
    if (CS.isErr()) {
      return CS.msg();
    }
    return create(*CS);
  }
  case '*':
  case '+':
  case '?':
    return std::string("nothing to repeat") + where();
  case '{': {
    size_t End;
    if (tryParseBraces(End)) {
      return std::string("nothing to repeat") + where();
    }
    ++Pos;
    return create(CharSet('{'));
  }
  default:
    ++Pos;
    return create(CharSet(C));
  }
}

Result<CharSet> RegexParser::parseEscape(bool InClass, bool &IsClassEscape) {
  // skip '\'
  ++Pos;
  if (atEnd()) {
    return std::string("\\ at end of pattern");
  }
  CodePoint C = peek();
  ++Pos;
  IsClassEscape = false;
  switch (C) {
  case 'd':
    IsClassEscape = true;
    return CharSet::digit();
  case 'D':
    IsClassEscape = true;
    return CharSet::digit().complement();
  case 'w':
    IsClassEscape = true;
    return CharSet::word();
  case 'W':
    IsClassEscape = true;
    return CharSet::word().complement();
  case 's':
    IsClassEscape = true;
    return CharSet::space();
  case 'S':
    IsClassEscape = true;
    return CharSet::space().complement();
  case 't':
    return CharSet('\t');
  case 'n':
    return CharSet('\n');
  case 'r':
    return CharSet('\r');
  case 'f':
    return CharSet('\f');
  case 'v':
    return CharSet('\v');
  case 'b':
    if (InClass) {
      return CharSet('\b');
    }
    return std::string("word boundary assertions are not supported") +
           where();
  case 'B':
    return std::string("word boundary assertions are not supported") +
           where();
  case '0':
    if (isDigit(peek()) && !atEnd()) {
      return std::string("octal escapes are not supported") + where();
    }
    return CharSet(0);
  case 'c': {
    CodePoint L = peek();
    if ((L >= 'a' && L <= 'z') || (L >= 'A' && L <= 'Z')) {
      ++Pos;
      return CharSet(L % 32);
    }
    return CharSet('\\');
  }
  case 'x': {
    int H1 = hexValue(peek()), H2 = hexValue(peek(1));
    if (H1 < 0 || H2 < 0) {
      return CharSet('x');
    }
    Pos += 2;
    return CharSet(static_cast<CodePoint>(H1 * 16 + H2));
  }
  case 'u': {
    if (lookingAt('{')) {
      size_t I = Pos + 1;
      CodePoint V = 0;
      while (I < P.size() && hexValue(P[I]) >= 0 && V <= MaxCodePoint) {
        V = V * 16 + hexValue(P[I]);
        ++I;
      }
      if (I < P.size() && P[I] == '}' && I > Pos + 1 && V <= MaxCodePoint) {
        Pos = I + 1;
        return CharSet(V);
      }
      return CharSet('u');
    }
    CodePoint V = 0;
    for (int I = 0; I < 4; ++I) {
      int H = hexValue(peek(I));
      if (H < 0) {
        return CharSet('u');
      }
      V = V * 16 + H;
    }
    Pos += 4;
    return CharSet(V);
  }
  default:
    if (C >= '1' && C <= '9') {
      return std::string("backreferences are not supported") + where();
    }
    if (C == 'k' && lookingAt('<')) {
      return std::string("backreferences are not supported") + where();
    }
    if (C == 'p' || C == 'P') {
      return std::string("unicode property escapes are not supported") +
             where();
    }
    return CharSet(C);
  }
}

Result<CharSet> RegexParser::parseClass() {
  // skip '['
  ++Pos;
  bool Negated = false;
  if (lookingAt('^')) {
    Negated = true;
    ++Pos;
  }
  CharSet Ret;
  auto readOne = [&](CharSet &Out, bool &IsClassEscape) -> std::string {
    IsClassEscape = false;
    if (lookingAt('\\')) {
      auto R = parseEscape(true, IsClassEscape);
      if (R.isErr()) {
        return R.msg();
      }
      Out = *R;
      return "";
    }
    Out = CharSet(peek());
    ++Pos;
    return "";
  };
  while (!atEnd() && !lookingAt(']')) {
    CharSet Lo;
    bool LoClass;
    auto Err = readOne(Lo, LoClass);
    if (!Err.empty()) {
      return Err;
    }
    if (lookingAt('-') && !lookingAt(']', 1) && Pos + 1 < P.size()) {
      ++Pos;
      CharSet Hi;
      bool HiClass;
      Err = readOne(Hi, HiClass);
      if (!Err.empty()) {
        return Err;
      }
      CodePoint L, H;
      if (!LoClass && !HiClass && Lo.isSingle(L) && Hi.isSingle(H)) {
        if (L > H) {
          return std::string("range out of order in character class") +
                 where();
        }
        Ret.addRange(L, H);
        continue;
      }
      // a class escape next to '-' makes the dash literal.
      Ret.add(Lo);
      Ret.add('-');
      Ret.add(Hi);
      continue;
    }
    Ret.add(Lo);
  }
  if (atEnd()) {
    return std::string("missing ']'") + where();
  }
  ++Pos;
  return Negated ? Ret.complement() : Ret;
}

} // namespace

Result<PRExp> parseRegex(llvm::StringRef Pattern) {
  std::vector<CodePoint> Points;
  if (!decodeUTF8(Pattern, Points)) {
    return std::string("pattern is not valid UTF-8");
  }
  RegexParser Parser(Points);
  auto R = Parser.parseTop();
  if (R.isOk()) {
    LLVM_DEBUG(llvm::dbgs() << "parseRegex: " << Pattern << " => "
                            << toString(*R) << "\n");
  }
  return R;
}

Result<PRExp> formatLanguage(llvm::StringRef Format) {
  static const char *Date =
      "\\d{4}-(?:0[1-9]|1[0-2])-(?:0[1-9]|[12]\\d|3[01])";
  static const char *Time = "(?:[01]\\d|2[0-3]):[0-5]\\d:(?:[0-5]\\d|60)"
                            "(?:\\.\\d+)?(?:[Zz]|[+-](?:[01]\\d|2[0-3]):[0-5]"
                            "\\d)";
  static const char *Label = "[A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?";
  static const char *Octet = "(?:25[0-5]|2[0-4]\\d|1\\d\\d|[1-9]?\\d)";
  std::string Host = std::string(Label) + "(?:\\." + Label + ")*";
  std::string Pattern =
      llvm::StringSwitch<std::string>(Format)
          .Case("date", std::string("^") + Date + "$")
          .Case("time", std::string("^") + Time + "$")
          .Case("date-time", std::string("^") + Date + "[Tt]" + Time + "$")
          .Case("email",
                "^[A-Za-z0-9.!#$%&'*+/=?^_`{|}~-]+@" + Host + "$")
          .Case("hostname", "^" + Host + "$")
          .Case("ipv4", std::string("^") + Octet + "(?:\\." + Octet + "){3}$")
          .Case("uuid", "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-"
                        "[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$")
          .Default("");
  if (Pattern.empty()) {
    return "unsupported format '" + Format.str() + "'";
  }
  return parseRegex(Pattern);
}

} // namespace schemasub::automata
