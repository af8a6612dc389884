#include "Automata/CharSet.h"

#include <algorithm>
#include <cstdio>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ConvertUTF.h>

namespace schemasub::automata {

CharSet CharSet::digit() { return CharSet('0', '9'); }

CharSet CharSet::word() {
  CharSet Ret('0', '9');
  Ret.addRange('A', 'Z');
  Ret.addRange('a', 'z');
  Ret.add('_');
  return Ret;
}

// WhiteSpace and LineTerminator of ECMA-262.
CharSet CharSet::space() {
  CharSet Ret('\t', '\r');
  Ret.add(' ');
  Ret.add(0xA0);
  Ret.add(0x1680);
  Ret.addRange(0x2000, 0x200A);
  Ret.addRange(0x2028, 0x2029);
  Ret.add(0x202F);
  Ret.add(0x205F);
  Ret.add(0x3000);
  Ret.add(0xFEFF);
  return Ret;
}

CharSet CharSet::dot() {
  CharSet Terminators('\n');
  Terminators.add('\r');
  Terminators.addRange(0x2028, 0x2029);
  return Terminators.complement();
}

void CharSet::addRange(CodePoint Lo, CodePoint Hi) {
  if (Lo > Hi) {
    return;
  }
  std::vector<Range> Out;
  Out.reserve(Ranges.size() + 1);
  bool Placed = false;
  for (auto &R : Ranges) {
    // R entirely before the new range, not adjacent.
    if (R.second + 1 < Lo) {
      Out.push_back(R);
    } else if (Hi + 1 < R.first) {
      if (!Placed) {
        Out.push_back({Lo, Hi});
        Placed = true;
      }
      Out.push_back(R);
    } else {
      // overlapping or adjacent, merge into the new range.
      Lo = std::min(Lo, R.first);
      Hi = std::max(Hi, R.second);
    }
  }
  if (!Placed) {
    Out.push_back({Lo, Hi});
  }
  Ranges = std::move(Out);
}

void CharSet::add(const CharSet &Other) {
  for (auto &R : Other.Ranges) {
    addRange(R.first, R.second);
  }
}

CharSet CharSet::complement() const {
  CharSet Ret;
  CodePoint Next = 0;
  for (auto &R : Ranges) {
    if (R.first > Next) {
      Ret.Ranges.push_back({Next, R.first - 1});
    }
    Next = R.second + 1;
  }
  if (Next <= MaxCodePoint) {
    Ret.Ranges.push_back({Next, MaxCodePoint});
  }
  return Ret;
}

CharSet CharSet::intersect(const CharSet &Other) const {
  CharSet Ret;
  size_t I = 0, J = 0;
  while (I < Ranges.size() && J < Other.Ranges.size()) {
    auto &A = Ranges[I];
    auto &B = Other.Ranges[J];
    CodePoint Lo = std::max(A.first, B.first);
    CodePoint Hi = std::min(A.second, B.second);
    if (Lo <= Hi) {
      Ret.Ranges.push_back({Lo, Hi});
    }
    if (A.second < B.second) {
      ++I;
    } else {
      ++J;
    }
  }
  return Ret;
}

CharSet CharSet::unionWith(const CharSet &Other) const {
  CharSet Ret = *this;
  Ret.add(Other);
  return Ret;
}

bool CharSet::contains(CodePoint C) const {
  auto It = std::upper_bound(
      Ranges.begin(), Ranges.end(), C,
      [](CodePoint V, const Range &R) { return V < R.first; });
  if (It == Ranges.begin()) {
    return false;
  }
  --It;
  return C <= It->second;
}

bool CharSet::isSingle(CodePoint &C) const {
  if (Ranges.size() == 1 && Ranges[0].first == Ranges[0].second) {
    C = Ranges[0].first;
    return true;
  }
  return false;
}

std::string encodeUTF8(CodePoint C) {
  char Buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
  char *Ptr = Buf;
  if (!llvm::ConvertCodePointToUTF8(C, Ptr)) {
    return "\xEF\xBF\xBD";
  }
  return std::string(Buf, Ptr);
}

bool decodeUTF8(llvm::StringRef Str, std::vector<CodePoint> &Out) {
  const llvm::UTF8 *Cur = reinterpret_cast<const llvm::UTF8 *>(Str.begin());
  const llvm::UTF8 *End = reinterpret_cast<const llvm::UTF8 *>(Str.end());
  while (Cur < End) {
    llvm::UTF32 C;
    if (llvm::convertUTF8Sequence(&Cur, End, &C, llvm::strictConversion) !=
        llvm::conversionOK) {
      return false;
    }
    Out.push_back(C);
  }
  return true;
}

static std::string escapeCodePoint(CodePoint C, bool InClass) {
  switch (C) {
  case '\t':
    return "\\t";
  case '\n':
    return "\\n";
  case '\r':
    return "\\r";
  case '\f':
    return "\\f";
  case '\v':
    return "\\v";
  default:
    break;
  }
  llvm::StringRef Meta = InClass ? "\\]^-[" : "\\^$.|?*+()[]{}/";
  if (C < 0x80 && Meta.contains(static_cast<char>(C))) {
    return std::string("\\") + static_cast<char>(C);
  }
  if (C < 0x20 || (C >= 0x7F && C < 0xA0) || (C >= 0xD800 && C <= 0xDFFF) ||
      C == 0x2028 || C == 0x2029) {
    char Buf[8];
    std::snprintf(Buf, sizeof(Buf), "\\u%04X", static_cast<unsigned>(C));
    return Buf;
  }
  return encodeUTF8(C);
}

static std::string classBody(const std::vector<CharSet::Range> &Ranges) {
  std::string Ret;
  for (auto &R : Ranges) {
    Ret += escapeCodePoint(R.first, true);
    if (R.second == R.first) {
      continue;
    }
    if (R.second != R.first + 1) {
      Ret += "-";
    }
    Ret += escapeCodePoint(R.second, true);
  }
  return Ret;
}

std::string CharSet::toRegex() const {
  CodePoint C;
  if (isSingle(C)) {
    return escapeCodePoint(C, false);
  }
  if (empty()) {
    return "[]";
  }
  if (isAny()) {
    return "[\\s\\S]";
  }
  if (*this == dot()) {
    return ".";
  }
  if (*this == digit()) {
    return "\\d";
  }
  if (*this == word()) {
    return "\\w";
  }
  CharSet Neg = complement();
  if (Neg.Ranges.size() < Ranges.size()) {
    return "[^" + classBody(Neg.Ranges) + "]";
  }
  return "[" + classBody(Ranges) + "]";
}

std::vector<CharSet::Range> partition(const std::vector<CharSet> &Sets) {
  // Boundaries are the first code point of each maximal piece.
  std::vector<uint64_t> Points;
  for (auto &S : Sets) {
    for (auto &R : S.ranges()) {
      Points.push_back(R.first);
      Points.push_back(static_cast<uint64_t>(R.second) + 1);
    }
  }
  std::sort(Points.begin(), Points.end());
  Points.erase(std::unique(Points.begin(), Points.end()), Points.end());
  std::vector<CharSet::Range> Ret;
  for (size_t I = 0; I + 1 < Points.size(); ++I) {
    CodePoint Lo = static_cast<CodePoint>(Points[I]);
    CodePoint Hi = static_cast<CodePoint>(Points[I + 1] - 1);
    bool Covered = false;
    for (auto &S : Sets) {
      if (S.contains(Lo)) {
        Covered = true;
        break;
      }
    }
    if (Covered) {
      Ret.push_back({Lo, Hi});
    }
  }
  return Ret;
}

} // namespace schemasub::automata
