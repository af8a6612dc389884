#ifndef _SCHEMASUB_AUTOMATA_CHARSET_H_
#define _SCHEMASUB_AUTOMATA_CHARSET_H_

#include <cstdint>
#include <llvm/ADT/StringRef.h>
#include <string>
#include <utility>
#include <vector>

namespace schemasub::automata {

using CodePoint = uint32_t;
constexpr CodePoint MaxCodePoint = 0x10FFFF;

/// A set of unicode code points, stored as sorted disjoint closed ranges.
class CharSet {
public:
  using Range = std::pair<CodePoint, CodePoint>;

  CharSet() = default;
  CharSet(CodePoint C) { addRange(C, C); }
  CharSet(CodePoint Lo, CodePoint Hi) { addRange(Lo, Hi); }

  static CharSet any() { return CharSet(0, MaxCodePoint); }
  static CharSet digit();
  static CharSet word();
  static CharSet space();
  /// `.` excludes line terminators.
  static CharSet dot();

  void addRange(CodePoint Lo, CodePoint Hi);
  void add(CodePoint C) { addRange(C, C); }
  void add(const CharSet &Other);

  CharSet complement() const;
  CharSet intersect(const CharSet &Other) const;
  CharSet unionWith(const CharSet &Other) const;
  CharSet subtract(const CharSet &Other) const {
    return intersect(Other.complement());
  }

  bool contains(CodePoint C) const;
  bool empty() const { return Ranges.empty(); }
  bool isAny() const {
    return Ranges.size() == 1 && Ranges[0].first == 0 &&
           Ranges[0].second == MaxCodePoint;
  }
  /// Returns the code point if the set contains exactly one.
  bool isSingle(CodePoint &C) const;
  const std::vector<Range> &ranges() const { return Ranges; }

  bool operator==(const CharSet &Other) const { return Ranges == Other.Ranges; }
  bool operator!=(const CharSet &Other) const { return !(*this == Other); }
  bool operator<(const CharSet &Other) const { return Ranges < Other.Ranges; }

  /// Render as a regex atom: a literal or a bracket class.
  std::string toRegex() const;

private:
  std::vector<Range> Ranges;
};

/// Split the given sets into disjoint ranges, so that every input set is a
/// union of some of the returned ranges.
std::vector<CharSet::Range> partition(const std::vector<CharSet> &Sets);

std::string encodeUTF8(CodePoint C);
/// Decode UTF-8 text into code points. Returns false on malformed input.
bool decodeUTF8(llvm::StringRef Str, std::vector<CodePoint> &Out);

} // namespace schemasub::automata

#endif
