#ifndef _SCHEMASUB_AUTOMATA_REXP_H_
#define _SCHEMASUB_AUTOMATA_REXP_H_

#include "Automata/CharSet.h"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemasub::automata::rexp {

struct Null;
struct Empty;
struct Star;
struct Or;
struct And;
struct Node;

using RExp = std::variant<Null, Empty, Star, Or, And, Node>;
using PRExp = std::shared_ptr<RExp>;
// The empty language, rendered as `[]`.
struct Null {};
// The language of the empty string.
struct Empty {};
struct Star {
  PRExp E;
};
// Alternation, ordered to keep the rendered pattern stable.
struct Or {
  std::vector<PRExp> E;
};
// Concatenation.
struct And {
  std::vector<PRExp> E;
};
// One code point out of a set.
struct Node {
  CharSet E;
};

inline bool isNull(const PRExp &rexp) {
  return std::holds_alternative<Null>(*rexp);
}

inline bool isEmpty(const PRExp &rexp) {
  return std::holds_alternative<Empty>(*rexp);
}

PRExp createNull();
PRExp createEmpty();
PRExp createOr(std::vector<PRExp> E = {});
PRExp createAnd(std::vector<PRExp> E = {});
PRExp createStar(const PRExp &E);
PRExp createOptional(const PRExp &E);
PRExp create(const CharSet &CS);
/// Concatenation of the code points of a literal.
PRExp createLiteral(const std::vector<CodePoint> &Str);

/// Unanchored pattern text. Equal texts denote the same language, so it also
/// serves as a key when deduplicating alternatives.
std::string toString(const PRExp &rexp);
/// ECMA-262 pattern text matching the same strings as a full match.
std::string toPattern(const PRExp &rexp);
PRExp simplifyOnce(const PRExp &Original);
PRExp operator&(const PRExp &A, const PRExp &B);
PRExp operator|(const PRExp &A, const PRExp &B);

/// State elimination over a graph given as an edge map. Returns the path
/// expression from \p Start to \p Final. Every other node in \p Nodes is
/// eliminated in order.
PRExp eliminate(std::map<std::pair<unsigned, unsigned>, PRExp> P,
                const std::vector<unsigned> &Nodes, unsigned Start,
                unsigned Final);

} // namespace schemasub::automata::rexp

#endif
