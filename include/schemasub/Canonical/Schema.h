#ifndef _SCHEMASUB_CANONICAL_SCHEMA_H_
#define _SCHEMASUB_CANONICAL_SCHEMA_H_

#include "Automata/Automaton.h"
#include "Canonical/Range.h"
#include <llvm/ADT/StringRef.h>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace schemasub {

struct Schema;
using PSchema = std::shared_ptr<const Schema>;

/// JSON value kinds, in the order they are serialized.
enum class Kind { Null, Boolean, Number, String, Array, Object };
constexpr unsigned NumKinds = 6;
const char *toString(Kind K);

struct NullTy {
  bool operator==(const NullTy &) const { return true; }
};

struct BooleanTy {
  bool AllowFalse = true;
  bool AllowTrue = true;

  bool isAny() const { return AllowFalse && AllowTrue; }
  bool operator==(const BooleanTy &rhs) const {
    return AllowFalse == rhs.AllowFalse && AllowTrue == rhs.AllowTrue;
  }
};

/// \brief One number atom: an interval, optionally restricted to integers or to
/// the multiples of a step.
///
/// After normalization, finite bounds of a stepped or integer type sit on the
/// grid and are closed, and a single admitted value is a point with no step.
struct NumberTy {
  Bound Lower = Bound::negInf();
  Bound Upper = Bound::posInf();
  std::optional<double> Step;
  bool Integer = false;

  bool isAny() const {
    return !Lower.isFinite() && !Upper.isFinite() && !Step && !Integer;
  }
  bool isPoint() const {
    return Lower.isFinite() && Upper.isFinite() && !Lower.Open &&
           !Upper.Open && Lower.Value == Upper.Value;
  }
  bool operator==(const NumberTy &rhs) const {
    return Lower == rhs.Lower && Upper == rhs.Upper && Step == rhs.Step &&
           Integer == rhs.Integer;
  }
};

/// Strings with a length range and an optional regular language. A null
/// language accepts every string.
struct StringTy {
  SizeRange Length;
  automata::PDFA Lang;
  /// Pattern text the language was built from, kept for serialization.
  std::optional<std::string> Source;

  bool isAny() const { return Length.isAny() && !Lang; }
};

/// \brief Arrays, as a positional prefix followed by a homogeneous rest.
///
/// A homogeneous array has an empty prefix. A Bottom element caps the
/// maximum length at its position. Children are never null.
struct ArrayTy {
  std::vector<PSchema> Prefix;
  PSchema Rest;
  SizeRange Length;
  bool Unique = false;

  /// Every array. Children refer to the shared Top.
  static ArrayTy any();
  const PSchema &at(size_t I) const {
    return I < Prefix.size() ? Prefix[I] : Rest;
  }
  bool isAny() const;
};

struct PatternProperty {
  std::string Source;
  automata::PDFA Lang;
  PSchema Value;
};

struct ObjectTy {
  std::map<std::string, PSchema> Properties;
  std::set<std::string> Required;
  std::vector<PatternProperty> Patterns;
  PSchema Additional;
  SizeRange Count;

  /// Every object.
  static ObjectTy any();
  bool isAny() const;
};

/// \brief Canonical form of a schema: an independent descriptor per JSON value
/// kind, absent when the kind is rejected.
///
/// Numbers, arrays and objects are unions of atoms, since neither an interval
/// nor a structural descriptor is closed under union. An empty union rejects
/// the kind. Null, booleans and strings are closed under union and keep a
/// single descriptor.
///
/// Top has every kind present and unconstrained; Bottom has no kind. Values
/// are immutable once built and shared through PSchema. The shared Top is its
/// own array element and additional property, so traversals must stop at
/// isTop() before descending.
struct Schema {
  std::optional<NullTy> Null;
  std::optional<BooleanTy> Boolean;
  std::vector<NumberTy> Numbers;
  std::optional<StringTy> String;
  std::vector<ArrayTy> Arrays;
  std::vector<ObjectTy> Objects;
  /// Semantic annotation (normalized concept IRI).
  std::optional<std::string> SType;

  static PSchema top();
  static PSchema bottom();

  /// The only number atom, null when numbers are rejected or form a union.
  const NumberTy *number() const {
    return Numbers.size() == 1 ? &Numbers[0] : nullptr;
  }
  const ArrayTy *array() const {
    return Arrays.size() == 1 ? &Arrays[0] : nullptr;
  }
  const ObjectTy *object() const {
    return Objects.size() == 1 ? &Objects[0] : nullptr;
  }

  bool hasKind(Kind K) const;
  bool isBottom() const;
  bool isTop() const;
  unsigned numKinds() const;
  /// The only present kind, if there is exactly one.
  std::optional<Kind> singleKind() const;
};

std::string toString(const PSchema &S);

} // namespace schemasub

#endif
