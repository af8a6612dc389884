#ifndef _SCHEMASUB_AUTOMATA_REGEX_PARSER_H_
#define _SCHEMASUB_AUTOMATA_REGEX_PARSER_H_

#include "Automata/RExp.h"
#include "utils.h"
#include <llvm/ADT/StringRef.h>

namespace schemasub::automata {

/// Largest bound accepted in a `{n,m}` quantifier.
constexpr unsigned MaxRepeat = 1000;

/// Parse an ECMA-262 pattern into a regular expression over code points.
///
/// The result describes the set of whole strings accepted by the pattern
/// under `search` semantics: unanchored alternatives may match anywhere.
/// Backreferences, lookaround and word boundaries are not regular and are
/// reported as errors.
Result<rexp::PRExp> parseRegex(llvm::StringRef Pattern);

/// The regular language of a supported `format` keyword, or an error for an
/// unknown format.
Result<rexp::PRExp> formatLanguage(llvm::StringRef Format);

} // namespace schemasub::automata

#endif
