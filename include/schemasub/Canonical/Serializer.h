#ifndef _SCHEMASUB_CANONICAL_SERIALIZER_H_
#define _SCHEMASUB_CANONICAL_SERIALIZER_H_

#include "Canonical/Schema.h"
#include <llvm/Support/JSON.h>

namespace schemasub {

/// Render a canonical schema as a JSON Schema document.
///
/// Bottom is `{"not": {}}` and Top is `{}`. A single kind becomes one keyword
/// object, several kinds an `anyOf` (or a `type` list when none of them is
/// constrained). The semantic annotation is emitted as `stype`.
llvm::json::Value toJSON(const PSchema &S);

} // namespace schemasub

#endif
