#ifndef _SCHEMASUB_UNITTESTS_SEMANTICTESTUTILS_H_
#define _SCHEMASUB_UNITTESTS_SEMANTICTESTUTILS_H_

#include "Errors.h"
#include "Semantic/OntologyLoader.h"
#include <gtest/gtest.h>
#include <iostream>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>
#include <string>

namespace schemasub::semantic {

/// A fresh directory under the system temp dir.
inline std::string makeTempDir() {
  llvm::SmallString<128> Path;
  std::error_code EC = llvm::sys::fs::createUniqueDirectory("schemasub", Path);
  EXPECT_FALSE(EC) << EC.message();
  return std::string(Path.str());
}

inline std::string writeFile(llvm::StringRef Dir, llvm::StringRef Name,
                             llvm::StringRef Content) {
  llvm::SmallString<128> Path(Dir);
  llvm::sys::path::append(Path, Name);
  std::error_code EC;
  llvm::raw_fd_ostream OS(Path, EC);
  EXPECT_FALSE(EC) << EC.message();
  OS << Content;
  return std::string(Path.str());
}

inline std::vector<Triple> parseOrFail(llvm::StringRef Text,
                                       llvm::StringRef Base = "") {
  auto R = parseTurtle(Text, "test.ttl", Base);
  if (!R) {
    ADD_FAILURE() << llvm::toString(R.takeError());
    return {};
  }
  for (auto &T : *R) {
    std::cerr << T.Subject << " " << T.Predicate << " " << T.Object << "\n";
  }
  return std::move(*R);
}

/// The message of a load error, empty if \p R succeeded.
inline std::string loadError(llvm::Expected<std::vector<Triple>> R) {
  if (R) {
    ADD_FAILURE() << "loaded " << R->size() << " triples";
    return "";
  }
  std::string Msg;
  bool IsGraphFailure = R.errorIsA<GraphLoadFailure>();
  EXPECT_TRUE(IsGraphFailure);
  Msg = llvm::toString(R.takeError());
  std::cerr << Msg << "\n";
  return Msg;
}

} // namespace schemasub::semantic

#endif
