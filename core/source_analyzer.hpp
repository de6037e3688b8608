#ifndef CORE_SOURCE_ANALYZER_HPP
#define CORE_SOURCE_ANALYZER_HPP

#include <string>

#include "absl/types/optional.h"

namespace core {

// Returns the name of the class to run: the first "public class Name {"
// declaration or, failing that, the first class declaration. Returns nullopt
// for blank sources or sources without classes.
absl::optional<std::string> ExtractEntryPoint(const std::string& source);

// Returns true if the source declares a public static void main(String[])
// method, in any of its usual spellings.
bool HasRunnableEntryPoint(const std::string& source);

// Hex-encoded SHA-256 of the source text.
std::string Fingerprint(const std::string& source);

// True if the source only contains whitespace.
bool IsBlank(const std::string& source);

}  // namespace core

#endif
