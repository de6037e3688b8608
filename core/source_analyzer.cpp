#include "core/source_analyzer.hpp"

#include "absl/strings/ascii.h"
#include "glog/logging.h"
#include "re2/re2.h"
#include "util/sha256.hpp"

namespace core {

namespace {
const RE2* Compile(const char* regex) {
  const RE2* pattern = new RE2(regex);
  CHECK(pattern->ok()) << "Invalid pattern " << regex << ": "
                       << pattern->error();
  return pattern;
}

// RE2 matches in linear time, so whitespace runs of any length are safe.
const RE2& PublicClassPattern() {
  static const RE2* pattern =
      Compile(R"((?m)^\s*public\s+class\s+([\w$\pL\pN]+)\s*\{)");
  return *pattern;
}

const RE2& ClassPattern() {
  static const RE2* pattern =
      Compile(R"((?m)^\s*(?:(?:public|final|abstract|strictfp)\s+)*)"
              R"(class\s+([\w$\pL\pN]+))");
  return *pattern;
}

const RE2& MainPattern() {
  static const RE2* pattern = Compile(
      R"((?:public\s+static|static\s+public)\s+(?:final\s+)?void\s+main\s*\()"
      R"(\s*(?:final\s+)?String\s*(?:\[\s*\]|\.\.\.|\s[\w$]+\s*\[\s*\]))");
  return *pattern;
}
}  // namespace

bool IsBlank(const std::string& source) {
  return absl::StripAsciiWhitespace(source).empty();
}

absl::optional<std::string> ExtractEntryPoint(const std::string& source) {
  if (IsBlank(source)) return absl::nullopt;
  std::string name;
  if (RE2::PartialMatch(source, PublicClassPattern(), &name) ||
      RE2::PartialMatch(source, ClassPattern(), &name)) {
    return name;
  }
  return absl::nullopt;
}

bool HasRunnableEntryPoint(const std::string& source) {
  if (IsBlank(source)) return false;
  return RE2::PartialMatch(source, MainPattern());
}

std::string Fingerprint(const std::string& source) {
  return util::SHA256::Of(source);
}

}  // namespace core
