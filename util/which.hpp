#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in $PATH, or an empty string. Successful lookups
// are cached unless use_cache is false. Safe to call from multiple threads.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
