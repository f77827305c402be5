#ifndef SAMPLEHASH_SRC_KY_COMMON_NOEXCEPT_H
#define SAMPLEHASH_SRC_KY_COMMON_NOEXCEPT_H

#include <functional>

namespace ky {

/// Runs `function` and returns its exit code; any exception that escapes is
/// logged as fatal.
int NoExcept(const std::function<int()> &function);

}  // namespace ky

#endif  // SAMPLEHASH_SRC_KY_COMMON_NOEXCEPT_H
