#include <glog/logging.h>
#include <ky/noexcept.h>

#include <exception>

namespace ky {

int NoExcept(const std::function<int()> &function) {
  try {
    return function();
  } catch (const std::exception &e) {
    LOG(FATAL) << "uncaught exception: " << e.what();
  } catch (...) {
    LOG(FATAL) << "uncaught exception of unknown type";
  }
  return 2;
}

}  // namespace ky
