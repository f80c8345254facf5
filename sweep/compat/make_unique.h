#ifndef SWEEP_COMPAT_MAKE_UNIQUE_H_
#define SWEEP_COMPAT_MAKE_UNIQUE_H_

#include <memory>
#include <utility>

namespace sweep {

// Stand-in for std::make_unique, which is not available until C++14.
template <typename T, typename... Args>
std::unique_ptr<T> MakeUnique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

}  // namespace sweep

#endif  // SWEEP_COMPAT_MAKE_UNIQUE_H_
