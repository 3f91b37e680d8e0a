#include "sandbox/runtime.hpp"

namespace coderun {

sandbox_runtime::~sandbox_runtime() {}

}  // namespace coderun
