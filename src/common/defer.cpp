#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace coderun {
using namespace std;

scope_exit::scope_exit() : f() {}

scope_exit::scope_exit(function<void()> f) : f(move(f)) {}

scope_exit::scope_exit(scope_exit &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scope_exit::~scope_exit() {
    if (!f) return;
    try {
        f();
    } catch (std::exception &ex) {
        LOG(WARNING) << "Deferred action failed: " << ex.what();
    }
}

scope_exit scope_exit::operator+(function<void()> f) const {
    return scope_exit(move(f));
}

void scope_exit::dismiss() {
    f = nullptr;
}

}  // namespace coderun
