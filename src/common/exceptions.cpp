#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace coderun {
using namespace std;

coderun_exception::coderun_exception()
    : coderun_exception("") {}

coderun_exception::coderun_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *coderun_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const coderun_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

runtime_unavailable::runtime_unavailable()
    : coderun_exception() {}

runtime_unavailable::runtime_unavailable(const string &message)
    : coderun_exception(message) {}

precondition_error::precondition_error()
    : coderun_exception() {}

precondition_error::precondition_error(const string &message)
    : coderun_exception(message) {}

container_error::container_error()
    : coderun_exception() {}

container_error::container_error(const string &message)
    : coderun_exception(message) {}

}  // namespace coderun
