#include "common/utils.hpp"
#include <cstdlib>

namespace coderun {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

bool has_env(const string &key) {
    return getenv(key.c_str()) != nullptr;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

long long elapsed_time::milliseconds() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace coderun
