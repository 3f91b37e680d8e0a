#include "sandbox/limits.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <cmath>
#include <limits>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

int64_t parse_memory_size(const string &text) {
    string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
    if (value.empty())
        throw precondition_error("empty memory size");

    int shift = 0;
    switch (value.back()) {
        case 'b': shift = 0; break;
        case 'k': shift = 10; break;
        case 'm': shift = 20; break;
        case 'g': shift = 30; break;
        default:
            if (!isdigit((unsigned char)value.back()))
                throw precondition_error("unknown unit in memory size " + text);
            shift = -1;
    }
    if (shift >= 0) value.pop_back();

    int64_t number;
    try {
        number = boost::lexical_cast<int64_t>(value);
    } catch (boost::bad_lexical_cast &) {
        throw precondition_error("malformed memory size " + text);
    }
    if (number < 0)
        throw precondition_error("negative memory size " + text);
    if (shift > 0 && number > (numeric_limits<int64_t>::max() >> shift))
        throw precondition_error("memory size " + text + " is too large");
    return shift > 0 ? number << shift : number;
}

int64_t cpu_quota(double cpus) {
    return static_cast<int64_t>(llround(cpus * CPU_PERIOD));
}

}  // namespace coderun
