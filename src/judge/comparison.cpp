#include "judge/comparison.hpp"
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

comparison_result compare(execution_service &service,
                          const string &submitted_source,
                          const string &reference_source,
                          const vector<test_case> &test_cases) {
    if (boost::algorithm::trim_copy(reference_source).empty())
        throw precondition_error("no reference solution");
    if (test_cases.empty())
        throw precondition_error("no test cases");

    comparison_result result;
    result.submitted = validate(service, submitted_source, test_cases);
    result.reference = validate(service, reference_source, test_cases);
    result.matches_reference = result.submitted.overall_success &&
                               result.reference.overall_success &&
                               result.submitted.score == result.reference.score;
    return result;
}

}  // namespace coderun
