#include "judge/hints.hpp"
#include <fmt/format.h>
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

vector<hint_view> resolve_hints(const vector<hint> &hints, int attempt_count, size_t max_hints) {
    size_t count = hints.size();
    if (max_hints > 0 && max_hints < count) count = max_hints;

    vector<hint_view> views;
    views.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        int position = (int)i + 1;
        hint_view view;
        // 有存储的顺序号时原样返回，解锁条件只看位置
        view.ordinal = hints[i].ordinal > 0 ? hints[i].ordinal : position;
        view.unlocked = attempt_count > position - 1;
        if (view.unlocked)
            view.text = hints[i].text;
        else
            view.text = fmt::format("Hint {} (unlocked after {} attempts)", position, position);
        views.push_back(move(view));
    }
    return views;
}

void from_json(const json &j, hint &h) {
    h.text = get_value<string>(j, "hint_text");
    assign_optional(j, h.ordinal, "order_index");
}

void to_json(json &j, const hint_view &view) {
    j = {{"order_index", view.ordinal},
         {"hint_text", view.text},
         {"unlocked", view.unlocked}};
}

}  // namespace coderun
