#include "gtest/gtest.h"
#include "judge/hints.hpp"

using namespace std;
using namespace coderun;
using nlohmann::json;

static vector<hint> make_hints(int n) {
    vector<hint> hints;
    for (int i = 1; i <= n; ++i) hints.push_back({i, "hint text " + to_string(i)});
    return hints;
}

static int unlocked_count(const vector<hint_view> &views) {
    int count = 0;
    for (auto &view : views) count += view.unlocked;
    return count;
}

TEST(HintsTest, UnlockByAttempts) {
    auto hints = make_hints(3);
    EXPECT_EQ(unlocked_count(resolve_hints(hints, 0)), 0);
    EXPECT_EQ(unlocked_count(resolve_hints(hints, 1)), 1);
    EXPECT_EQ(unlocked_count(resolve_hints(hints, 2)), 2);
    EXPECT_EQ(unlocked_count(resolve_hints(hints, 3)), 3);
    EXPECT_EQ(unlocked_count(resolve_hints(hints, 100)), 3);
}

TEST(HintsTest, LockedHintsShowPlaceholder) {
    auto views = resolve_hints(make_hints(3), 1);
    ASSERT_EQ(views.size(), 3u);
    EXPECT_EQ(views[0].text, "hint text 1");
    EXPECT_TRUE(views[0].unlocked);
    EXPECT_EQ(views[1].text, "Hint 2 (unlocked after 2 attempts)");
    EXPECT_FALSE(views[1].unlocked);
    EXPECT_EQ(views[2].text, "Hint 3 (unlocked after 3 attempts)");
    EXPECT_EQ(views[2].ordinal, 3);
}

TEST(HintsTest, MaxHintsTruncates) {
    EXPECT_EQ(resolve_hints(make_hints(5), 10, 2).size(), 2u);
    EXPECT_EQ(resolve_hints(make_hints(5), 10, 0).size(), 5u);
    EXPECT_EQ(resolve_hints(make_hints(2), 10, 5).size(), 2u);
}

TEST(HintsTest, NegativeAttemptsUnlockNothing) {
    EXPECT_EQ(unlocked_count(resolve_hints(make_hints(2), -3)), 0);
}

TEST(HintsTest, NoHints) {
    EXPECT_TRUE(resolve_hints({}, 5).empty());
}

TEST(HintsTest, Json) {
    auto hints = json::parse(R"([{"hint_text": "Use a loop"}, {"hint_text": "Mind the edge case"}])").get<vector<hint>>();
    ASSERT_EQ(hints.size(), 2u);
    EXPECT_EQ(hints[1].text, "Mind the edge case");

    json j = resolve_hints(hints, 1);
    EXPECT_EQ(j[0]["order_index"], 1);
    EXPECT_EQ(j[0]["hint_text"], "Use a loop");
    EXPECT_EQ(j[0]["unlocked"], true);
    EXPECT_EQ(j[1]["unlocked"], false);
}

TEST(HintsTest, StoredOrderIndexIsReturned) {
    auto hints = json::parse(R"([{"hint_text": "first", "order_index": 10}, {"hint_text": "second", "order_index": 20}, {"hint_text": "third"}])").get<vector<hint>>();
    json j = resolve_hints(hints, 1);
    EXPECT_EQ(j[0]["order_index"], 10);
    EXPECT_EQ(j[0]["unlocked"], true);
    EXPECT_EQ(j[1]["order_index"], 20);
    EXPECT_EQ(j[1]["hint_text"], "Hint 2 (unlocked after 2 attempts)");
    EXPECT_EQ(j[2]["order_index"], 3);
}
