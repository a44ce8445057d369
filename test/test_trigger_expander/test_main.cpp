#include <unity.h>
#include <optional>
#include <vector>

#include "errors.hpp"
#include "test_schedules.hpp"
#include "expander.hpp"
#include "time_util.hpp"
#include "validator.hpp"

void setUp() {}
void tearDown() {}

static void assert_instant(const TriggerInstant& t, TriggerAction action, Weekday d, int h, int m)
{
    TEST_ASSERT_EQUAL_INT(static_cast<int>(action), static_cast<int>(t.action));
    TEST_ASSERT_EQUAL_INT(static_cast<int>(d), static_cast<int>(t.weekday));
    TEST_ASSERT_EQUAL_INT(h, t.hour);
    TEST_ASSERT_EQUAL_INT(m, t.minute);
}

void test_sunday_night_reports_whole_duration()
{
    auto triggers = expand(normalize({ sched("night", 0, Weekday::Sunday, 23, 0, 5, 0) }));
    TEST_ASSERT_EQUAL_UINT(2, triggers.size());

    // Monday 05:00 comes first in week order
    assert_instant(triggers[0], TriggerAction::Stop, Weekday::Monday, 5, 0);
    assert_instant(triggers[1], TriggerAction::Start, Weekday::Sunday, 23, 0);
    TEST_ASSERT_EQUAL_INT(360, triggers[1].duration_minutes);
}

void test_every_day_schedule_gives_seven_pairs()
{
    auto triggers = expand(normalize({ sched("office", 0, std::nullopt, 9, 0, 17, 30) }));
    TEST_ASSERT_EQUAL_UINT(14, triggers.size());

    for (int d=0; d<7; ++d) {
        const auto& on  = triggers[2*d];
        const auto& off = triggers[2*d + 1];
        assert_instant(on,  TriggerAction::Start, static_cast<Weekday>(d), 9, 0);
        assert_instant(off, TriggerAction::Stop,  static_cast<Weekday>(d), 17, 30);
        TEST_ASSERT_EQUAL_INT(510, on.duration_minutes);
    }
}

void test_touching_windows_stop_before_start()
{
    auto triggers = expand(normalize({
        sched("gym",  1, Weekday::Monday, 17, 0, 18, 0),
        sched("work", 0, Weekday::Monday, 9, 0, 17, 0),
    }));
    TEST_ASSERT_EQUAL_UINT(4, triggers.size());
    assert_instant(triggers[0], TriggerAction::Start, Weekday::Monday, 9, 0);
    assert_instant(triggers[1], TriggerAction::Stop,  Weekday::Monday, 17, 0);
    assert_instant(triggers[2], TriggerAction::Start, Weekday::Monday, 17, 0);
    assert_instant(triggers[3], TriggerAction::Stop,  Weekday::Monday, 18, 0);
    TEST_ASSERT_EQUAL_STRING("work", triggers[1].source_id.c_str());
    TEST_ASSERT_EQUAL_STRING("gym", triggers[2].source_id.c_str());
    TEST_ASSERT_EQUAL_INT(60, triggers[2].duration_minutes);
}

void test_start_durations_sum_to_covered_minutes()
{
    auto intervals = normalize({
        sched("sleep", 0, std::nullopt, 23, 30, 6, 0),
        sched("work",  1, Weekday::Tuesday, 9, 15, 12, 45),
        sched("sat",   2, Weekday::Saturday, 10, 0, 20, 0),
    });
    auto triggers = expand(intervals);

    int sum = 0;
    for (auto& t : triggers)
        if (t.action == TriggerAction::Start) sum += t.duration_minutes;

    std::vector<bool> covered(kMinutesPerWeek, false);
    for (auto& iv : intervals)
        for (int m = iv.start; m < iv.end; ++m) covered[m % kMinutesPerWeek] = true;
    int total = 0;
    for (bool c : covered) if (c) ++total;

    TEST_ASSERT_EQUAL_INT(total, sum);
    TEST_ASSERT_EQUAL_INT(7*390 + 210 + 600, sum);
}

void test_triggers_are_in_week_order()
{
    auto triggers = expand(normalize({
        sched("a", 0, Weekday::Thursday, 20, 0, 1, 0),
        sched("b", 1, Weekday::Monday, 8, 0, 9, 0),
        sched("c", 2, Weekday::Sunday, 22, 0, 2, 0),
    }));
    for (std::size_t i=1; i<triggers.size(); ++i)
        TEST_ASSERT_TRUE(trigger_minute_of_week(triggers[i-1]) <= trigger_minute_of_week(triggers[i]));
}

void test_start_carries_hosts()
{
    auto in = sched("focus", 0, Weekday::Wednesday, 13, 0, 15, 0);
    in.host_blacklist = std::vector<std::string>{"news.ycombinator.com"};
    in.block_as_whitelist = true;
    auto triggers = expand(normalize({ in }));

    TEST_ASSERT_EQUAL_UINT(1, triggers[0].hosts.size());
    TEST_ASSERT_EQUAL_STRING("news.ycombinator.com", triggers[0].hosts[0].c_str());
    TEST_ASSERT_TRUE(triggers[0].block_as_whitelist);
    TEST_ASSERT_EQUAL_UINT(0, triggers[1].hosts.size());
}

void test_invalid_input_is_internal_fault()
{
    NormalizedInterval a; a.start = 600; a.end = 700;
    NormalizedInterval b; b.start = 650; b.end = 800;
    bool thrown = false;
    try { expand({a, b}); }
    catch (const InternalConsistencyFault&) { thrown = true; }
    TEST_ASSERT_TRUE(thrown);
}

void test_empty_input_gives_no_triggers()
{
    TEST_ASSERT_EQUAL_UINT(0, expand({}).size());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_sunday_night_reports_whole_duration);
    RUN_TEST(test_every_day_schedule_gives_seven_pairs);
    RUN_TEST(test_touching_windows_stop_before_start);
    RUN_TEST(test_start_durations_sum_to_covered_minutes);
    RUN_TEST(test_triggers_are_in_week_order);
    RUN_TEST(test_start_carries_hosts);
    RUN_TEST(test_invalid_input_is_internal_fault);
    RUN_TEST(test_empty_input_gives_no_triggers);
    return UNITY_END();
}
