#include <cstring>
#include <string>
#include <vector>

#include "farmlink/devices.h"
#include "farmlink/domain_strings.h"
#include "farmlink/logger.h"
#include "farmlink/sensor_status.h"
#include "farmlink/task_scheduler.h"
#include "farmlink/time_format.h"
#include "test_support.h"

using namespace farmlink;

static void test_parse_time_of_day()
{
    TimeOfDay t;
    EXPECT_TRUE(time_format::parseTimeOfDay("00:00", t));
    EXPECT_TRUE(time_format::parseTimeOfDay("23:59", t));
    EXPECT_EQ_INT(t.hour, 23);
    EXPECT_EQ_INT(t.minute, 59);
    EXPECT_EQ_INT(t.minutesSinceMidnight(), 1439);

    EXPECT_FALSE(time_format::parseTimeOfDay(nullptr, t));
    EXPECT_FALSE(time_format::parseTimeOfDay("", t));
    EXPECT_FALSE(time_format::parseTimeOfDay("24:00", t));
    EXPECT_FALSE(time_format::parseTimeOfDay("12:60", t));
    EXPECT_FALSE(time_format::parseTimeOfDay("7:05", t));
    EXPECT_FALSE(time_format::parseTimeOfDay("07:05:00", t));
    EXPECT_FALSE(time_format::parseTimeOfDay("07-05", t));
    EXPECT_EQ_INT(t.hour, 23);
}

static void test_format_time()
{
    TimeOfDay t;
    t.hour = 6;
    t.minute = 5;
    char buf[8];
    EXPECT_TRUE(time_format::formatTimeOfDay(t, buf, sizeof(buf)));
    EXPECT_EQ_STR(buf, "06:05");

    char tiny[5];
    EXPECT_FALSE(time_format::formatTimeOfDay(t, tiny, sizeof(tiny)));
    EXPECT_EQ_STR(tiny, "");

    t.hour = 24;
    EXPECT_FALSE(time_format::formatTimeOfDay(t, buf, sizeof(buf)));

    char clock[12];
    EXPECT_TRUE(time_format::formatLocalClock(1700000000123ull, clock, sizeof(clock)));
    EXPECT_EQ_INT(std::strlen(clock), 8);
    EXPECT_TRUE(clock[2] == ':' && clock[5] == ':');
    EXPECT_FALSE(time_format::formatLocalClock(0, clock, 8));
}

static void test_domain_strings()
{
    EXPECT_EQ_STR(toString(Severity::SUCCESS), "success");
    EXPECT_EQ_STR(toString(SessionPhase::AUTHENTICATING), "authenticating");
    EXPECT_EQ_STR(toString(ScheduleField::STOOL_TIME), "stool_time");
    EXPECT_EQ_STR(toString(FeedStatus::MID), "MID");
    EXPECT_EQ_STR(toString(AmmoniaStatus::HIGH), "High");

    ScheduleField f;
    EXPECT_TRUE(domain_strings::scheduleField_fromKey("LED_OFF", f));
    EXPECT_TRUE(f == ScheduleField::LED_OFF);
    EXPECT_FALSE(domain_strings::scheduleField_fromKey("led", f));
    EXPECT_FALSE(domain_strings::scheduleField_fromKey(nullptr, f));
}

static void test_device_catalog()
{
    size_t count = 0;
    const DeviceInfo *catalog = device_catalog(count);
    EXPECT_EQ_INT(count, 6);
    for (size_t i = 0; i < count; ++i)
    {
        EXPECT_TRUE(device_index(catalog[i].id) == i);
    }

    Device d;
    EXPECT_TRUE(device_fromKey("Heater", d));
    EXPECT_TRUE(d == Device::HEATER);
    EXPECT_FALSE(device_fromKey("pump", d));
    EXPECT_FALSE(device_fromKey("", d));

    EXPECT_FALSE(device_isMomentary(Device::FAN));
    EXPECT_TRUE(device_isMomentary(Device::STEPPER2));
    EXPECT_EQ_INT(device_info(Device::FEED).pulseMs, 5000);
    EXPECT_EQ_INT(device_info(Device::STEPPER1).pulseMs, 30000);
    EXPECT_EQ_INT(device_info(Device::LED).pulseMs, 0);
    EXPECT_EQ_STR(device_info(Device::STEPPER1).label, "STEPPER1");
}

static void test_sensor_status()
{
    EXPECT_TRUE(sensor_feedStatus(0) == FeedStatus::LOW);
    EXPECT_TRUE(sensor_feedStatus(19) == FeedStatus::LOW);
    EXPECT_TRUE(sensor_feedStatus(20) == FeedStatus::MID);
    EXPECT_TRUE(sensor_feedStatus(59) == FeedStatus::MID);
    EXPECT_TRUE(sensor_feedStatus(60) == FeedStatus::FULL);
    EXPECT_TRUE(sensor_ammoniaStatus(20.0f) == AmmoniaStatus::SAFE);
    EXPECT_TRUE(sensor_ammoniaStatus(20.5f) == AmmoniaStatus::HIGH);
}

static void test_task_scheduler_order_and_cancel()
{
    ManualClock clock;
    TaskScheduler scheduler(clock);
    std::vector<int> ran;

    const TaskId late = scheduler.scheduleAfter(300, "late", [&ran]()
                                                { ran.push_back(3); });
    scheduler.scheduleAfter(100, "a", [&ran]()
                            { ran.push_back(1); });
    scheduler.scheduleAfter(100, "b", [&ran]()
                            { ran.push_back(2); });
    const TaskId dropped = scheduler.scheduleAfter(200, "dropped", [&ran]()
                                                   { ran.push_back(99); });
    EXPECT_TRUE(late != kInvalidTaskId);
    EXPECT_EQ_INT(scheduler.pendingCount(), 4);

    uint64_t due = 0;
    EXPECT_TRUE(scheduler.nextDueMs(due));
    EXPECT_EQ_INT(due, clock.nowMs() + 100);

    EXPECT_TRUE(scheduler.cancel(dropped));
    EXPECT_FALSE(scheduler.cancel(dropped));
    EXPECT_FALSE(scheduler.isPending(dropped));

    clock.advance(99);
    EXPECT_EQ_INT(scheduler.runDue(), 0);
    clock.advance(400);
    EXPECT_EQ_INT(scheduler.runDue(), 3);
    EXPECT_EQ_INT(ran.size(), 3);
    EXPECT_EQ_INT(ran[0], 1);
    EXPECT_EQ_INT(ran[1], 2);
    EXPECT_EQ_INT(ran[2], 3);
    EXPECT_FALSE(scheduler.nextDueMs(due));
}

static void test_task_scheduled_from_task_waits()
{
    ManualClock clock;
    TaskScheduler scheduler(clock);
    int runs = 0;
    scheduler.scheduleAfter(0, "outer", [&scheduler, &runs]()
                            {
        ++runs;
        scheduler.scheduleAfter(10, "inner", [&runs]()
                                { ++runs; }); });
    EXPECT_EQ_INT(scheduler.runDue(), 1);
    EXPECT_EQ_INT(runs, 1);
    clock.advance(10);
    EXPECT_EQ_INT(scheduler.runDue(), 1);
    EXPECT_EQ_INT(runs, 2);
}

static void test_schedule_defaults()
{
    const Schedule s = schedule_defaults();
    EXPECT_EQ_INT(s.get(ScheduleField::EGG_TIME).hour, 8);
    EXPECT_EQ_INT(s.get(ScheduleField::STOOL_TIME).hour, 9);
    EXPECT_EQ_INT(s.get(ScheduleField::FEED_TIME).hour, 7);
    EXPECT_EQ_INT(s.get(ScheduleField::LED_ON).hour, 6);
    EXPECT_EQ_INT(s.get(ScheduleField::LED_OFF).hour, 18);
}

int main()
{
    logger_begin(true, false);
    test_parse_time_of_day();
    test_format_time();
    test_domain_strings();
    test_device_catalog();
    test_sensor_status();
    test_task_scheduler_order_and_cancel();
    test_task_scheduled_from_task_waits();
    test_schedule_defaults();
    return finishTests("domain");
}
