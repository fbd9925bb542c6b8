#include "farmlink/logger.h"
#include "farmlink/schedule_manager.h"
#include "farmlink/time_format.h"
#include "test_support.h"

using namespace farmlink;

static uint64_t fixedWallClock()
{
    return 1700000000000ull;
}

static TimeOfDay hhmm(const char *text)
{
    TimeOfDay t;
    EXPECT_TRUE(time_format::parseTimeOfDay(text, t));
    return t;
}

struct Rig
{
    FakeChannel channel;
    EventLog events{nullptr, fixedWallClock};
    ScheduleManager schedule{channel, events};
};

static void test_draft_starts_at_defaults()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.draft() == schedule_defaults());
    EXPECT_TRUE(rig.schedule.draft().get(ScheduleField::EGG_TIME) == hhmm("08:00"));
    EXPECT_TRUE(rig.schedule.draft().get(ScheduleField::LED_OFF) == hhmm("18:00"));
    EXPECT_FALSE(rig.schedule.isDirty());
}

static void test_set_field_validates()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::FEED_TIME, "06:45"));
    EXPECT_TRUE(rig.schedule.isDirty());
    EXPECT_TRUE(rig.schedule.draft().get(ScheduleField::FEED_TIME) == hhmm("06:45"));

    const Schedule before = rig.schedule.draft();
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::FEED_TIME, "24:00"));
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::FEED_TIME, "7:00"));
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::FEED_TIME, "ab:cd"));
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::FEED_TIME, "12:60"));
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::FEED_TIME, nullptr));

    TimeOfDay bad;
    bad.hour = 25;
    EXPECT_FALSE(rig.schedule.setField(ScheduleField::LED_ON, bad));
    EXPECT_TRUE(rig.schedule.draft() == before);
    EXPECT_EQ_INT(rig.channel.issued.size(), 0);
}

static void test_led_on_after_led_off_is_allowed()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::LED_ON, "22:00"));
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::LED_OFF, "05:30"));
}

static void test_save_writes_whole_record()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::EGG_TIME, "10:15"));
    EXPECT_TRUE(rig.schedule.save());
    EXPECT_EQ_INT(rig.channel.pending.size(), 1);
    EXPECT_EQ_STR(rig.channel.pending.front().path, "schedule");
    EXPECT_EQ_STR(rig.channel.pending.front().json,
                  "{\"egg_time\":\"10:15\",\"stool_time\":\"09:00\",\"feed_time\":\"07:00\","
                  "\"led_on\":\"06:00\",\"led_off\":\"18:00\"}");
    EXPECT_EQ_INT(rig.schedule.savesInFlight(), 1);

    EXPECT_TRUE(rig.channel.complete(true));
    EXPECT_EQ_INT(rig.schedule.savesInFlight(), 0);
    EXPECT_EQ_STR(rig.events.entries().front().message, "Schedule updated successfully");
    EXPECT_TRUE(rig.events.entries().front().severity == Severity::SUCCESS);
    EXPECT_FALSE(rig.schedule.isDirty());
}

static void test_failed_save_logs_error_and_stays_dirty()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::STOOL_TIME, "11:00"));
    EXPECT_TRUE(rig.schedule.save());
    EXPECT_TRUE(rig.channel.complete(false, "permission denied"));
    EXPECT_EQ_STR(rig.events.entries().front().message, "Failed to save schedule: permission denied");
    EXPECT_TRUE(rig.events.entries().front().severity == Severity::ERROR);
    EXPECT_TRUE(rig.schedule.isDirty());
    EXPECT_TRUE(rig.schedule.draft().get(ScheduleField::STOOL_TIME) == hhmm("11:00"));
}

static void test_edit_during_save_keeps_draft_dirty()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::EGG_TIME, "10:00"));
    EXPECT_TRUE(rig.schedule.save());
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::EGG_TIME, "10:30"));
    EXPECT_TRUE(rig.channel.complete(true));
    EXPECT_TRUE(rig.schedule.isDirty());
}

static void test_remote_update_discards_unsaved_edit()
{
    Rig rig;
    EXPECT_TRUE(rig.schedule.setField(ScheduleField::FEED_TIME, "05:00"));

    Schedule remote = schedule_defaults();
    remote.set(ScheduleField::LED_ON, hhmm("05:45"));
    rig.schedule.onRemoteUpdate(remote);

    EXPECT_TRUE(rig.schedule.draft() == remote);
    EXPECT_TRUE(rig.schedule.draft().get(ScheduleField::FEED_TIME) == hhmm("07:00"));
    EXPECT_FALSE(rig.schedule.isDirty());
}

int main()
{
    logger_begin(true, false);
    test_draft_starts_at_defaults();
    test_set_field_validates();
    test_led_on_after_led_off_is_allowed();
    test_save_writes_whole_record();
    test_failed_save_logs_error_and_stays_dirty();
    test_edit_during_save_keeps_draft_dirty();
    test_remote_update_discards_unsaved_edit();
    return finishTests("schedule_manager");
}
