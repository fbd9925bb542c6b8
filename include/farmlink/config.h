// Compile-time defaults for farmlink.
// Contract: values must be sane/positive; override any of them with -D at build time.
#pragma once

// — Logging —
#ifndef FARMLINK_CFG_LOG_COLOR
#define FARMLINK_CFG_LOG_COLOR 1 // ANSI colorized stderr logs (0=off, 1=on), runtime config can turn it off
#endif
#ifndef FARMLINK_CFG_LOG_HIGH_FREQ_DEFAULT
#define FARMLINK_CFG_LOG_HIGH_FREQ_DEFAULT 1 // throttled DEBUG/trace logs at startup (0=off, 1=on)
#endif

// — Event log —
#ifndef FARMLINK_CFG_EVENT_LOG_CAPACITY
#define FARMLINK_CFG_EVENT_LOG_CAPACITY 50u
#endif
#ifndef FARMLINK_CFG_NOTIFY_TITLE
#define FARMLINK_CFG_NOTIFY_TITLE "QuailSmart Update"
#endif

// — Momentary actuators (pulse length before the automatic revert) —
#ifndef FARMLINK_CFG_FEED_PULSE_MS
#define FARMLINK_CFG_FEED_PULSE_MS 5000u
#endif
#ifndef FARMLINK_CFG_STEPPER_PULSE_MS
#define FARMLINK_CFG_STEPPER_PULSE_MS 30000u
#endif

// — Schedule defaults (used until the store delivers a record) —
#ifndef FARMLINK_CFG_DEFAULT_EGG_TIME
#define FARMLINK_CFG_DEFAULT_EGG_TIME "08:00"
#endif
#ifndef FARMLINK_CFG_DEFAULT_STOOL_TIME
#define FARMLINK_CFG_DEFAULT_STOOL_TIME "09:00"
#endif
#ifndef FARMLINK_CFG_DEFAULT_FEED_TIME
#define FARMLINK_CFG_DEFAULT_FEED_TIME "07:00"
#endif
#ifndef FARMLINK_CFG_DEFAULT_LED_ON
#define FARMLINK_CFG_DEFAULT_LED_ON "06:00"
#endif
#ifndef FARMLINK_CFG_DEFAULT_LED_OFF
#define FARMLINK_CFG_DEFAULT_LED_OFF "18:00"
#endif

// — Sensor status thresholds —
#ifndef FARMLINK_CFG_FEED_LOW_BELOW
#define FARMLINK_CFG_FEED_LOW_BELOW 20
#endif
#ifndef FARMLINK_CFG_FEED_MID_BELOW
#define FARMLINK_CFG_FEED_MID_BELOW 60
#endif
#ifndef FARMLINK_CFG_AMMONIA_HIGH_ABOVE
#define FARMLINK_CFG_AMMONIA_HIGH_ABOVE 20.0f
#endif

// — In-process store —
#ifndef FARMLINK_CFG_STORE_CAPACITY
#define FARMLINK_CFG_STORE_CAPACITY 4096u // ArduinoJson pool bytes for the whole tree
#endif

// — Main loop —
#ifndef FARMLINK_CFG_LOOP_SLEEP_MS
#define FARMLINK_CFG_LOOP_SLEEP_MS 10u
#endif
#ifndef FARMLINK_CFG_CONSOLE_BUF
#define FARMLINK_CFG_CONSOLE_BUF 128u // bytes for one console command line
#endif
#ifndef FARMLINK_CFG_CONFIG_PATH
#define FARMLINK_CFG_CONFIG_PATH "farmlink.json"
#endif

// — Simulation peer —
#ifndef FARMLINK_CFG_SIM_SENSOR_MS
#define FARMLINK_CFG_SIM_SENSOR_MS 2000u
#endif
#ifndef FARMLINK_CFG_AUTH_RETRY_MS
#define FARMLINK_CFG_AUTH_RETRY_MS 3000u
#endif
