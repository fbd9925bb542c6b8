#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <string>

#include "farmlink/app_config.h"
#include "farmlink/logger.h"
#include "test_support.h"

using namespace farmlink;

static ConfigError parse(const char *json, AppConfig &cfg)
{
    return appConfig_parse(json, strlen(json), cfg);
}

static ConfigError parse(const std::string &json, AppConfig &cfg)
{
    return appConfig_parse(json.data(), json.size(), cfg);
}

static void test_defaults()
{
    const AppConfig cfg;
    EXPECT_TRUE(cfg.simulationEnabled);
    EXPECT_TRUE(cfg.simulationMode == SimMode::NORMAL);
    EXPECT_FALSE(cfg.authExistingSession);
    EXPECT_EQ_INT(cfg.authFailAttempts, 0);
    EXPECT_EQ_INT(cfg.authRetryMs, FARMLINK_CFG_AUTH_RETRY_MS);
    EXPECT_EQ_INT(cfg.simulationIntervalMs, FARMLINK_CFG_SIM_SENSOR_MS);
}

static void test_full_parse()
{
    AppConfig cfg;
    const char *json = "{\"log\":{\"color\":false,\"high_freq\":true},"
                       "\"notifications\":{\"enabled\":false,\"title\":\"Coop\"},"
                       "\"auth\":{\"existing_session\":true,\"fail_attempts\":2,\"retry_ms\":500},"
                       "\"simulation\":{\"enabled\":false,\"mode\":\"Malformed\",\"sensor_interval_ms\":250}}";
    EXPECT_TRUE(parse(json, cfg) == ConfigError::OK);
    EXPECT_FALSE(cfg.logColor);
    EXPECT_TRUE(cfg.logHighFreq);
    EXPECT_FALSE(cfg.notificationsEnabled);
    EXPECT_EQ_STR(cfg.notifyTitle, "Coop");
    EXPECT_TRUE(cfg.authExistingSession);
    EXPECT_EQ_INT(cfg.authFailAttempts, 2);
    EXPECT_EQ_INT(cfg.authRetryMs, 500);
    EXPECT_FALSE(cfg.simulationEnabled);
    EXPECT_TRUE(cfg.simulationMode == SimMode::MALFORMED);
    EXPECT_EQ_INT(cfg.simulationIntervalMs, 250);
}

static void test_partial_parse_keeps_other_values()
{
    AppConfig cfg;
    cfg.notifyTitle = "Barn";
    EXPECT_TRUE(parse("{\"auth\":{\"fail_attempts\":1}}", cfg) == ConfigError::OK);
    EXPECT_EQ_INT(cfg.authFailAttempts, 1);
    EXPECT_EQ_STR(cfg.notifyTitle, "Barn");
    EXPECT_TRUE(parse("{}", cfg) == ConfigError::OK);
    EXPECT_EQ_INT(cfg.authFailAttempts, 1);
}

static void test_errors_leave_config_untouched()
{
    AppConfig cfg;
    cfg.authFailAttempts = 4;

    EXPECT_TRUE(parse("{\"auth\":{\"fail_attempts\":7,\"existing_session\":\"yes\"}}", cfg) == ConfigError::WRONG_TYPE);
    EXPECT_TRUE(parse("{\"auth\":{\"fail_attempts\":300}}", cfg) == ConfigError::OUT_OF_RANGE);
    EXPECT_TRUE(parse("{\"simulation\":{\"sensor_interval_ms\":10}}", cfg) == ConfigError::OUT_OF_RANGE);
    EXPECT_TRUE(parse("{\"simulation\":{\"mode\":\"chaos\"}}", cfg) == ConfigError::OUT_OF_RANGE);
    EXPECT_TRUE(parse("{\"simulation\":{\"mode\":3}}", cfg) == ConfigError::WRONG_TYPE);
    EXPECT_TRUE(parse("{\"log\":true}", cfg) == ConfigError::WRONG_TYPE);
    EXPECT_TRUE(parse("{\"log\":", cfg) == ConfigError::INVALID_JSON);
    EXPECT_TRUE(parse("[1]", cfg) == ConfigError::NOT_OBJECT);

    EXPECT_EQ_INT(cfg.authFailAttempts, 4);
    EXPECT_FALSE(cfg.authExistingSession);
    EXPECT_TRUE(cfg.simulationMode == SimMode::NORMAL);
}

static void test_late_error_discards_earlier_sections()
{
    AppConfig cfg;
    const bool colorBefore = cfg.logColor;
    EXPECT_TRUE(parse("{\"log\":{\"color\":" + std::string(colorBefore ? "false" : "true") +
                          "},\"notifications\":{\"title\":5}}",
                      cfg) == ConfigError::WRONG_TYPE);
    EXPECT_TRUE(cfg.logColor == colorBefore);
    EXPECT_TRUE(parse("{\"auth\":{\"retry_ms\":10},\"simulation\":{\"enabled\":1}}", cfg) ==
                ConfigError::WRONG_TYPE);
    EXPECT_EQ_INT(cfg.authRetryMs, FARMLINK_CFG_AUTH_RETRY_MS);
}

static void test_sim_mode_names()
{
    SimMode mode = SimMode::NORMAL;
    EXPECT_TRUE(simMode_fromString("SILENT", mode));
    EXPECT_TRUE(mode == SimMode::SILENT);
    EXPECT_FALSE(simMode_fromString("", mode));
    EXPECT_FALSE(simMode_fromString(nullptr, mode));
    EXPECT_TRUE(mode == SimMode::SILENT);
    EXPECT_EQ_STR(simMode_name(SimMode::MALFORMED), "malformed");
    EXPECT_EQ_STR(configErrorName(ConfigError::NOT_FOUND), "not_found");
}

static void test_load_from_file()
{
    AppConfig cfg;
    EXPECT_TRUE(appConfig_load("/nonexistent/farmlink.json", cfg) == ConfigError::NOT_FOUND);

    char path[] = "/tmp/farmlink_config_XXXXXX";
    const int fd = mkstemp(path);
    EXPECT_TRUE(fd >= 0);
    if (fd < 0)
    {
        return;
    }
    const char *json = "{\"auth\":{\"existing_session\":true}}";
    const ssize_t written = write(fd, json, strlen(json));
    close(fd);
    EXPECT_EQ_INT(written, (long long)strlen(json));

    EXPECT_TRUE(appConfig_load(path, cfg) == ConfigError::OK);
    EXPECT_TRUE(cfg.authExistingSession);
    unlink(path);
}

int main()
{
    logger_begin(true, false);
    test_defaults();
    test_full_parse();
    test_partial_parse_keeps_other_values();
    test_errors_leave_config_untouched();
    test_late_error_discards_earlier_sections();
    test_sim_mode_names();
    test_load_from_file();
    return finishTests("app_config");
}
