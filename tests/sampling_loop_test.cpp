#include "test_harness.hpp"
#include <main/tasks/sampling_loop.hpp>
#include <main/utils/logger.hpp>
#include <string>
#include <vector>

namespace {
    class FakeSensors : public PlantSensors {
    public:
        float lux = 500.0f;
        uint16_t moisture_raw = 1000;
        float temp_c = 22.0f;
        bool lux_ok = true;
        bool moisture_ok = true;
        bool temp_ok = true;
        int reads = 0;

        bool readLux(float& out_lux) override {
            ++reads;
            out_lux = lux;
            return lux_ok;
        }
        bool readMoistureRaw(uint16_t& out_raw) override {
            ++reads;
            out_raw = moisture_raw;
            return moisture_ok;
        }
        bool readTemperatureC(float& out_celsius) override {
            ++reads;
            out_celsius = temp_c;
            return temp_ok;
        }
    };

    struct Publish {
        std::string feed;
        float value;
    };

    class FakeSession : public TelemetrySession {
    public:
        std::vector<Publish> published;
        int publish_attempts = 0;
        int fail_on_attempt = 0; // 1-based; 0 never fails
        int reset_count = 0;
        int service_count = 0;
        bool reset_ok = true;

        bool connect() override { return true; }
        bool publish(const char* feed, float value) override {
            ++publish_attempts;
            if (publish_attempts == fail_on_attempt) {
                return false;
            }
            published.push_back(Publish{ feed, value });
            return true;
        }
        bool reset() override {
            ++reset_count;
            return reset_ok;
        }
        void service() override { ++service_count; }
    };

    class FakeClock : public MonotonicClock {
    public:
        uint64_t now = 1000;
        uint64_t nowMs() const override { return now; }
    };

    static const SamplingLoop::Settings kHaltSettings{ 60000, SensorFailurePolicy::HALT };
    static const SamplingLoop::Settings kSkipSettings{ 60000, SensorFailurePolicy::SKIP_CYCLE };
}

static void test_first_poll_publishes_converted_values()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    EXPECT_FALSE(loop.hasCompletedCycle());
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    EXPECT_EQ_INT(session.published.size(), 3);
    if (session.published.size() == 3)
    {
        EXPECT_STREQ(session.published[0].feed.c_str(), "sun");
        EXPECT_NEAR(session.published[0].value, 46.45, 0.01);
        EXPECT_STREQ(session.published[1].feed.c_str(), "spruce.moisture");
        EXPECT_NEAR(session.published[1].value, 50.0, 1e-5);
        EXPECT_STREQ(session.published[2].feed.c_str(), "spruce.temperature");
        EXPECT_NEAR(session.published[2].value, 71.6, 1e-4);
    }
    EXPECT_TRUE(loop.hasCompletedCycle());
    EXPECT_EQ_INT(loop.lastUpdatedMs(), 1000);
    EXPECT_NEAR(loop.lastMeasurement().temperature_f, 71.6, 1e-4);
    EXPECT_TRUE(loop.state() == SamplingLoop::State::IDLE);
}

static void test_stays_idle_before_interval()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    const int reads_after_first = sensors.reads;

    clock.now += 59000;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::IDLE);
    EXPECT_EQ_INT(session.published.size(), 3);
    EXPECT_EQ_INT(sensors.reads, reads_after_first);
}

static void test_cycles_when_interval_elapses_exactly()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    clock.now += 60000;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    EXPECT_EQ_INT(session.published.size(), 6);
    EXPECT_EQ_INT(loop.lastUpdatedMs(), 61000);
}

static void test_publish_failure_resets_once_and_keeps_timestamp()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    clock.now += 60000;

    // Second channel of the second cycle fails
    session.fail_on_attempt = 5;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISH_FAILED);
    EXPECT_EQ_INT(session.reset_count, 1);
    EXPECT_EQ_INT(session.published.size(), 4);
    EXPECT_STREQ(session.published.back().feed.c_str(), "sun");
    EXPECT_EQ_INT(loop.lastUpdatedMs(), 1000);
    EXPECT_TRUE(loop.state() == SamplingLoop::State::IDLE);

    // Timestamp was not advanced, so the very next poll retries the cycle
    clock.now += 100;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    EXPECT_EQ_INT(session.reset_count, 1);
    EXPECT_EQ_INT(session.published.size(), 7);
    EXPECT_EQ_INT(loop.lastUpdatedMs(), 61100);
}

static void test_publish_failure_with_failed_reset_still_abandons_cycle()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    session.fail_on_attempt = 1;
    session.reset_ok = false;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISH_FAILED);
    EXPECT_EQ_INT(session.reset_count, 1);
    EXPECT_EQ_INT(session.published.size(), 0);
    EXPECT_FALSE(loop.hasCompletedCycle());
}

static void test_immediate_repoll_after_success_is_idle()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::IDLE);
    }
    clock.now += 59999;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::IDLE);
    clock.now += 1;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
}

static void test_service_runs_on_every_poll()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    (void)loop.poll();
    (void)loop.poll();
    (void)loop.poll();
    EXPECT_EQ_INT(session.service_count, 3);
}

static void test_sensor_failure_halts_without_publishing()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kHaltSettings);

    sensors.moisture_ok = false;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::SENSOR_FATAL);
    EXPECT_EQ_INT(session.publish_attempts, 0);
    EXPECT_EQ_INT(session.reset_count, 0);
    EXPECT_FALSE(loop.hasCompletedCycle());
    // Temperature is never read once moisture fails
    EXPECT_EQ_INT(sensors.reads, 2);
}

static void test_sensor_failure_skip_waits_full_interval()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kSkipSettings);

    sensors.lux_ok = false;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::SENSOR_SKIPPED);
    EXPECT_EQ_INT(session.publish_attempts, 0);
    EXPECT_EQ_INT(loop.lastUpdatedMs(), 1000);

    sensors.lux_ok = true;
    clock.now += 30000;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::IDLE);
    clock.now += 30000;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::PUBLISHED);
    EXPECT_EQ_INT(session.published.size(), 3);
}

static void test_temperature_failure_skip()
{
    FakeSensors sensors;
    FakeSession session;
    FakeClock clock;
    SamplingLoop loop(sensors, session, clock, kSkipSettings);

    sensors.temp_ok = false;
    EXPECT_TRUE(loop.poll() == SamplingLoop::PollResult::SENSOR_SKIPPED);
    EXPECT_EQ_INT(sensors.reads, 3);
    EXPECT_EQ_INT(session.publish_attempts, 0);
}

int main()
{
    // Quiet: no sink installed
    Logger::setSink(nullptr);

    test_first_poll_publishes_converted_values();
    test_stays_idle_before_interval();
    test_cycles_when_interval_elapses_exactly();
    test_publish_failure_resets_once_and_keeps_timestamp();
    test_publish_failure_with_failed_reset_still_abandons_cycle();
    test_immediate_repoll_after_success_is_idle();
    test_service_runs_on_every_poll();
    test_sensor_failure_halts_without_publishing();
    test_sensor_failure_skip_waits_full_interval();
    test_temperature_failure_skip();
    return test_result("sampling_loop_test");
}
