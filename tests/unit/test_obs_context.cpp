#include <gtest/gtest.h>
#include "obs/context.h"
#include "obs/logging.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

namespace {

using namespace promptgrid::obs;

class CapturedLog {
public:
    CapturedLog() : old_default_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss_);
        auto logger = std::make_shared<spdlog::logger>("test_context", sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    ~CapturedLog() { spdlog::set_default_logger(old_default_); }

    auto Json() -> nlohmann::json { return nlohmann::json::parse(oss_.str()); }

private:
    std::ostringstream oss_;
    std::shared_ptr<spdlog::logger> old_default_;
};

TEST(ObsContextTest, LogEventIncludesContext) {
    CapturedLog log;
    {
        Context ctx;
        ctx.worker_id = "worker-1";
        ctx.cell_id = "42";
        ScopedContext scope(ctx);

        LogEvent(LogLevel::Info, "test_event", "test_component", {{"extra", "val"}});
    }

    auto j = log.Json();
    EXPECT_EQ(j["event"], "test_event");
    EXPECT_EQ(j["component"], "test_component");
    EXPECT_EQ(j["level"], "info");
    EXPECT_EQ(j["service"], "promptgrid");
    EXPECT_EQ(j["worker_id"], "worker-1");
    EXPECT_EQ(j["cell_id"], "42");
    EXPECT_EQ(j["extra"], "val");
    EXPECT_FALSE(j.contains("model_id"));
}

TEST(ObsContextTest, ExplicitFieldsWinOverContext) {
    CapturedLog log;
    {
        Context ctx;
        ctx.cell_id = "1";
        ScopedContext scope(ctx);
        LogEvent(LogLevel::Warn, "cell_reopened", "watchdog", {{"cell_id", 9}});
    }
    auto j = log.Json();
    EXPECT_EQ(j["level"], "warning");
    EXPECT_EQ(j["cell_id"], 9);
}

TEST(ObsContextTest, ScopedContextNesting) {
    Context outer;
    outer.worker_id = "outer";

    {
        ScopedContext s1(outer);
        EXPECT_EQ(GetContext().worker_id, "outer");

        Context inner;
        inner.worker_id = "inner";
        {
            ScopedContext s2(inner);
            EXPECT_EQ(GetContext().worker_id, "inner");
        }

        EXPECT_EQ(GetContext().worker_id, "outer");
    }

    EXPECT_FALSE(HasContext());
}

TEST(ObsContextTest, ScopedTimerLogsDuration) {
    CapturedLog log;
    {
        ScopedTimer timer("batch_processed", "worker", {{"batch_size", 3}});
    }
    auto j = log.Json();
    EXPECT_EQ(j["event"], "batch_processed");
    EXPECT_EQ(j["batch_size"], 3);
    EXPECT_TRUE(j.contains("duration_ms"));
}

TEST(ObsContextTest, EventsBelowLoggerLevelAreDropped) {
    CapturedLog log;
    spdlog::default_logger()->set_level(spdlog::level::warn);
    LogEvent(LogLevel::Info, "cell_claimed", "worker");
    LogEvent(LogLevel::Error, "release_failed", "worker");
    auto j = log.Json();
    EXPECT_EQ(j["event"], "release_failed");
    EXPECT_EQ(j["level"], "error");
}

} // namespace
