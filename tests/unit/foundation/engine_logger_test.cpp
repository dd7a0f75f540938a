#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "elemcore/foundation/engine_logger.hpp"
#include "elemcore/foundation/error_code.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace elemcore::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class EngineLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    bool anyRecordContains(std::string_view needle) const {
        for (const auto& r : mockLogger_->records()) {
            if (r.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// --- Category / level names ---

TEST(LogCategoryTest, CategoryNames) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Affinity), "Affinity");
    EXPECT_EQ(logCategoryName(LogCategory::Composition), "Composition");
    EXPECT_EQ(logCategoryName(LogCategory::Resistance), "Resistance");
    EXPECT_EQ(logCategoryName(LogCategory::Modifier), "Modifier");
    EXPECT_EQ(logCategoryName(LogCategory::Attack), "Attack");
    EXPECT_EQ(logCategoryName(LogCategory::Resolution), "Resolution");
    EXPECT_EQ(logCategoryName(LogCategory::World), "World");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(99)), "Unknown");
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// --- Level filtering ---

TEST(EngineLoggerBasicTest, DefaultCategoryLevels) {
    EngineLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Affinity), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Composition), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Resistance), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Modifier), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Attack), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Resolution), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::World), LogLevel::Info);
}

TEST(EngineLoggerBasicTest, IsEnabledRespectsLevels) {
    EngineLogger logger;
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Modifier));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::World));

    logger.setCategoryLevel(LogCategory::World, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::World));
}

TEST(EngineLoggerBasicTest, InvalidCategoryIsOff) {
    EngineLogger logger;
    auto bogus = static_cast<LogCategory>(200);
    EXPECT_EQ(logger.getCategoryLevel(bogus), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, bogus));
}

// --- Formatting ---

TEST_F(EngineLoggerTest, LogFormatsMessageWithCategory) {
    EngineLogger logger;
    logger.log(LogLevel::Info, LogCategory::Affinity, "Loaded 12 affinities");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Affinity] Loaded 12 affinities");
}

TEST_F(EngineLoggerTest, LogFiltersMessagesBelowLevel) {
    EngineLogger logger;
    logger.log(LogLevel::Debug, LogCategory::World, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(EngineLoggerTest, LogWithContextIncludesFields) {
    EngineLogger logger;

    LogContext ctx;
    ctx.entityId = EntityId(7);
    ctx.sourceId = "env_volcano";
    ctx.modifierId = "heat_wave";
    ctx.extra["stacks"] = "2";

    logger.logWithContext(LogLevel::Debug, LogCategory::Modifier, "Modifier applied", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(msg.rfind("[Modifier] Modifier applied {", 0), 0u);
    EXPECT_NE(msg.find("entity_id=7"), std::string::npos);
    EXPECT_NE(msg.find("source_id=env_volcano"), std::string::npos);
    EXPECT_NE(msg.find("modifier_id=heat_wave"), std::string::npos);
    EXPECT_NE(msg.find("stacks=2"), std::string::npos);
    EXPECT_EQ(msg.back(), '}');
}

TEST_F(EngineLoggerTest, LogWithEmptyContextOmitsBraces) {
    EngineLogger logger;
    LogContext ctx;
    ctx.entityId = EntityId(); // invalid ids are skipped
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(EngineLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto named = std::make_shared<MockLogger>();
    auto registered =
        GlobalLoggerRegistry::instance().register_logger("elemcore.Resolution", named);
    ASSERT_FALSE(registered.is_err());

    EngineLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Resolution, "resolved");
    logger.log(LogLevel::Info, LogCategory::Core, "core");

    ASSERT_EQ(named->records().size(), 1u);
    EXPECT_EQ(named->records()[0].message, "[Resolution] resolved");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] core");
}

TEST_F(EngineLoggerTest, FlushDelegatesToLogger) {
    EngineLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// --- Macros ---

TEST(EngineLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&EngineLogger::instance(), &EngineLogger::instance());
}

TEST_F(EngineLoggerTest, MacroLogsWhenEnabled) {
    EngineLogger::instance().setCategoryLevel(LogCategory::Attack, LogLevel::Debug);
    ELEMCORE_LOG_DEBUG(LogCategory::Attack, "macro test");
    EXPECT_TRUE(anyRecordContains("macro test"));
    EngineLogger::instance().setCategoryLevel(LogCategory::Attack, LogLevel::Info);
}

TEST_F(EngineLoggerTest, MacroSkipsWhenDisabled) {
    EngineLogger::instance().setCategoryLevel(LogCategory::Attack, LogLevel::Error);
    mockLogger_->reset();

    ELEMCORE_LOG_WARN(LogCategory::Attack, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    EngineLogger::instance().setCategoryLevel(LogCategory::Attack, LogLevel::Info);
}
