#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "cas/foundation/auth_error.hpp"
#include "cas/foundation/auth_logger.hpp"
#include "cas/foundation/error_code.hpp"

#include "../../support/mock_logger.hpp"

using namespace cas::foundation;
using kcenon::common::interfaces::log_level;

class AuthLoggerTest : public cas::test::MockLoggerTest {};

// ---------------------------------------------------------------------------
// ErrorCode / AuthError
// ---------------------------------------------------------------------------

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::StorageConflict), "Storage");
    EXPECT_EQ(errorSubsystem(ErrorCode::DecryptionFailed), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnsupportedAlgorithm), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::ClientNotFound), "Client");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidToken), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, AuthErrorCarriesCodeAndMessage) {
    AuthError err(ErrorCode::KeyMaterialInvalid, "bad key");
    EXPECT_EQ(err.code(), ErrorCode::KeyMaterialInvalid);
    EXPECT_EQ(err.message(), "bad key");
    EXPECT_EQ(err.subsystem(), "Crypto");
    EXPECT_FALSE(err.isSuccess());
}

TEST(ErrorCodeTest, DefaultAuthErrorIsUnknown) {
    AuthError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Token), "Token");
    EXPECT_EQ(logCategoryName(LogCategory::Crypto), "Crypto");
    EXPECT_EQ(logCategoryName(LogCategory::Client), "Client");
    EXPECT_EQ(logCategoryName(LogCategory::Storage), "Storage");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST(AuthLoggerBasicTest, DefaultCategoryLevels) {
    AuthLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Token), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Crypto), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Client), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Storage), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(AuthLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    AuthLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Token));

    logger.setCategoryLevel(LogCategory::Token, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Token));

    logger.setCategoryLevel(LogCategory::Token, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Token));
}

TEST(AuthLoggerBasicTest, InvalidCategoryReturnsOff) {
    AuthLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(AuthLoggerTest, LogFormatsMessageWithCategory) {
    AuthLogger logger;
    logger.log(LogLevel::Info, LogCategory::Crypto, "Loaded RS256 signing key");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Crypto] Loaded RS256 signing key");
}

TEST_F(AuthLoggerTest, LogFiltersMessagesBelowLevel) {
    AuthLogger logger;
    logger.log(LogLevel::Info, LogCategory::Storage, "filtered");
    logger.log(LogLevel::Debug, LogCategory::Core, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(AuthLoggerTest, LogWithContextRendersFieldsInStableOrder) {
    AuthLogger logger;
    LogContext ctx;
    ctx.userId = "u-1";
    ctx.tenantId = "t-1";
    ctx.clientId = "spa";
    ctx.recordId = "r-9";
    ctx.extra["reason"] = "expired";
    ctx.extra["attempt"] = "2";

    logger.logWithContext(LogLevel::Warning, LogCategory::Token, "Refresh token rejected", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message,
              "[Token] Refresh token rejected {user_id=u-1, tenant_id=t-1, client_id=spa, "
              "record_id=r-9, attempt=2, reason=expired}");
}

TEST_F(AuthLoggerTest, LogWithEmptyContextOmitsBraces) {
    AuthLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(AuthLoggerTest, ConcurrentLoggingKeepsEveryLine) {
    AuthLogger logger;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Client, "line");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mockLogger_->records().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_F(AuthLoggerTest, FlushDelegatesToLogger) {
    AuthLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// CAS_LOG macros
// ---------------------------------------------------------------------------

TEST_F(AuthLoggerTest, MacroLogsThroughSingleton) {
    AuthLogger::instance().setCategoryLevel(LogCategory::Config, LogLevel::Debug);
    CAS_LOG_DEBUG(LogCategory::Config, "macro test");
    AuthLogger::instance().setCategoryLevel(LogCategory::Config, LogLevel::Info);

    EXPECT_EQ(mockLogger_->countContaining("[Config] macro test"), 1u);
}

TEST_F(AuthLoggerTest, ContextMacroLogsThroughSingleton) {
    LogContext ctx;
    ctx.clientId = "console";
    CAS_LOG_CTX(LogLevel::Warning, LogCategory::Client, "client disabled", ctx);

    EXPECT_EQ(mockLogger_->countContaining("[Client] client disabled {client_id=console}"), 1u);
}
