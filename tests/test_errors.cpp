#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "errors/RetryHandler.hpp"
#include "errors/TemplateError.hpp"

namespace errors {
namespace test {

class RetryHandlerTest : public ::testing::Test {
protected:
    RetryHandler make_handler(int max_retries = 3) {
        RetryConfig cfg;
        cfg.max_retries = max_retries;
        return RetryHandler(store_, cfg, [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    RetryAttemptStore store_;
    std::vector<std::chrono::milliseconds> sleeps_;
    const RetryContext ctx_{"tmpl-1", "user-1"};
};

TEST(TemplateErrorTest, CodesAndRetryPolicy) {
    EXPECT_STREQ(error_code(ErrorType::RateLimitExceeded), "RATE_LIMIT_EXCEEDED");
    EXPECT_TRUE(is_retryable(ErrorType::NetworkError));
    EXPECT_TRUE(is_retryable(ErrorType::RenderFailed));
    EXPECT_FALSE(is_retryable(ErrorType::ValidationFailed));
    EXPECT_FALSE(is_retryable(ErrorType::TemplateNotFound));

    EXPECT_EQ(retry_delay(ErrorType::RateLimitExceeded).count(), 5000);
    EXPECT_EQ(retry_delay(ErrorType::NetworkError).count(), 2000);
    EXPECT_EQ(retry_delay(ErrorType::ParseError).count(), 0);
}

TEST(TemplateErrorTest, ToJson) {
    const TemplateEngineError e = rate_limit_exceeded(10, 60000, "tmpl-1", "user-1");
    const nlohmann::json j = e.to_json();

    EXPECT_EQ(j.at("code"), "RATE_LIMIT_EXCEEDED");
    EXPECT_EQ(j.at("message"), "Rate limit exceeded: 10 requests per 60000ms");
    EXPECT_EQ(j.at("userMessage"), "Too many requests. Please wait a moment and try again.");
    EXPECT_EQ(j.at("retryable"), true);
    EXPECT_EQ(j.at("templateId"), "tmpl-1");
    EXPECT_EQ(j.at("details").at("limit"), 10);
    EXPECT_FALSE(j.at("timestamp").get<std::string>().empty());

    const nlohmann::json bare = validation_error("bad input").to_json();
    EXPECT_FALSE(bare.contains("templateId"));
    EXPECT_FALSE(bare.contains("details"));
}

TEST(TemplateErrorTest, FromExceptionClassifiesMessages) {
    EXPECT_EQ(from_exception(std::runtime_error("template not found")).type(), ErrorType::TemplateNotFound);
    EXPECT_EQ(from_exception(std::runtime_error("Unauthorized")).type(), ErrorType::PermissionDenied);
    EXPECT_EQ(from_exception(std::runtime_error("fetch timed out")).type(), ErrorType::NetworkError);
    EXPECT_EQ(from_exception(std::runtime_error("bad JSON")).type(), ErrorType::ParseError);
    EXPECT_EQ(from_exception(std::runtime_error("validation broke")).type(), ErrorType::ValidationFailed);
    EXPECT_EQ(from_exception(std::runtime_error("export blew up")).type(), ErrorType::ExportFailed);

    const TemplateEngineError other = from_exception(std::runtime_error("disk on fire"), "t1");
    EXPECT_EQ(other.type(), ErrorType::RenderFailed);
    EXPECT_EQ(other.details().at("originalError"), "disk on fire");

    const TemplateEngineError original = storage_error("save", "quota", "t1");
    EXPECT_EQ(from_exception(original).type(), ErrorType::StorageError);
}

TEST_F(RetryHandlerTest, RetriesNetworkErrorsUntilSuccess) {
    RetryHandler handler = make_handler();
    int calls = 0;

    const int result = handler.run([&] {
        ++calls;
        if (calls <= 2) throw network_error("fetch", "connection reset");
        return 42;
    }, ctx_);

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 2000);
    EXPECT_EQ(store_.attempts("tmpl-1-user-1"), 0);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(RetryHandlerTest, ValidationErrorsAreNotRetried) {
    RetryHandler handler = make_handler();
    int calls = 0;

    EXPECT_THROW(handler.run([&] {
        ++calls;
        throw validation_failed("tmpl-1", nlohmann::json::array());
    }, ctx_), TemplateEngineError);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryHandlerTest, GivesUpAfterMaxRetries) {
    RetryHandler handler = make_handler(2);
    int calls = 0;

    try {
        handler.run([&]() -> int {
            ++calls;
            throw storage_error("save", "disk full");
        }, ctx_);
        FAIL() << "expected the last error to be rethrown";
    } catch (const TemplateEngineError& e) {
        EXPECT_EQ(e.type(), ErrorType::StorageError);
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(RetryHandlerTest, ForeignExceptionsAreClassifiedOnRetry) {
    RetryHandler handler = make_handler();
    int calls = 0;

    handler.run([&] {
        ++calls;
        if (calls == 1) throw rendering_failed("tmpl-1", "layout engine crashed");
        if (calls == 2) throw std::runtime_error("network unreachable");
    }, ctx_);

    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 1000);
    EXPECT_EQ(sleeps_[1].count(), 2000);
}

TEST_F(RetryHandlerTest, ContextKeyDefaults) {
    EXPECT_EQ(RetryContext{}.key(), "unknown-anonymous");
    EXPECT_EQ(ctx_.key(), "tmpl-1-user-1");

    store_.set("a", 2);
    const nlohmann::json j = store_.to_json();
    EXPECT_EQ(j.at("activeRetries"), 1);
    EXPECT_EQ(j.at("retryDetails").at("a"), 2);
    store_.clear_all();
    EXPECT_EQ(store_.size(), 0u);
}

} // namespace test
} // namespace errors
