#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>

#include "errors/TemplateError.hpp"
#include "nlohmann/json.hpp"

namespace errors {

struct RetryContext {
    std::string template_id;
    std::string user_id;

    // "<templateId>-<userId>", with unknown/anonymous for missing parts.
    std::string key() const;
};

struct RetryConfig {
    int max_retries = 3;
    bool verbose = false;
};

// Attempt counters shared by every handler that is given the same store.
class RetryAttemptStore {
public:
    int attempts(const std::string& key) const;
    void set(const std::string& key, int attempts);
    void clear(const std::string& key);
    void clear_all();
    size_t size() const;

    nlohmann::json to_json() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, int> attempts_;
};

class RetryHandler {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static void default_sleeper(std::chrono::milliseconds d);

    explicit RetryHandler(RetryAttemptStore& store,
                          RetryConfig config = {},
                          Sleeper sleeper = &RetryHandler::default_sleeper);

    void set_max_retries(int n) { config_.max_retries = n; }
    int max_retries() const { return config_.max_retries; }

    // Runs `op`; a TemplateEngineError it throws is handed to handle_error.
    template <typename Op>
    auto run(Op&& op, const RetryContext& ctx) -> decltype(op()) {
        try {
            return op();
        } catch (const TemplateEngineError& e) {
            return handle_error(e, op, ctx);
        }
    }

    // Retries `op` while the error is retryable and the key has attempts left.
    // Rethrows the last error once retries are exhausted or not allowed.
    template <typename Op>
    auto handle_error(const TemplateEngineError& error, Op&& op, const RetryContext& ctx) -> decltype(op()) {
        const std::string key = ctx.key();
        const int attempts = store_.attempts(key);

        if (error.retryable() && attempts < config_.max_retries) {
            const auto delay = error.retry_delay();
            if (config_.verbose) {
                std::cerr << "RetryHandler: " << error.code() << " on " << key
                          << ", retrying in " << delay.count() << "ms (attempt "
                          << (attempts + 1) << "/" << config_.max_retries << ")\n";
            }

            store_.set(key, attempts + 1);
            sleeper_(delay);

            TemplateEngineError next = error;
            try {
                if constexpr (std::is_void_v<decltype(op())>) {
                    op();
                    store_.clear(key);
                    return;
                } else {
                    auto result = op();
                    store_.clear(key);
                    return result;
                }
            } catch (const std::exception& e) {
                next = from_exception(e, ctx.template_id, ctx.user_id);
            }
            return handle_error(next, op, ctx);
        }

        store_.clear(key);
        throw error;
    }

private:
    RetryAttemptStore& store_;
    RetryConfig config_;
    Sleeper sleeper_;
};

} // namespace errors
