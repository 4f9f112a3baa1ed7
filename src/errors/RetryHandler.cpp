#include "errors/RetryHandler.hpp"

#include <thread>

namespace errors {

std::string RetryContext::key() const {
    return (template_id.empty() ? std::string("unknown") : template_id) + "-" +
           (user_id.empty() ? std::string("anonymous") : user_id);
}

int RetryAttemptStore::attempts(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = attempts_.find(key);
    return it == attempts_.end() ? 0 : it->second;
}

void RetryAttemptStore::set(const std::string& key, int attempts) {
    std::lock_guard<std::mutex> lock(mu_);
    attempts_[key] = attempts;
}

void RetryAttemptStore::clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    attempts_.erase(key);
}

void RetryAttemptStore::clear_all() {
    std::lock_guard<std::mutex> lock(mu_);
    attempts_.clear();
}

size_t RetryAttemptStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return attempts_.size();
}

nlohmann::json RetryAttemptStore::to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    nlohmann::json details = nlohmann::json::object();
    for (const auto& kv : attempts_) details[kv.first] = kv.second;
    return {{"activeRetries", attempts_.size()}, {"retryDetails", details}};
}

void RetryHandler::default_sleeper(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

RetryHandler::RetryHandler(RetryAttemptStore& store, RetryConfig config, Sleeper sleeper)
    : store_(store), config_(config), sleeper_(std::move(sleeper)) {}

} // namespace errors
