#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace errors {

enum class ErrorType {
    TemplateNotFound,
    RenderFailed,
    ExportFailed,
    CustomizationInvalid,
    ValidationFailed,
    PermissionDenied,
    RateLimitExceeded,
    StorageError,
    NetworkError,
    ParseError
};

// "TEMPLATE_NOT_FOUND", "RENDER_FAILED", ...
const char* error_code(ErrorType t);

// Fixed end-user sentence for each kind.
std::string user_message(ErrorType t);

bool is_retryable(ErrorType t);

// Suggested wait before the next attempt; zero for kinds that are never retried.
std::chrono::milliseconds retry_delay(ErrorType t);

class TemplateEngineError : public std::runtime_error {
public:
    TemplateEngineError(ErrorType type,
                        const std::string& message,
                        std::string template_id = {},
                        nlohmann::json details = nlohmann::json::object(),
                        std::string user_id = {});

    ErrorType type() const { return type_; }
    const char* code() const { return error_code(type_); }
    const std::string& template_id() const { return template_id_; }
    const std::string& user_id() const { return user_id_; }
    const nlohmann::json& details() const { return details_; }
    const std::string& timestamp() const { return timestamp_; }

    std::string user_message() const { return errors::user_message(type_); }
    bool retryable() const { return is_retryable(type_); }
    std::chrono::milliseconds retry_delay() const { return errors::retry_delay(type_); }

    nlohmann::json to_json() const;

private:
    ErrorType type_;
    std::string template_id_;
    nlohmann::json details_;
    std::string user_id_;
    std::string timestamp_;
};

// Input rejected by a customization or color/typography/layout/section operation.
TemplateEngineError validation_error(const std::string& message,
                                     nlohmann::json details = nlohmann::json::object());

TemplateEngineError template_not_found(const std::string& template_id, const std::string& user_id = {});
TemplateEngineError rendering_failed(const std::string& template_id, const std::string& reason,
                                     nlohmann::json details = nlohmann::json::object(),
                                     const std::string& user_id = {});
TemplateEngineError export_failed(const std::string& template_id, const std::string& format,
                                  const std::string& reason, const std::string& user_id = {});
TemplateEngineError validation_failed(const std::string& template_id, nlohmann::json validation_errors,
                                      const std::string& user_id = {});
TemplateEngineError permission_denied(const std::string& action, const std::string& template_id = {},
                                      const std::string& user_id = {});
TemplateEngineError rate_limit_exceeded(int limit, long long window_ms, const std::string& template_id = {},
                                        const std::string& user_id = {});
TemplateEngineError storage_error(const std::string& operation, const std::string& reason,
                                  const std::string& template_id = {}, const std::string& user_id = {});
TemplateEngineError network_error(const std::string& operation, const std::string& reason,
                                  const std::string& template_id = {}, const std::string& user_id = {});
TemplateEngineError parse_error(const std::string& data_type, const std::string& reason,
                                const std::string& template_id = {}, const std::string& user_id = {});
TemplateEngineError customization_invalid(const std::string& template_id,
                                          const std::vector<std::string>& invalid_fields,
                                          const std::string& user_id = {});

// Wraps a foreign exception, guessing the kind from its message.
// A TemplateEngineError is returned unchanged.
TemplateEngineError from_exception(const std::exception& e,
                                   const std::string& template_id = {},
                                   const std::string& user_id = {});

} // namespace errors
