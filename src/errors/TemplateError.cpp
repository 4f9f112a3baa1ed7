#include "errors/TemplateError.hpp"

#include "util/TextUtil.hpp"

namespace errors {

const char* error_code(ErrorType t) {
    switch (t) {
        case ErrorType::TemplateNotFound: return "TEMPLATE_NOT_FOUND";
        case ErrorType::RenderFailed: return "RENDER_FAILED";
        case ErrorType::ExportFailed: return "EXPORT_FAILED";
        case ErrorType::CustomizationInvalid: return "CUSTOMIZATION_INVALID";
        case ErrorType::ValidationFailed: return "VALIDATION_FAILED";
        case ErrorType::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorType::RateLimitExceeded: return "RATE_LIMIT_EXCEEDED";
        case ErrorType::StorageError: return "STORAGE_ERROR";
        case ErrorType::NetworkError: return "NETWORK_ERROR";
        case ErrorType::ParseError: return "PARSE_ERROR";
    }
    return "RENDER_FAILED";
}

std::string user_message(ErrorType t) {
    switch (t) {
        case ErrorType::TemplateNotFound:
            return "The requested template could not be found.";
        case ErrorType::RenderFailed:
            return "Failed to generate the resume preview. Please try again.";
        case ErrorType::ExportFailed:
            return "Failed to export the resume. Please try a different format.";
        case ErrorType::CustomizationInvalid:
            return "The customization options are invalid. Please check your settings.";
        case ErrorType::ValidationFailed:
            return "The template data is invalid. Please review your information.";
        case ErrorType::PermissionDenied:
            return "You do not have permission to perform this action.";
        case ErrorType::RateLimitExceeded:
            return "Too many requests. Please wait a moment and try again.";
        case ErrorType::StorageError:
            return "A storage error occurred. Please try again later.";
        case ErrorType::NetworkError:
            return "A network error occurred. Please check your connection.";
        case ErrorType::ParseError:
            return "Failed to process the template data. Please try again.";
    }
    return "An unexpected error occurred. Please try again.";
}

bool is_retryable(ErrorType t) {
    switch (t) {
        case ErrorType::RateLimitExceeded:
        case ErrorType::NetworkError:
        case ErrorType::StorageError:
        case ErrorType::RenderFailed:
        case ErrorType::ExportFailed:
            return true;
        default:
            return false;
    }
}

std::chrono::milliseconds retry_delay(ErrorType t) {
    switch (t) {
        case ErrorType::RateLimitExceeded: return std::chrono::milliseconds(5000);
        case ErrorType::NetworkError: return std::chrono::milliseconds(2000);
        case ErrorType::StorageError: return std::chrono::milliseconds(3000);
        case ErrorType::RenderFailed: return std::chrono::milliseconds(1000);
        case ErrorType::ExportFailed: return std::chrono::milliseconds(1000);
        default: return std::chrono::milliseconds(0);
    }
}

TemplateEngineError::TemplateEngineError(ErrorType type,
                                         const std::string& message,
                                         std::string template_id,
                                         nlohmann::json details,
                                         std::string user_id)
    : std::runtime_error(message),
      type_(type),
      template_id_(std::move(template_id)),
      details_(std::move(details)),
      user_id_(std::move(user_id)),
      timestamp_(textutil::iso8601_now()) {}

nlohmann::json TemplateEngineError::to_json() const {
    nlohmann::json j;
    j["code"] = code();
    j["message"] = what();
    j["userMessage"] = user_message();
    j["retryable"] = retryable();
    j["retryDelay"] = retry_delay().count();
    j["timestamp"] = timestamp_;
    if (!template_id_.empty()) j["templateId"] = template_id_;
    if (!user_id_.empty()) j["userId"] = user_id_;
    if (!details_.is_null() && !details_.empty()) j["details"] = details_;
    return j;
}

TemplateEngineError validation_error(const std::string& message, nlohmann::json details) {
    return TemplateEngineError(ErrorType::ValidationFailed, message, {}, std::move(details));
}

TemplateEngineError template_not_found(const std::string& template_id, const std::string& user_id) {
    return TemplateEngineError(ErrorType::TemplateNotFound,
                               "Template not found: " + template_id,
                               template_id, {{"templateId", template_id}}, user_id);
}

TemplateEngineError rendering_failed(const std::string& template_id, const std::string& reason,
                                     nlohmann::json details, const std::string& user_id) {
    return TemplateEngineError(ErrorType::RenderFailed,
                               "Template rendering failed: " + reason,
                               template_id, std::move(details), user_id);
}

TemplateEngineError export_failed(const std::string& template_id, const std::string& format,
                                  const std::string& reason, const std::string& user_id) {
    return TemplateEngineError(ErrorType::ExportFailed,
                               "Template export failed for " + format + ": " + reason,
                               template_id, {{"format", format}}, user_id);
}

TemplateEngineError validation_failed(const std::string& template_id, nlohmann::json validation_errors,
                                      const std::string& user_id) {
    return TemplateEngineError(ErrorType::ValidationFailed,
                               "Template validation failed",
                               template_id, {{"validationErrors", std::move(validation_errors)}}, user_id);
}

TemplateEngineError permission_denied(const std::string& action, const std::string& template_id,
                                      const std::string& user_id) {
    return TemplateEngineError(ErrorType::PermissionDenied,
                               "Permission denied for action: " + action,
                               template_id, {{"action", action}}, user_id);
}

TemplateEngineError rate_limit_exceeded(int limit, long long window_ms, const std::string& template_id,
                                        const std::string& user_id) {
    return TemplateEngineError(ErrorType::RateLimitExceeded,
                               "Rate limit exceeded: " + std::to_string(limit) + " requests per " +
                                   std::to_string(window_ms) + "ms",
                               template_id, {{"limit", limit}, {"window", window_ms}}, user_id);
}

TemplateEngineError storage_error(const std::string& operation, const std::string& reason,
                                  const std::string& template_id, const std::string& user_id) {
    return TemplateEngineError(ErrorType::StorageError,
                               "Storage error during " + operation + ": " + reason,
                               template_id, {{"operation", operation}}, user_id);
}

TemplateEngineError network_error(const std::string& operation, const std::string& reason,
                                  const std::string& template_id, const std::string& user_id) {
    return TemplateEngineError(ErrorType::NetworkError,
                               "Network error during " + operation + ": " + reason,
                               template_id, {{"operation", operation}}, user_id);
}

TemplateEngineError parse_error(const std::string& data_type, const std::string& reason,
                                const std::string& template_id, const std::string& user_id) {
    return TemplateEngineError(ErrorType::ParseError,
                               "Parse error for " + data_type + ": " + reason,
                               template_id, {{"dataType", data_type}}, user_id);
}

TemplateEngineError customization_invalid(const std::string& template_id,
                                          const std::vector<std::string>& invalid_fields,
                                          const std::string& user_id) {
    return TemplateEngineError(ErrorType::CustomizationInvalid,
                               "Invalid customization fields: " + textutil::join(invalid_fields, ", "),
                               template_id, {{"invalidFields", invalid_fields}}, user_id);
}

TemplateEngineError from_exception(const std::exception& e,
                                   const std::string& template_id,
                                   const std::string& user_id) {
    if (const auto* te = dynamic_cast<const TemplateEngineError*>(&e)) {
        return *te;
    }

    const std::string raw = e.what();
    const std::string msg = textutil::to_lower_copy(raw);
    const std::string tid = template_id.empty() ? "unknown" : template_id;

    if (msg.find("not found") != std::string::npos) {
        return template_not_found(tid, user_id);
    }
    if (msg.find("permission") != std::string::npos || msg.find("unauthorized") != std::string::npos) {
        return permission_denied("unknown", template_id, user_id);
    }
    if (msg.find("network") != std::string::npos || msg.find("fetch") != std::string::npos) {
        return network_error("unknown", raw, template_id, user_id);
    }
    if (msg.find("parse") != std::string::npos || msg.find("json") != std::string::npos) {
        return parse_error("unknown", raw, template_id, user_id);
    }
    if (msg.find("validation") != std::string::npos) {
        return validation_failed(tid, nlohmann::json::array({{{"message", raw}}}), user_id);
    }
    if (msg.find("render") != std::string::npos) {
        return rendering_failed(tid, raw, nlohmann::json::object(), user_id);
    }
    if (msg.find("export") != std::string::npos) {
        return export_failed(tid, "unknown", raw, user_id);
    }

    return TemplateEngineError(ErrorType::RenderFailed, raw, template_id,
                               {{"originalError", raw}}, user_id);
}

} // namespace errors
