#include <urlcodec/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace urlcodec {

Error Error::Config(const std::string& message) {
    Error error;
    error.operation = "ConfigLoader";
    error.message = message;
    error.category = ErrorCategory::Config;
    return error;
}

Error Error::Io(const std::string& operation, const std::string& message) {
    Error error;
    error.operation = operation;
    error.message = message;
    error.category = ErrorCategory::Io;
    return error;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << ": " << message;
    if (hint.has_value() && !hint->empty()) {
        oss << " (" << *hint << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    body["message"] = message;
    if (index.has_value()) {
        body["index"] = *index;
    }
    if (character.has_value()) {
        body["character"] = *character;
    }
    if (hint.has_value() && !hint->empty()) {
        body["hint"] = *hint;
    }
    body["exit_code"] = ExitCode();

    nlohmann::json j;
    j["error"] = std::move(body);
    // Input handed to the decoder is not guaranteed to be UTF-8.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace urlcodec
