#include "rangefetch/response_classifier.hpp"

#include <json/json.h>
#include <fmt/format.h>

#include <algorithm>
#include <memory>

namespace rangefetch {

namespace {

std::string errorMessageOrStatus(long status, const ErrorBodySource& error_body) {
    std::string message = error_body ? extractErrorMessage(error_body()) : std::string{};
    if (message.empty()) {
        message = fmt::format("HTTP {}", status);
    }
    return message;
}

} // namespace

Outcome classifyResponse(long status, bool api_mode, const ErrorBodySource& error_body) {
    if (status >= 200 && status <= 208) {
        return Outcome::success();
    }

    switch (status) {
        case 400:
            return Outcome::recoverable("Bad Request!");
        case 401:
            return Outcome::recoverable(api_mode ? "GitHub API Bad Credentials!"
                                                 : "Unauthorized Or Bad Credentials!");
        case 403:
            if (api_mode) {
                return Outcome::fatal("GitHub API Rate Limit Reached!");
            }
            return Outcome::recoverable("Forbidden!");
        case 404: {
            if (!api_mode) {
                return Outcome::recoverable("Not Found!");
            }
            const std::string message = errorMessageOrStatus(status, error_body);
            if (message.find("Not Found") != std::string::npos) {
                return Outcome::recoverable("GitHub Page Not Found!");
            }
            return Outcome::recoverable("GitHub API: " + message);
        }
        case 500:
            return Outcome::recoverable("Internal Server Error!");
        case 501:
            return Outcome::recoverable("Not Implemented!");
        case 502:
            return Outcome::recoverable("Bad Gateway!");
        case 503:
            return Outcome::recoverable("Service Unavailable!");
        case 504:
            return Outcome::recoverable("Gateway Timeout!");
        default:
            break;
    }

    const std::string message = errorMessageOrStatus(status, error_body);
    return Outcome::recoverable(api_mode ? "Unknown API Error! Error Message: " + message : message);
}

std::string extractErrorMessage(std::string_view body) {
    if (body.empty()) {
        return {};
    }

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        return {};
    }

    if (!root.isObject() || !root.isMember("message")) {
        return {};
    }

    const Json::Value& field = root["message"];
    std::string message;
    if (field.isString()) {
        message = field.asString();
    } else {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        message = Json::writeString(writer, field);
    }
    message.erase(std::remove(message.begin(), message.end(), '"'), message.end());
    return message;
}

bool isApiHost(std::string_view host, const std::vector<std::string>& api_hosts) {
    return std::any_of(api_hosts.begin(), api_hosts.end(), [host](const std::string& api_host) {
        return !api_host.empty() && host.find(api_host) != std::string_view::npos;
    });
}

} // namespace rangefetch
