#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangefetch {

enum class OutcomeKind {
    Success,
    // Recorded on the transfer; the operation returns an empty result.
    Recoverable,
    // Recorded on the transfer and raised to the caller.
    Fatal
};

struct Outcome {
    OutcomeKind kind{OutcomeKind::Success};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return kind == OutcomeKind::Success; }
    [[nodiscard]] bool isFatal() const noexcept { return kind == OutcomeKind::Fatal; }

    static Outcome success() { return {}; }
    static Outcome recoverable(std::string message) { return {OutcomeKind::Recoverable, std::move(message)}; }
    static Outcome fatal(std::string message) { return {OutcomeKind::Fatal, std::move(message)}; }
};

// Supplies the response body of a failed request. Only invoked for statuses whose message comes from it.
using ErrorBodySource = std::function<std::string()>;

[[nodiscard]] Outcome classifyResponse(long status, bool api_mode, const ErrorBodySource& error_body);

// The "message" field of a JSON error body, quotes removed. Empty if there is none.
[[nodiscard]] std::string extractErrorMessage(std::string_view body);

[[nodiscard]] bool isApiHost(std::string_view host, const std::vector<std::string>& api_hosts);

} // namespace rangefetch
