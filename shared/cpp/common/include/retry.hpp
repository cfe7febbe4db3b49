#pragma once
#include "cancel.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Bounded retry with exponential back-off and jitter. Injected into every
// backend and storage client; the orchestrator itself never retries.
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};
    double jitter{0.2}; // each delay is scaled by a factor in [1 - jitter, 1 + jitter]

    // Back-off to sleep after failed attempt `attempt` (1-based).
    std::chrono::milliseconds delay_after(int attempt) const;
    // Upper bound of all back-off sleeps of one invocation.
    std::chrono::milliseconds worst_case_backoff() const;
};

// HTTP status to error class: 2xx is not an error and must not be passed in.
ErrorKind classify_http_status(long status);
ErrorKind classify_transport(TransportFailure failure);

template <class T>
struct Attempt {
    std::optional<T> value;
    Failure failure;

    static Attempt ok(T v) { Attempt a; a.value = std::move(v); return a; }
    static Attempt fail(ErrorKind kind, std::string message) {
        Attempt a;
        a.failure = Failure{kind, std::move(message), kind == ErrorKind::Transient};
        return a;
    }
};

template <class T>
struct Retried {
    std::optional<T> value;
    Failure failure;
    int attempts{0};
};

// Calls fn(attempt) until it yields a value, a non-transient failure, or the
// policy is exhausted. Exhaustion is reported as Unavailable and not
// retryable by the caller, since the budget is already spent.
template <class T, class Fn>
Retried<T> run_with_retry(const RetryPolicy& policy, const CancelToken& cancel,
                          const std::string& tag, Fn&& fn) {
    Retried<T> out;
    Failure last;
    const int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancel.cancelled()) {
            out.failure = Failure{ErrorKind::Cancelled,
                                  cancel.cancel_requested() ? "cancelled" : "run deadline exceeded", false};
            return out;
        }
        out.attempts = attempt;
        Attempt<T> a = fn(attempt);
        if (a.value) {
            out.value = std::move(a.value);
            return out;
        }
        if (a.failure.kind != ErrorKind::Transient) {
            out.failure = std::move(a.failure);
            out.failure.retryable = false;
            return out;
        }
        last = std::move(a.failure);
        if (attempt == max_attempts) break;
        auto delay = policy.delay_after(attempt);
        log_warn(tag, "attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                      " failed: " + last.message + "; retrying in " + std::to_string(delay.count()) + "ms");
        if (!cancel.wait_for(delay)) {
            out.failure = Failure{ErrorKind::Cancelled,
                                  cancel.cancel_requested() ? "cancelled" : "run deadline exceeded", false};
            return out;
        }
    }
    out.failure = Failure{ErrorKind::Unavailable,
                          "gave up after " + std::to_string(out.attempts) + " attempts: " + last.message, false};
    return out;
}
