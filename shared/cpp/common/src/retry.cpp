#include "../include/retry.hpp"
#include <algorithm>
#include <cmath>
#include <random>

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (attempt < 1) attempt = 1;
    double d = (double)base_delay.count() * std::pow(2.0, (double)(attempt - 1));
    d = std::min(d, (double)max_delay.count());
    if (jitter > 0.0) {
        thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
        d *= dist(rng);
    }
    return std::chrono::milliseconds((long long)std::max(0.0, d));
}

std::chrono::milliseconds RetryPolicy::worst_case_backoff() const {
    std::chrono::milliseconds total{0};
    for (int attempt = 1; attempt < max_attempts; ++attempt) {
        double d = (double)base_delay.count() * std::pow(2.0, (double)(attempt - 1));
        d = std::min(d, (double)max_delay.count()) * (1.0 + std::max(0.0, jitter));
        total += std::chrono::milliseconds((long long)d);
    }
    return total;
}

ErrorKind classify_http_status(long status) {
    if (status >= 500 || status == 429 || status == 408) return ErrorKind::Transient;
    if (status == 401 || status == 403) return ErrorKind::Unauthorized;
    if (status == 400 || status == 413 || status == 422) return ErrorKind::Validation;
    return ErrorKind::Unexpected;
}

ErrorKind classify_transport(TransportFailure failure) {
    switch (failure) {
        case TransportFailure::ConnectFailed:
        case TransportFailure::Timeout:
            return ErrorKind::Transient;
        case TransportFailure::Cancelled:
            return ErrorKind::Cancelled;
        case TransportFailure::Other:
            return ErrorKind::Unexpected;
    }
    return ErrorKind::Unexpected;
}
