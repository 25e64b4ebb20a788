#pragma once

#include <stdexcept>
#include <string>

namespace heatcast {

/// Base of every recoverable error raised inside a loop iteration.
class HeatcastError : public std::runtime_error {
public:
    explicit HeatcastError(const std::string& what) : std::runtime_error(what) {}
};

/// The event-source call itself failed (network, auth, rate limit, bad payload).
class SourceError : public HeatcastError {
public:
    SourceError(const std::string& what, long http_status = 0)
        : HeatcastError(what), http_status_(http_status) {}

    /// 0 when the request never produced an HTTP response.
    long httpStatus() const { return http_status_; }

private:
    long http_status_;
};

/// One item's timestamp could not be interpreted.
class TimestampParseError : public HeatcastError {
public:
    explicit TimestampParseError(const std::string& what) : HeatcastError(what) {}
};

/// Fewer than two events: no gap statistic exists.
class InsufficientDataError : public HeatcastError {
public:
    explicit InsufficientDataError(const std::string& what) : HeatcastError(what) {}
};

/// The downstream send failed.
class TransportError : public HeatcastError {
public:
    explicit TransportError(const std::string& what) : HeatcastError(what) {}
};

}  // namespace heatcast
