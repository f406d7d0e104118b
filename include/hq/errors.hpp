#pragma once

#include <stdexcept>
#include <string>

namespace hq {

enum class ErrorKind {
    LogFormat,
    EmptySeries,
    NoStabilityData,
    UnknownPlotKind,
    InvalidArgument,
};

const char* error_kind_str(ErrorKind k);

// Base of every error raised by the analysis core.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

// Input log cannot be opened or decoded; aborts the whole load.
class LogFormatError : public Error {
public:
    explicit LogFormatError(const std::string& what) : Error(ErrorKind::LogFormat, what) {}
};

// A min/max/aggregate query over a series without any sample.
class EmptySeriesError : public Error {
public:
    explicit EmptySeriesError(const std::string& what) : Error(ErrorKind::EmptySeries, what) {}
};

// Stability analysis needs at least two slices.
class NoStabilityDataError : public Error {
public:
    explicit NoStabilityDataError(const std::string& what) : Error(ErrorKind::NoStabilityData, what) {}
};

class UnknownPlotKindError : public Error {
public:
    explicit UnknownPlotKindError(const std::string& what) : Error(ErrorKind::UnknownPlotKind, what) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& what) : Error(ErrorKind::InvalidArgument, what) {}
};

} // namespace hq
