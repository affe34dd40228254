#pragma once

#include <stdexcept>
#include <string>

namespace ustw {

// Not enough observations for the requested window
class InsufficientHistory : public std::runtime_error {
public:
    InsufficientHistory(const std::string& what, size_t required, size_t available)
        : std::runtime_error(what)
        , required_(required)
        , available_(available) {}

    size_t required() const { return required_; }
    size_t available() const { return available_; }

private:
    size_t required_;
    size_t available_;
};

// Price history provider could not supply a series
class DataUnavailable : public std::runtime_error {
public:
    DataUnavailable(const std::string& instrument_id, const std::string& reason)
        : std::runtime_error("Data unavailable for " + instrument_id + ": " + reason)
        , instrument_id_(instrument_id) {}

    const std::string& instrumentId() const { return instrument_id_; }

private:
    std::string instrument_id_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ustw
