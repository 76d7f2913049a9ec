#pragma once

#include <stdexcept>
#include <string>

namespace meridian {

class MeridianError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Device records violate the parser contract (unparsable address, bad mask, ...)
class TopologyInferenceError : public MeridianError {
public:
    explicit TopologyInferenceError(const std::string& message)
        : MeridianError("Topology inference failed: " + message) {}
};

class NotFoundError : public MeridianError {
public:
    NotFoundError(const std::string& what_kind, const std::string& key)
        : MeridianError(what_kind + " not found: " + key)
        , _key(key) {}
    
    auto key() const -> const std::string& { return _key; }

private:
    std::string _key;
};

class InvalidStateError : public MeridianError {
public:
    using MeridianError::MeridianError;
};

class InvalidTransitionError : public InvalidStateError {
public:
    InvalidTransitionError(const std::string& machine, const std::string& from, const std::string& event)
        : InvalidStateError("Illegal " + machine + " transition: " + event + " in state " + from) {}
};

class ConfigurationError : public MeridianError {
public:
    using MeridianError::MeridianError;
};

class SerializationError : public MeridianError {
public:
    using MeridianError::MeridianError;
};

} // namespace meridian
