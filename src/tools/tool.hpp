#pragma once

#include <stdexcept>
#include <string>

#include "bus/event_emitter.hpp"
#include "nlohmann/json.hpp"

namespace snipguard::tools {

// Malformed tool parameters. Raised before the engine is entered.
class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual nlohmann::json Execute(const nlohmann::json& params, bus::EventEmitter& events) = 0;
};

}  // namespace snipguard::tools
