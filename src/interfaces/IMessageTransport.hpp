#pragma once

#include <string>

#include <nlohmann/json.hpp>

class IMessageTransport {
public:
    virtual ~IMessageTransport() = default;
    // Throws std::runtime_error when the message could not be handed off.
    virtual void publish(const std::string& destination, const nlohmann::json& payload) = 0;
};
