#pragma once

#include "../models/Alert.hpp"

class IAlertSink {
public:
    virtual ~IAlertSink() = default;
    virtual void raise(const Alert& alert) = 0;
};
