#pragma once

#include <chrono>

#include "../interfaces/IClock.hpp"

class SystemClock : public IClock {
public:
    std::chrono::steady_clock::time_point steadyNow() override {
        return std::chrono::steady_clock::now();
    }
    std::chrono::system_clock::time_point systemNow() override {
        return std::chrono::system_clock::now();
    }
};
