//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.hpp
// Purpose: Periodic background health checks feeding a failure callback
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace server {

//==========================================================================================================
// HealthReport
// Fields:
//   passed: Whether every check in the pass completed without throwing.
//   failedChecks: Names of the checks that threw.
//   completedPasses: Number of passes run since construction.
//==========================================================================================================
struct HealthReport {
    bool passed{true};
    std::vector<std::string> failedChecks;
    std::chrono::system_clock::time_point timestamp{};
    uint64_t completedPasses{0};

    JSONValue ToJSON() const;
};

//==========================================================================================================
// HealthMonitor
// Purpose: Runs named checks on a fixed interval on its own thread.
// Notes:
//   - A check reports failure by throwing. Each failure is passed to the failure handler.
//   - The first pass happens one interval after Start().
//   - Stop() interrupts the wait immediately and joins the thread.
//==========================================================================================================
class HealthMonitor {
public:
    using CheckFn = std::function<void()>;
    using FailureHandler = std::function<void(const std::string& checkName, const std::exception& error)>;

    HealthMonitor(std::chrono::milliseconds interval, FailureHandler onFailure);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Checks run in insertion order. Adding a check under an existing name replaces it.
    void AddCheck(const std::string& name, CheckFn fn);

    void Start();
    void Stop();
    bool IsRunning() const;

    // Runs one pass synchronously on the calling thread.
    HealthReport RunOnce();

    void SetInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds Interval() const;

    HealthReport LastReport() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace server
} // namespace toolhost
