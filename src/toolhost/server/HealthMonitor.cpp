//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.cpp
// Purpose: HealthMonitor implementation
//==========================================================================================================

#include "toolhost/server/HealthMonitor.hpp"
#include "toolhost/JSONHelpers.h"
#include "logging/Logger.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace toolhost {
namespace server {

JSONValue HealthReport::ToJSON() const {
    return json::ObjectBuilder()
        .Set("passed", passed)
        .Set("failedChecks", failedChecks)
        .Set("timestamp", json::Timestamp(timestamp))
        .Set("completedPasses", static_cast<uint64_t>(completedPasses))
        .Build();
}

class HealthMonitor::Impl {
public:
    Impl(std::chrono::milliseconds i, FailureHandler f) : intervalMs(i.count()), onFailure(std::move(f)) {}

    std::atomic<int64_t> intervalMs;
    FailureHandler onFailure;

    mutable std::mutex checksMutex;
    std::vector<std::pair<std::string, CheckFn>> checks;

    // Serializes passes between the timer thread and RunOnce callers.
    std::mutex passMutex;
    mutable std::mutex reportMutex;
    HealthReport lastReport;

    std::mutex threadMutex;
    std::mutex waitMutex;
    std::condition_variable_any waitCv;
    std::jthread thread;
    std::atomic<bool> running{false};

    HealthReport runPass() {
        std::vector<std::pair<std::string, CheckFn>> snapshot;
        {
            std::lock_guard<std::mutex> lock(checksMutex);
            snapshot = checks;
        }

        std::lock_guard<std::mutex> pass(passMutex);
        HealthReport report;
        for (const auto& [name, fn] : snapshot) {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_WARN("Health check '{}' failed: {}", name, e.what());
                report.passed = false;
                report.failedChecks.push_back(name);
                if (onFailure) {
                    onFailure(name, e);
                }
            }
        }
        report.timestamp = std::chrono::system_clock::now();
        {
            std::lock_guard<std::mutex> lock(reportMutex);
            report.completedPasses = lastReport.completedPasses + 1;
            lastReport = report;
        }
        LOG_DEBUG("Health check pass {} completed ({} checks, passed={})", report.completedPasses,
                  snapshot.size(), report.passed);
        return report;
    }

    void loop(std::stop_token st) {
        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(waitMutex);
                const auto delay = std::chrono::milliseconds(intervalMs.load());
                if (waitCv.wait_for(lock, st, delay, [&st] { return st.stop_requested(); })) {
                    break;
                }
            }
            if (st.stop_requested()) break;
            runPass();
        }
    }
};

HealthMonitor::HealthMonitor(std::chrono::milliseconds interval, FailureHandler onFailure)
    : pImpl(std::make_unique<Impl>(interval, std::move(onFailure))) {}

HealthMonitor::~HealthMonitor() {
    Stop();
}

void HealthMonitor::AddCheck(const std::string& name, CheckFn fn) {
    std::lock_guard<std::mutex> lock(pImpl->checksMutex);
    for (auto& entry : pImpl->checks) {
        if (entry.first == name) {
            entry.second = std::move(fn);
            return;
        }
    }
    pImpl->checks.emplace_back(name, std::move(fn));
}

void HealthMonitor::Start() {
    std::lock_guard<std::mutex> lock(pImpl->threadMutex);
    if (pImpl->running) return;
    pImpl->running = true;
    pImpl->thread = std::jthread([impl = pImpl.get()](std::stop_token st) { impl->loop(st); });
    LOG_INFO("Health monitoring started (interval={}ms)", pImpl->intervalMs.load());
}

void HealthMonitor::Stop() {
    std::lock_guard<std::mutex> lock(pImpl->threadMutex);
    if (!pImpl->running) return;
    pImpl->running = false;
    pImpl->thread.request_stop();
    if (pImpl->thread.joinable()) {
        if (pImpl->thread.get_id() == std::this_thread::get_id()) {
            pImpl->thread.detach();
        } else {
            pImpl->thread.join();
        }
    }
    LOG_INFO("Health monitoring stopped");
}

bool HealthMonitor::IsRunning() const {
    return pImpl->running.load();
}

HealthReport HealthMonitor::RunOnce() {
    return pImpl->runPass();
}

void HealthMonitor::SetInterval(std::chrono::milliseconds interval) {
    pImpl->intervalMs = interval.count();
}

std::chrono::milliseconds HealthMonitor::Interval() const {
    return std::chrono::milliseconds(pImpl->intervalMs.load());
}

HealthReport HealthMonitor::LastReport() const {
    std::lock_guard<std::mutex> lock(pImpl->reportMutex);
    return pImpl->lastReport;
}

} // namespace server
} // namespace toolhost
