#include "application/ShutdownCoordinator.hpp"

#include <iostream>

namespace memtrade::application {

ShutdownCoordinator::ShutdownCoordinator(
    std::shared_ptr<ports::output::IStorageControl> storage,
    std::shared_ptr<StaleOrderMonitor> monitor,
    std::shared_ptr<StreamMaintenanceService> maintenance,
    std::chrono::milliseconds syncWait)
    : storage_(std::move(storage))
    , monitor_(std::move(monitor))
    , maintenance_(std::move(maintenance))
    , syncWait_(syncWait)
{}

bool ShutdownCoordinator::isDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_.has_value();
}

ShutdownStep ShutdownCoordinator::runStep(
    const std::string& name, const std::function<std::string(bool&)>& action)
{
    ShutdownStep step;
    step.name = name;
    try {
        step.ok = true;
        step.detail = action(step.ok);
    } catch (const std::exception& e) {
        step.ok = false;
        step.detail = e.what();
    }

    if (step.ok) {
        std::cout << "[Shutdown] " << name << ": ok"
                  << (step.detail.empty() ? "" : " (" + step.detail + ")") << std::endl;
    } else {
        std::cerr << "[Shutdown] " << name << ": FAILED " << step.detail << std::endl;
    }
    return step;
}

ShutdownReport ShutdownCoordinator::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (report_) {
        return *report_;
    }

    std::cout << "[Shutdown] Starting shutdown sequence" << std::endl;
    ShutdownReport report;

    report.steps.push_back(runStep("stop_monitor", [this](bool&) -> std::string {
        if (!monitor_) return "not configured";
        monitor_->stop();
        return "";
    }));

    report.steps.push_back(runStep("stop_maintenance", [this](bool&) -> std::string {
        if (!maintenance_) return "not configured";
        maintenance_->stop();
        return "";
    }));

    report.steps.push_back(runStep("close_ingestion", [this](bool&) -> std::string {
        storage_->closeIngestion();
        return "";
    }));

    report.steps.push_back(runStep("await_pending_syncs", [this](bool& ok) -> std::string {
        ok = storage_->awaitPendingSyncs(syncWait_);
        return ok ? "" : "timed out after " + std::to_string(syncWait_.count()) + "ms";
    }));

    report.steps.push_back(runStep("force_sync_all", [this, &report](bool& ok) -> std::string {
        report.syncResults = storage_->forceSyncAll();
        size_t failed = 0;
        for (const auto& [kind, result] : report.syncResults) {
            if (!result.ok) ++failed;
        }
        ok = failed == 0;
        return std::to_string(report.syncResults.size()) + " repositories, " +
               std::to_string(failed) + " failed";
    }));

    report.steps.push_back(runStep("force_dump_all", [this, &report](bool& ok) -> std::string {
        report.dumpResults = storage_->forceDumpAll();
        size_t failed = 0;
        size_t records = 0;
        for (const auto& [kind, result] : report.dumpResults) {
            if (!result.ok) ++failed;
            records += result.records;
        }
        ok = failed == 0;
        return std::to_string(records) + " records dumped, " + std::to_string(failed) + " failed";
    }));

    report.steps.push_back(runStep("final_stats", [this](bool&) -> std::string {
        std::cout << "[Shutdown] Storage: " << storage_->storageInfo().dump() << std::endl;
        if (monitor_) {
            const auto s = monitor_->statistics();
            std::cout << "[Shutdown] StaleOrderMonitor: checks=" << s.checksPerformed
                      << " stale=" << s.staleOrdersFound
                      << " canceled=" << s.cancellations
                      << " recreated=" << s.recreations
                      << " failed=" << s.recreationFailures << std::endl;
        }
        return "";
    }));

    std::cout << "[Shutdown] Shutdown sequence finished"
              << (report.allOk() ? "" : " with errors") << std::endl;

    report_ = report;
    return report;
}

} // namespace memtrade::application
