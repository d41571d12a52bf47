#pragma once

#include "StaleOrderMonitor.hpp"
#include "StreamMaintenanceService.hpp"
#include "ports/output/IStorageControl.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace memtrade::application {

/**
 * @brief Итог одного шага остановки
 */
struct ShutdownStep {
    std::string name;
    bool ok = false;
    std::string detail;
};

struct ShutdownReport {
    std::vector<ShutdownStep> steps;
    std::map<domain::RepositoryKind, domain::SyncResult> syncResults;
    std::map<domain::RepositoryKind, domain::DumpResult> dumpResults;

    bool allOk() const {
        for (const auto& step : steps) {
            if (!step.ok) return false;
        }
        return true;
    }
};

/**
 * @brief Порядок остановки процесса
 *
 * 1. остановить монитор и обслуживание потоков;
 * 2. закрыть приём потоковых данных;
 * 3. дождаться фоновой синхронизации (не дольше syncWait);
 * 4. forceSyncAll();
 * 5. forceDumpAll();
 * 6. записать итоговую статистику в лог.
 *
 * Ошибка шага логируется и записывается в отчёт, следующие шаги
 * выполняются. Повторный вызов shutdown() возвращает первый отчёт.
 */
class ShutdownCoordinator {
public:
    ShutdownCoordinator(
        std::shared_ptr<ports::output::IStorageControl> storage,
        std::shared_ptr<StaleOrderMonitor> monitor,
        std::shared_ptr<StreamMaintenanceService> maintenance,
        std::chrono::milliseconds syncWait);

    ShutdownReport shutdown();

    bool isDone() const;

private:
    ShutdownStep runStep(const std::string& name, const std::function<std::string(bool&)>& action);

    std::shared_ptr<ports::output::IStorageControl> storage_;
    std::shared_ptr<StaleOrderMonitor> monitor_;
    std::shared_ptr<StreamMaintenanceService> maintenance_;
    std::chrono::milliseconds syncWait_;

    mutable std::mutex mutex_;
    std::optional<ShutdownReport> report_;
};

} // namespace memtrade::application
