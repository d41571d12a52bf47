#pragma once

#include "ports/output/IDurableStore.hpp"
#include "domain/StorageStats.hpp"

#include <TaskPool.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Фоновая синхронизация таблицы в памяти с долговременным хранилищем
 *
 * Каждое изменение порождает независимую задачу в ограниченном пуле;
 * вызывающий поток никогда не ждёт БД. Ошибки записи учитываются
 * в статистике и не откатывают запись в памяти.
 *
 * Полная пересинхронизация берёт эксклюзивную блокировку на время записи
 * в хранилище, задачи записи берут разделяемую. Перед снимком таблицы
 * фиксируется номер последнего изменения (watermark): задачи с номером
 * не больше watermark уже отражены в снимке и отбрасываются.
 * Постановка задач в очередь блокировкой не ограничивается.
 *
 * @tparam Entity domain::Order или domain::Deal
 */
template <typename Entity>
class WriteThroughSync {
public:
    using Store = ports::output::IDurableStore<Entity>;
    using SnapshotFn = std::function<std::vector<Entity>()>;

    WriteThroughSync(
        std::string name,
        std::shared_ptr<Store> store,
        size_t queueCapacity,
        size_t workers)
        : name_(std::move(name))
        , store_(std::move(store))
        , pool_("sync:" + name_, workers, queueCapacity)
    {}

    ~WriteThroughSync() {
        pool_.shutdown();
    }

    WriteThroughSync(const WriteThroughSync&) = delete;
    WriteThroughSync& operator=(const WriteThroughSync&) = delete;

    /**
     * @brief Прочитать все строки из хранилища (загрузка при старте)
     * @return nullopt, если хранилище недоступно
     */
    std::optional<std::vector<Entity>> loadAll() {
        try {
            store_->ensureSchema();
            auto rows = store_->loadAll();
            std::cout << "[WriteThrough:" << name_ << "] Loaded " << rows.size()
                      << " rows from durable store" << std::endl;
            return rows;
        } catch (const std::exception& e) {
            recordError(e.what());
            std::cerr << "[WriteThrough:" << name_ << "] Durable store unavailable, "
                      << "starting with empty table (degraded mode): " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    /**
     * @brief Запланировать upsert сохранённой копии
     */
    void scheduleUpsert(const Entity& entity) {
        const uint64_t seq = sequence_.fetch_add(1) + 1;
        schedule(seq, entity.id, [store = store_, entity]() { store->upsert(entity); });
    }

    void scheduleRemove(int64_t id) {
        const uint64_t seq = sequence_.fetch_add(1) + 1;
        schedule(seq, id, [store = store_, id]() { store->remove(id); });
    }

    /**
     * @brief Транзакционно перезаписать таблицу в хранилище снимком памяти
     */
    domain::SyncResult fullResync(const SnapshotFn& snapshot) {
        std::unique_lock<std::shared_mutex> lock(resyncMutex_);

        domain::SyncResult result;
        const uint64_t mark = sequence_.load();
        auto rows = snapshot();

        try {
            store_->replaceAll(rows);
            watermark_ = std::max(watermark_, mark);
            ++resyncs_;
            result.ok = true;
            result.rows = rows.size();
            std::cout << "[WriteThrough:" << name_ << "] Full resync wrote "
                      << rows.size() << " rows" << std::endl;
        } catch (const std::exception& e) {
            ++resyncFailures_;
            recordError(e.what());
            result.error = e.what();
            std::cerr << "[WriteThrough:" << name_ << "] Full resync failed: " << e.what() << std::endl;
        }
        return result;
    }

    bool awaitPending(std::chrono::milliseconds timeout) {
        return pool_.waitIdle(timeout);
    }

    size_t pending() const {
        return pool_.pending();
    }

    domain::SyncStats stats() const {
        domain::SyncStats s;
        s.scheduled = scheduled_.load();
        s.succeeded = succeeded_.load();
        s.failed = failed_.load();
        s.dropped = dropped_.load();
        s.superseded = superseded_.load();
        s.resyncs = resyncs_.load();
        s.resyncFailures = resyncFailures_.load();
        std::lock_guard<std::mutex> lock(errorMutex_);
        s.lastError = lastError_;
        return s;
    }

private:
    void schedule(uint64_t seq, int64_t id, std::function<void()> write) {
        bool accepted = pool_.submit([this, seq, id, write = std::move(write)]() {
            runWrite(seq, id, write);
        });

        if (accepted) {
            ++scheduled_;
        } else {
            ++dropped_;
            std::cerr << "[WriteThrough:" << name_ << "] Sync queue full, dropped write for id="
                      << id << " (next full resync will repair it)" << std::endl;
        }
    }

    void runWrite(uint64_t seq, int64_t id, const std::function<void()>& write) {
        std::shared_lock<std::shared_mutex> lock(resyncMutex_);

        if (seq <= watermark_) {
            ++superseded_;
            return;
        }

        try {
            write();
            ++succeeded_;
        } catch (const std::exception& e) {
            ++failed_;
            recordError(e.what());
            std::cerr << "[WriteThrough:" << name_ << "] Write for id=" << id
                      << " failed: " << e.what() << std::endl;
        }
    }

    void recordError(const std::string& error) {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = error;
    }

    std::string name_;
    std::shared_ptr<Store> store_;

    std::shared_mutex resyncMutex_;
    uint64_t watermark_ = 0;  // guarded by resyncMutex_
    std::atomic<uint64_t> sequence_{0};

    std::atomic<uint64_t> scheduled_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> superseded_{0};
    std::atomic<uint64_t> resyncs_{0};
    std::atomic<uint64_t> resyncFailures_{0};

    mutable std::mutex errorMutex_;
    std::string lastError_;

    // Последним: потоки пула останавливаются раньше, чем разрушаются поля выше
    TaskPool pool_;
};

} // namespace memtrade::adapters::secondary
