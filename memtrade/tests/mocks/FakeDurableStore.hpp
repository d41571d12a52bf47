#pragma once

#include "ports/output/IDurableStoreProvider.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace memtrade::tests {

/**
 * @brief Хранилище в памяти вместо PostgreSQL
 *
 * - setUnreachable(true): каждый вызов выбрасывает std::runtime_error;
 * - holdWrites(): upsert/remove ждут releaseWrites(), чтобы задачи
 *   синхронизации накапливались в очереди.
 */
template <typename Entity>
class FakeDurableStore : public ports::output::IDurableStore<Entity> {
public:
    void ensureSchema() override {
        check();
        ++schemaCalls_;
    }

    void upsert(const Entity& entity) override {
        waitIfHeld();
        check();
        std::lock_guard<std::mutex> lock(mutex_);
        rows_[entity.id] = entity;
        ++upserts_;
    }

    void remove(int64_t id) override {
        waitIfHeld();
        check();
        std::lock_guard<std::mutex> lock(mutex_);
        rows_.erase(id);
        ++removes_;
    }

    void replaceAll(const std::vector<Entity>& entities) override {
        check();
        std::lock_guard<std::mutex> lock(mutex_);
        rows_.clear();
        for (const auto& entity : entities) {
            rows_[entity.id] = entity;
        }
        ++replaceAllCalls_;
    }

    std::vector<Entity> loadAll() override {
        check();
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Entity> result;
        for (const auto& [id, entity] : rows_) {
            result.push_back(entity);
        }
        return result;
    }

    // Управление из тестов

    void setUnreachable(bool unreachable) { unreachable_ = unreachable; }

    void holdWrites() {
        std::lock_guard<std::mutex> lock(gateMutex_);
        held_ = true;
    }

    void releaseWrites() {
        {
            std::lock_guard<std::mutex> lock(gateMutex_);
            held_ = false;
        }
        gateCv_.notify_all();
    }

    /// Число потоков, ожидающих releaseWrites()
    int waitingWriters() const { return waiting_.load(); }

    void seed(const Entity& entity) {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_[entity.id] = entity;
    }

    std::optional<Entity> row(int64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(id);
        return it != rows_.end() ? std::optional<Entity>(it->second) : std::nullopt;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

    int upserts() const { return upserts_.load(); }
    int removes() const { return removes_.load(); }
    int replaceAllCalls() const { return replaceAllCalls_.load(); }
    int schemaCalls() const { return schemaCalls_.load(); }

private:
    void check() const {
        if (unreachable_.load()) {
            throw std::runtime_error("connection refused");
        }
    }

    void waitIfHeld() {
        std::unique_lock<std::mutex> lock(gateMutex_);
        ++waiting_;
        gateCv_.wait(lock, [this]() { return !held_; });
        --waiting_;
    }

    mutable std::mutex mutex_;
    std::map<int64_t, Entity> rows_;

    std::atomic<bool> unreachable_{false};
    std::atomic<int> upserts_{0};
    std::atomic<int> removes_{0};
    std::atomic<int> replaceAllCalls_{0};
    std::atomic<int> schemaCalls_{0};

    std::mutex gateMutex_;
    std::condition_variable gateCv_;
    bool held_ = false;
    std::atomic<int> waiting_{0};
};

/**
 * @brief Провайдер, отдающий одни и те же FakeDurableStore
 *
 * Повторное создание репозитория поверх того же провайдера
 * имитирует перезапуск процесса с той же базой.
 */
class FakeStoreProvider : public ports::output::IDurableStoreProvider {
public:
    FakeStoreProvider()
        : orderStore(std::make_shared<FakeDurableStore<domain::Order>>())
        , dealStore(std::make_shared<FakeDurableStore<domain::Deal>>())
    {}

    std::shared_ptr<ports::output::IOrderStore> createOrderStore() override {
        if (failOnCreate) {
            throw std::runtime_error("could not connect to server");
        }
        return orderStore;
    }

    std::shared_ptr<ports::output::IDealStore> createDealStore() override {
        if (failOnCreate) {
            throw std::runtime_error("could not connect to server");
        }
        return dealStore;
    }

    std::shared_ptr<FakeDurableStore<domain::Order>> orderStore;
    std::shared_ptr<FakeDurableStore<domain::Deal>> dealStore;
    bool failOnCreate = false;
};

} // namespace memtrade::tests
