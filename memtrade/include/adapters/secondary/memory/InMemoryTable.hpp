#pragma once

#include <ThreadSafeMap.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Таблица сущностей в памяти с ключом id
 *
 * Только память, без ввода-вывода. Читатели работают параллельно,
 * запись берёт эксклюзивную блокировку на время замены указателя.
 * Наружу отдаются копии, поэтому изменить строку можно только через upsert().
 *
 * @tparam Entity тип с полем int64_t id (0, если id не назначен)
 */
template <typename Entity>
class InMemoryTable {
public:
    using Predicate = std::function<bool(const Entity&)>;

    InMemoryTable() = default;

    InMemoryTable(const InMemoryTable&) = delete;
    InMemoryTable& operator=(const InMemoryTable&) = delete;

    /**
     * @brief Вставить или заменить строку
     * @return Сохранённая копия с назначенным id
     */
    Entity upsert(const Entity& entity) {
        auto row = std::make_shared<Entity>(entity);
        if (row->id == 0) {
            row->id = nextId_.fetch_add(1);
        } else {
            bumpSequence(row->id);
        }
        rows_.insert(row->id, row);
        return *row;
    }

    std::optional<Entity> get(int64_t id) const {
        auto row = rows_.find(id);
        return row ? std::optional<Entity>(*row) : std::nullopt;
    }

    bool contains(int64_t id) const {
        return rows_.contains(id);
    }

    /**
     * @brief Линейный просмотр; результат упорядочен по id
     */
    std::vector<Entity> scan(const Predicate& predicate) const {
        return copySorted(rows_.getIf(predicate));
    }

    std::vector<Entity> all() const {
        return copySorted(rows_.getAll());
    }

    bool remove(int64_t id) {
        return rows_.remove(id);
    }

    /**
     * @brief Заменить содержимое (загрузка при старте)
     * @details Последовательность id продолжается после максимального загруженного.
     */
    void replaceAll(const std::vector<Entity>& entities) {
        std::unordered_map<int64_t, std::shared_ptr<const Entity>> content;
        content.reserve(entities.size());
        for (const auto& entity : entities) {
            content[entity.id] = std::make_shared<Entity>(entity);
            bumpSequence(entity.id);
        }
        rows_.replaceAll(std::move(content));
    }

    void clear() {
        rows_.clear();
    }

    size_t size() const {
        return rows_.size();
    }

    /// Следующий id, который будет назначен
    int64_t nextId() const {
        return nextId_.load();
    }

private:
    void bumpSequence(int64_t id) {
        int64_t current = nextId_.load();
        while (id >= current && !nextId_.compare_exchange_weak(current, id + 1)) {
        }
    }

    static std::vector<Entity> copySorted(const std::vector<std::shared_ptr<const Entity>>& rows) {
        std::vector<Entity> result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(*row);
        }
        std::sort(result.begin(), result.end(),
            [](const Entity& a, const Entity& b) { return a.id < b.id; });
        return result;
    }

    ThreadSafeMap<int64_t, Entity> rows_;
    std::atomic<int64_t> nextId_{1};
};

} // namespace memtrade::adapters::secondary
