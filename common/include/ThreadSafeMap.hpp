#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная хеш-таблица (много читателей / один писатель)
 * @details
 * Значения хранятся как std::shared_ptr<const V>: запись заменяет указатель
 * целиком, поэтому ранее выданные читателям значения никогда не меняются.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using ValuePtr = std::shared_ptr<const V>;

    ThreadSafeMap() = default;

    void insert(const K &key, const ValuePtr &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    ValuePtr find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Удалить элемент
     * @return true, если элемент существовал
     */
    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * @brief Атомарно заменить всё содержимое
     */
    void replaceAll(std::unordered_map<K, ValuePtr> content)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.swap(content);
    }

    /**
     * @brief Снимок всех значений на момент вызова
     */
    std::vector<ValuePtr> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<ValuePtr> result;
        result.reserve(map_.size());
        for (const auto &entry : map_) {
            result.push_back(entry.second);
        }
        return result;
    }

    /**
     * @brief Снимок значений, удовлетворяющих предикату
     */
    std::vector<ValuePtr> getIf(const std::function<bool(const V &)> &predicate) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<ValuePtr> result;
        for (const auto &entry : map_) {
            if (predicate(*entry.second)) {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, ValuePtr> map_;
};
