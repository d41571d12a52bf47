#pragma once

#include <cstdint>
#include <vector>

namespace memtrade::ports::output {

/**
 * @brief Долговременное хранилище сущностей (копия для восстановления)
 *
 * Реализации могут выбрасывать исключения при недоступности хранилища:
 * вызывающая сторона (WriteThroughSync) перехватывает их и ведёт статистику.
 *
 * @tparam Entity domain::Order или domain::Deal
 */
template <typename Entity>
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    /**
     * @brief Создать таблицу, если её нет
     */
    virtual void ensureSchema() = 0;

    /**
     * @brief Идемпотентная вставка или обновление по id
     */
    virtual void upsert(const Entity& entity) = 0;

    virtual void remove(int64_t id) = 0;

    /**
     * @brief Транзакционно заменить всё содержимое таблицы
     */
    virtual void replaceAll(const std::vector<Entity>& entities) = 0;

    virtual std::vector<Entity> loadAll() = 0;
};

} // namespace memtrade::ports::output
