#pragma once

#include "IDurableStore.hpp"
#include "domain/Deal.hpp"
#include "domain/Order.hpp"

#include <memory>

namespace memtrade::ports::output {

using IOrderStore = IDurableStore<domain::Order>;
using IDealStore = IDurableStore<domain::Deal>;

/**
 * @brief Фабрика подключений к долговременному хранилищу
 *
 * Методы выбрасывают исключение, если хранилище недоступно при создании.
 */
class IDurableStoreProvider {
public:
    virtual ~IDurableStoreProvider() = default;

    virtual std::shared_ptr<IOrderStore> createOrderStore() = 0;
    virtual std::shared_ptr<IDealStore> createDealStore() = 0;
};

} // namespace memtrade::ports::output
