#pragma once

#include "domain/Deal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace memtrade::ports::input {

/**
 * @brief Сценарии работы со сделками
 *
 * Проверяет инварианты связи Deal ↔ Order на границе репозиториев.
 * Нарушения выбрасываются как domain::InvariantViolation /
 * domain::StateTransitionError и не подавляются.
 */
class IDealService {
public:
    virtual ~IDealService() = default;

    virtual domain::Deal openDeal(const std::string& symbol, const domain::Decimal& targetProfitPercent) = 0;

    /**
     * @brief Привязать ордер на покупку к сделке
     * @throws domain::InvariantViolation если у сделки уже есть открытый ордер на покупку
     */
    virtual domain::Deal attachBuyOrder(int64_t dealId, int64_t orderId) = 0;

    /**
     * @brief Заменить ордер на покупку (предыдущий должен быть закрыт)
     */
    virtual domain::Deal replaceBuyOrder(int64_t dealId, int64_t newOrderId) = 0;

    /**
     * @brief Оставить сделку без ордера на покупку с указанием причины
     */
    virtual domain::Deal detachBuyOrder(int64_t dealId, const std::string& reason) = 0;

    virtual domain::Deal startWaitingSell(int64_t dealId, int64_t sellOrderId) = 0;

    virtual domain::Deal completeDeal(int64_t dealId, const domain::Decimal& realizedProfit) = 0;

    virtual domain::Deal cancelDeal(int64_t dealId) = 0;

    virtual domain::Deal failDeal(int64_t dealId, const std::string& reason) = 0;

    virtual std::optional<domain::Deal> findDeal(int64_t dealId) const = 0;
};

} // namespace memtrade::ports::input
