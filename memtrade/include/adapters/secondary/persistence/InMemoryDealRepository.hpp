#pragma once

#include "ports/output/IDealRepository.hpp"
#include "adapters/secondary/memory/InMemoryTable.hpp"

#include <algorithm>
#include <iostream>

namespace memtrade::adapters::secondary {

/**
 * @brief In-memory реализация репозитория сделок
 *
 * При maxDeals > 0 и переполнении вытесняются самые старые завершённые сделки.
 */
class InMemoryDealRepository : public ports::output::IDealRepository {
public:
    explicit InMemoryDealRepository(size_t maxDeals = 0)
        : maxDeals_(maxDeals)
    {}

    domain::Deal save(const domain::Deal& deal) override {
        auto saved = table_.upsert(deal);
        if (maxDeals_ > 0 && table_.size() > maxDeals_) {
            evictFinalDeals();
        }
        return saved;
    }

    std::optional<domain::Deal> findById(int64_t id) const override {
        return table_.get(id);
    }

    std::vector<domain::Deal> findActive() const override {
        return table_.scan([](const domain::Deal& d) { return !d.isFinal(); });
    }

    std::vector<domain::Deal> findBySymbol(const std::string& symbol) const override {
        return table_.scan([&symbol](const domain::Deal& d) { return d.symbol == symbol; });
    }

    std::vector<domain::Deal> scan(const Predicate& predicate) const override {
        return table_.scan(predicate);
    }

    std::vector<domain::Deal> findAll() const override {
        return table_.all();
    }

    bool deleteById(int64_t id) override {
        return table_.remove(id);
    }

    size_t count() const override {
        return table_.size();
    }

    void loadSnapshot(const std::vector<domain::Deal>& deals) {
        table_.replaceAll(deals);
    }

private:
    void evictFinalDeals() {
        auto finals = table_.scan([](const domain::Deal& d) { return d.isFinal(); });
        std::sort(finals.begin(), finals.end(),
            [](const domain::Deal& a, const domain::Deal& b) {
                auto aDone = a.completedAt.value_or(a.createdAt);
                auto bDone = b.completedAt.value_or(b.createdAt);
                return aDone < bDone;
            });

        const size_t current = table_.size();
        if (current <= maxDeals_) {
            return;
        }
        size_t excess = current - maxDeals_;
        size_t evicted = 0;
        for (const auto& deal : finals) {
            if (evicted >= excess) {
                break;
            }
            if (table_.remove(deal.id)) {
                ++evicted;
            }
        }

        if (evicted > 0) {
            std::cout << "[DealsRepo] Evicted " << evicted << " final deals (capacity "
                      << maxDeals_ << ")" << std::endl;
        }
    }

    InMemoryTable<domain::Deal> table_;
    size_t maxDeals_;
};

} // namespace memtrade::adapters::secondary
