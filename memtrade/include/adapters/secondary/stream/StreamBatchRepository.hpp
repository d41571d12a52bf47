#pragma once

#include "ColumnarBatchFile.hpp"
#include "ColumnarCodec.hpp"
#include "domain/enums/RepositoryKind.hpp"
#include "ports/output/IStreamRepository.hpp"
#include "settings/StorageSettings.hpp"

#include <TaskPool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Потоковое хранилище: буфер в памяти + пакетные файлы на диске
 *
 * - append/appendBatch только добавляют в буфер;
 * - при достижении dumpThreshold весь буфер забирается целиком и
 *   выгружается в файл в фоновом потоке, новые записи идут в новый буфер;
 * - одновременно выполняется не более одной выгрузки;
 * - если во время выгрузки буфер достиг memoryLimit, самые старые записи
 *   вытесняются без сохранения (учитываются в stats().evicted);
 * - при ошибке записи файла пакет возвращается в начало буфера, сверх
 *   memoryLimit вытесняются самые старые записи.
 *
 * Пока пакет пишется на диск, чтения видят его наравне с буфером.
 *
 * @tparam Observation domain::Ticker, domain::OrderBookSnapshot, domain::IndicatorPoint
 */
template <typename Observation>
class StreamBatchRepository : public ports::output::IStreamRepository<Observation> {
public:
    using Codec = ColumnarCodec<Observation>;
    using Batch = std::shared_ptr<const std::vector<Observation>>;

    StreamBatchRepository(
        domain::RepositoryKind kind,
        const settings::StreamSettings& limits,
        const std::string& dumpRoot,
        int retentionDays)
        : name_(domain::toString(kind))
        , dumpDir_(std::filesystem::path(dumpRoot) / name_)
        , memoryLimit_(limits.getMemoryLimitBytes())
        , dumpThreshold_(limits.getDumpThresholdBytes())
        , retentionDays_(retentionDays)
        , lastDumpAt_(domain::Timestamp::now())
        , dumpPool_("dump:" + name_, 1, 0)
    {
        std::cout << "[StreamRepo:" << name_ << "] Ready: limit=" << memoryLimit_
                  << "B threshold=" << dumpThreshold_ << "B dir=" << dumpDir_.string() << std::endl;
    }

    ~StreamBatchRepository() override {
        closeIngestion();
        dumpPool_.shutdown();
    }

    StreamBatchRepository(const StreamBatchRepository&) = delete;
    StreamBatchRepository& operator=(const StreamBatchRepository&) = delete;

    bool append(const Observation& observation) override {
        if (!accepting_.load()) {
            ++rejectedAfterClose_;
            return false;
        }

        Batch batch;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            batch = pushLocked(observation);
        }

        if (batch) {
            scheduleDump(std::move(batch));
        }
        return true;
    }

    bool appendBatch(const std::vector<Observation>& observations) override {
        if (!accepting_.load()) {
            rejectedAfterClose_ += observations.size();
            return false;
        }

        Batch batch;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            // Порог проверяется после каждой записи: буфер уходит в выгрузку
            // раньше, чем хвост пакета упрётся в memoryLimit
            for (const auto& observation : observations) {
                auto taken = pushLocked(observation);
                if (taken) {
                    batch = std::move(taken);
                }
            }
        }

        if (batch) {
            scheduleDump(std::move(batch));
        }
        return true;
    }

    std::vector<Observation> lastN(size_t n) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<Observation> result;
        const size_t inFlightSize = inFlight_ ? inFlight_->size() : 0;
        const size_t total = inFlightSize + buffer_.size();
        const size_t skip = total > n ? total - n : 0;
        result.reserve(total - skip);

        size_t index = 0;
        if (inFlight_) {
            for (const auto& row : *inFlight_) {
                if (index++ >= skip) result.push_back(row);
            }
        }
        for (const auto& row : buffer_) {
            if (index++ >= skip) result.push_back(row);
        }
        return result;
    }

    std::vector<Observation> lastNBySymbol(const std::string& symbol, size_t n) const override {
        auto rows = collect([&symbol](const Observation& o) { return o.symbol == symbol; });
        if (rows.size() > n) {
            rows.erase(rows.begin(), rows.end() - static_cast<std::ptrdiff_t>(n));
        }
        return rows;
    }

    std::optional<Observation> latest(const std::string& symbol) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        for (auto it = buffer_.rbegin(); it != buffer_.rend(); ++it) {
            if (it->symbol == symbol) return *it;
        }
        if (inFlight_) {
            for (auto it = inFlight_->rbegin(); it != inFlight_->rend(); ++it) {
                if (it->symbol == symbol) return *it;
            }
        }
        return std::nullopt;
    }

    std::vector<Observation> rangeBySymbolAndTime(
        const std::string& symbol, int64_t fromMillis, int64_t toMillis) const override
    {
        return collect([&](const Observation& o) {
            return o.symbol == symbol && o.timestamp >= fromMillis && o.timestamp <= toMillis;
        });
    }

    domain::DumpResult forceDump() override {
        // Асинхронная выгрузка должна завершиться, иначе порядок файлов нарушится
        if (!dumpPool_.waitIdle(std::chrono::minutes(1))) {
            domain::DumpResult busy;
            busy.error = "previous dump still in progress";
            return busy;
        }

        Batch batch;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (dumpInFlight_) {
                domain::DumpResult busy;
                busy.error = "previous dump still in progress";
                return busy;
            }
            if (buffer_.empty()) {
                domain::DumpResult empty;
                empty.ok = true;
                return empty;
            }
            batch = takeBufferLocked();
        }

        return writeBatch(batch);
    }

    bool requestDump() override {
        Batch batch;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (dumpInFlight_ || buffer_.empty()) {
                return false;
            }
            batch = takeBufferLocked();
        }
        scheduleDump(std::move(batch));
        return true;
    }

    bool awaitPendingDumps(std::chrono::milliseconds timeout) override {
        return dumpPool_.waitIdle(timeout);
    }

    domain::MemoryUsage memoryUsage() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        domain::MemoryUsage usage;
        usage.recordCount = buffer_.size();
        usage.estimatedBytes = bufferBytes_;
        usage.percentOfLimit = memoryLimit_ > 0
            ? static_cast<double>(bufferBytes_) * 100.0 / static_cast<double>(memoryLimit_)
            : 0.0;
        return usage;
    }

    /**
     * @details Удаляются только файлы этого репозитория, чьё имя содержит
     * метку времени старше retentionDays. Буфер в памяти не затрагивается.
     */
    size_t cleanupExpiredDumps(const domain::Timestamp& now) override {
        std::error_code ec;
        if (!std::filesystem::exists(dumpDir_, ec)) {
            return 0;
        }

        const auto cutoff = now.addDays(-retentionDays_);
        size_t deleted = 0;

        for (std::filesystem::directory_iterator it(dumpDir_, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file()) {
                continue;
            }
            auto createdAt = timestampFromFileName(it->path().filename().string());
            if (!createdAt || *createdAt >= cutoff) {
                continue;
            }

            std::error_code removeError;
            if (std::filesystem::remove(it->path(), removeError)) {
                ++deleted;
            } else if (removeError) {
                std::cerr << "[StreamRepo:" << name_ << "] Cannot delete " << it->path().string()
                          << ": " << removeError.message() << std::endl;
            }
        }

        if (ec) {
            std::cerr << "[StreamRepo:" << name_ << "] Retention sweep failed: " << ec.message() << std::endl;
        }
        if (deleted > 0) {
            filesDeleted_ += deleted;
            std::cout << "[StreamRepo:" << name_ << "] Retention sweep deleted " << deleted
                      << " files older than " << retentionDays_ << " days" << std::endl;
        }
        return deleted;
    }

    void closeIngestion() override {
        if (accepting_.exchange(false)) {
            std::cout << "[StreamRepo:" << name_ << "] Ingestion closed" << std::endl;
        }
    }

    domain::Timestamp lastDumpAt() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return lastDumpAt_;
    }

    domain::StreamStats stats() const override {
        domain::StreamStats s;
        s.appended = appended_.load();
        s.dumps = dumps_.load();
        s.dumpedRecords = dumpedRecords_.load();
        s.dumpFailures = dumpFailures_.load();
        s.evicted = evicted_.load();
        s.rejectedAfterClose = rejectedAfterClose_.load();
        s.filesDeleted = filesDeleted_.load();
        return s;
    }

    const std::filesystem::path& dumpDirectory() const { return dumpDir_; }

private:
    // ------------------------------------------------------------------------
    // Буфер (вызывается под эксклюзивной блокировкой)
    // ------------------------------------------------------------------------

    /**
     * @return Пакет для выгрузки, если запись довела буфер до порога
     */
    Batch pushLocked(const Observation& observation) {
        buffer_.push_back(observation);
        bufferBytes_ += Codec::estimateBytes(buffer_.back());
        ++appended_;

        auto batch = takeIfThresholdLocked();
        evictOverLimitLocked();
        return batch;
    }

    /// Жёсткий потолок memoryLimit: вытесняются самые старые записи
    void evictOverLimitLocked() {
        while (bufferBytes_ > memoryLimit_ && !buffer_.empty()) {
            bufferBytes_ -= std::min(bufferBytes_, Codec::estimateBytes(buffer_.front()));
            buffer_.pop_front();
            ++evicted_;
        }
    }

    Batch takeIfThresholdLocked() {
        if (dumpInFlight_ || bufferBytes_ < dumpThreshold_ || buffer_.empty()) {
            return nullptr;
        }
        return takeBufferLocked();
    }

    Batch takeBufferLocked() {
        auto batch = std::make_shared<const std::vector<Observation>>(
            std::make_move_iterator(buffer_.begin()), std::make_move_iterator(buffer_.end()));
        buffer_.clear();
        bufferBytes_ = 0;
        inFlight_ = batch;
        dumpInFlight_ = true;
        return batch;
    }

    void restoreBatchLocked(const Batch& batch) {
        buffer_.insert(buffer_.begin(), batch->begin(), batch->end());
        bufferBytes_ = 0;
        for (const auto& row : buffer_) {
            bufferBytes_ += Codec::estimateBytes(row);
        }
        evictOverLimitLocked();
    }

    // ------------------------------------------------------------------------
    // Выгрузка
    // ------------------------------------------------------------------------

    void scheduleDump(Batch batch) {
        bool accepted = dumpPool_.submit([this, batch]() { writeBatch(batch); });
        if (!accepted) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            restoreBatchLocked(batch);
            inFlight_.reset();
            dumpInFlight_ = false;
            std::cerr << "[StreamRepo:" << name_ << "] Dump rejected, batch kept in memory" << std::endl;
        }
    }

    domain::DumpResult writeBatch(const Batch& batch) {
        domain::DumpResult result;
        const auto now = domain::Timestamp::now();
        const auto path = nextFilePath(now);

        try {
            ColumnarBatchFile::write(path, *batch, now.toMillis());

            result.ok = true;
            result.path = path.string();
            result.records = batch->size();
            ++dumps_;
            dumpedRecords_ += batch->size();

            std::unique_lock<std::shared_mutex> lock(mutex_);
            inFlight_.reset();
            dumpInFlight_ = false;
            lastDumpAt_ = now;
        } catch (const std::exception& e) {
            ++dumpFailures_;
            result.error = e.what();
            std::cerr << "[StreamRepo:" << name_ << "] Dump of " << batch->size()
                      << " records failed: " << e.what() << std::endl;

            std::unique_lock<std::shared_mutex> lock(mutex_);
            restoreBatchLocked(batch);
            inFlight_.reset();
            dumpInFlight_ = false;
            return result;
        }

        std::cout << "[StreamRepo:" << name_ << "] Dumped " << result.records
                  << " records to " << result.path << std::endl;
        return result;
    }

    std::filesystem::path nextFilePath(const domain::Timestamp& now) {
        std::filesystem::path path;
        std::error_code ec;
        do {
            std::ostringstream name;
            name << name_ << '_' << now.toFileStamp() << '_'
                 << std::setw(3) << std::setfill('0') << (now.toMillis() % 1000) << '_'
                 << std::setw(6) << std::setfill('0') << ++fileSeq_
                 << ColumnarBatchFile::EXTENSION;
            path = dumpDir_ / name.str();
        } while (std::filesystem::exists(path, ec));
        return path;
    }

    /**
     * @brief Метка времени из имени "<kind>_YYYYmmdd_HHMMSS_mmm_seq.msgpack"
     */
    std::optional<domain::Timestamp> timestampFromFileName(const std::string& fileName) const {
        const std::string prefix = name_ + "_";
        const std::string extension = ColumnarBatchFile::EXTENSION;
        if (fileName.size() < prefix.size() + 15 + extension.size() ||
            fileName.compare(0, prefix.size(), prefix) != 0 ||
            fileName.compare(fileName.size() - extension.size(), extension.size(), extension) != 0) {
            return std::nullopt;
        }

        std::string stamp = fileName.substr(prefix.size(), 15);  // YYYYmmdd_HHMMSS
        std::tm tm = {};
        std::istringstream ss(stamp);
        ss >> std::get_time(&tm, "%Y%m%d_%H%M%S");
        if (ss.fail()) {
            return std::nullopt;
        }
        return domain::Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    template <typename Pred>
    std::vector<Observation> collect(Pred predicate) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<Observation> result;
        if (inFlight_) {
            for (const auto& row : *inFlight_) {
                if (predicate(row)) result.push_back(row);
            }
        }
        for (const auto& row : buffer_) {
            if (predicate(row)) result.push_back(row);
        }
        return result;
    }

    std::string name_;
    std::filesystem::path dumpDir_;
    size_t memoryLimit_;
    size_t dumpThreshold_;
    int retentionDays_;

    mutable std::shared_mutex mutex_;
    std::deque<Observation> buffer_;
    size_t bufferBytes_ = 0;
    Batch inFlight_;              // пакет, который сейчас пишется на диск
    bool dumpInFlight_ = false;
    domain::Timestamp lastDumpAt_;

    std::atomic<bool> accepting_{true};
    std::atomic<uint64_t> fileSeq_{0};

    std::atomic<uint64_t> appended_{0};
    std::atomic<uint64_t> dumps_{0};
    std::atomic<uint64_t> dumpedRecords_{0};
    std::atomic<uint64_t> dumpFailures_{0};
    std::atomic<uint64_t> evicted_{0};
    std::atomic<uint64_t> rejectedAfterClose_{0};
    std::atomic<uint64_t> filesDeleted_{0};

    TaskPool dumpPool_;
};

} // namespace memtrade::adapters::secondary
