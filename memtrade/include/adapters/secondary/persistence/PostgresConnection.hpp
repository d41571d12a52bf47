#pragma once

#include <pqxx/pqxx>

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace memtrade::adapters::secondary {

/**
 * @brief Соединение с PostgreSQL, общее для операций одного хранилища
 *
 * Операции сериализуются мьютексом. Разорванное соединение
 * переоткрывается при следующем вызове.
 */
class PostgresConnection {
public:
    /**
     * @throws std::exception если БД недоступна
     */
    PostgresConnection(std::string connectionString, std::string tag)
        : connectionString_(std::move(connectionString))
        , tag_(std::move(tag))
    {
        std::cout << "[" << tag_ << "] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString_);
            std::cout << "[" << tag_ << "] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[" << tag_ << "] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresConnection() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    /**
     * @brief Выполнить fn в транзакции и зафиксировать её
     * @throws std::exception при ошибке БД (транзакция откатывается)
     */
    void inTransaction(const std::function<void(pqxx::work&)>& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureOpen();

        pqxx::work txn(*connection_);
        fn(txn);
        txn.commit();
    }

    bool isConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_ && connection_->is_open();
    }

    const std::string& tag() const { return tag_; }

private:
    void ensureOpen() {
        if (!connection_ || !connection_->is_open()) {
            std::cerr << "[" << tag_ << "] Connection lost, reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(connectionString_);
        }
    }

    std::string connectionString_;
    std::string tag_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace memtrade::adapters::secondary
