#pragma once

#include <pqxx/pqxx>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace promptgrid {

/**
 * @brief Smart pointer for database connections that handles returning to pool.
 */
using DbConnectionPtr = std::unique_ptr<pqxx::connection, std::function<void(pqxx::connection*)>>;

/**
 * @brief Hands out PostgreSQL connections to the store.
 */
class DbConnectionManager {
public:
    virtual ~DbConnectionManager() = default;

    virtual DbConnectionPtr GetConnection() = 0;

    virtual std::string GetConnectionString() const = 0;
};

/**
 * @brief Bounded connection pool shared by the worker threads of one process.
 */
class PooledDbConnectionManager : public DbConnectionManager {
public:
    using ConnectionInitializer = std::function<void(pqxx::connection&)>;

    PooledDbConnectionManager(std::string conn_str,
                              size_t pool_size,
                              std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5),
                              ConnectionInitializer initializer = nullptr);
    ~PooledDbConnectionManager() override;

    DbConnectionPtr GetConnection() override;
    std::string GetConnectionString() const override { return conn_str_; }

    struct PoolStats {
        size_t size;
        size_t in_use;
        size_t available;
        long long total_acquires;
        long long total_timeouts;
        double total_wait_ms;
    };
    PoolStats GetStats() const;

private:
    void ReleaseConnection(pqxx::connection* conn);

    std::string conn_str_;
    size_t pool_size_;
    std::chrono::milliseconds acquire_timeout_;
    ConnectionInitializer initializer_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<pqxx::connection>> pool_;
    size_t in_use_count_ = 0;

    long long total_acquires_ = 0;
    long long total_timeouts_ = 0;
    double total_wait_ms_ = 0.0;

    bool shutdown_ = false;
};

} // namespace promptgrid
