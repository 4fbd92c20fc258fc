// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "database.hpp"
#include "durable_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace hashdb
{
/// The background durable writer.
///
/// Claims closed flush batches oldest first, commits them to the durable store and
/// acknowledges them. A failed commit keeps the batch in the STORING state and is retried
/// after retry_delay. With a non-zero flush interval the worker also closes the open batch
/// periodically if it holds writes.
class FlushWorker
{
    Database& m_db;
    DurableStore& m_durable;
    const std::chrono::milliseconds m_flush_interval;
    const std::chrono::milliseconds m_retry_delay;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<uint64_t> m_batches_written{0};
    std::atomic<uint64_t> m_failures{0};

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;

    void run();

    /// Stores the oldest unacknowledged batch if there is one.
    /// @return False if the batch could not be stored.
    bool store_next();

    void back_off();

public:
    FlushWorker(Database& db, DurableStore& durable, std::chrono::milliseconds flush_interval,
        std::chrono::milliseconds retry_delay = std::chrono::milliseconds{100});
    ~FlushWorker() noexcept;

    FlushWorker(const FlushWorker&) = delete;
    FlushWorker& operator=(const FlushWorker&) = delete;

    void start();

    /// Stops the thread. Batches not stored yet stay in the pipeline.
    void stop();

    [[nodiscard]] bool running() const noexcept { return m_running; }
    [[nodiscard]] uint64_t batches_written() const noexcept { return m_batches_written; }
    [[nodiscard]] uint64_t failures() const noexcept { return m_failures; }
};

}  // namespace hashdb
