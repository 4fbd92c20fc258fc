// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "flush_worker.hpp"
#include "log.hpp"

namespace hashdb
{
namespace
{
/// The wait between checks for the stop request when no flush interval is configured.
constexpr std::chrono::milliseconds IDLE_WAIT{1000};
}  // namespace

FlushWorker::FlushWorker(Database& db, DurableStore& durable,
    std::chrono::milliseconds flush_interval, std::chrono::milliseconds retry_delay)
  : m_db{db}, m_durable{durable}, m_flush_interval{flush_interval}, m_retry_delay{retry_delay}
{}

FlushWorker::~FlushWorker() noexcept
{
    stop();
}

void FlushWorker::start()
{
    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true))
        return;
    m_stopping = false;
    m_thread = std::thread([this] { run(); });
    HASHDB_LOG(loggers::generic::get(), info) << "flush worker started";
}

void FlushWorker::stop()
{
    if (!m_running.exchange(false))
        return;

    m_stopping = true;
    {
        std::lock_guard lock{m_mutex};
    }
    m_cv.notify_all();
    m_db.pipeline().notify_all();

    if (m_thread.joinable())
        m_thread.join();
    HASHDB_LOG(loggers::generic::get(), info)
        << "flush worker stopped after " << m_batches_written << " batches";
}

void FlushWorker::run()
{
    using clock = std::chrono::steady_clock;
    auto& pipeline = m_db.pipeline();
    auto last_flush = clock::now();
    bool retry = false;

    while (!m_stopping)
    {
        auto timeout = IDLE_WAIT;
        if (m_flush_interval.count() != 0)
        {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - last_flush);
            if (elapsed >= m_flush_interval)
            {
                if (pipeline.has_open_writes())
                    pipeline.flush();
                last_flush = clock::now();
                timeout = m_flush_interval;
            }
            else
                timeout = m_flush_interval - elapsed;
        }

        if (retry)
            back_off();
        else if (!pipeline.wait_for_pending(timeout, m_stopping))
            continue;

        if (m_stopping)
            break;
        retry = !store_next();
    }
}

bool FlushWorker::store_next()
{
    auto claimed = m_db.pipeline().claim(0);
    if (const auto* ec = std::get_if<std::error_code>(&claimed))
    {
        HASHDB_LOG(loggers::generic::get(), error) << "cannot claim flush batch: " << ec->message();
        ++m_failures;
        return false;
    }

    const auto batch = std::get<std::shared_ptr<const FlushBatch>>(claimed);
    if (batch == nullptr)
        return true;

    if (const auto ec = m_durable.write_batch(*batch))
    {
        HASHDB_LOG(loggers::generic::get(), warning)
            << "commit of flush " << batch->flush_id << " failed: " << ec.message()
            << ", retrying in " << m_retry_delay.count() << " ms";
        ++m_failures;
        return false;
    }

    if (const auto ec = m_db.ack_flush(batch->flush_id))
    {
        HASHDB_LOG(loggers::generic::get(), error)
            << "acknowledgement of flush " << batch->flush_id << " failed: " << ec.message();
        ++m_failures;
        return false;
    }

    ++m_batches_written;
    HASHDB_LOG(loggers::generic::get(), debug)
        << "flush " << batch->flush_id << " committed: " << batch->node_count() << " nodes, "
        << batch->program_count() << " programs";
    return true;
}

void FlushWorker::back_off()
{
    std::unique_lock lock{m_mutex};
    m_cv.wait_for(lock, m_retry_delay, [this] { return m_stopping.load(); });
}

}  // namespace hashdb
