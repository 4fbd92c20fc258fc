// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0

#include "flush_pipeline.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>

namespace hashdb
{
FlushPipeline::FlushPipeline(size_t auto_flush_threshold)
  : m_open{std::make_unique<FlushBatch>()}, m_auto_flush_threshold{auto_flush_threshold}
{}

FlushPipeline::~FlushPipeline() noexcept = default;

bool FlushPipeline::in_closed_batch(const Fea& hash, bool program) const noexcept
{
    return std::ranges::any_of(m_closed, [&](const ClosedBatch& c) {
        return program ? c.batch->find_program(hash) != nullptr :
                         c.batch->find_node(hash) != nullptr;
    });
}

FlushResult FlushPipeline::close_open_batch()
{
    m_open->flush_id = ++m_last_flush_id;
    m_open->state_root = m_state_root;

    HASHDB_LOG(loggers::generic::get(), debug)
        << "flush " << m_open->flush_id << " closed with " << m_open->node_count() << " nodes, "
        << m_open->program_count() << " programs";

    m_closed.push_back({std::shared_ptr<const FlushBatch>{std::move(m_open)}, FlushState::pending});
    m_open = std::make_unique<FlushBatch>();
    m_cv.notify_all();
    return {m_last_flush_id, m_stored_flush_id};
}

void FlushPipeline::stage(std::span<const StagedNode> nodes,
    std::span<const StagedProgram> programs, const std::optional<Fea>& state_root)
{
    std::lock_guard lock{m_mutex};

    for (const auto& w : nodes)
    {
        // Nodes are content-addressed: a second write of the same hash carries the same content.
        if (m_open->find_node(w.hash) != nullptr)
            continue;
        auto& target = (w.known_stored || in_closed_batch(w.hash, false)) ? m_open->nodes_update :
                                                                            m_open->nodes;
        target.put(w.hash, w.node);
    }

    for (const auto& w : programs)
    {
        if (m_open->programs.contains(w.hash))
            m_open->programs.put(w.hash, w.data);
        else if (m_open->programs_update.contains(w.hash) || w.known_stored ||
                 in_closed_batch(w.hash, true))
            m_open->programs_update.put(w.hash, w.data);
        else
            m_open->programs.put(w.hash, w.data);
    }

    if (state_root.has_value())
        m_state_root = *state_root;

    if (m_auto_flush_threshold != 0 && m_open->node_count() >= m_auto_flush_threshold)
        close_open_batch();
}

FlushResult FlushPipeline::flush()
{
    std::lock_guard lock{m_mutex};
    return close_open_batch();
}

std::variant<std::shared_ptr<const FlushBatch>, std::error_code> FlushPipeline::claim(
    uint64_t flush_id)
{
    std::lock_guard lock{m_mutex};

    ClosedBatch* entry = nullptr;
    if (flush_id == 0)
    {
        if (m_closed.empty())
            return std::shared_ptr<const FlushBatch>{};
        entry = &m_closed.front();
    }
    else
    {
        if (flush_id <= m_stored_flush_id || flush_id > m_last_flush_id)
            return make_error_code(DB_KEY_NOT_FOUND);

        // Closed batches have consecutive ids starting right after the stored one.
        entry = &m_closed[flush_id - m_stored_flush_id - 1];
    }

    if (entry->state == FlushState::pending)
    {
        entry->state = FlushState::storing;
        m_storing_flush_id = std::max(m_storing_flush_id, entry->batch->flush_id);
    }
    return entry->batch;
}

std::variant<std::vector<std::shared_ptr<const FlushBatch>>, std::error_code>
FlushPipeline::collect_stored(uint64_t flush_id) const
{
    std::lock_guard lock{m_mutex};

    std::vector<std::shared_ptr<const FlushBatch>> batches;
    if (flush_id <= m_stored_flush_id)
        return batches;
    if (flush_id > m_storing_flush_id)
        return make_error_code(INTERNAL_ERROR);

    for (const auto& c : m_closed)
    {
        if (c.batch->flush_id > flush_id)
            break;
        if (c.state != FlushState::storing)
            return make_error_code(INTERNAL_ERROR);
        batches.push_back(c.batch);
    }
    return batches;
}

std::error_code FlushPipeline::release_stored(uint64_t flush_id)
{
    std::lock_guard lock{m_mutex};

    if (flush_id <= m_stored_flush_id)
        return {};
    if (flush_id > m_storing_flush_id)
        return make_error_code(INTERNAL_ERROR);
    if (std::ranges::any_of(m_closed, [flush_id](const ClosedBatch& c) {
            return c.batch->flush_id <= flush_id && c.state != FlushState::storing;
        }))
        return make_error_code(INTERNAL_ERROR);

    while (!m_closed.empty() && m_closed.front().batch->flush_id <= flush_id)
        m_closed.pop_front();
    m_stored_flush_id = flush_id;

    HASHDB_LOG(loggers::generic::get(), debug) << "flush " << flush_id << " stored";
    return {};
}

std::optional<NodeValue> FlushPipeline::find_node(const Fea& hash) const
{
    std::lock_guard lock{m_mutex};
    if (const auto* n = m_open->find_node(hash))
        return *n;
    for (auto it = m_closed.rbegin(); it != m_closed.rend(); ++it)
    {
        if (const auto* n = it->batch->find_node(hash))
            return *n;
    }
    return {};
}

std::optional<bytes> FlushPipeline::find_program(const Fea& hash) const
{
    std::lock_guard lock{m_mutex};
    if (const auto* p = m_open->find_program(hash))
        return *p;
    for (auto it = m_closed.rbegin(); it != m_closed.rend(); ++it)
    {
        if (const auto* p = it->batch->find_program(hash))
            return *p;
    }
    return {};
}

FlushStatus FlushPipeline::status() const
{
    std::lock_guard lock{m_mutex};

    FlushStatus s;
    s.stored_flush_id = m_stored_flush_id;
    s.storing_flush_id = m_storing_flush_id;
    s.last_flush_id = m_last_flush_id;
    s.pending_to_flush_nodes = m_open->node_count();
    s.pending_to_flush_programs = m_open->program_count();
    for (const auto& c : m_closed)
    {
        if (c.state == FlushState::pending)
        {
            s.pending_to_flush_nodes += c.batch->node_count();
            s.pending_to_flush_programs += c.batch->program_count();
        }
        else
        {
            s.storing_nodes += c.batch->node_count();
            s.storing_programs += c.batch->program_count();
        }
    }
    return s;
}

uint64_t FlushPipeline::stored_flush_id() const
{
    std::lock_guard lock{m_mutex};
    return m_stored_flush_id;
}

bool FlushPipeline::has_open_writes() const
{
    std::lock_guard lock{m_mutex};
    return !m_open->empty();
}

bool FlushPipeline::wait_for_pending(
    std::chrono::milliseconds timeout, const std::atomic<bool>& stop)
{
    std::unique_lock lock{m_mutex};
    const auto has_pending = [this] {
        return std::ranges::any_of(
            m_closed, [](const ClosedBatch& c) { return c.state == FlushState::pending; });
    };
    m_cv.wait_for(lock, timeout, [&] { return stop || has_pending(); });
    return has_pending();
}

void FlushPipeline::notify_all()
{
    {
        // Taking the lock orders the notification after a concurrent predicate check.
        std::lock_guard lock{m_mutex};
    }
    m_cv.notify_all();
}

}  // namespace hashdb
