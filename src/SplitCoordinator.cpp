/**
 * @file SplitCoordinator.cpp
 * @brief Implementation of the EventSplitter and ChunkStream classes.
 */

#include "lheutils/SplitCoordinator.hpp"
#include "lheutils/Errors.hpp"
#include <memory>
#include <utility>

namespace lheutils
{
    const Init& ChunkStream::init() const
    {
        return m_splitter.init();
    }

    bool ChunkStream::next(Event& event)
    {
        if (!m_splitter.pull(m_index, event)) return false;
        ++m_delivered;
        return true;
    }

    EventSplitter::EventSplitter(std::unique_ptr<EventStream> source, long long chunkSize)
        : m_source(std::move(source)), m_chunkSize(0)
    {
        if (chunkSize <= 0)
        {
            throw InvalidChunkSize(chunkSize);
        }
        m_chunkSize = static_cast<size_t>(chunkSize);
    }

    bool EventSplitter::fillLookahead()
    {
        if (!m_hasLookahead && !m_sourceDone)
        {
            m_hasLookahead = m_source->next(m_lookahead);
            if (!m_hasLookahead) m_sourceDone = true;
        }
        return m_hasLookahead;
    }

    std::unique_ptr<ChunkStream> EventSplitter::nextChunk()
    {
        // Drain whatever the previous chunk left unread
        while (m_remaining > 0 && fillLookahead())
        {
            m_hasLookahead = false;
            --m_remaining;
        }

        const bool hasEvents = fillLookahead();
        if (!hasEvents && m_chunks > 0)
        {
            return nullptr;
        }

        ++m_chunks;
        m_remaining = m_chunkSize;
        return std::make_unique<ChunkStream>(ChunkStream::Key{}, *this, m_chunks);
    }

    bool EventSplitter::pull(size_t chunkIndex, Event& event)
    {
        if (chunkIndex != m_chunks || m_remaining == 0) return false;
        if (!fillLookahead()) return false;

        event = std::move(m_lookahead);
        m_hasLookahead = false;
        --m_remaining;
        return true;
    }

} // namespace lheutils
