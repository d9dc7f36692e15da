/**
 * @file SplitCoordinator.hpp
 * @brief Partitioning of one event stream into bounded-size chunks.
 */

#pragma once

#include "EventStream.hpp"
#include <cstddef>
#include <memory>

namespace lheutils
{
    class EventSplitter;

    /**
     * @class ChunkStream
     * @brief View over the next chunkSize events of an EventSplitter.
     *
     * A chunk stops producing events once the splitter has moved on to
     * the next chunk. It must not outlive its splitter.
     */
    class ChunkStream : public EventStream
    {
    public:
        /// Only an EventSplitter can create chunks.
        class Key
        {
            friend class EventSplitter;
            Key() = default;
        };

        ChunkStream(Key, EventSplitter& splitter, size_t index)
            : m_splitter(splitter), m_index(index) {}

        const Init& init() const override;
        bool next(Event& event) override;

        /// Position of this chunk in the split (1-based).
        size_t index() const { return m_index; }

        /// Events delivered by this chunk so far.
        size_t eventsRead() const { return m_delivered; }

    private:
        EventSplitter& m_splitter;
        size_t m_index;
        size_t m_delivered = 0;
    };

    /**
     * @class EventSplitter
     * @brief Lazy sequence of chunks of at most chunkSize events.
     *
     * Only the event that decides whether another chunk exists is read
     * ahead, so no empty trailing chunk is produced. An empty source
     * yields exactly one empty chunk.
     */
    class EventSplitter
    {
    public:
        /**
         * @throws InvalidChunkSize if chunkSize is not positive.
         */
        EventSplitter(std::unique_ptr<EventStream> source, long long chunkSize);

        const Init& init() const { return m_source->init(); }

        /**
         * @brief Starts the next chunk.
         *
         * Events left unread in the previous chunk are skipped, so chunk
         * boundaries always fall on multiples of chunkSize.
         *
         * @return The chunk, or nullptr when the source is exhausted.
         */
        std::unique_ptr<ChunkStream> nextChunk();

        size_t chunkSize() const { return m_chunkSize; }
        size_t chunksProduced() const { return m_chunks; }

    private:
        friend class ChunkStream;

        bool pull(size_t chunkIndex, Event& event);
        bool fillLookahead();

        std::unique_ptr<EventStream> m_source;
        size_t m_chunkSize;

        Event m_lookahead;
        bool m_hasLookahead = false;
        bool m_sourceDone = false;

        size_t m_chunks = 0;
        size_t m_remaining = 0; ///< Events the current chunk may still deliver
    };

} // namespace lheutils
