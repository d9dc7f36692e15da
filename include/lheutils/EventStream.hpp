/**
 * @file EventStream.hpp
 * @brief Lazy, forward-only sequences of events bound to one Init.
 *
 * Every stage of a pipeline (decoder, transforms, merge, split) is an
 * EventStream and pulls from the stage before it. Nothing is read ahead
 * beyond what a stage needs to produce its next event.
 */

#pragma once

#include "Event.hpp"
#include "Init.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace lheutils
{
    class EventStream
    {
    public:
        virtual ~EventStream() = default;

        /**
         * @brief The header shared by every event of this stream.
         *
         * Stages that mutate the header do so before the first event is
         * pulled, so the returned reference is stable during iteration.
         */
        virtual const Init& init() const = 0;

        /**
         * @brief Pulls the next event.
         * @param event Event object to be overwritten.
         * @return true if an event was produced, false at the end of the stream.
         * @throws DecodeError if the underlying source is truncated or malformed.
         */
        virtual bool next(Event& event) = 0;
    };

    /**
     * @class VectorEventStream
     * @brief An EventStream over events held in memory.
     */
    class VectorEventStream : public EventStream
    {
    public:
        VectorEventStream(Init init, std::vector<Event> events)
            : m_init(std::move(init)), m_events(std::move(events)) {}

        const Init& init() const override { return m_init; }

        bool next(Event& event) override
        {
            if (m_pos >= m_events.size()) return false;
            event = m_events[m_pos++];
            return true;
        }

    private:
        Init m_init;
        std::vector<Event> m_events;
        size_t m_pos = 0;
    };

} // namespace lheutils
