/**
 * @file MergeCoordinator.hpp
 * @brief Concatenation of event streams sharing one header.
 */

#pragma once

#include "EventStream.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace lheutils
{
    /**
     * @class ConcatenatedStream
     * @brief Exhausts each source in order before moving to the next.
     */
    class ConcatenatedStream : public EventStream
    {
    public:
        /**
         * @brief Checks every header against the first one.
         *
         * No event is pulled before all headers have been compared.
         *
         * @throws std::invalid_argument if sources is empty.
         * @throws IncompatibleHeaders naming the first mismatching source
         * and field.
         */
        explicit ConcatenatedStream(std::vector<std::unique_ptr<EventStream>> sources);

        const Init& init() const override { return m_init; }
        bool next(Event& event) override;

        /// Events delivered so far; the grand total once exhausted.
        size_t totalEvents() const { return m_total; }

        size_t numSources() const { return m_sources.size(); }

    private:
        std::vector<std::unique_ptr<EventStream>> m_sources;
        Init m_init;
        size_t m_current = 0;
        size_t m_total = 0;
    };

    /**
     * @brief Merges the sources into one stream.
     *
     * A single source is returned unchanged.
     *
     * @throws std::invalid_argument if sources is empty.
     * @throws IncompatibleHeaders if the headers differ.
     */
    std::unique_ptr<EventStream> merge(std::vector<std::unique_ptr<EventStream>> sources);

} // namespace lheutils
