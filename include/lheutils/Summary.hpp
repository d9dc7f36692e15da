/**
 * @file Summary.hpp
 * @brief Event counts and channel breakdowns that merge across files.
 */

#pragma once

#include "Event.hpp"
#include "EventStream.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lheutils
{
    /**
     * @struct ChannelKey
     * @brief Sorted incoming (status -1) and outgoing (status 1) PDG IDs.
     */
    struct ChannelKey
    {
        std::vector<int> incoming;
        std::vector<int> outgoing;

        static ChannelKey fromEvent(const Event& event);

        /// "[2212, 2212] -> [-11, 11]"
        std::string toString() const;

        bool operator==(const ChannelKey& other) const
        {
            return incoming == other.incoming && outgoing == other.outgoing;
        }
        bool operator<(const ChannelKey& other) const
        {
            if (incoming != other.incoming) return incoming < other.incoming;
            return outgoing < other.outgoing;
        }
    };

    struct ChannelCounts
    {
        size_t events = 0;
        size_t negative = 0;   ///< Events with a negative central weight

        bool operator==(const ChannelCounts& other) const
        {
            return events == other.events && negative == other.negative;
        }
    };

    /**
     * @class Summary
     * @brief Totals and per-channel counts of one or more event streams.
     *
     * merge() is associative and commutative, and a default-constructed
     * Summary is its identity.
     */
    class Summary
    {
    public:
        void add(const Event& event);

        Summary& merge(const Summary& other);
        Summary& operator+=(const Summary& other) { return merge(other); }

        size_t totalEvents() const { return m_events; }
        size_t negativeEvents() const { return m_negative; }

        /// Fraction of events with negative weight, 0 for an empty summary.
        double negativeRatio() const;

        /// Fraction of all events falling in the channel.
        double share(const ChannelKey& key) const;

        const std::map<ChannelKey, ChannelCounts>& channels() const { return m_channels; }

        /// Channels ordered by decreasing event count.
        std::vector<std::pair<ChannelKey, ChannelCounts>> channelsByCount() const;

        bool operator==(const Summary& other) const
        {
            return m_events == other.m_events && m_negative == other.m_negative &&
                   m_channels == other.m_channels;
        }
        bool operator!=(const Summary& other) const { return !(*this == other); }

    private:
        size_t m_events = 0;
        size_t m_negative = 0;
        std::map<ChannelKey, ChannelCounts> m_channels;
    };

    inline Summary operator+(Summary a, const Summary& b)
    {
        a += b;
        return a;
    }

    /// Consumes the whole stream.
    Summary summarize(EventStream& stream);

    /**
     * @struct ProcessSummary
     * @brief Cross-section of one <init> process and the channels of its events.
     */
    struct ProcessSummary
    {
        ProcessInfo process;
        Summary summary;
    };

    /**
     * @struct FileInfo
     * @brief Description of one LHE source, as printed by lheinfo.
     */
    struct FileInfo
    {
        std::string source;
        InitInfo beams;
        std::vector<std::pair<std::string, size_t>> weightGroups; ///< Name and number of weights
        std::vector<ProcessSummary> processes;
        Summary total;

        /// Consumes the whole stream; events of unknown processes count only in total.
        static FileInfo collect(const std::string& source, EventStream& stream);
    };

} // namespace lheutils
