/**
 * @file Summary.cpp
 * @brief Implementation of the Summary and FileInfo classes.
 */

#include "lheutils/Summary.hpp"
#include <algorithm>
#include <sstream>

namespace lheutils
{
    namespace
    {
        void appendList(std::ostringstream& out, const std::vector<int>& ids)
        {
            out << '[';
            for (size_t i = 0; i < ids.size(); ++i)
            {
                if (i) out << ", ";
                out << ids[i];
            }
            out << ']';
        }
    }

    ChannelKey ChannelKey::fromEvent(const Event& event)
    {
        ChannelKey key;
        for (const auto& particle : event.particles)
        {
            if (particle.status == -1) key.incoming.push_back(particle.id);
            else if (particle.status == 1) key.outgoing.push_back(particle.id);
        }
        std::sort(key.incoming.begin(), key.incoming.end());
        std::sort(key.outgoing.begin(), key.outgoing.end());
        return key;
    }

    std::string ChannelKey::toString() const
    {
        std::ostringstream out;
        appendList(out, incoming);
        out << " -> ";
        appendList(out, outgoing);
        return out.str();
    }

    void Summary::add(const Event& event)
    {
        const bool negative = event.info.weight < 0.0;
        ChannelCounts& counts = m_channels[ChannelKey::fromEvent(event)];
        ++counts.events;
        ++m_events;
        if (negative)
        {
            ++counts.negative;
            ++m_negative;
        }
    }

    Summary& Summary::merge(const Summary& other)
    {
        m_events += other.m_events;
        m_negative += other.m_negative;
        for (const auto& [key, counts] : other.m_channels)
        {
            ChannelCounts& mine = m_channels[key];
            mine.events += counts.events;
            mine.negative += counts.negative;
        }
        return *this;
    }

    double Summary::negativeRatio() const
    {
        if (m_events == 0) return 0.0;
        return static_cast<double>(m_negative) / static_cast<double>(m_events);
    }

    double Summary::share(const ChannelKey& key) const
    {
        auto it = m_channels.find(key);
        if (m_events == 0 || it == m_channels.end()) return 0.0;
        return static_cast<double>(it->second.events) / static_cast<double>(m_events);
    }

    std::vector<std::pair<ChannelKey, ChannelCounts>> Summary::channelsByCount() const
    {
        std::vector<std::pair<ChannelKey, ChannelCounts>> sorted(m_channels.begin(), m_channels.end());
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b) { return a.second.events > b.second.events; });
        return sorted;
    }

    Summary summarize(EventStream& stream)
    {
        Summary summary;
        Event event;
        while (stream.next(event))
        {
            summary.add(event);
        }
        return summary;
    }

    FileInfo FileInfo::collect(const std::string& source, EventStream& stream)
    {
        const Init& init = stream.init();

        FileInfo info;
        info.source = source;
        info.beams = init.info;
        for (const auto& group : init.weightGroups)
        {
            info.weightGroups.emplace_back(group.name(), group.size());
        }
        for (const auto& proc : init.processes)
        {
            info.processes.push_back({proc, Summary{}});
        }

        Event event;
        while (stream.next(event))
        {
            info.total.add(event);
            for (auto& proc : info.processes)
            {
                if (proc.process.procId == event.info.procId)
                {
                    proc.summary.add(event);
                    break;
                }
            }
        }
        return info;
    }

} // namespace lheutils
