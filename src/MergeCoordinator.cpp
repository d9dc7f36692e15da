/**
 * @file MergeCoordinator.cpp
 * @brief Implementation of the ConcatenatedStream class and merge().
 */

#include "lheutils/MergeCoordinator.hpp"
#include "lheutils/Errors.hpp"
#include <stdexcept>
#include <utility>

namespace lheutils
{
    ConcatenatedStream::ConcatenatedStream(std::vector<std::unique_ptr<EventStream>> sources)
        : m_sources(std::move(sources))
    {
        if (m_sources.empty())
        {
            throw std::invalid_argument("Cannot concatenate an empty list of sources");
        }

        const Init& reference = m_sources.front()->init();
        for (size_t i = 1; i < m_sources.size(); ++i)
        {
            if (auto field = firstDifference(reference, m_sources[i]->init()))
            {
                throw IncompatibleHeaders(i, *field);
            }
        }
        m_init = reference;
    }

    bool ConcatenatedStream::next(Event& event)
    {
        while (m_current < m_sources.size())
        {
            if (m_sources[m_current]->next(event))
            {
                ++m_total;
                return true;
            }
            // Release the exhausted source (closes its file)
            m_sources[m_current].reset();
            ++m_current;
        }
        return false;
    }

    std::unique_ptr<EventStream> merge(std::vector<std::unique_ptr<EventStream>> sources)
    {
        if (sources.empty())
        {
            throw std::invalid_argument("merge() requires at least one source");
        }
        if (sources.size() == 1)
        {
            return std::move(sources.front());
        }
        return std::make_unique<ConcatenatedStream>(std::move(sources));
    }

} // namespace lheutils
