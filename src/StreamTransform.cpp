/**
 * @file StreamTransform.cpp
 * @brief Implementation of the TransformedStream class.
 */

#include "lheutils/StreamTransform.hpp"
#include "lheutils/WeightRegistry.hpp"
#include <utility>

namespace lheutils
{
    TransformedStream::TransformedStream(std::unique_ptr<EventStream> source,
                                         std::vector<TransformPolicy> policies)
        : m_source(std::move(source)), m_policies(std::move(policies)), m_init(m_source->init())
    {
        WeightRegistry registry(m_init);
        for (const auto& policy : m_policies)
        {
            if (const auto* append = std::get_if<AppendWeight>(&policy))
            {
                registry.addWeight(append->group, append->weightId, append->text);
            }
            else if (const auto* only = std::get_if<RestrictToWeight>(&policy))
            {
                registry.restrictTo(only->weightId);
            }
        }
    }

    bool TransformedStream::next(Event& event)
    {
        while (m_source->next(event))
        {
            if (apply(event)) return true;
            ++m_dropped;
        }
        return false;
    }

    bool TransformedStream::apply(Event& event) const
    {
        for (const auto& policy : m_policies)
        {
            if (const auto* append = std::get_if<AppendWeight>(&policy))
            {
                event.weights[append->weightId] = event.info.weight;
            }
            else if (const auto* only = std::get_if<RestrictToWeight>(&policy))
            {
                auto it = event.weights.find(only->weightId);
                if (it == event.weights.end()) return false;

                const double value = it->second;
                event.info.weight = value;
                event.weights.clear();
                event.weights.emplace(only->weightId, value);
            }
        }
        return true;
    }

} // namespace lheutils
