/**
 * @file StreamTransform.hpp
 * @brief Weight-aware transforms applied lazily to an EventStream.
 */

#pragma once

#include "EventStream.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace lheutils
{
    /**
     * @brief Copies each event's central weight into a new named weight.
     * The weight is registered in the header under the given group.
     */
    struct AppendWeight
    {
        std::string group;
        std::string weightId;
        std::string text;
    };

    /**
     * @brief Promotes one alternate weight to the central weight.
     *
     * The event keeps only the selected weight entry, and the header only
     * its definition. Events without the weight are dropped.
     */
    struct RestrictToWeight
    {
        std::string weightId;
    };

    using TransformPolicy = std::variant<AppendWeight, RestrictToWeight>;

    /**
     * @class TransformedStream
     * @brief Applies a list of policies, in order, to another stream.
     *
     * The header is adjusted in the constructor, before any event is
     * pulled. Events are transformed one at a time in next().
     */
    class TransformedStream : public EventStream
    {
    public:
        /**
         * @throws DuplicateWeightId or WeightIdNotFound if a policy cannot
         * be applied to the source header.
         */
        TransformedStream(std::unique_ptr<EventStream> source, std::vector<TransformPolicy> policies);

        const Init& init() const override { return m_init; }
        bool next(Event& event) override;

        /// Number of events removed by RestrictToWeight so far.
        size_t eventsDropped() const { return m_dropped; }

    private:
        bool apply(Event& event) const;

        std::unique_ptr<EventStream> m_source;
        std::vector<TransformPolicy> m_policies;
        Init m_init;
        size_t m_dropped = 0;
    };

} // namespace lheutils
