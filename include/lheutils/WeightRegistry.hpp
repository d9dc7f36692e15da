/**
 * @file WeightRegistry.hpp
 * @brief Guarded mutations of a header's weight-group table.
 */

#pragma once

#include "Init.hpp"
#include <string>
#include <string_view>

namespace lheutils
{
    /**
     * @class WeightRegistry
     * @brief Adds and selects weight definitions of one Init.
     *
     * Weight IDs stay unique across all groups, and new weights get the
     * index max(existing indices) + 1, recomputed on every call.
     */
    class WeightRegistry
    {
    public:
        explicit WeightRegistry(Init& init) : m_init(init) {}

        /**
         * @brief Registers a new weight, creating the group if needed.
         * @return The index given to the new weight.
         * @throws DuplicateWeightId if the ID exists in any group. The
         * header is left unchanged.
         */
        int addWeight(const std::string& group, const std::string& weightId, const std::string& text);

        /**
         * @brief Keeps only the definition of weightId; groups left empty
         * are removed.
         * @throws WeightIdNotFound if no group holds weightId. The header
         * is left unchanged.
         */
        void restrictTo(const std::string& weightId);

        bool contains(std::string_view weightId) const
        {
            return m_init.findWeight(weightId).second != nullptr;
        }

        const Init& init() const { return m_init; }

    private:
        Init& m_init;
    };

} // namespace lheutils
