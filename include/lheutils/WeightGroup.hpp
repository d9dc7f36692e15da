/**
 * @file WeightGroup.hpp
 * @brief A named group of alternate event weight definitions.
 *
 * Weights are kept in file order. IDs are unique inside a group; the
 * stronger header-wide uniqueness is enforced by WeightRegistry.
 */

#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lheutils
{
    /**
     * @struct WeightInfo
     * @brief One <weight> definition of the <initrwgt> block.
     */
    struct WeightInfo
    {
        std::string id;
        std::string text;   ///< Content of the <weight> element
        int index = 0;      ///< Position among all header weights (1-based)

        /// Attributes other than 'id' (e.g. MUR, MUF, PDF)
        std::map<std::string, std::string> attributes;
    };

    class WeightGroup
    {
    public:
        WeightGroup() = default;
        explicit WeightGroup(std::string name) : m_name(std::move(name)) {}

        const std::string& name() const { return m_name; }

        /// Attributes other than 'name' (e.g. combine)
        std::map<std::string, std::string>& attributes() { return m_attributes; }
        const std::map<std::string, std::string>& attributes() const { return m_attributes; }

        WeightInfo* find(std::string_view id)
        {
            for (auto& weight : m_weights)
            {
                if (weight.id == id) return &weight;
            }
            return nullptr;
        }

        const WeightInfo* find(std::string_view id) const
        {
            for (const auto& weight : m_weights)
            {
                if (weight.id == id) return &weight;
            }
            return nullptr;
        }

        bool contains(std::string_view id) const { return find(id) != nullptr; }

        /**
         * @brief Appends a weight definition.
         * @throws std::runtime_error if the ID is already in this group.
         */
        WeightInfo& add(WeightInfo weight)
        {
            if (contains(weight.id))
            {
                throw std::runtime_error("Duplicate weight id '" + weight.id + "' in group '" + m_name + "'");
            }
            m_weights.push_back(std::move(weight));
            return m_weights.back();
        }

        /// Keeps only the weight with the given ID (or nothing if absent).
        void keepOnly(std::string_view id)
        {
            std::vector<WeightInfo> kept;
            if (const WeightInfo* weight = find(id))
            {
                kept.push_back(*weight);
            }
            m_weights = std::move(kept);
        }

        const std::vector<WeightInfo>& weights() const { return m_weights; }
        size_t size() const { return m_weights.size(); }
        bool empty() const { return m_weights.empty(); }

    private:
        std::string m_name;
        std::map<std::string, std::string> m_attributes;
        std::vector<WeightInfo> m_weights;
    };

} // namespace lheutils
