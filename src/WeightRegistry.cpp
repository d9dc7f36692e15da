/**
 * @file WeightRegistry.cpp
 * @brief Implementation of the WeightRegistry class.
 */

#include "lheutils/WeightRegistry.hpp"
#include "lheutils/Errors.hpp"
#include <algorithm>

namespace lheutils
{
    int WeightRegistry::addWeight(const std::string& group, const std::string& weightId, const std::string& text)
    {
        auto [owner, existing] = m_init.findWeight(weightId);
        if (existing)
        {
            throw DuplicateWeightId(weightId, owner->name());
        }

        WeightInfo weight;
        weight.id = weightId;
        weight.text = text;
        weight.index = m_init.maxWeightIndex() + 1;

        WeightGroup* target = m_init.findWeightGroup(group);
        if (!target)
        {
            m_init.weightGroups.emplace_back(group);
            target = &m_init.weightGroups.back();
        }
        return target->add(std::move(weight)).index;
    }

    void WeightRegistry::restrictTo(const std::string& weightId)
    {
        if (!contains(weightId))
        {
            throw WeightIdNotFound(weightId);
        }

        for (auto& group : m_init.weightGroups)
        {
            group.keepOnly(weightId);
        }
        auto& groups = m_init.weightGroups;
        groups.erase(std::remove_if(groups.begin(), groups.end(),
                                    [](const WeightGroup& g) { return g.empty(); }),
                     groups.end());
    }

} // namespace lheutils
