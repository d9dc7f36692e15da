/**
 * @file Init.cpp
 * @brief Lookups and the structural comparator of Init.
 */

#include "lheutils/Init.hpp"
#include <algorithm>
#include <initializer_list>
#include <map>

namespace lheutils
{

WeightGroup* Init::findWeightGroup(std::string_view name)
{
    for (auto& group : weightGroups)
    {
        if (group.name() == name) return &group;
    }
    return nullptr;
}

const WeightGroup* Init::findWeightGroup(std::string_view name) const
{
    for (const auto& group : weightGroups)
    {
        if (group.name() == name) return &group;
    }
    return nullptr;
}

std::pair<const WeightGroup*, const WeightInfo*> Init::findWeight(std::string_view id) const
{
    for (const auto& group : weightGroups)
    {
        if (const WeightInfo* weight = group.find(id))
        {
            return {&group, weight};
        }
    }
    return {nullptr, nullptr};
}

int Init::maxWeightIndex() const
{
    int maxIndex = 0;
    for (const auto& group : weightGroups)
    {
        for (const auto& weight : group.weights())
        {
            maxIndex = std::max(maxIndex, weight.index);
        }
    }
    return maxIndex;
}

std::vector<const WeightInfo*> Init::weightsByIndex() const
{
    std::vector<const WeightInfo*> result;
    result.reserve(numWeights());
    for (const auto& group : weightGroups)
    {
        for (const auto& weight : group.weights())
        {
            result.push_back(&weight);
        }
    }
    std::stable_sort(result.begin(), result.end(),
        [](const WeightInfo* a, const WeightInfo* b) { return a->index < b->index; });
    return result;
}

size_t Init::numWeights() const
{
    size_t n = 0;
    for (const auto& group : weightGroups) n += group.size();
    return n;
}

// --- Structural comparison ---

namespace
{
    using Difference = std::optional<std::string>;

    template <typename T>
    Difference compareField(const char* name, const T& a, const T& b)
    {
        if (a == b) return std::nullopt;
        return std::string(name);
    }

    Difference compareAttributes(const std::string& where,
                                 const std::map<std::string, std::string>& a,
                                 const std::map<std::string, std::string>& b)
    {
        if (a.size() != b.size())
        {
            return where + " attribute count";
        }
        for (const auto& [key, value] : a)
        {
            auto it = b.find(key);
            if (it == b.end() || it->second != value)
            {
                return where + " attribute '" + key + "'";
            }
        }
        return std::nullopt;
    }

    Difference compareInfo(const InitInfo& a, const InitInfo& b)
    {
        for (auto diff : {
                compareField("beamA", a.beamA, b.beamA),
                compareField("beamB", a.beamB, b.beamB),
                compareField("energyA", a.energyA, b.energyA),
                compareField("energyB", a.energyB, b.energyB),
                compareField("pdfGroupA", a.pdfGroupA, b.pdfGroupA),
                compareField("pdfGroupB", a.pdfGroupB, b.pdfGroupB),
                compareField("pdfSetA", a.pdfSetA, b.pdfSetA),
                compareField("pdfSetB", a.pdfSetB, b.pdfSetB),
                compareField("weightingStrategy", a.weightingStrategy, b.weightingStrategy),
                compareField("numProcesses", a.numProcesses, b.numProcesses)})
        {
            if (diff) return "init." + *diff;
        }
        return std::nullopt;
    }

    Difference compareProcess(size_t i, const ProcessInfo& a, const ProcessInfo& b)
    {
        for (auto diff : {
                compareField("xSection", a.xSection, b.xSection),
                compareField("error", a.error, b.error),
                compareField("maxWeight", a.maxWeight, b.maxWeight),
                compareField("procId", a.procId, b.procId)})
        {
            if (diff) return "process[" + std::to_string(i) + "]." + *diff;
        }
        return std::nullopt;
    }

    Difference compareWeight(const std::string& where, const WeightInfo& a, const WeightInfo& b)
    {
        if (a.text != b.text) return where + ".text";
        if (a.index != b.index) return where + ".index";
        return compareAttributes(where, a.attributes, b.attributes);
    }

    Difference compareGroup(const WeightGroup& a, const WeightGroup& b)
    {
        const std::string where = "weightgroup '" + a.name() + "'";
        if (auto diff = compareAttributes(where, a.attributes(), b.attributes())) return diff;
        if (a.size() != b.size()) return where + " weight count";

        for (const auto& weight : a.weights())
        {
            const WeightInfo* other = b.find(weight.id);
            if (!other) return where + " weight '" + weight.id + "'";
            if (auto diff = compareWeight(where + " weight '" + weight.id + "'", weight, *other)) return diff;
        }
        return std::nullopt;
    }
}

std::optional<std::string> firstDifference(const Init& a, const Init& b)
{
    if (a.version != b.version) return std::string("version");
    if (auto diff = compareInfo(a.info, b.info)) return diff;

    if (a.processes.size() != b.processes.size()) return std::string("process count");
    for (size_t i = 0; i < a.processes.size(); ++i)
    {
        if (auto diff = compareProcess(i, a.processes[i], b.processes[i])) return diff;
    }

    if (a.weightGroups.size() != b.weightGroups.size()) return std::string("weightgroup count");
    for (const auto& group : a.weightGroups)
    {
        const WeightGroup* other = b.findWeightGroup(group.name());
        if (!other) return "weightgroup '" + group.name() + "'";
        if (auto diff = compareGroup(group, *other)) return diff;
    }
    return std::nullopt;
}

} // namespace lheutils
