/**
 * @file Init.hpp
 * @brief The shared initialization section of an LHE file.
 *
 * Holds the <init> block (beams and processes), the weight group table
 * of <initrwgt> and the verbatim remainder of the <header> block. One
 * Init is decoded per file and shared by every event of that file.
 */

#pragma once

#include "WeightGroup.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lheutils
{
    /**
     * @struct InitInfo
     * @brief First line of the <init> block.
     *
     * IDBMUP(1,2) EBMUP(1,2) PDFGUP(1,2) PDFSUP(1,2) IDWTUP NPRUP
     */
    struct InitInfo
    {
        int    beamA = 0;            ///< PDG ID of beam A
        int    beamB = 0;            ///< PDG ID of beam B
        double energyA = 0.0;        ///< Energy of beam A [GeV]
        double energyB = 0.0;        ///< Energy of beam B [GeV]
        int    pdfGroupA = 0;
        int    pdfGroupB = 0;
        int    pdfSetA = 0;
        int    pdfSetB = 0;
        int    weightingStrategy = 0; ///< IDWTUP
        int    numProcesses = 0;      ///< NPRUP
    };

    /**
     * @struct ProcessInfo
     * @brief One process line of the <init> block: XSECUP XERRUP XMAXUP LPRUP.
     */
    struct ProcessInfo
    {
        double xSection = 0.0;  ///< [pb]
        double error = 0.0;     ///< [pb]
        double maxWeight = 0.0;
        int    procId = 0;
    };

    struct Init
    {
        std::string version = "3.0";
        InitInfo info;
        std::vector<ProcessInfo> processes;
        std::vector<WeightGroup> weightGroups;

        /// Content of <header> except <initrwgt>, kept verbatim. Not part
        /// of header equality.
        std::string headerText;

        WeightGroup* findWeightGroup(std::string_view name);
        const WeightGroup* findWeightGroup(std::string_view name) const;

        /**
         * @brief Looks up a weight ID across all groups.
         * @return The owning group and the weight, or {nullptr, nullptr}.
         */
        std::pair<const WeightGroup*, const WeightInfo*> findWeight(std::string_view id) const;

        /// Largest weight index of the header, 0 if there are no weights.
        int maxWeightIndex() const;

        /// All weight definitions ordered by index.
        std::vector<const WeightInfo*> weightsByIndex() const;

        size_t numWeights() const;
    };

    /**
     * @brief Field-by-field comparison of two init sections.
     *
     * Compares the version, InitInfo, every process and every weight group
     * and weight definition including attributes. Groups are matched by name
     * and weights by ID, so the order of the table does not matter.
     *
     * @return A description of the first differing field, or std::nullopt
     * if both are structurally equal.
     */
    std::optional<std::string> firstDifference(const Init& a, const Init& b);

    inline bool operator==(const Init& a, const Init& b) { return !firstDifference(a, b).has_value(); }
    inline bool operator!=(const Init& a, const Init& b) { return !(a == b); }

} // namespace lheutils
