/**
 * @file LHEWriter.hpp
 * @brief Serialization of an Init and its events to LHE text.
 */

#pragma once

#include "Event.hpp"
#include "Init.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lheutils
{
    /**
     * @brief Which per-event weight information is written.
     */
    enum class WeightFormat
    {
        Rwgt,     ///< <rwgt><wgt id=...> blocks
        Weights,  ///< Positional <weights> blocks, in header index order
        None      ///< No alternate weights and no <initrwgt>
    };

    const char* toString(WeightFormat format);

    /// Parses "rwgt", "weights" or "none".
    std::optional<WeightFormat> parseWeightFormat(std::string_view name);

    /**
     * @class LHEWriter
     * @brief Appends the LHE text of one document to string buffers.
     *
     * Numbers are written in the shortest form that reads back to the
     * same value, so decoding the output reproduces every field exactly.
     * The Init must outlive the writer.
     */
    class LHEWriter
    {
    public:
        LHEWriter(const Init& init, WeightFormat format = WeightFormat::Rwgt);

        /// Opening tag, <header> and <init>.
        void writeHeader(std::string& out) const;

        /// The <init> block alone.
        void writeInit(std::string& out) const;

        /**
         * @brief Appends one <event> block.
         * @throws EncodeError if the format is Weights and the event lacks
         * one of the header's weights. Nothing is appended in that case.
         */
        void writeEvent(std::string& out, const Event& event) const;

        /// Closing </LesHouchesEvents>.
        void writeFooter(std::string& out) const;

        WeightFormat format() const { return m_format; }

    private:
        void writeWeightGroups(std::string& out) const;

        const Init& m_init;
        WeightFormat m_format;
        std::vector<std::string> m_weightOrder; ///< Header weight IDs by index
    };

} // namespace lheutils
