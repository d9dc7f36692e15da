/**
 * @file LHEWriter.cpp
 * @brief Implementation of the LHEWriter class.
 */

#include "lheutils/LHEWriter.hpp"
#include "lheutils/Errors.hpp"
#include "utils/TextIO.hpp"
#include <map>

namespace lheutils
{
    namespace
    {
        void appendAttribute(std::string& out, const std::string& key, const std::string& value)
        {
            out += ' ';
            out += key;
            out += "=\"";
            out += utils::escapeXml(value);
            out += '"';
        }

        void appendAttributes(std::string& out, const std::map<std::string, std::string>& attributes)
        {
            for (const auto& [key, value] : attributes)
            {
                appendAttribute(out, key, value);
            }
        }

        template <typename T>
        void appendField(std::string& out, T value, size_t width)
        {
            out += ' ';
            utils::appendNumber(out, value, width);
        }

        void appendParticle(std::string& out, const Particle& p)
        {
            appendField(out, p.id, 8);
            appendField(out, p.status, 2);
            appendField(out, p.mother1, 4);
            appendField(out, p.mother2, 4);
            appendField(out, p.color1, 4);
            appendField(out, p.color2, 4);
            appendField(out, p.px, 24);
            appendField(out, p.py, 24);
            appendField(out, p.pz, 24);
            appendField(out, p.e, 24);
            appendField(out, p.m, 24);
            appendField(out, p.lifetime, 0);
            appendField(out, p.spin, 0);
            out += '\n';
        }
    }

    const char* toString(WeightFormat format)
    {
        switch (format)
        {
        case WeightFormat::Rwgt:    return "rwgt";
        case WeightFormat::Weights: return "weights";
        case WeightFormat::None:    return "none";
        }
        return "unknown";
    }

    std::optional<WeightFormat> parseWeightFormat(std::string_view name)
    {
        if (name == "rwgt") return WeightFormat::Rwgt;
        if (name == "weights") return WeightFormat::Weights;
        if (name == "none") return WeightFormat::None;
        return std::nullopt;
    }

    LHEWriter::LHEWriter(const Init& init, WeightFormat format)
        : m_init(init), m_format(format)
    {
        for (const WeightInfo* weight : m_init.weightsByIndex())
        {
            m_weightOrder.push_back(weight->id);
        }
    }

    void LHEWriter::writeHeader(std::string& out) const
    {
        out += "<LesHouchesEvents";
        appendAttribute(out, "version", m_init.version);
        out += ">\n";

        const bool withWeights = m_format != WeightFormat::None && !m_init.weightGroups.empty();
        if (!m_init.headerText.empty() || withWeights)
        {
            out += "<header>\n";
            if (!m_init.headerText.empty())
            {
                // Raw markup, captured unexpanded by the decoder
                out += m_init.headerText;
                out += '\n';
            }
            if (withWeights) writeWeightGroups(out);
            out += "</header>\n";
        }

        writeInit(out);
    }

    void LHEWriter::writeWeightGroups(std::string& out) const
    {
        out += "<initrwgt>\n";
        for (const auto& group : m_init.weightGroups)
        {
            out += "<weightgroup";
            appendAttribute(out, "name", group.name());
            appendAttributes(out, group.attributes());
            out += ">\n";
            for (const auto& weight : group.weights())
            {
                out += "<weight";
                appendAttribute(out, "id", weight.id);
                appendAttributes(out, weight.attributes);
                out += '>';
                out += utils::escapeXml(weight.text);
                out += "</weight>\n";
            }
            out += "</weightgroup>\n";
        }
        out += "</initrwgt>\n";
    }

    void LHEWriter::writeInit(std::string& out) const
    {
        const InitInfo& info = m_init.info;
        out += "<init>\n";
        appendField(out, info.beamA, 8);
        appendField(out, info.beamB, 8);
        appendField(out, info.energyA, 0);
        appendField(out, info.energyB, 0);
        appendField(out, info.pdfGroupA, 0);
        appendField(out, info.pdfGroupB, 0);
        appendField(out, info.pdfSetA, 0);
        appendField(out, info.pdfSetB, 0);
        appendField(out, info.weightingStrategy, 0);
        // NPRUP follows the process list actually written
        appendField(out, static_cast<int>(m_init.processes.size()), 0);
        out += '\n';
        for (const auto& proc : m_init.processes)
        {
            appendField(out, proc.xSection, 0);
            appendField(out, proc.error, 0);
            appendField(out, proc.maxWeight, 0);
            appendField(out, proc.procId, 0);
            out += '\n';
        }
        out += "</init>\n";
    }

    void LHEWriter::writeEvent(std::string& out, const Event& event) const
    {
        if (m_format == WeightFormat::Weights)
        {
            for (const auto& id : m_weightOrder)
            {
                if (!event.weights.count(id))
                {
                    throw EncodeError("Event lacks weight '" + id + "' required by <weights> output");
                }
            }
        }

        const EventInfo& info = event.info;
        out += "<event";
        appendAttributes(out, event.attributes);
        out += ">\n";
        // NUP follows the particle list actually written
        appendField(out, static_cast<int>(event.particles.size()), 0);
        appendField(out, info.procId, 0);
        appendField(out, info.weight, 0);
        appendField(out, info.scale, 0);
        appendField(out, info.aqed, 0);
        appendField(out, info.aqcd, 0);
        out += '\n';
        for (const auto& particle : event.particles)
        {
            appendParticle(out, particle);
        }

        if (m_format == WeightFormat::Rwgt && !event.weights.empty())
        {
            out += "<rwgt>\n";
            auto appendWgt = [&out](const std::string& id, double value)
            {
                out += "<wgt";
                appendAttribute(out, "id", id);
                out += '>';
                appendField(out, value, 0);
                out += " </wgt>\n";
            };
            for (const auto& id : m_weightOrder)
            {
                auto it = event.weights.find(id);
                if (it != event.weights.end()) appendWgt(id, it->second);
            }
            for (const auto& [id, value] : event.weights)
            {
                if (!m_init.findWeight(id).second) appendWgt(id, value);
            }
            out += "</rwgt>\n";
        }
        else if (m_format == WeightFormat::Weights && !m_weightOrder.empty())
        {
            out += "<weights>";
            for (const auto& id : m_weightOrder)
            {
                appendField(out, event.weights.at(id), 0);
            }
            out += " </weights>\n";
        }
        out += "</event>\n";
    }

    void LHEWriter::writeFooter(std::string& out) const
    {
        out += "</LesHouchesEvents>\n";
    }

} // namespace lheutils
