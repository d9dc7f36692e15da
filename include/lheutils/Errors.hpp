/**
 * @file Errors.hpp
 * @brief Exception types raised by the lheutils library.
 *
 * Every error is a std::runtime_error carrying a composed, human-readable
 * message. The derived classes keep the fields a caller needs to decide
 * how to react (source name, event index, weight ID, ...).
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lheutils
{
    /**
     * @class LHEError
     * @brief Base class of all lheutils errors.
     */
    class LHEError : public std::runtime_error
    {
    public:
        explicit LHEError(const std::string& what)
            : std::runtime_error(what) {}
    };

    /**
     * @class DecodeError
     * @brief The decoder hit a terminal condition while reading a source.
     *
     * Events completed before the failure have already been delivered;
     * eventIndex() is the number of events read from the source so far.
     */
    class DecodeError : public LHEError
    {
    public:
        DecodeError(const std::string& source, std::size_t eventIndex, const std::string& reason)
            : LHEError(source + ": " + reason + " (after event " + std::to_string(eventIndex) + ")"),
              m_source(source), m_eventIndex(eventIndex), m_reason(reason) {}

        const std::string& source() const { return m_source; }
        std::size_t eventIndex() const { return m_eventIndex; }
        const std::string& reason() const { return m_reason; }

    private:
        std::string m_source;
        std::size_t m_eventIndex;
        std::string m_reason;
    };

    /// Input ended before the document was complete.
    class DecodeTruncated : public DecodeError
    {
    public:
        DecodeTruncated(const std::string& source, std::size_t eventIndex, const std::string& reason)
            : DecodeError(source, eventIndex, "truncated input: " + reason) {}
    };

    /// Input is not a valid LHE document.
    class DecodeMalformed : public DecodeError
    {
    public:
        DecodeMalformed(const std::string& source, std::size_t eventIndex, const std::string& reason)
            : DecodeError(source, eventIndex, "malformed input: " + reason) {}
    };

    class DuplicateWeightId : public LHEError
    {
    public:
        DuplicateWeightId(const std::string& weightId, const std::string& group)
            : LHEError("Weight ID '" + weightId + "' already exists in group '" + group + "'"),
              m_weightId(weightId), m_group(group) {}

        const std::string& weightId() const { return m_weightId; }
        const std::string& group() const { return m_group; }

    private:
        std::string m_weightId;
        std::string m_group;
    };

    class WeightIdNotFound : public LHEError
    {
    public:
        explicit WeightIdNotFound(const std::string& weightId)
            : LHEError("Weight ID '" + weightId + "' not found in init weight groups"),
              m_weightId(weightId) {}

        const std::string& weightId() const { return m_weightId; }

    private:
        std::string m_weightId;
    };

    /**
     * @class IncompatibleHeaders
     * @brief Two init sections differ, so their event streams cannot be merged.
     */
    class IncompatibleHeaders : public LHEError
    {
    public:
        IncompatibleHeaders(std::size_t sourceIndex, const std::string& field)
            : LHEError("Input " + std::to_string(sourceIndex) +
                       " has a different initialization section than input 0 (first difference: " +
                       field + ")"),
              m_sourceIndex(sourceIndex), m_field(field) {}

        std::size_t sourceIndex() const { return m_sourceIndex; }
        const std::string& field() const { return m_field; }

    private:
        std::size_t m_sourceIndex;
        std::string m_field;
    };

    class InvalidChunkSize : public LHEError
    {
    public:
        explicit InvalidChunkSize(long long chunkSize)
            : LHEError("Chunk size must be a positive integer (got " + std::to_string(chunkSize) + ")") {}
    };

    class IncompatibleOutputOptions : public LHEError
    {
    public:
        explicit IncompatibleOutputOptions(const std::string& what)
            : LHEError(what) {}
    };

    class SourceNotFound : public LHEError
    {
    public:
        explicit SourceNotFound(const std::string& path)
            : LHEError("Input file '" + path + "' not found"), m_path(path) {}

        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
    };

    /// An event cannot be represented in the requested output format.
    class EncodeError : public LHEError
    {
    public:
        explicit EncodeError(const std::string& what)
            : LHEError(what) {}
    };

} // namespace lheutils
