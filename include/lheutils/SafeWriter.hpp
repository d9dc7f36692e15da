/**
 * @file SafeWriter.hpp
 * @brief Writing an EventStream to stdout, a stream or an atomically
 * replaced file.
 */

#pragma once

#include "EventStream.hpp"
#include "LHEFile.hpp"
#include "LHEWriter.hpp"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>

namespace lheutils
{
    /**
     * @class Destination
     * @brief Where a SafeWriter sends its output.
     */
    class Destination
    {
    public:
        enum class Kind { StandardOutput, Stream, File };

        static Destination standardOutput() { return Destination(Kind::StandardOutput, "", nullptr); }
        static Destination stream(std::ostream& out) { return Destination(Kind::Stream, "", &out); }
        static Destination file(const std::string& path) { return Destination(Kind::File, path, nullptr); }

        /// "-" selects standard output.
        static Destination fromPath(const std::string& path)
        {
            return path == "-" ? standardOutput() : file(path);
        }

        Kind kind() const { return m_kind; }
        bool isFile() const { return m_kind == Kind::File; }
        const std::string& path() const { return m_path; }
        std::ostream* ostream() const { return m_stream; }

    private:
        Destination(Kind kind, std::string path, std::ostream* stream)
            : m_kind(kind), m_path(std::move(path)), m_stream(stream) {}

        Kind m_kind;
        std::string m_path;
        std::ostream* m_stream;
    };

    struct WriteOptions
    {
        WeightFormat weightFormat = WeightFormat::Rwgt;

        /// gzip the output. Files ending in .gz or .gzip are always compressed.
        bool compress = false;

        /// Stop at a decode error, close the document and report instead of throwing.
        bool repair = false;

        /// Permission source for a new file (the destination's own bits win if it exists).
        std::string permissionsFrom;
    };

    struct WriteReport
    {
        size_t eventsWritten = 0;
        bool truncated = false;                    ///< The source ended with a decode error
        DecodeStatus status = DecodeStatus::Ok;    ///< Truncated or Malformed if truncated
        std::string reason;                        ///< Message of the decode error
    };

    /**
     * @class SafeWriter
     * @brief Serializes a header and its event stream.
     *
     * File destinations are written to a temporary file in the same
     * directory, flushed to disk and renamed over the destination once
     * the whole stream has been written. On failure the temporary file
     * is removed and the destination is left untouched. Stream
     * destinations are written directly.
     */
    class SafeWriter
    {
    public:
        explicit SafeWriter(WriteOptions options = {}) : m_options(std::move(options)) {}

        /**
         * @brief Writes stream.init() followed by every event of stream.
         *
         * @throws IncompatibleOutputOptions if compression is requested for
         * a stream destination (before any output).
         * @throws DecodeError if the source fails and repair is off.
         * @throws EncodeError if an event cannot be written in the format.
         */
        WriteReport write(EventStream& stream, const Destination& destination) const;

        const WriteOptions& options() const { return m_options; }

    private:
        WriteOptions m_options;
    };

    /// True if path ends in .gz or .gzip.
    bool hasGzipSuffix(const std::string& path);

} // namespace lheutils
