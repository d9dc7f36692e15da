/**
 * @file LHEFile.hpp
 * @brief The main user-facing API for reading an LHE file.
 *
 * LHEFile opens a .lhe or .lhe.gz file (or standard input) and parses the
 * header eagerly. Events are decoded lazily, one pull at a time, so files
 * of any size can be processed without holding them in memory.
 */

#pragma once

#include "EventStream.hpp"
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

namespace lheutils
{
    /**
     * @brief Terminal condition of a decoded source.
     */
    enum class DecodeStatus
    {
        Ok,         ///< No error so far (or clean end of document)
        Truncated,  ///< Input ended before the document was complete
        Malformed   ///< Input is not a valid LHE document
    };

    const char* toString(DecodeStatus status);

    /**
     * @class LHEFile
     * @brief Decoder of one LHE source, exposed as an EventStream.
     */
    class LHEFile : public EventStream
    {
    public:
        /**
         * @brief Opens an LHE file for reading.
         *
         * Compressed input is detected from the content, not the suffix.
         *
         * @param filepath Path to the file, or "-" for standard input.
         * @throws SourceNotFound if the file does not exist.
         * @throws DecodeTruncated or DecodeMalformed if the header cannot
         * be decoded.
         */
        explicit LHEFile(const std::string& filepath);

        /**
         * @brief Reads an LHE document from a caller-owned stream.
         * @param in The stream; must outlive this object.
         * @param name Source name used in error messages.
         */
        explicit LHEFile(std::istream& in, const std::string& name = "<stream>");

        ~LHEFile() override;

        // --- EventStream ---

        const Init& init() const override;

        /**
         * @brief Reads the next event from the source sequentially.
         *
         * @param event An Event object to be populated.
         * @return true if an event was read, false at the end of the file.
         * @throws DecodeTruncated or DecodeMalformed when the source turns
         * out to be broken. The error is raised once, after every event
         * preceding the failure has been returned; later calls return false.
         */
        bool next(Event& event) override;

        // --- Source state ---

        /// Terminal condition observed so far.
        DecodeStatus status() const;

        /// Number of events returned by next().
        size_t eventsRead() const;

        /// File path, "<stdin>" or the stream name.
        const std::string& sourceName() const;

    private:
        /**
         * @struct Impl
         * @brief Private implementation (PIMPL) idiom.
         */
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace lheutils
