/**
 * @file LHEStream.hpp
 * @brief Internal class for reading LHE records from a byte source.
 *
 * This class handles the low-level input (plain or gzip files, standard
 * input, std::istream), feeds it chunk by chunk to an expat SAX parser
 * and assembles the Init and the Event records from the parser callbacks.
 * Only the events completed by the most recent chunk are buffered.
 */

#pragma once

#include "lheutils/Event.hpp"
#include "lheutils/Init.hpp"
#include "lheutils/LHEFile.hpp"
#include <expat.h>
#include <cstddef>
#include <deque>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lheutils
{
    /**
     * @class InputError
     * @brief Raised by a ByteSource when the underlying input fails.
     */
    class InputError : public std::runtime_error
    {
    public:
        InputError(const std::string& what, bool truncated)
            : std::runtime_error(what), m_truncated(truncated) {}

        /// True if the input ended prematurely (e.g. a cut gzip stream).
        bool truncated() const { return m_truncated; }

    private:
        bool m_truncated;
    };

    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /**
         * @brief Reads up to n bytes.
         * @return The number of bytes read, 0 at end of input.
         * @throws InputError on a read error.
         */
        virtual size_t read(char* buffer, size_t n) = 0;
    };

    /**
     * @brief Opens a named file, or standard input for "-".
     * Compressed and plain files are both read through zlib.
     * @throws SourceNotFound if the file does not exist.
     */
    std::unique_ptr<ByteSource> openFileSource(const std::string& filepath);

    /// Wraps a caller-owned stream.
    std::unique_ptr<ByteSource> openStreamSource(std::istream& in);

    class LHEStream
    {
    public:
        LHEStream(std::unique_ptr<ByteSource> source, std::string name);
        ~LHEStream();

        LHEStream(const LHEStream&) = delete;
        LHEStream& operator=(const LHEStream&) = delete;

        /**
         * @brief Parses up to the end of the <init> block.
         * @throws DecodeTruncated or DecodeMalformed if the header is broken.
         */
        void readInit();

        /**
         * @brief Delivers the next event, parsing more input if needed.
         * @return false at the end of the document.
         * @throws DecodeError once, after all events preceding the failure
         * have been delivered.
         */
        bool nextEvent(Event& event);

        const Init& init() const { return m_init; }
        DecodeStatus status() const { return m_status; }
        size_t eventsRead() const { return m_eventsRead; }
        const std::string& name() const { return m_name; }

    private:
        enum class Context
        {
            Document,
            Root,
            Header,
            HeaderRaw,
            InitRwgt,
            WeightGroup,
            Weight,
            Init,
            Event,
            EventRwgt,
            EventWgt,
            EventWeights,
            Skip
        };

        // --- Input ---
        bool pull();
        void fail(DecodeStatus status, const std::string& reason);
        [[noreturn]] void raisePending();

        // --- SAX callbacks ---
        static void XMLCALL onStart(void* ud, const XML_Char* name, const XML_Char** attributes);
        static void XMLCALL onEnd(void* ud, const XML_Char* name);
        static void XMLCALL onChar(void* ud, const XML_Char* buf, int len);
        static void XMLCALL onDefault(void* ud, const XML_Char* buf, int len);

        void startElement(const std::string& name, const XML_Char** attributes);
        void endElement(const std::string& name);
        void abort(const std::string& reason);

        // --- Record assembly ---
        bool parseInitBlock(std::string& error);
        bool parseEventBlock(std::string& error);
        void parsePositionalWeights();

        Context current() const { return m_contexts.back(); }

        std::unique_ptr<ByteSource> m_source;
        std::string m_name;
        XML_Parser m_parser = nullptr;
        std::vector<char> m_buffer;

        Init m_init;
        std::vector<const WeightInfo*> m_weightOrder;
        bool m_initComplete = false;
        bool m_documentComplete = false;
        int m_weightCounter = 0;

        std::vector<Context> m_contexts;
        std::string m_text;      ///< Character data of the current record
        std::string m_innerText; ///< Character data of <weight>, <wgt> or <weights>
        std::string m_weightId;  ///< ID of the <weight> or <wgt> being read
        size_t m_groupIndex = 0; ///< Weight group receiving <weight> elements
        Event m_event;           ///< Event being assembled
        std::deque<Event> m_ready;

        // --- Terminal state ---
        bool m_finished = false;
        DecodeStatus m_status = DecodeStatus::Ok;
        std::string m_errorReason;
        std::string m_callbackError;
        bool m_errorRaised = false;
        size_t m_eventsRead = 0;
    };

} // namespace lheutils
