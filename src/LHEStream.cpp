/**
 * @file LHEStream.cpp
 * @brief Implementation of the LHEStream class.
 */

#include "LHEStream.hpp"
#include "lheutils/Errors.hpp"
#include "utils/TextIO.hpp" // Use the central utility
#include <zlib.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <utility>

namespace lheutils
{

namespace
{
    constexpr size_t kChunkSize = 65536;

    class GzipSource : public ByteSource
    {
    public:
        GzipSource(gzFile file, std::string name)
            : m_file(file), m_name(std::move(name))
        {
            gzbuffer(m_file, 128 * 1024);
        }

        ~GzipSource() override
        {
            gzclose(m_file);
        }

        size_t read(char* buffer, size_t n) override
        {
            int got = gzread(m_file, buffer, static_cast<unsigned>(n));
            if (got > 0)
            {
                // A pending error (if any) is reported by the next call.
                return static_cast<size_t>(got);
            }

            int errnum = Z_OK;
            const char* msg = gzerror(m_file, &errnum);
            if (errnum == Z_OK && got == 0)
            {
                return 0;
            }
            if (errnum == Z_ERRNO)
            {
                throw InputError("read error on " + m_name + ": " + std::strerror(errno), false);
            }
            // Z_BUF_ERROR: the compressed stream ended early
            throw InputError(std::string("gzip: ") + (msg ? msg : "read error"), errnum == Z_BUF_ERROR);
        }

    private:
        gzFile m_file;
        std::string m_name;
    };

    class IStreamSource : public ByteSource
    {
    public:
        explicit IStreamSource(std::istream& in) : m_in(in) {}

        size_t read(char* buffer, size_t n) override
        {
            m_in.read(buffer, static_cast<std::streamsize>(n));
            std::streamsize got = m_in.gcount();
            if (m_in.bad())
            {
                throw InputError("stream read error", false);
            }
            return static_cast<size_t>(got);
        }

    private:
        std::istream& m_in;
    };

    bool isTruncation(XML_Error code)
    {
        switch (code)
        {
        case XML_ERROR_NO_ELEMENTS:
        case XML_ERROR_UNCLOSED_TOKEN:
        case XML_ERROR_PARTIAL_CHAR:
        case XML_ERROR_UNCLOSED_CDATA_SECTION:
            return true;
        default:
            return false;
        }
    }

    std::map<std::string, std::string> collectAttributes(const XML_Char** attributes)
    {
        std::map<std::string, std::string> result;
        for (size_t i = 0; attributes[i]; i += 2)
        {
            result[attributes[i]] = attributes[i + 1];
        }
        return result;
    }

    // Removes key from attrs and returns its value.
    std::optional<std::string> takeAttribute(std::map<std::string, std::string>& attrs, const std::string& key)
    {
        auto it = attrs.find(key);
        if (it == attrs.end()) return std::nullopt;
        std::string value = std::move(it->second);
        attrs.erase(it);
        return value;
    }
}

// --- Sources ---

std::unique_ptr<ByteSource> openFileSource(const std::string& filepath)
{
    if (filepath == "-")
    {
        int fd = ::dup(STDIN_FILENO);
        if (fd < 0)
        {
            throw std::runtime_error(std::string("Failed to duplicate stdin: ") + std::strerror(errno));
        }
        gzFile file = gzdopen(fd, "rb");
        if (!file)
        {
            ::close(fd);
            throw std::runtime_error("Failed to open stdin for reading");
        }
        return std::make_unique<GzipSource>(file, "<stdin>");
    }

    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec))
    {
        throw SourceNotFound(filepath);
    }
    if (std::filesystem::is_directory(filepath, ec))
    {
        throw std::runtime_error("'" + filepath + "' is not a file");
    }

    gzFile file = gzopen(filepath.c_str(), "rb");
    if (!file)
    {
        throw std::runtime_error("Failed to open file: " + filepath + " (" + std::strerror(errno) + ")");
    }
    return std::make_unique<GzipSource>(file, filepath);
}

std::unique_ptr<ByteSource> openStreamSource(std::istream& in)
{
    return std::make_unique<IStreamSource>(in);
}

// --- Constructor / Destructor ---

LHEStream::LHEStream(std::unique_ptr<ByteSource> source, std::string name)
    : m_source(std::move(source)), m_name(std::move(name)), m_buffer(kChunkSize)
{
    m_parser = XML_ParserCreate(nullptr);
    if (!m_parser)
    {
        throw std::runtime_error("Failed to create XML parser");
    }
    XML_SetUserData(m_parser, this);
    XML_SetElementHandler(m_parser, onStart, onEnd);
    XML_SetCharacterDataHandler(m_parser, onChar);
    XML_SetDefaultHandlerExpand(m_parser, onDefault);

    m_contexts.push_back(Context::Document);
}

LHEStream::~LHEStream()
{
    if (m_parser) XML_ParserFree(m_parser);
}

// --- Input ---

bool LHEStream::pull()
{
    if (m_finished) return false;

    size_t n = 0;
    try
    {
        n = m_source->read(m_buffer.data(), m_buffer.size());
    }
    catch (const InputError& e)
    {
        fail(e.truncated() ? DecodeStatus::Truncated : DecodeStatus::Malformed, e.what());
        return false;
    }

    const bool isFinal = (n == 0);
    if (XML_Parse(m_parser, m_buffer.data(), static_cast<int>(n), isFinal ? XML_TRUE : XML_FALSE)
        == XML_STATUS_ERROR)
    {
        if (!m_callbackError.empty())
        {
            fail(DecodeStatus::Malformed, m_callbackError);
            return false;
        }
        const XML_Error code = XML_GetErrorCode(m_parser);
        std::string reason = std::string(XML_ErrorString(code)) +
            " at line " + std::to_string(XML_GetCurrentLineNumber(m_parser));
        fail(isFinal && isTruncation(code) ? DecodeStatus::Truncated : DecodeStatus::Malformed, reason);
        return false;
    }

    if (isFinal) m_finished = true;
    return true;
}

void LHEStream::fail(DecodeStatus status, const std::string& reason)
{
    m_status = status;
    m_errorReason = reason;
    m_finished = true;
}

void LHEStream::raisePending()
{
    m_errorRaised = true;
    if (m_status == DecodeStatus::Truncated)
    {
        throw DecodeTruncated(m_name, m_eventsRead, m_errorReason);
    }
    throw DecodeMalformed(m_name, m_eventsRead, m_errorReason);
}

void LHEStream::readInit()
{
    while (!m_initComplete && !m_finished)
    {
        pull();
    }
    if (m_initComplete) return;

    if (m_status == DecodeStatus::Ok)
    {
        fail(DecodeStatus::Malformed, "no <init> block found");
    }
    raisePending();
}

bool LHEStream::nextEvent(Event& event)
{
    while (m_ready.empty())
    {
        if (m_finished)
        {
            if (m_status != DecodeStatus::Ok && !m_errorRaised)
            {
                raisePending();
            }
            return false;
        }
        pull();
    }

    event = std::move(m_ready.front());
    m_ready.pop_front();
    ++m_eventsRead;
    return true;
}

// --- SAX callbacks ---

// No exception may unwind through XML_Parse: each callback turns it into abort().

void XMLCALL LHEStream::onStart(void* ud, const XML_Char* name, const XML_Char** attributes)
{
    auto* s = static_cast<LHEStream*>(ud);
    try
    {
        s->startElement(name, attributes);
    }
    catch (const std::exception& e)
    {
        s->abort(std::string("<") + name + ">: " + e.what());
    }
}

void XMLCALL LHEStream::onEnd(void* ud, const XML_Char* name)
{
    auto* s = static_cast<LHEStream*>(ud);
    try
    {
        s->endElement(name);
    }
    catch (const std::exception& e)
    {
        s->abort(std::string("</") + name + ">: " + e.what());
    }
}

void XMLCALL LHEStream::onChar(void* ud, const XML_Char* buf, int len)
{
    auto* s = static_cast<LHEStream*>(ud);
    if (!s->m_callbackError.empty()) return;

    try
    {
        switch (s->current())
        {
        case Context::Header:
        case Context::HeaderRaw:
            // Forward the raw text (entities unexpanded) to onDefault
            XML_DefaultCurrent(s->m_parser);
            break;
        case Context::Init:
        case Context::Event:
            s->m_text.append(buf, static_cast<size_t>(len));
            break;
        case Context::Weight:
        case Context::EventWgt:
        case Context::EventWeights:
            s->m_innerText.append(buf, static_cast<size_t>(len));
            break;
        default:
            break;
        }
    }
    catch (const std::exception& e)
    {
        s->abort(std::string("character data: ") + e.what());
    }
}

void XMLCALL LHEStream::onDefault(void* ud, const XML_Char* buf, int len)
{
    auto* s = static_cast<LHEStream*>(ud);
    Context ctx = s->current();
    if (ctx == Context::Header || ctx == Context::HeaderRaw)
    {
        try
        {
            s->m_init.headerText.append(buf, static_cast<size_t>(len));
        }
        catch (const std::exception& e)
        {
            s->abort(std::string("header text: ") + e.what());
        }
    }
}

void LHEStream::abort(const std::string& reason)
{
    if (m_callbackError.empty())
    {
        m_callbackError = reason;
    }
    XML_StopParser(m_parser, XML_FALSE);
}

void LHEStream::startElement(const std::string& name, const XML_Char** attributes)
{
    if (!m_callbackError.empty()) return;

    const Context parent = current();
    Context ctx = Context::Skip;

    switch (parent)
    {
    case Context::Document:
    {
        if (name != "LesHouchesEvents")
        {
            abort("root element is <" + name + ">, expected <LesHouchesEvents>");
            return;
        }
        auto attrs = collectAttributes(attributes);
        if (auto version = takeAttribute(attrs, "version")) m_init.version = *version;
        ctx = Context::Root;
        break;
    }
    case Context::Root:
        if (name == "header")
        {
            ctx = Context::Header;
        }
        else if (name == "init")
        {
            m_text.clear();
            ctx = Context::Init;
        }
        else if (name == "event")
        {
            if (!m_initComplete)
            {
                abort("<event> before <init>");
                return;
            }
            m_event.clear();
            m_event.attributes = collectAttributes(attributes);
            m_text.clear();
            ctx = Context::Event;
        }
        break;
    case Context::Header:
        if (name == "initrwgt")
        {
            ctx = Context::InitRwgt;
            break;
        }
        [[fallthrough]];
    case Context::HeaderRaw:
        XML_DefaultCurrent(m_parser);
        ctx = Context::HeaderRaw;
        break;
    case Context::InitRwgt:
        if (name == "weightgroup")
        {
            auto attrs = collectAttributes(attributes);
            std::string groupName;
            if (auto value = takeAttribute(attrs, "name")) groupName = *value;
            else if (auto type = takeAttribute(attrs, "type")) groupName = *type;

            WeightGroup* group = m_init.findWeightGroup(groupName);
            if (!group)
            {
                m_init.weightGroups.emplace_back(groupName);
                group = &m_init.weightGroups.back();
                group->attributes() = std::move(attrs);
            }
            m_groupIndex = static_cast<size_t>(group - m_init.weightGroups.data());
            ctx = Context::WeightGroup;
        }
        break;
    case Context::WeightGroup:
        if (name == "weight")
        {
            auto attrs = collectAttributes(attributes);
            auto id = takeAttribute(attrs, "id");
            if (!id)
            {
                abort("<weight> without id attribute");
                return;
            }
            if (m_init.findWeight(*id).second)
            {
                abort("duplicate weight id '" + *id + "' in <initrwgt>");
                return;
            }
            WeightInfo weight;
            weight.id = *id;
            weight.index = ++m_weightCounter;
            weight.attributes = std::move(attrs);
            m_init.weightGroups[m_groupIndex].add(std::move(weight));
            m_weightId = *id;
            m_innerText.clear();
            ctx = Context::Weight;
        }
        break;
    case Context::Event:
        if (name == "rwgt")
        {
            ctx = Context::EventRwgt;
        }
        else if (name == "weights")
        {
            m_innerText.clear();
            ctx = Context::EventWeights;
        }
        break;
    case Context::EventRwgt:
        if (name == "wgt")
        {
            auto attrs = collectAttributes(attributes);
            auto id = takeAttribute(attrs, "id");
            if (!id)
            {
                abort("<wgt> without id attribute");
                return;
            }
            m_weightId = *id;
            m_innerText.clear();
            ctx = Context::EventWgt;
        }
        break;
    default:
        break;
    }

    m_contexts.push_back(ctx);
}

void LHEStream::endElement(const std::string& name)
{
    if (!m_callbackError.empty()) return;

    const Context ctx = current();
    m_contexts.pop_back();

    switch (ctx)
    {
    case Context::Root:
        m_documentComplete = true;
        break;
    case Context::Header:
        m_init.headerText = std::string(utils::trim(m_init.headerText));
        break;
    case Context::HeaderRaw:
        XML_DefaultCurrent(m_parser);
        break;
    case Context::Weight:
        if (WeightInfo* weight = m_init.weightGroups[m_groupIndex].find(m_weightId))
        {
            weight->text = std::string(utils::trim(m_innerText));
        }
        break;
    case Context::Init:
    {
        std::string error;
        if (!parseInitBlock(error))
        {
            abort(error);
            return;
        }
        m_weightOrder = m_init.weightsByIndex();
        m_initComplete = true;
        break;
    }
    case Context::Event:
    {
        std::string error;
        if (!parseEventBlock(error))
        {
            abort(error);
            return;
        }
        m_ready.push_back(std::move(m_event));
        break;
    }
    case Context::EventWgt:
    {
        double value = 0.0;
        std::string_view sv(m_innerText);
        if (!utils::consumeNext(sv, value))
        {
            abort("invalid value of <wgt id='" + m_weightId + "'>");
            return;
        }
        m_event.weights[m_weightId] = value;
        break;
    }
    case Context::EventWeights:
        parsePositionalWeights();
        break;
    default:
        (void)name;
        break;
    }
}

// --- Record assembly ---

bool LHEStream::parseInitBlock(std::string& error)
{
    std::string_view sv(m_text);
    InitInfo& info = m_init.info;

    bool ok = utils::consumeNext(sv, info.beamA) &&
              utils::consumeNext(sv, info.beamB) &&
              utils::consumeNext(sv, info.energyA) &&
              utils::consumeNext(sv, info.energyB) &&
              utils::consumeNext(sv, info.pdfGroupA) &&
              utils::consumeNext(sv, info.pdfGroupB) &&
              utils::consumeNext(sv, info.pdfSetA) &&
              utils::consumeNext(sv, info.pdfSetB) &&
              utils::consumeNext(sv, info.weightingStrategy) &&
              utils::consumeNext(sv, info.numProcesses);
    if (!ok || info.numProcesses < 0)
    {
        error = "invalid first line of <init>";
        return false;
    }

    // Counts come from the file; no reserve()
    m_init.processes.clear();
    for (int i = 0; i < info.numProcesses; ++i)
    {
        ProcessInfo proc;
        ok = utils::consumeNext(sv, proc.xSection) &&
             utils::consumeNext(sv, proc.error) &&
             utils::consumeNext(sv, proc.maxWeight) &&
             utils::consumeNext(sv, proc.procId);
        if (!ok)
        {
            error = "invalid process line " + std::to_string(i + 1) + " of <init>";
            return false;
        }
        m_init.processes.push_back(proc);
    }
    return true;
}

bool LHEStream::parseEventBlock(std::string& error)
{
    const std::string where = "event " + std::to_string(m_eventsRead + m_ready.size() + 1);
    std::string_view sv(m_text);
    EventInfo& info = m_event.info;

    bool ok = utils::consumeNext(sv, info.nParticles) &&
              utils::consumeNext(sv, info.procId) &&
              utils::consumeNext(sv, info.weight) &&
              utils::consumeNext(sv, info.scale) &&
              utils::consumeNext(sv, info.aqed) &&
              utils::consumeNext(sv, info.aqcd);
    if (!ok || info.nParticles < 0)
    {
        error = where + ": invalid event information line";
        return false;
    }

    for (int i = 0; i < info.nParticles; ++i)
    {
        Particle p;
        ok = utils::consumeNext(sv, p.id) &&
             utils::consumeNext(sv, p.status) &&
             utils::consumeNext(sv, p.mother1) &&
             utils::consumeNext(sv, p.mother2) &&
             utils::consumeNext(sv, p.color1) &&
             utils::consumeNext(sv, p.color2) &&
             utils::consumeNext(sv, p.px) &&
             utils::consumeNext(sv, p.py) &&
             utils::consumeNext(sv, p.pz) &&
             utils::consumeNext(sv, p.e) &&
             utils::consumeNext(sv, p.m) &&
             utils::consumeNext(sv, p.lifetime) &&
             utils::consumeNext(sv, p.spin);
        if (!ok)
        {
            error = where + ": expected " + std::to_string(info.nParticles) +
                    " particles, particle " + std::to_string(i + 1) + " is missing or invalid";
            return false;
        }
        m_event.particles.push_back(p);
    }

    // Anything left must be '#' comment lines
    while (!sv.empty())
    {
        size_t eol = sv.find('\n');
        std::string_view line = utils::trim(sv.substr(0, eol));
        if (!line.empty() && line.front() != '#')
        {
            error = where + ": more particle lines than NUP=" + std::to_string(info.nParticles);
            return false;
        }
        if (eol == std::string_view::npos) break;
        sv.remove_prefix(eol + 1);
    }
    return true;
}

void LHEStream::parsePositionalWeights()
{
    std::string_view sv(m_innerText);
    size_t i = 0;
    for (std::string_view token = utils::nextToken(sv); !token.empty(); token = utils::nextToken(sv), ++i)
    {
        double value = 0.0;
        if (!utils::parseNumber(token, value))
        {
            abort("invalid value in <weights>: '" + std::string(token) + "'");
            return;
        }
        // Values beyond the declared weights have no ID to attach to
        if (i < m_weightOrder.size())
        {
            m_event.weights[m_weightOrder[i]->id] = value;
        }
    }
}

} // namespace lheutils
