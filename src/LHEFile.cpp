/**
 * @file LHEFile.cpp
 * @brief Implementation of the LHEFile class.
 */

#include "lheutils/LHEFile.hpp"
#include "lheutils/Errors.hpp"
#include "LHEStream.hpp"
#include <stdexcept>
#include <utility>

namespace lheutils
{
    /**
     * @struct LHEFile::Impl
     * @brief Private implementation (PIMPL) struct for LHEFile.
     */
    struct LHEFile::Impl
    {
        std::unique_ptr<LHEStream> stream;

        Impl(std::unique_ptr<ByteSource> source, std::string name)
        {
            stream = std::make_unique<LHEStream>(std::move(source), std::move(name));
            stream->readInit();
        }
    };

    const char* toString(DecodeStatus status)
    {
        switch (status)
        {
        case DecodeStatus::Ok:        return "ok";
        case DecodeStatus::Truncated: return "truncated";
        case DecodeStatus::Malformed: return "malformed";
        }
        return "unknown";
    }

    LHEFile::LHEFile(const std::string& filepath)
    try : m_impl(std::make_unique<Impl>(openFileSource(filepath), filepath == "-" ? "<stdin>" : filepath))
    {
    }
    catch (const LHEError&)
    {
        // Already carries the source name
        throw;
    }
    catch (const std::exception& e)
    {
        throw std::runtime_error("Failed to open LHEFile '" + filepath + "': " + e.what());
    }

    LHEFile::LHEFile(std::istream& in, const std::string& name)
        : m_impl(std::make_unique<Impl>(openStreamSource(in), name))
    {
    }

    LHEFile::~LHEFile()
    {
    }

    const Init& LHEFile::init() const
    {
        return m_impl->stream->init();
    }

    bool LHEFile::next(Event& event)
    {
        return m_impl->stream->nextEvent(event);
    }

    DecodeStatus LHEFile::status() const
    {
        return m_impl->stream->status();
    }

    size_t LHEFile::eventsRead() const
    {
        return m_impl->stream->eventsRead();
    }

    const std::string& LHEFile::sourceName() const
    {
        return m_impl->stream->name();
    }

} // namespace lheutils
