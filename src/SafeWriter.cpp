/**
 * @file SafeWriter.cpp
 * @brief Implementation of the SafeWriter class.
 */

#include "lheutils/SafeWriter.hpp"
#include "lheutils/Errors.hpp"
#include <zlib.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace lheutils
{
    namespace
    {
        constexpr size_t kFlushThreshold = 1 << 20;

        std::runtime_error systemError(const std::string& what)
        {
            return std::runtime_error(what + ": " + std::strerror(errno));
        }

        class ByteSink
        {
        public:
            virtual ~ByteSink() = default;
            virtual void write(const std::string& data) = 0;
            /// Completes the output; data is on its way to the device after this.
            virtual void finish() = 0;
        };

        class OStreamSink : public ByteSink
        {
        public:
            explicit OStreamSink(std::ostream& out) : m_out(out) {}

            void write(const std::string& data) override
            {
                m_out.write(data.data(), static_cast<std::streamsize>(data.size()));
                if (!m_out) throw std::runtime_error("Failed to write to output stream");
            }

            void finish() override
            {
                m_out.flush();
                if (!m_out) throw std::runtime_error("Failed to flush output stream");
            }

        private:
            std::ostream& m_out;
        };

        class FdSink : public ByteSink
        {
        public:
            explicit FdSink(int fd) : m_fd(fd) {}

            void write(const std::string& data) override
            {
                const char* ptr = data.data();
                size_t left = data.size();
                while (left > 0)
                {
                    ssize_t n = ::write(m_fd, ptr, left);
                    if (n < 0)
                    {
                        if (errno == EINTR) continue;
                        throw systemError("Failed to write output");
                    }
                    ptr += n;
                    left -= static_cast<size_t>(n);
                }
            }

            void finish() override {}

        private:
            int m_fd;
        };

        class GzipSink : public ByteSink
        {
        public:
            explicit GzipSink(int fd)
            {
                // gzclose() closes the descriptor it was given
                int dupFd = ::dup(fd);
                if (dupFd < 0) throw systemError("Failed to duplicate output descriptor");
                m_file = gzdopen(dupFd, "wb");
                if (!m_file)
                {
                    ::close(dupFd);
                    throw std::runtime_error("Failed to open gzip output");
                }
            }

            ~GzipSink() override
            {
                if (m_file) gzclose(m_file);
            }

            void write(const std::string& data) override
            {
                if (data.empty()) return;
                int n = gzwrite(m_file, data.data(), static_cast<unsigned>(data.size()));
                if (n <= 0)
                {
                    int errnum = Z_OK;
                    throw std::runtime_error(std::string("gzip write failed: ") + gzerror(m_file, &errnum));
                }
            }

            void finish() override
            {
                int rc = gzclose(m_file);
                m_file = nullptr;
                if (rc != Z_OK)
                {
                    throw std::runtime_error("gzip close failed (code " + std::to_string(rc) + ")");
                }
            }

        private:
            gzFile m_file = nullptr;
        };

        /**
         * @class TempFile
         * @brief Hidden temporary file beside the destination, removed
         * unless committed.
         */
        class TempFile
        {
        public:
            TempFile(const fs::path& directory, const std::string& name)
                : m_directory(directory)
            {
                std::string pattern = (directory / ("." + name + ".XXXXXX")).string();
                std::vector<char> buffer(pattern.begin(), pattern.end());
                buffer.push_back('\0');
                m_fd = ::mkstemp(buffer.data());
                if (m_fd < 0)
                {
                    throw systemError("Cannot create temporary file in '" + directory.string() + "'");
                }
                m_path = buffer.data();
            }

            ~TempFile()
            {
                if (m_fd >= 0) ::close(m_fd);
                if (!m_committed)
                {
                    std::error_code ec;
                    fs::remove(m_path, ec);
                }
            }

            TempFile(const TempFile&) = delete;
            TempFile& operator=(const TempFile&) = delete;

            int fd() const { return m_fd; }
            const fs::path& path() const { return m_path; }

            void setMode(mode_t mode)
            {
                if (::fchmod(m_fd, mode) != 0)
                {
                    throw systemError("Cannot set permissions of '" + m_path.string() + "'");
                }
            }

            /// Syncs the data, renames over target and syncs the directory.
            void commit(const fs::path& target)
            {
                if (::fsync(m_fd) != 0)
                {
                    throw systemError("fsync failed on '" + m_path.string() + "'");
                }
                int fd = m_fd;
                m_fd = -1;
                if (::close(fd) != 0)
                {
                    throw systemError("close failed on '" + m_path.string() + "'");
                }

                fs::rename(m_path, target);
                m_committed = true;

                // Make the rename itself durable
                int dirFd = ::open(m_directory.c_str(), O_RDONLY | O_DIRECTORY);
                if (dirFd >= 0)
                {
                    ::fsync(dirFd);
                    ::close(dirFd);
                }
            }

        private:
            fs::path m_directory;
            fs::path m_path;
            int m_fd = -1;
            bool m_committed = false;
        };

        mode_t targetMode(const fs::path& target, const std::string& reference)
        {
            struct stat st;
            if (::stat(target.c_str(), &st) == 0)
            {
                return st.st_mode & 07777;
            }
            if (!reference.empty() && ::stat(reference.c_str(), &st) == 0)
            {
                return st.st_mode & 07777;
            }
            mode_t mask = ::umask(0);
            ::umask(mask);
            return 0666 & ~mask;
        }

        WriteReport writeDocument(EventStream& stream, ByteSink& sink, const WriteOptions& options)
        {
            LHEWriter writer(stream.init(), options.weightFormat);
            WriteReport report;

            std::string buffer;
            writer.writeHeader(buffer);

            Event event;
            try
            {
                while (stream.next(event))
                {
                    writer.writeEvent(buffer, event);
                    ++report.eventsWritten;
                    if (buffer.size() >= kFlushThreshold)
                    {
                        sink.write(buffer);
                        buffer.clear();
                    }
                }
            }
            catch (const DecodeError& e)
            {
                if (!options.repair) throw;
                report.truncated = true;
                report.status = dynamic_cast<const DecodeTruncated*>(&e)
                    ? DecodeStatus::Truncated : DecodeStatus::Malformed;
                report.reason = e.what();
            }

            writer.writeFooter(buffer);
            sink.write(buffer);
            sink.finish();
            return report;
        }
    }

    bool hasGzipSuffix(const std::string& path)
    {
        auto endsWith = [&path](const std::string& suffix)
        {
            return path.size() >= suffix.size() &&
                   path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
        };
        return endsWith(".gz") || endsWith(".gzip");
    }

    WriteReport SafeWriter::write(EventStream& stream, const Destination& destination) const
    {
        if (!destination.isFile())
        {
            if (m_options.compress)
            {
                throw IncompatibleOutputOptions(
                    "Compressed output requires a file destination, not standard output or a stream");
            }
            std::ostream& out = destination.kind() == Destination::Kind::Stream
                ? *destination.ostream() : std::cout;
            OStreamSink sink(out);
            return writeDocument(stream, sink, m_options);
        }

        const fs::path target(destination.path());
        if (target.filename().empty())
        {
            throw std::runtime_error("Invalid output path '" + destination.path() + "'");
        }
        fs::path directory = target.parent_path();
        if (directory.empty()) directory = ".";

        const bool compress = m_options.compress || hasGzipSuffix(destination.path());

        TempFile temp(directory, target.filename().string());
        temp.setMode(targetMode(target, m_options.permissionsFrom));

        WriteReport report;
        {
            std::unique_ptr<ByteSink> sink;
            if (compress) sink = std::make_unique<GzipSink>(temp.fd());
            else sink = std::make_unique<FdSink>(temp.fd());
            report = writeDocument(stream, *sink, m_options);
        }
        temp.commit(target);
        return report;
    }

} // namespace lheutils
