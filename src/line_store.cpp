#include "ari/line_store.hpp"
#include "ari/logging.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ari
{

    namespace
    {
        std::string errno_message(int err)
        {
            return std::strerror(err);
        }

        Result<void> ensure_parent_directory(const std::string &path)
        {
            auto parent = std::filesystem::path(path).parent_path();
            if (parent.empty() || std::filesystem::exists(parent))
                return {};

            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(AriError::storage(
                    std::format("Unable to create directory {}: {}", parent.string(), ec.message())));
            }
            std::filesystem::permissions(parent, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                return std::unexpected(AriError::storage(
                    std::format("Unable to restrict permissions on {}: {}", parent.string(), ec.message())));
            }
            return {};
        }

        // Closes the descriptor on every path out of append
        struct FdGuard
        {
            int fd;
            ~FdGuard()
            {
                if (fd >= 0)
                    ::close(fd);
            }
        };
    } // namespace

    FileLineStore::FileLineStore(std::string path) : path_(std::move(path)) {}

    bool FileLineStore::exists() const
    {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

    Result<void> FileLineStore::truncate_torn_tail(int fd, off_t size) const
    {
        // Scan backwards for the last newline; everything after it is torn
        std::array<char, 4096> chunk{};
        off_t end = size;
        off_t keep = 0;
        bool found = false;
        while (end > 0 && !found)
        {
            off_t begin = end > static_cast<off_t>(chunk.size()) ? end - static_cast<off_t>(chunk.size()) : 0;
            auto want = static_cast<std::size_t>(end - begin);
            ssize_t got = ::pread(fd, chunk.data(), want, begin);
            if (got != static_cast<ssize_t>(want))
            {
                return std::unexpected(AriError::storage(
                    std::format("Unable to read the tail of {}: {}", path_, errno_message(errno))));
            }
            for (auto i = static_cast<off_t>(want); i > 0; --i)
            {
                if (chunk[static_cast<std::size_t>(i - 1)] == '\n')
                {
                    keep = begin + i;
                    found = true;
                    break;
                }
            }
            end = begin;
        }

        logging::get("audit")->warn("Discarding {} byte(s) of an interrupted record at the end of {}",
                                    size - keep, path_);
        if (::ftruncate(fd, keep) != 0)
        {
            return std::unexpected(AriError::storage(
                std::format("Unable to discard the torn tail of {}: {}", path_, errno_message(errno))));
        }
        return {};
    }

    Result<void> FileLineStore::append(const std::string &line)
    {
        if (line.find('\n') != std::string::npos)
        {
            return std::unexpected(AriError::invalid_input("Record contains a newline"));
        }

        if (auto dir = ensure_parent_directory(path_); !dir)
            return dir;

        FdGuard guard{::open(path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR)};
        if (guard.fd < 0)
        {
            return std::unexpected(AriError::storage(std::format("Unable to open {}: {}", path_, errno_message(errno))));
        }

        struct stat st{};
        if (::fstat(guard.fd, &st) != 0)
        {
            return std::unexpected(AriError::storage(std::format("Unable to stat {}: {}", path_, errno_message(errno))));
        }

        off_t size = st.st_size;
        if (size > 0)
        {
            char last = '\0';
            if (::pread(guard.fd, &last, 1, size - 1) != 1)
            {
                return std::unexpected(AriError::storage(
                    std::format("Unable to read the tail of {}: {}", path_, errno_message(errno))));
            }
            if (last != '\n')
            {
                if (auto trimmed = truncate_torn_tail(guard.fd, size); !trimmed)
                    return trimmed;
                if (::fstat(guard.fd, &st) != 0)
                {
                    return std::unexpected(AriError::storage(std::format("Unable to stat {}: {}", path_, errno_message(errno))));
                }
                size = st.st_size;
            }
        }

        std::string record = line;
        record += '\n';

        ssize_t written = ::write(guard.fd, record.data(), record.size());
        if (written != static_cast<ssize_t>(record.size()))
        {
            int err = errno;
            // Roll back whatever part of the record reached the file
            if (written > 0 && ::ftruncate(guard.fd, size) != 0)
            {
                logging::get("audit")->error("Unable to roll back a short write to {}: {}", path_, errno_message(errno));
            }
            return std::unexpected(AriError::storage(std::format(
                "Short write to {}: {}", path_, written < 0 ? errno_message(err) : std::string("partial record"))));
        }

        if (::fsync(guard.fd) != 0)
        {
            return std::unexpected(AriError::storage(std::format("fsync failed on {}: {}", path_, errno_message(errno))));
        }

        int fd = guard.fd;
        guard.fd = -1;
        if (::close(fd) != 0)
        {
            return std::unexpected(AriError::storage(std::format("close failed on {}: {}", path_, errno_message(errno))));
        }
        return {};
    }

    Result<std::vector<std::string>> FileLineStore::read_all() const
    {
        std::vector<std::string> lines;
        if (!exists())
            return lines;

        std::ifstream file(path_, std::ios::binary);
        if (!file.is_open())
        {
            return std::unexpected(AriError::storage(std::format("Unable to read {}", path_)));
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad())
        {
            return std::unexpected(AriError::storage(std::format("I/O error while reading {}", path_)));
        }

        const std::string content = buffer.str();
        std::size_t start = 0;
        while (start < content.size())
        {
            auto end = content.find('\n', start);
            if (end == std::string::npos)
                break; // unterminated tail: an append still in flight
            if (end > start)
                lines.emplace_back(content, start, end - start);
            start = end + 1;
        }
        return lines;
    }

} // namespace ari
