#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <sys/types.h>

namespace ari
{

    /**
     * Append-only sequence of text records, one per line. Backends must make
     * each append atomic: a reader sees either the old tail or the new one,
     * never a partial record.
     */
    class LineStore
    {
    public:
        virtual ~LineStore() = default;

        /** Append one record; line must not contain '\n' */
        virtual Result<void> append(const std::string &line) = 0;

        /** Every complete record in order. A store that does not exist yet reads as empty. */
        virtual Result<std::vector<std::string>> read_all() const = 0;

        virtual bool exists() const = 0;

        /** Human-readable location for logs and errors */
        virtual std::string describe() const = 0;
    };

    /**
     * LineStore over a local file. Each append is a single write(2) on an
     * O_APPEND descriptor followed by fsync. The parent directory is created
     * with mode 0700 and the file with 0600.
     *
     * An unterminated tail left by an interrupted append is cut off before
     * the next record is written, and a short write is rolled back, so a
     * torn record never merges with the one that follows it.
     */
    class FileLineStore : public LineStore
    {
    public:
        explicit FileLineStore(std::string path);

        Result<void> append(const std::string &line) override;
        Result<std::vector<std::string>> read_all() const override;
        bool exists() const override;
        std::string describe() const override { return path_; }

        const std::string &path() const { return path_; }

    private:
        Result<void> truncate_torn_tail(int fd, off_t size) const;

        std::string path_;
    };

} // namespace ari
