#include "fmt/format.h"
#include "runerip/commands.h"
#include "runerip/error.h"
#include "runerip/logging.h"
#include "runerip/stream.h"
#include "runerip/utf8.h"
#include "runerip/view.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

#define LOGGER() (runerip::logging::get("commands"))

namespace runerip {

namespace {

bool is_std_stream(const std::string& path)
{
    return path.empty() || path == "-";
}

// an open file descriptor, closed on destruction unless it is one of
// the standard streams
class FileDesc
{
public:
    FileDesc(const std::string& path, int flags, int stdfd) :
        m_path(path)
    {
        if (is_std_stream(path)) {
            m_path = stdfd == STDIN_FILENO ? "stdin" : "stdout";
            m_fd = stdfd;
            return;
        }

        m_fd = ::open(path.c_str(), flags, 0644);
        if (m_fd < 0)
            throw IoError(fmt::format("unable to open {} ({}): {}",
                    path, errno, strerror(errno)));
        m_owns = true;
    }

    ~FileDesc()
    {
        if (m_owns)
            ::close(m_fd);
    }

    FileDesc(const FileDesc&) = delete;
    FileDesc& operator=(const FileDesc&) = delete;

    // reads up to len bytes; zero at end of input
    std::size_t read(char* buf, std::size_t len)
    {
        for (;;) {
            ssize_t r = ::read(m_fd, buf, len);
            if (r >= 0)
                return static_cast<std::size_t>(r);
            if (errno != EINTR)
                throw IoError(fmt::format("unable to read {} ({}): {}",
                        m_path, errno, strerror(errno)));
        }
    }

    void write(std::string_view data)
    {
        auto pdata = data.data();
        auto len = data.size();
        while (len > 0) {
            ssize_t r = ::write(m_fd, pdata, len);
            if (r < 0) {
                if (errno == EINTR)
                    continue;
                throw IoError(fmt::format("unable to write {} ({}): {}",
                        m_path, errno, strerror(errno)));
            }

            len -= r;
            pdata += r;
        }
    }

private:
    std::string m_path;
    int m_fd = -1;
    bool m_owns = false;
};

} // namespace

std::optional<encoding> parse_encoding(std::string_view name)
{
    if (name == tables::utf8::name || name == "utf-8")
        return encoding::utf8;
    if (name == tables::wtf8::name || name == "wtf-8")
        return encoding::wtf8;
    if (name == tables::text::name)
        return encoding::text;
    return std::nullopt;
}

std::string_view encoding_name(encoding enc)
{
    return with_tables(enc, [](auto t) { return decltype(t)::name; });
}

bool is_command(std::string_view name)
{
    constexpr std::array<std::string_view, 5> commands{
            "count", "sum", "validate", "transcode", "stream"};
    return std::find(commands.begin(), commands.end(), name) != commands.end();
}

std::size_t count_runes(encoding enc, std::string_view buf)
{
    return with_tables(enc, [&](auto t) {
        return runerip::count<decltype(t)>(buf);
    });
}

uint64_t sum_runes(encoding enc, std::string_view buf)
{
    return with_tables(enc, [&](auto t) {
        auto view = View<decltype(t)>::fromValidated(buf);

        uint64_t sum = 0;
        auto it = view.iterator();
        while (auto cp = it.next())
            sum += *cp;
        return sum;
    });
}

std::u16string transcode(encoding enc, std::string_view buf)
{
    return with_tables(enc, [&](auto t) {
        return to_utf16<decltype(t)>(buf);
    });
}

std::optional<std::size_t> find_malformed(encoding enc, std::string_view buf)
{
    std::size_t cursor = 0;
    bool valid = with_tables(enc, [&](auto t) {
        return runerip::validate<decltype(t)>(buf, cursor);
    });

    if (valid)
        return std::nullopt;
    return cursor;
}

StreamTotals stream_count(encoding enc, const std::string& path,
        std::size_t chunk_size)
{
    if (chunk_size == 0)
        chunk_size = 1;

    FileDesc in(path, O_RDONLY, STDIN_FILENO);
    std::vector<char> buf(chunk_size);

    return with_tables(enc, [&](auto t) {
        StreamCounter<decltype(t)> counter;

        std::size_t chunks = 0;
        while (auto len = in.read(buf.data(), buf.size())) {
            counter.feed({buf.data(), len});
            chunks++;
        }
        LOGGER()->debug("read {} bytes in {} chunks", counter.bytes(), chunks);

        StreamTotals totals;
        totals.runes = counter.finish();
        totals.bytes = counter.bytes();
        totals.sum = counter.sum();
        return totals;
    });
}

std::string read_input(const std::string& path)
{
    FileDesc in(path, O_RDONLY, STDIN_FILENO);

    std::string data;
    std::vector<char> buf(64 * 1024);
    while (auto len = in.read(buf.data(), buf.size()))
        data.append(buf.data(), len);

    LOGGER()->debug("read {} bytes", data.size());
    return data;
}

void write_output(const std::string& path, std::string_view data)
{
    FileDesc out(path, O_WRONLY | O_CREAT | O_TRUNC, STDOUT_FILENO);
    out.write(data);
}

} // namespace runerip
