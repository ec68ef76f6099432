#ifndef RUNERIP_ERROR_H
#define RUNERIP_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace runerip {

/// Raised when the automaton rejects its input.
///
/// offset() is the byte whose transition rejected, which can be later
/// than the first byte of the bad sequence (Unicode's maximal subpart
/// convention), or the lead byte of a sequence cut off by the end of
/// the buffer. written() is the number of output units produced before
/// the failure, for operations that produce any.
///
/// When the buffer ends inside a sequence that would also have been
/// rejected, the two paths differ: count() checks the sequence length
/// before running the automaton and reports the lead byte, while
/// validate(), transcode_utf16(), View::fromValidated() and
/// StreamCounter report the rejected byte. For "\xE0\x80" count() says
/// 0 and validate() says 1.
class MalformedEncoding : public std::runtime_error
{
public:
    explicit MalformedEncoding(std::size_t offset, std::size_t written = 0);

    MalformedEncoding(const MalformedEncoding&) = default;
    MalformedEncoding& operator=(const MalformedEncoding&) = default;
    MalformedEncoding(MalformedEncoding&&) = default;
    MalformedEncoding& operator=(MalformedEncoding&&) = default;

    virtual ~MalformedEncoding();

    std::size_t offset() const { return m_offset; }
    std::size_t written() const { return m_written; }

private:
    std::size_t m_offset;
    std::size_t m_written;
};

class IoError : public std::runtime_error
{
public:
    explicit IoError(const std::string& arg);
    explicit IoError(const char* arg);

    IoError(const IoError&) = default;
    IoError& operator=(const IoError&) = default;
    IoError(IoError&&) = default;
    IoError& operator=(IoError&&) = default;

    virtual ~IoError();
};

} // namespace runerip

#endif // RUNERIP_ERROR_H
