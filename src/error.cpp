#include "runerip/error.h"

#include "fmt/format.h"

namespace runerip {

MalformedEncoding::MalformedEncoding(std::size_t offset, std::size_t written) :
    std::runtime_error(fmt::format("malformed encoding at byte {}", offset)),
    m_offset(offset),
    m_written(written)
{}

MalformedEncoding::~MalformedEncoding() = default;

IoError::IoError(const std::string& arg) :
    std::runtime_error(arg)
{}

IoError::IoError(const char* arg) :
    std::runtime_error(arg)
{}

IoError::~IoError() = default;

} // namespace runerip
