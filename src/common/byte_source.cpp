#include "byte_source.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>

namespace sendstream {

size_t MemorySource::read_some(uint8_t *dst, size_t n) {
  calls_++;
  size_t k = std::min(n, data_.size() - pos_);
  if (k)
    std::memcpy(dst, data_.data() + pos_, k);
  pos_ += k;
  return k;
}

DescriptorSource::DescriptorSource(int fd, bool owns)
    : desc_(io_, fd), owns_(owns) {}

DescriptorSource::~DescriptorSource() {
  if (!owns_) {
    desc_.release();
    return;
  }
  std::error_code ec;
  desc_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "close failed: %s",
                           ec.message().c_str());
}

size_t DescriptorSource::read_some(uint8_t *dst, size_t n) {
  if (eof_ || ec_ || n == 0)
    return 0;
  std::error_code ec;
  size_t k = desc_.read_some(asio::buffer(dst, n), ec);
  if (ec == asio::error::eof) {
    eof_ = true;
    return k;
  }
  if (ec) {
    ec_ = ec;
    Logger::instance().log(LogLevel::WARN, "read failed: %s",
                           ec.message().c_str());
    return k;
  }
  return k;
}

} // namespace sendstream
