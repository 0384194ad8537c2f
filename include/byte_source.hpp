#pragma once
#include <asio.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace sendstream {

// Sequential, forward-only input. read_some returns 0 only at end of input or
// after a read error; failed() tells the two apart.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read_some(uint8_t* dst, size_t n) = 0;
    virtual bool failed() const { return false; }
    virtual std::string error_message() const { return std::string(); }
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    size_t read_some(uint8_t* dst, size_t n) override;
    size_t consumed() const { return pos_; }
    // Number of read_some calls, including those made at end of input.
    size_t read_calls() const { return calls_; }
private:
    std::vector<uint8_t> data_;
    size_t pos_{0};
    size_t calls_{0};
};

// Reads a pipe, file or terminal descriptor with blocking reads.
class DescriptorSource : public ByteSource {
public:
    // With `owns` false the descriptor is released, not closed, on destruction.
    DescriptorSource(int fd, bool owns);
    ~DescriptorSource() override;
    DescriptorSource(const DescriptorSource&) = delete;
    DescriptorSource& operator=(const DescriptorSource&) = delete;

    size_t read_some(uint8_t* dst, size_t n) override;
    bool failed() const override { return static_cast<bool>(ec_); }
    std::string error_message() const override { return ec_ ? ec_.message() : std::string(); }

private:
    asio::io_context io_;
    asio::posix::stream_descriptor desc_;
    bool owns_;
    bool eof_{false};
    std::error_code ec_;
};

} // namespace sendstream
