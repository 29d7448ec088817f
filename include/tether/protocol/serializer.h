#pragma once
#include <tether/protocol/json_value.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::protocol {

// Big-endian binary writer for wire messages.
class Serializer {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_f64(double value);
    void write_bool(bool value);
    void write_string(std::string_view str);

    // One tag byte per node followed by its contents; objects keep key order.
    void write_value(const JsonValue& value);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take_data() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class Deserializer {
public:
    explicit Deserializer(const uint8_t* data, size_t size);
    explicit Deserializer(const std::vector<uint8_t>& data);

    // All readers throw DecodeError when the buffer runs short.
    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    double read_f64();
    bool read_bool();
    std::string read_string();
    JsonValue read_value();

    bool has_remaining() const;
    size_t remaining() const;

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
    int depth_ = 0;

    void check_remaining(size_t needed) const;
};

} // namespace tether::protocol
