#include <tether/protocol/serializer.h>
#include <tether/protocol/remote_object.h>

#include <cstring>

namespace tether::protocol {

namespace {

enum ValueTag : uint8_t {
    kTagUndefined = 0,
    kTagNull = 1,
    kTagFalse = 2,
    kTagTrue = 3,
    kTagNumber = 4,
    kTagString = 5,
    kTagArray = 6,
    kTagObject = 7,
};

constexpr int kMaxNestingDepth = 1000;

} // anonymous namespace

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

void Serializer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Serializer::write_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Serializer::write_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Serializer::write_f64(double value) {
    uint64_t uval;
    std::memcpy(&uval, &value, sizeof(uval));
    write_u64(uval);
}

void Serializer::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void Serializer::write_string(std::string_view str) {
    write_u32(static_cast<uint32_t>(str.size()));
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    buffer_.insert(buffer_.end(), bytes, bytes + str.size());
}

void Serializer::write_value(const JsonValue& value) {
    switch (value.type()) {
        case JsonType::Undefined:
            write_u8(kTagUndefined);
            break;
        case JsonType::Null:
            write_u8(kTagNull);
            break;
        case JsonType::Bool:
            write_u8(value.as_bool() ? kTagTrue : kTagFalse);
            break;
        case JsonType::Number:
            write_u8(kTagNumber);
            write_f64(value.as_number());
            break;
        case JsonType::String:
            write_u8(kTagString);
            write_string(value.as_string());
            break;
        case JsonType::Array:
            write_u8(kTagArray);
            write_u32(static_cast<uint32_t>(value.as_array().size()));
            for (const auto& item : value.as_array()) {
                write_value(item);
            }
            break;
        case JsonType::Object:
            write_u8(kTagObject);
            write_u32(static_cast<uint32_t>(value.as_object().size()));
            for (const auto& [key, member] : value.as_object()) {
                write_string(key);
                write_value(member);
            }
            break;
    }
}

// ---------------------------------------------------------------------------
// Deserializer
// ---------------------------------------------------------------------------

Deserializer::Deserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

Deserializer::Deserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

void Deserializer::check_remaining(size_t needed) const {
    if (needed > size_ - offset_) {
        throw DecodeError(
            "Deserializer underflow: need " + std::to_string(needed) +
            " bytes but only " + std::to_string(size_ - offset_) + " remaining");
    }
}

uint8_t Deserializer::read_u8() {
    check_remaining(1);
    return data_[offset_++];
}

uint32_t Deserializer::read_u32() {
    check_remaining(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 4;
    return value;
}

uint64_t Deserializer::read_u64() {
    check_remaining(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 8;
    return value;
}

double Deserializer::read_f64() {
    uint64_t uval = read_u64();
    double value;
    std::memcpy(&value, &uval, sizeof(value));
    return value;
}

bool Deserializer::read_bool() {
    return read_u8() != 0;
}

std::string Deserializer::read_string() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return result;
}

JsonValue Deserializer::read_value() {
    if (depth_ >= kMaxNestingDepth) {
        throw DecodeError("Deserializer: value nesting too deep");
    }

    uint8_t tag = read_u8();
    switch (tag) {
        case kTagUndefined: return JsonValue();
        case kTagNull:      return JsonValue(nullptr);
        case kTagFalse:     return JsonValue(false);
        case kTagTrue:      return JsonValue(true);
        case kTagNumber:    return JsonValue(read_f64());
        case kTagString:    return JsonValue(read_string());
        case kTagArray: {
            uint32_t count = read_u32();
            JsonValue array = JsonValue::array();
            ++depth_;
            for (uint32_t i = 0; i < count; ++i) {
                array.push_back(read_value());
            }
            --depth_;
            return array;
        }
        case kTagObject: {
            uint32_t count = read_u32();
            JsonValue object = JsonValue::object();
            ++depth_;
            for (uint32_t i = 0; i < count; ++i) {
                std::string key = read_string();
                object.set(key, read_value());
            }
            --depth_;
            return object;
        }
        default:
            throw DecodeError("Deserializer: unknown value tag " + std::to_string(tag));
    }
}

bool Deserializer::has_remaining() const {
    return offset_ < size_;
}

size_t Deserializer::remaining() const {
    return size_ - offset_;
}

} // namespace tether::protocol
