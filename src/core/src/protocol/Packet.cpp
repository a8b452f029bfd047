/**
 * @file Packet.cpp
 * @brief Packet codec implementation
 */

#include "Packet.hpp"
#include "DeviceError.hpp"
#include "../common/Error.hpp"
#include <algorithm>
#include <cstring>

namespace nxt {
namespace protocol {

namespace {

bool isAscii(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0x80) == 0;
    });
}

/**
 * Validate UTF-8: rejects stray continuation bytes, truncated and
 * overlong sequences, surrogates and code points above U+10FFFF.
 */
bool isValidUtf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t c = data[i];
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= length) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        static const uint32_t kMinForLength[4] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string decodeText(const uint8_t* data, size_t length) {
    if (!isValidUtf8(data, length)) {
        throw Error(ErrorCode::INVALID_STRING, "Invalid characters for string");
    }
    return std::string(reinterpret_cast<const char*>(data), length);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Packet::Packet(Opcode opcode)
    : m_type(isSystem(opcode) ? PacketType::SYSTEM : PacketType::DIRECT),
      m_opcode(opcode) {
}

Packet::Packet(PacketType type, Opcode opcode)
    : m_type(type),
      m_opcode(opcode) {
    bool system = isSystem(opcode);
    bool agrees = system
        ? (type == PacketType::SYSTEM || type == PacketType::SYSTEM_NO_REPLY)
        : (type == PacketType::DIRECT || type == PacketType::DIRECT_NO_REPLY);
    if (!agrees) {
        throw Error(ErrorCode::SERIALISE,
                    "Packet type " + packetTypeToString(type) +
                    " does not match opcode " + opcodeToString(opcode));
    }
}

Packet::Packet(PacketType type, Opcode opcode, std::vector<uint8_t> data)
    : m_type(type),
      m_opcode(opcode),
      m_data(std::move(data)) {
}

// ============================================================================
// Parse / Serialise
// ============================================================================

Packet Packet::parse(const uint8_t* data, size_t length) {
    if (!data || length < 1) {
        throw Error(ErrorCode::PARSE, "Reached end of input");
    }
    auto type = packetTypeFromByte(data[0]);
    if (!type) {
        throw Error(ErrorCode::PARSE, "Invalid packet type");
    }

    if (length < HEADER_SIZE) {
        throw Error(ErrorCode::PARSE, "Reached end of input");
    }
    auto opcode = opcodeFromByte(data[1]);
    if (!opcode) {
        throw Error(ErrorCode::PARSE, "Invalid opcode");
    }

    return Packet(*type, *opcode,
                  std::vector<uint8_t>(data + HEADER_SIZE, data + length));
}

size_t Packet::serialise(uint8_t* buffer, size_t bufferSize) const {
    size_t totalSize = HEADER_SIZE + m_data.size();
    if (!buffer || totalSize > bufferSize || totalSize > MAX_PACKET_SIZE) {
        throw Error(ErrorCode::SERIALISE, "Packet too long (" +
                    std::to_string(totalSize) + " bytes)");
    }

    buffer[0] = static_cast<uint8_t>(m_type);
    buffer[1] = static_cast<uint8_t>(m_opcode);
    if (!m_data.empty()) {
        std::memcpy(buffer + HEADER_SIZE, m_data.data(), m_data.size());
    }
    return totalSize;
}

std::vector<uint8_t> Packet::serialise() const {
    uint8_t buffer[MAX_PACKET_SIZE];
    size_t written = serialise(buffer, sizeof(buffer));
    return std::vector<uint8_t>(buffer, buffer + written);
}

void Packet::checkStatus() {
    const size_t start = m_offset;
    uint8_t code = readU8();
    auto status = deviceErrorFromByte(code);
    if (!status) {
        m_offset = start;
        throw Error(ErrorCode::PARSE, "Invalid status");
    }
    if (*status != DeviceError::NONE) {
        m_offset = start;
        throw Error(*status);
    }
}

// ============================================================================
// Writers
// ============================================================================

void Packet::pushBool(bool value) {
    m_data.push_back(value ? 1 : 0);
}

void Packet::pushU8(uint8_t value) {
    m_data.push_back(value);
}

void Packet::pushI8(int8_t value) {
    m_data.push_back(static_cast<uint8_t>(value));
}

void Packet::pushU16(uint16_t value) {
    m_data.push_back(static_cast<uint8_t>(value & 0xFF));
    m_data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void Packet::pushU32(uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        m_data.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Packet::pushSlice(const uint8_t* data, size_t length) {
    if (data && length > 0) {
        m_data.insert(m_data.end(), data, data + length);
    }
}

void Packet::pushFilename(const std::string& name) {
    // plus one for the NUL terminator
    if (name.size() + 1 > FILENAME_LEN) {
        throw Error(ErrorCode::SERIALISE, "Filename too long");
    }
    if (!isAscii(name)) {
        throw Error(ErrorCode::SERIALISE, "Filename must be ascii");
    }
    m_data.insert(m_data.end(), name.begin(), name.end());
    m_data.insert(m_data.end(), FILENAME_LEN - name.size(), 0);
}

void Packet::pushString(const std::string& value, size_t maxLen) {
    if (value.size() + 1 > maxLen) {
        throw Error(ErrorCode::SERIALISE, "String too long");
    }
    m_data.insert(m_data.end(), value.begin(), value.end());
    m_data.insert(m_data.end(), maxLen - value.size(), 0);
}

// ============================================================================
// Readers
// ============================================================================

const uint8_t* Packet::take(size_t length) {
    if (length > remaining()) {
        throw Error(ErrorCode::PARSE, length == 1 ? "Reached end of input"
                                                  : "Requested slice too long");
    }
    const uint8_t* start = m_data.data() + m_offset;
    m_offset += length;
    return start;
}

bool Packet::readBool() {
    return *take(1) != 0;
}

uint8_t Packet::readU8() {
    return *take(1);
}

int8_t Packet::readI8() {
    return static_cast<int8_t>(*take(1));
}

uint16_t Packet::readU16() {
    const uint8_t* p = take(2);
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

int16_t Packet::readI16() {
    return static_cast<int16_t>(readU16());
}

uint32_t Packet::readU32() {
    const uint8_t* p = take(4);
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

int32_t Packet::readI32() {
    return static_cast<int32_t>(readU32());
}

std::vector<uint8_t> Packet::readSlice(size_t length) {
    const uint8_t* p = take(length);
    return std::vector<uint8_t>(p, p + length);
}

std::string Packet::readFilename() {
    size_t start = m_offset;
    const uint8_t* p = take(FILENAME_LEN);
    const uint8_t* end = std::find(p, p + FILENAME_LEN, 0);
    try {
        return decodeText(p, static_cast<size_t>(end - p));
    } catch (const Error&) {
        m_offset = start;
        throw;
    }
}

std::string Packet::readString(size_t maxLen) {
    size_t start = m_offset;
    const uint8_t* p = take(maxLen);
    size_t length = maxLen;
    while (length > 0 && p[length - 1] == 0) {
        --length;
    }
    try {
        return decodeText(p, length);
    } catch (const Error&) {
        m_offset = start;
        throw;
    }
}

bool Packet::operator==(const Packet& other) const {
    return m_type == other.m_type &&
           m_opcode == other.m_opcode &&
           std::equal(m_data.begin() + m_offset, m_data.end(),
                      other.m_data.begin() + other.m_offset, other.m_data.end());
}

} // namespace protocol
} // namespace nxt
