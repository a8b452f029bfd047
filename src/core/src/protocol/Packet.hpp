/**
 * @file Packet.hpp
 * @brief Packet codec: typed field writers, cursor-based field readers,
 *        whole-packet serialise/parse
 *
 * All multi-byte integers are little-endian. Filenames occupy exactly
 * FILENAME_LEN bytes, NUL padded. Bounded strings occupy exactly the
 * caller-supplied length, NUL padded.
 *
 * Reads are all-or-nothing: a read that would run past the end of the
 * payload throws and leaves the cursor where it was.
 */

#pragma once

#include "PacketTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nxt {
namespace protocol {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t HEADER_SIZE     = 2;   // TYPE(1) + OPCODE(1)
constexpr size_t MAX_PACKET_SIZE = 64;  // Hardware message limit
constexpr size_t MAX_PAYLOAD     = MAX_PACKET_SIZE - HEADER_SIZE;
constexpr size_t FILENAME_LEN    = 20;  // Including NUL terminator

// ============================================================================
// Packet
// ============================================================================

class Packet {
public:
    /// Request packet; type is DIRECT or SYSTEM according to isSystem(opcode)
    explicit Packet(Opcode opcode);

    /**
     * Request packet with an explicit type.
     * Throws SERIALISE if the type disagrees with the opcode class or is REPLY.
     */
    Packet(PacketType type, Opcode opcode);

    /**
     * Parse a received message: type byte, opcode byte, payload.
     * The status byte of a reply is left in the payload; see checkStatus().
     */
    static Packet parse(const uint8_t* data, size_t length);
    static Packet parse(const std::vector<uint8_t>& data) {
        return parse(data.data(), data.size());
    }

    /**
     * Serialise into a MAX_PACKET_SIZE buffer.
     * @return number of bytes used
     */
    size_t serialise(uint8_t* buffer, size_t bufferSize) const;
    std::vector<uint8_t> serialise() const;

    PacketType type() const { return m_type; }
    Opcode opcode() const { return m_opcode; }
    const std::vector<uint8_t>& data() const { return m_data; }
    size_t offset() const { return m_offset; }
    size_t remaining() const { return m_data.size() - m_offset; }

    /**
     * Consume the status byte and throw the classified device error if it
     * is not success. An unassigned status byte is a PARSE failure.
     * On failure the status byte is left unread.
     */
    void checkStatus();

    // ------------------------------------------------------------------------
    // Writers (append to payload)
    // ------------------------------------------------------------------------

    void pushBool(bool value);
    void pushU8(uint8_t value);
    void pushI8(int8_t value);
    void pushU16(uint16_t value);
    void pushU32(uint32_t value);
    void pushSlice(const uint8_t* data, size_t length);
    void pushSlice(const std::vector<uint8_t>& data) { pushSlice(data.data(), data.size()); }

    /// ASCII name, NUL padded to FILENAME_LEN; name plus terminator must fit
    void pushFilename(const std::string& name);

    /// Text NUL padded to maxLen; text plus terminator must fit
    void pushString(const std::string& value, size_t maxLen);

    // ------------------------------------------------------------------------
    // Readers (advance cursor)
    // ------------------------------------------------------------------------

    bool readBool();
    uint8_t readU8();
    int8_t readI8();
    uint16_t readU16();
    int16_t readI16();
    uint32_t readU32();
    int32_t readI32();
    std::vector<uint8_t> readSlice(size_t length);

    /// FILENAME_LEN bytes, text up to the first NUL
    std::string readFilename();

    /// Exactly maxLen bytes with all trailing NULs stripped
    std::string readString(size_t maxLen);

    /// Type, opcode and the unread part of the payload
    bool operator==(const Packet& other) const;
    bool operator!=(const Packet& other) const { return !(*this == other); }

private:
    Packet(PacketType type, Opcode opcode, std::vector<uint8_t> data);

    const uint8_t* take(size_t length);

    PacketType m_type;
    Opcode m_opcode;
    std::vector<uint8_t> m_data;
    size_t m_offset = 0;
};

} // namespace protocol
} // namespace nxt
