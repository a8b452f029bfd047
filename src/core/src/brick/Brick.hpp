/**
 * @file Brick.hpp
 * @brief Request/reply engine and high-level brick operations
 *
 * Every operation builds one request packet, exchanges it over the
 * transport and decodes the reply. Failures are thrown as nxt::Error;
 * nothing is retried.
 *
 * Brick is a cheap copyable value; copies share the same transport.
 * There is no whole-exchange lock: two threads running commands on the
 * same connection can receive each other's replies (REPLY_MISMATCH).
 * Serialize access above this layer if a connection is shared.
 */

#pragma once

#include "MotorTypes.hpp"
#include "SensorTypes.hpp"
#include "SystemTypes.hpp"
#include "../protocol/Packet.hpp"
#include "../transport/ITransport.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nxt {

// ============================================================================
// Limits and well-known addresses
// ============================================================================

constexpr size_t MAX_MESSAGE_LEN = 58;
constexpr size_t MAX_NAME_LEN    = 15;
constexpr uint8_t MAX_INBOX_ID   = 19;
constexpr size_t MAX_LS_TX_LEN   = 255;

constexpr uint32_t MOD_DISPLAY              = 0xA0001;
constexpr uint16_t DISPLAY_DATA_OFFSET      = 119;
constexpr size_t DISPLAY_WIDTH              = 100;
constexpr size_t DISPLAY_HEIGHT             = 64;
constexpr size_t DISPLAY_DATA_LEN           = DISPLAY_WIDTH * DISPLAY_HEIGHT / 8;
constexpr uint16_t DISPLAY_DATA_CHUNK_SIZE  = 32;
constexpr size_t DISPLAY_NUM_CHUNKS         = DISPLAY_DATA_LEN / DISPLAY_DATA_CHUNK_SIZE;

using DisplayData = std::array<uint8_t, DISPLAY_DATA_LEN>;

class Brick {
public:
    /// Wrap a transport without talking to the brick; name() stays empty
    explicit Brick(std::shared_ptr<transport::ITransport> transport);

    /// Wrap a transport and read the brick name with getDeviceInfo()
    static Brick connect(std::shared_ptr<transport::ITransport> transport);

    const std::string& name() const { return m_name; }
    transport::ITransport& transport() const { return *m_transport; }

    // ========================================================================
    // Engine
    // ========================================================================

    /**
     * Transmit a request.
     * With checkStatus, also receive the reply, verify its opcode and
     * consume its status byte.
     */
    void send(const protocol::Packet& pkt, bool checkStatus);

    /**
     * Transmit a request and return its reply with the status byte still
     * unread. Throws REPLY_MISMATCH if the reply opcode differs.
     */
    protocol::Packet sendRecv(const protocol::Packet& pkt);

    // ========================================================================
    // Device / program
    // ========================================================================

    uint16_t getBatteryLevel();   // millivolts
    FwVersion getFirmwareVersion();
    void startProgram(const std::string& name);
    void stopProgram();
    std::string getCurrentProgramName();
    uint32_t keepAlive();         // sleep time limit in ms

    DeviceInfo getDeviceInfo();
    void setBrickName(const std::string& name);
    void deleteUserFlash();
    void bluetoothFactoryReset();
    uint8_t pollCommandLength(BufType buf);
    std::vector<uint8_t> pollCommand(BufType buf, uint8_t len);

    // ========================================================================
    // Sound
    // ========================================================================

    void playSoundFile(const std::string& file, bool loop);
    void playTone(uint16_t freq, uint16_t durationMs);
    void stopSoundPlayback();

    // ========================================================================
    // Motors
    // ========================================================================

    void setOutputState(OutPort port, int8_t power, OutMode mode,
                        RegulationMode regulationMode, int8_t turnRatio,
                        RunState runState, uint32_t tachoLimit);
    OutputState getOutputState(OutPort port);
    void resetMotorPosition(OutPort port, bool relative);

    // ========================================================================
    // Sensors
    // ========================================================================

    void setInputMode(InPort port, SensorType type, SensorMode mode);
    InputValues getInputValues(InPort port);
    void resetInputScaledValue(InPort port);

    // Low-speed (I2C) bus
    uint8_t lsGetStatus(InPort port);
    void lsWrite(InPort port, const std::vector<uint8_t>& txData, uint8_t rxBytes);
    std::vector<uint8_t> lsRead(InPort port);

    // ========================================================================
    // Mailboxes
    // ========================================================================

    void messageWrite(uint8_t inbox, const std::vector<uint8_t>& message);
    std::vector<uint8_t> messageRead(uint8_t remoteInbox, uint8_t localInbox, bool remove);

    // ========================================================================
    // Files
    // ========================================================================

    FileHandle fileOpenRead(const std::string& name);
    FileHandle fileOpenWrite(const std::string& name, uint32_t len);
    FileHandle fileOpenWriteLinear(const std::string& name, uint32_t len);
    FileHandle fileOpenWriteData(const std::string& name, uint32_t len);
    FileHandle fileOpenAppendData(const std::string& name);
    std::vector<uint8_t> fileRead(const FileHandle& handle, uint16_t len);
    uint16_t fileWrite(const FileHandle& handle, const std::vector<uint8_t>& data);
    void fileClose(const FileHandle& handle);
    void fileDelete(const std::string& name);

    /**
     * Start a file search. A device error (typically FILE_NOT_FOUND)
     * means there is no match.
     */
    FindFileHandle fileFindFirst(const std::string& pattern);

    /**
     * Advance a search with the handle returned by the previous step.
     * A device error ends the search; do not call again after it.
     */
    FindFileHandle fileFindNext(const FindFileHandle& handle);

    /**
     * Every file matching pattern. Iteration ends at the first device
     * error; any other failure propagates.
     */
    std::vector<FindFileHandle> listFiles(const std::string& pattern = "*.*");

    // ========================================================================
    // Modules / IO map
    // ========================================================================

    ModuleHandle moduleFindFirst(const std::string& pattern);
    ModuleHandle moduleFindNext(const ModuleHandle& handle);
    void moduleClose(const ModuleHandle& handle);
    std::vector<ModuleHandle> listModules(const std::string& pattern = "*.*");

    std::vector<uint8_t> readIoMap(uint32_t moduleId, uint16_t offset, uint16_t count);
    uint16_t writeIoMap(uint32_t moduleId, uint16_t offset, const std::vector<uint8_t>& data);

    /// Display frame buffer, DISPLAY_WIDTH x DISPLAY_HEIGHT at one bit per pixel
    DisplayData getDisplayData();

private:
    protocol::Packet recv(protocol::Opcode opcode);

    FindFileHandle readFindFileReply(protocol::Packet& reply);
    ModuleHandle readModuleReply(protocol::Packet& reply);
    FileHandle openForWrite(protocol::Opcode opcode, const std::string& name, uint32_t len);

    std::shared_ptr<transport::ITransport> m_transport;
    std::string m_name;
};

} // namespace nxt
