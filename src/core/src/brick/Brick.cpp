/**
 * @file Brick.cpp
 * @brief Request/reply engine and high-level brick operations
 *
 * Operations whose reply carries nothing but the status use
 * send(pkt, true). The rest use sendRecv(), consume the status with
 * checkStatus() and then read the typed reply fields in wire order.
 */

#include "Brick.hpp"
#include "../common/Error.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>

namespace nxt {

using protocol::Opcode;
using protocol::Packet;

// ============================================================================
// Construction
// ============================================================================

Brick::Brick(std::shared_ptr<transport::ITransport> transport)
    : m_transport(std::move(transport)) {
    if (!m_transport) {
        throw Error(ErrorCode::NO_BRICK, "No transport");
    }
}

Brick Brick::connect(std::shared_ptr<transport::ITransport> transport) {
    Brick brick(std::move(transport));
    brick.m_name = brick.getDeviceInfo().name;
    LOG_INFO("Connected to brick '{}' via {}", brick.m_name, brick.m_transport->name());
    return brick;
}

// ============================================================================
// Engine
// ============================================================================

void Brick::send(const Packet& pkt, bool checkStatus) {
    uint8_t buffer[protocol::MAX_PACKET_SIZE];
    size_t length = pkt.serialise(buffer, sizeof(buffer));

    LOG_TRACE("TX {} ({} bytes)", protocol::opcodeToString(pkt.opcode()), length);
    size_t written = m_transport->send(buffer, length);
    if (written != length) {
        LOG_DEBUG("Short write of {}: {} of {} bytes",
                  protocol::opcodeToString(pkt.opcode()), written, length);
        throw Error(ErrorCode::WRITE, "Short write: " + std::to_string(written) +
                                      " of " + std::to_string(length) + " bytes");
    }

    if (checkStatus) {
        Packet reply = recv(pkt.opcode());
        reply.checkStatus();
    }
}

Packet Brick::recv(Opcode opcode) {
    uint8_t buffer[protocol::MAX_PACKET_SIZE];
    size_t length = m_transport->recv(buffer, sizeof(buffer));

    Packet reply = Packet::parse(buffer, length);
    LOG_TRACE("RX {} ({} bytes)", protocol::opcodeToString(reply.opcode()), length);

    if (reply.opcode() != opcode) {
        LOG_DEBUG("Reply mismatch: expected {}, got {}",
                  protocol::opcodeToString(opcode), protocol::opcodeToString(reply.opcode()));
        throw Error(ErrorCode::REPLY_MISMATCH,
                    "Expected reply to " + protocol::opcodeToString(opcode) +
                    ", got " + protocol::opcodeToString(reply.opcode()));
    }
    return reply;
}

Packet Brick::sendRecv(const Packet& pkt) {
    send(pkt, false);
    return recv(pkt.opcode());
}

// ============================================================================
// Device / program
// ============================================================================

uint16_t Brick::getBatteryLevel() {
    Packet reply = sendRecv(Packet(Opcode::DIRECT_GET_BATT_LEVEL));
    reply.checkStatus();
    return reply.readU16();
}

FwVersion Brick::getFirmwareVersion() {
    Packet reply = sendRecv(Packet(Opcode::SYSTEM_VERSIONS));
    reply.checkStatus();

    FwVersion version;
    version.protMinor = reply.readU8();
    version.protMajor = reply.readU8();
    version.fwMinor = reply.readU8();
    version.fwMajor = reply.readU8();
    return version;
}

void Brick::startProgram(const std::string& name) {
    Packet pkt(Opcode::DIRECT_START_PROGRAM);
    pkt.pushFilename(name);
    send(pkt, true);
}

void Brick::stopProgram() {
    send(Packet(Opcode::DIRECT_STOP_PROGRAM), true);
}

std::string Brick::getCurrentProgramName() {
    Packet reply = sendRecv(Packet(Opcode::DIRECT_GET_CURR_PROGRAM));
    reply.checkStatus();
    return reply.readFilename();
}

uint32_t Brick::keepAlive() {
    Packet reply = sendRecv(Packet(Opcode::DIRECT_KEEP_ALIVE));
    reply.checkStatus();
    return reply.readU32();
}

DeviceInfo Brick::getDeviceInfo() {
    Packet reply = sendRecv(Packet(Opcode::SYSTEM_DEVICE_INFO));
    reply.checkStatus();

    DeviceInfo info;
    info.name = reply.readString(MAX_NAME_LEN);
    for (auto& byte : info.btAddr) {
        byte = reply.readU8();
    }
    reply.readU8();  // unused
    for (auto& byte : info.signalStrength) {
        byte = reply.readU8();
    }
    info.flash = reply.readU32();
    return info;
}

void Brick::setBrickName(const std::string& name) {
    Packet pkt(Opcode::SYSTEM_SET_BRICK_NAME);
    pkt.pushString(name, MAX_NAME_LEN);
    send(pkt, true);
}

void Brick::deleteUserFlash() {
    send(Packet(Opcode::SYSTEM_DELETE_USER_FLASH), true);
}

void Brick::bluetoothFactoryReset() {
    send(Packet(Opcode::SYSTEM_BT_FACTORY_RESET), true);
}

uint8_t Brick::pollCommandLength(BufType buf) {
    Packet pkt(Opcode::SYSTEM_POLL_CMD_LEN);
    pkt.pushU8(static_cast<uint8_t>(buf));

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU8();  // buffer number
    return reply.readU8();
}

std::vector<uint8_t> Brick::pollCommand(BufType buf, uint8_t len) {
    Packet pkt(Opcode::SYSTEM_POLL_CMD);
    pkt.pushU8(static_cast<uint8_t>(buf));
    pkt.pushU8(len);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU8();  // buffer number
    uint8_t count = reply.readU8();
    return reply.readSlice(count);
}

// ============================================================================
// Sound
// ============================================================================

void Brick::playSoundFile(const std::string& file, bool loop) {
    Packet pkt(Opcode::DIRECT_PLAY_SOUND_FILE);
    pkt.pushBool(loop);
    pkt.pushFilename(file);
    send(pkt, true);
}

void Brick::playTone(uint16_t freq, uint16_t durationMs) {
    Packet pkt(Opcode::DIRECT_PLAY_TONE);
    pkt.pushU16(freq);
    pkt.pushU16(durationMs);
    send(pkt, true);
}

void Brick::stopSoundPlayback() {
    send(Packet(Opcode::DIRECT_STOP_SOUND), true);
}

// ============================================================================
// Motors
// ============================================================================

void Brick::setOutputState(OutPort port, int8_t power, OutMode mode,
                           RegulationMode regulationMode, int8_t turnRatio,
                           RunState runState, uint32_t tachoLimit) {
    Packet pkt(Opcode::DIRECT_SET_OUT_STATE);
    pkt.pushU8(static_cast<uint8_t>(port));
    pkt.pushI8(power);
    pkt.pushU8(mode.bits);
    pkt.pushU8(static_cast<uint8_t>(regulationMode));
    pkt.pushI8(turnRatio);
    pkt.pushU8(static_cast<uint8_t>(runState));
    pkt.pushU32(tachoLimit);
    send(pkt, true);
}

OutputState Brick::getOutputState(OutPort port) {
    Packet pkt(Opcode::DIRECT_GET_OUT_STATE);
    pkt.pushU8(static_cast<uint8_t>(port));

    Packet reply = sendRecv(pkt);
    reply.checkStatus();

    OutputState state;
    state.port = outPortFromByte(reply.readU8());
    state.power = reply.readI8();
    state.mode = OutMode(reply.readU8());
    state.regulationMode = regulationModeFromByte(reply.readU8());
    state.turnRatio = reply.readI8();
    state.runState = runStateFromByte(reply.readU8());
    state.tachoLimit = reply.readU32();
    state.tachoCount = reply.readI32();
    state.blockTachoCount = reply.readI32();
    state.rotationCount = reply.readI32();
    return state;
}

void Brick::resetMotorPosition(OutPort port, bool relative) {
    Packet pkt(Opcode::DIRECT_RESET_POSITION);
    pkt.pushU8(static_cast<uint8_t>(port));
    pkt.pushBool(relative);
    send(pkt, true);
}

// ============================================================================
// Sensors
// ============================================================================

void Brick::setInputMode(InPort port, SensorType type, SensorMode mode) {
    Packet pkt(Opcode::DIRECT_SET_IN_MODE);
    pkt.pushU8(static_cast<uint8_t>(port));
    pkt.pushU8(static_cast<uint8_t>(type));
    pkt.pushU8(static_cast<uint8_t>(mode));
    send(pkt, true);
}

InputValues Brick::getInputValues(InPort port) {
    Packet pkt(Opcode::DIRECT_GET_IN_VALS);
    pkt.pushU8(static_cast<uint8_t>(port));

    Packet reply = sendRecv(pkt);
    reply.checkStatus();

    // port valid calibrated type mode raw(2) normalised(2) scaled(2) calibrated(2)
    InputValues values;
    values.port = inPortFromByte(reply.readU8());
    values.valid = reply.readBool();
    values.calibrated = reply.readBool();
    values.sensorType = sensorTypeFromByte(reply.readU8());
    values.sensorMode = sensorModeFromByte(reply.readU8());
    values.rawValue = reply.readU16();
    values.normalisedValue = reply.readU16();
    values.scaledValue = reply.readI16();
    values.calibratedValue = reply.readI16();
    return values;
}

void Brick::resetInputScaledValue(InPort port) {
    Packet pkt(Opcode::DIRECT_RESET_IN_VAL);
    pkt.pushU8(static_cast<uint8_t>(port));
    send(pkt, true);
}

uint8_t Brick::lsGetStatus(InPort port) {
    Packet pkt(Opcode::DIRECT_LS_GET_STATUS);
    pkt.pushU8(static_cast<uint8_t>(port));

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    return reply.readU8();
}

void Brick::lsWrite(InPort port, const std::vector<uint8_t>& txData, uint8_t rxBytes) {
    if (txData.size() > MAX_LS_TX_LEN) {
        throw Error(ErrorCode::SERIALISE, "Data too long");
    }

    Packet pkt(Opcode::DIRECT_LS_WRITE);
    pkt.pushU8(static_cast<uint8_t>(port));
    pkt.pushU8(static_cast<uint8_t>(txData.size()));
    pkt.pushU8(rxBytes);
    pkt.pushSlice(txData);
    send(pkt, true);
}

std::vector<uint8_t> Brick::lsRead(InPort port) {
    Packet pkt(Opcode::DIRECT_LS_READ);
    pkt.pushU8(static_cast<uint8_t>(port));

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    uint8_t count = reply.readU8();
    return reply.readSlice(count);
}

// ============================================================================
// Mailboxes
// ============================================================================

void Brick::messageWrite(uint8_t inbox, const std::vector<uint8_t>& message) {
    if (inbox > MAX_INBOX_ID) {
        throw Error(ErrorCode::SERIALISE, "Invalid mailbox ID");
    }
    if (message.size() > MAX_MESSAGE_LEN) {
        throw Error(ErrorCode::SERIALISE, "Message too long (max 58 bytes)");
    }

    // Length includes the NUL terminator
    Packet pkt(Opcode::DIRECT_MESSAGE_WRITE);
    pkt.pushU8(inbox);
    pkt.pushU8(static_cast<uint8_t>(message.size() + 1));
    pkt.pushSlice(message);
    pkt.pushU8(0);
    send(pkt, true);
}

std::vector<uint8_t> Brick::messageRead(uint8_t remoteInbox, uint8_t localInbox, bool remove) {
    Packet pkt(Opcode::DIRECT_MESSAGE_READ);
    pkt.pushU8(remoteInbox);
    pkt.pushU8(localInbox);
    pkt.pushBool(remove);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU8();  // local inbox
    uint8_t count = reply.readU8();
    return reply.readSlice(count);
}

// ============================================================================
// Files
// ============================================================================

FileHandle Brick::fileOpenRead(const std::string& name) {
    Packet pkt(Opcode::SYSTEM_OPEN_READ);
    pkt.pushFilename(name);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();

    FileHandle handle;
    handle.handle = reply.readU8();
    handle.len = reply.readU32();
    return handle;
}

FileHandle Brick::openForWrite(Opcode opcode, const std::string& name, uint32_t len) {
    Packet pkt(opcode);
    pkt.pushFilename(name);
    pkt.pushU32(len);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();

    FileHandle handle;
    handle.handle = reply.readU8();
    handle.len = len;
    return handle;
}

FileHandle Brick::fileOpenWrite(const std::string& name, uint32_t len) {
    return openForWrite(Opcode::SYSTEM_OPEN_WRITE, name, len);
}

FileHandle Brick::fileOpenWriteLinear(const std::string& name, uint32_t len) {
    return openForWrite(Opcode::SYSTEM_OPEN_WRITE_LINEAR, name, len);
}

FileHandle Brick::fileOpenWriteData(const std::string& name, uint32_t len) {
    return openForWrite(Opcode::SYSTEM_OPEN_WRITE_DATA, name, len);
}

FileHandle Brick::fileOpenAppendData(const std::string& name) {
    Packet pkt(Opcode::SYSTEM_OPEN_APPEND_DATA);
    pkt.pushFilename(name);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();

    FileHandle handle;
    handle.handle = reply.readU8();
    handle.len = reply.readU32();  // space remaining
    return handle;
}

std::vector<uint8_t> Brick::fileRead(const FileHandle& handle, uint16_t len) {
    Packet pkt(Opcode::SYSTEM_READ);
    pkt.pushU8(handle.handle);
    pkt.pushU16(len);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU8();  // handle
    uint16_t count = reply.readU16();
    return reply.readSlice(count);
}

uint16_t Brick::fileWrite(const FileHandle& handle, const std::vector<uint8_t>& data) {
    Packet pkt(Opcode::SYSTEM_WRITE);
    pkt.pushU8(handle.handle);
    pkt.pushSlice(data);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU8();  // handle
    return reply.readU16();
}

void Brick::fileClose(const FileHandle& handle) {
    Packet pkt(Opcode::SYSTEM_CLOSE);
    pkt.pushU8(handle.handle);
    send(pkt, true);
}

void Brick::fileDelete(const std::string& name) {
    Packet pkt(Opcode::SYSTEM_DELETE);
    pkt.pushFilename(name);
    send(pkt, true);
}

FindFileHandle Brick::readFindFileReply(Packet& reply) {
    reply.checkStatus();

    FindFileHandle found;
    found.handle = reply.readU8();
    found.name = reply.readFilename();
    found.len = reply.readU32();
    return found;
}

FindFileHandle Brick::fileFindFirst(const std::string& pattern) {
    Packet pkt(Opcode::SYSTEM_FIND_FIRST);
    pkt.pushFilename(pattern);

    Packet reply = sendRecv(pkt);
    return readFindFileReply(reply);
}

FindFileHandle Brick::fileFindNext(const FindFileHandle& handle) {
    Packet pkt(Opcode::SYSTEM_FIND_NEXT);
    pkt.pushU8(handle.handle);

    Packet reply = sendRecv(pkt);
    return readFindFileReply(reply);
}

std::vector<FindFileHandle> Brick::listFiles(const std::string& pattern) {
    std::vector<FindFileHandle> files;

    FindFileHandle current;
    try {
        current = fileFindFirst(pattern);
    } catch (const Error& e) {
        if (!e.isDevice()) {
            throw;
        }
        LOG_DEBUG("No files match '{}': {}", pattern, e.what());
        return files;
    }

    for (;;) {
        files.push_back(current);
        try {
            current = fileFindNext(current);
        } catch (const Error& e) {
            if (!e.isDevice()) {
                throw;
            }
            LOG_DEBUG("File search '{}' ended after {}: {}", pattern, files.size(), e.what());
            break;
        }
    }
    return files;
}

// ============================================================================
// Modules / IO map
// ============================================================================

ModuleHandle Brick::readModuleReply(Packet& reply) {
    reply.checkStatus();

    ModuleHandle module;
    module.handle = reply.readU8();
    module.name = reply.readFilename();
    module.id = reply.readU32();
    module.len = reply.readU32();
    module.iomapLen = reply.readU16();
    return module;
}

ModuleHandle Brick::moduleFindFirst(const std::string& pattern) {
    Packet pkt(Opcode::SYSTEM_FIND_FIRST_MODULE);
    pkt.pushFilename(pattern);

    Packet reply = sendRecv(pkt);
    return readModuleReply(reply);
}

ModuleHandle Brick::moduleFindNext(const ModuleHandle& handle) {
    Packet pkt(Opcode::SYSTEM_FIND_NEXT_MODULE);
    pkt.pushU8(handle.handle);

    Packet reply = sendRecv(pkt);
    return readModuleReply(reply);
}

void Brick::moduleClose(const ModuleHandle& handle) {
    Packet pkt(Opcode::SYSTEM_CLOSE_MOD_HANDLE);
    pkt.pushU8(handle.handle);
    send(pkt, true);
}

std::vector<ModuleHandle> Brick::listModules(const std::string& pattern) {
    std::vector<ModuleHandle> modules;

    ModuleHandle current;
    try {
        current = moduleFindFirst(pattern);
    } catch (const Error& e) {
        if (!e.isDevice()) {
            throw;
        }
        LOG_DEBUG("No modules match '{}': {}", pattern, e.what());
        return modules;
    }

    for (;;) {
        modules.push_back(current);
        try {
            current = moduleFindNext(current);
        } catch (const Error& e) {
            if (!e.isDevice()) {
                throw;
            }
            LOG_DEBUG("Module search '{}' ended after {}: {}", pattern, modules.size(), e.what());
            break;
        }
    }
    return modules;
}

std::vector<uint8_t> Brick::readIoMap(uint32_t moduleId, uint16_t offset, uint16_t count) {
    Packet pkt(Opcode::SYSTEM_IOMAP_READ);
    pkt.pushU32(moduleId);
    pkt.pushU16(offset);
    pkt.pushU16(count);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU32();  // module id
    uint16_t len = reply.readU16();
    return reply.readSlice(len);
}

uint16_t Brick::writeIoMap(uint32_t moduleId, uint16_t offset, const std::vector<uint8_t>& data) {
    if (data.size() > 0xFFFF) {
        throw Error(ErrorCode::INT_OUT_OF_RANGE,
                    "IO map write of " + std::to_string(data.size()) + " bytes");
    }

    Packet pkt(Opcode::SYSTEM_IOMAP_WRITE);
    pkt.pushU32(moduleId);
    pkt.pushU16(offset);
    pkt.pushU16(static_cast<uint16_t>(data.size()));
    pkt.pushSlice(data);

    Packet reply = sendRecv(pkt);
    reply.checkStatus();
    reply.readU32();  // module id
    return reply.readU16();
}

DisplayData Brick::getDisplayData() {
    DisplayData frame{};
    auto out = frame.begin();

    for (size_t chunk = 0; chunk < DISPLAY_NUM_CHUNKS; ++chunk) {
        auto offset = static_cast<uint16_t>(DISPLAY_DATA_OFFSET + chunk * DISPLAY_DATA_CHUNK_SIZE);
        std::vector<uint8_t> data = readIoMap(MOD_DISPLAY, offset, DISPLAY_DATA_CHUNK_SIZE);
        if (data.size() != DISPLAY_DATA_CHUNK_SIZE) {
            throw Error(ErrorCode::PARSE, "Display chunk " + std::to_string(chunk) + " has " +
                        std::to_string(data.size()) + " bytes");
        }
        out = std::copy(data.begin(), data.end(), out);
    }
    return frame;
}

} // namespace nxt
