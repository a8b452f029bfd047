/**
 * @file test_brick.cpp
 * @brief Unit tests for the request/reply engine and brick operations
 *
 * Runs against a scripted in-process transport: each recv() pops the
 * next canned reply, each send() is recorded for inspection.
 */

#include <gtest/gtest.h>
#include "nxt/core.hpp"
#include "common/Error.hpp"
#include "transport/ITransport.hpp"
#include <algorithm>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>

using namespace nxt;
using namespace nxt::protocol;

namespace {

class ScriptedTransport : public transport::ITransport {
public:
    size_t send(const uint8_t* data, size_t length) override {
        sent.emplace_back(data, data + length);
        return length - shortBy;
    }

    size_t recv(uint8_t* buffer, size_t length) override {
        if (replies.empty()) {
            throw Error(ErrorCode::TRANSPORT, "no scripted reply");
        }
        std::vector<uint8_t> reply = replies.front();
        replies.pop_front();
        size_t n = std::min(length, reply.size());
        std::memcpy(buffer, reply.data(), n);
        return n;
    }

    std::string name() const override { return "scripted"; }

    void reply(Opcode opcode, uint8_t status, const std::vector<uint8_t>& payload = {}) {
        std::vector<uint8_t> raw = {0x02, static_cast<uint8_t>(opcode), status};
        raw.insert(raw.end(), payload.begin(), payload.end());
        replies.push_back(raw);
    }

    std::vector<std::vector<uint8_t>> sent;
    std::deque<std::vector<uint8_t>> replies;
    size_t shortBy = 0;
};

std::vector<uint8_t> filename(const std::string& name) {
    std::vector<uint8_t> out(name.begin(), name.end());
    out.resize(FILENAME_LEN, 0);
    return out;
}

std::vector<uint8_t> u32le(uint32_t v) {
    return {static_cast<uint8_t>(v), static_cast<uint8_t>(v >> 8),
            static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 24)};
}

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

std::vector<uint8_t> findReply(uint8_t handle, const std::string& name, uint32_t len) {
    return concat({{handle}, filename(name), u32le(len)});
}

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::NONE;
}

} // namespace

class BrickTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<ScriptedTransport>();
        brick = std::make_unique<Brick>(transport);
    }

    std::shared_ptr<ScriptedTransport> transport;
    std::unique_ptr<Brick> brick;
};

// ============================================================================
// Engine
// ============================================================================

TEST_F(BrickTest, BatteryLevelExchange) {
    transport->replies.push_back({0x02, 0x0B, 0x00, 0x0B, 0x00});

    EXPECT_EQ(brick->getBatteryLevel(), 11);
    ASSERT_EQ(transport->sent.size(), 1u);
    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x00, 0x0B}));
}

TEST_F(BrickTest, ReplyOpcodeMismatch) {
    transport->reply(Opcode::DIRECT_STOP_SOUND, 0x00, {0x0B, 0x00});
    EXPECT_EQ(codeOf([&] { brick->getBatteryLevel(); }), ErrorCode::REPLY_MISMATCH);
}

TEST_F(BrickTest, MismatchCheckedBeforeStatus) {
    transport->reply(Opcode::DIRECT_STOP_SOUND, 0xEC);
    EXPECT_EQ(codeOf([&] { brick->stopProgram(); }), ErrorCode::REPLY_MISMATCH);
}

TEST_F(BrickTest, SendRecvLeavesStatusUnread) {
    transport->reply(Opcode::SYSTEM_VERSIONS, 0x00, {0x7C, 0x01, 0x1C, 0x01});

    Packet reply = brick->sendRecv(Packet(Opcode::SYSTEM_VERSIONS));
    EXPECT_EQ(reply.offset(), 0u);
    EXPECT_EQ(reply.remaining(), 5u);
}

TEST_F(BrickTest, CheckedSendSurfacesDeviceError) {
    transport->reply(Opcode::DIRECT_STOP_PROGRAM, 0xEC);
    try {
        brick->stopProgram();
        FAIL() << "expected device error";
    } catch (const Error& e) {
        ASSERT_TRUE(e.deviceError().has_value());
        EXPECT_EQ(*e.deviceError(), DeviceError::NO_ACTIVE_PROGRAM);
    }
}

TEST_F(BrickTest, UnknownStatusIsParseFailure) {
    transport->reply(Opcode::DIRECT_STOP_PROGRAM, 0x99);
    EXPECT_EQ(codeOf([&] { brick->stopProgram(); }), ErrorCode::PARSE);
}

TEST_F(BrickTest, ShortWrite) {
    transport->shortBy = 1;
    EXPECT_EQ(codeOf([&] { brick->stopProgram(); }), ErrorCode::WRITE);
    EXPECT_TRUE(transport->replies.empty());
}

TEST_F(BrickTest, TransportFailurePropagates) {
    EXPECT_EQ(codeOf([&] { brick->getBatteryLevel(); }), ErrorCode::TRANSPORT);
}

TEST_F(BrickTest, CopiesShareTransport) {
    Brick copy = *brick;
    EXPECT_EQ(&copy.transport(), &brick->transport());
}

TEST_F(BrickTest, ConnectReadsName) {
    std::vector<uint8_t> name = {'N', 'X', 'T', 0};
    name.resize(MAX_NAME_LEN, 0);
    transport->reply(Opcode::SYSTEM_DEVICE_INFO, 0x00,
                     concat({name, {0x00, 0x16, 0x53, 0x0A, 0x0B, 0x0C}, {0x00},
                             {0, 0, 0, 0}, u32le(12345)}));

    Brick connected = Brick::connect(transport);
    EXPECT_EQ(connected.name(), "NXT");
}

// ============================================================================
// Device / program
// ============================================================================

TEST_F(BrickTest, FirmwareVersionFieldOrder) {
    transport->reply(Opcode::SYSTEM_VERSIONS, 0x00, {0x7C, 0x01, 0x1C, 0x01});

    FwVersion v = brick->getFirmwareVersion();
    EXPECT_EQ(v.protMinor, 0x7C);
    EXPECT_EQ(v.protMajor, 0x01);
    EXPECT_EQ(v.fwMinor, 0x1C);
    EXPECT_EQ(v.fwMajor, 0x01);
}

TEST_F(BrickTest, DeviceInfo) {
    std::vector<uint8_t> name = {'r', 'o', 'v', 'e', 'r'};
    name.resize(MAX_NAME_LEN, 0);
    transport->reply(Opcode::SYSTEM_DEVICE_INFO, 0x00,
                     concat({name, {0x00, 0x16, 0x53, 0x0A, 0x0B, 0x0C}, {0xEE},
                             {1, 2, 3, 4}, u32le(49152)}));

    DeviceInfo info = brick->getDeviceInfo();
    EXPECT_EQ(info.name, "rover");
    EXPECT_EQ(info.btAddr[1], 0x16);
    EXPECT_EQ(info.btAddr[5], 0x0C);
    EXPECT_EQ(info.signalStrength[3], 4);
    EXPECT_EQ(info.flash, 49152u);
}

TEST_F(BrickTest, SetBrickNameRequest) {
    transport->reply(Opcode::SYSTEM_SET_BRICK_NAME, 0x00);
    brick->setBrickName("test");

    std::vector<uint8_t> expected = {0x01, 0x98, 't', 'e', 's', 't'};
    expected.resize(2 + MAX_NAME_LEN, 0);
    EXPECT_EQ(transport->sent[0], expected);
}

TEST_F(BrickTest, CurrentProgramName) {
    transport->reply(Opcode::DIRECT_GET_CURR_PROGRAM, 0x00, filename("line.rxe"));
    EXPECT_EQ(brick->getCurrentProgramName(), "line.rxe");
}

TEST_F(BrickTest, KeepAlive) {
    transport->reply(Opcode::DIRECT_KEEP_ALIVE, 0x00, u32le(600000));
    EXPECT_EQ(brick->keepAlive(), 600000u);
}

TEST_F(BrickTest, PollCommand) {
    transport->reply(Opcode::SYSTEM_POLL_CMD_LEN, 0x00, {0x01, 0x03});
    transport->reply(Opcode::SYSTEM_POLL_CMD, 0x00, {0x01, 0x03, 0xA, 0xB, 0xC});

    EXPECT_EQ(brick->pollCommandLength(BufType::HIGH_SPEED), 3);
    EXPECT_EQ(brick->pollCommand(BufType::HIGH_SPEED, 3), (std::vector<uint8_t>{0xA, 0xB, 0xC}));
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x01, 0xA2, 0x01, 0x03}));
}

TEST_F(BrickTest, StartProgramRequest) {
    transport->reply(Opcode::DIRECT_START_PROGRAM, 0x00);
    brick->startProgram("line.rxe");
    EXPECT_EQ(transport->sent[0], concat({{0x00, 0x00}, filename("line.rxe")}));
}

TEST_F(BrickTest, FlashAndFactoryReset) {
    transport->reply(Opcode::SYSTEM_DELETE_USER_FLASH, 0x00);
    transport->reply(Opcode::SYSTEM_BT_FACTORY_RESET, 0x00);
    brick->deleteUserFlash();
    brick->bluetoothFactoryReset();
    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x01, 0xA0}));
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x01, 0xA4}));
}

// ============================================================================
// Sound
// ============================================================================

TEST_F(BrickTest, SoundRequests) {
    transport->reply(Opcode::DIRECT_PLAY_SOUND_FILE, 0x00);
    transport->reply(Opcode::DIRECT_PLAY_TONE, 0x00);
    transport->reply(Opcode::DIRECT_STOP_SOUND, 0x00);

    brick->playSoundFile("beep.rso", true);
    brick->playTone(440, 500);
    brick->stopSoundPlayback();

    EXPECT_EQ(transport->sent[0], concat({{0x00, 0x02, 0x01}, filename("beep.rso")}));
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x00, 0x03, 0xB8, 0x01, 0xF4, 0x01}));
    EXPECT_EQ(transport->sent[2], (std::vector<uint8_t>{0x00, 0x0C}));
}

// ============================================================================
// Motors / sensors
// ============================================================================

TEST_F(BrickTest, SetOutputStateRequest) {
    transport->reply(Opcode::DIRECT_SET_OUT_STATE, 0x00);
    brick->setOutputState(OutPort::A, -75, OutMode(OutMode::ON) | OutMode(OutMode::BRAKE),
                          RegulationMode::SPEED, 0, RunState::RUNNING, 360);

    EXPECT_EQ(transport->sent[0],
              (std::vector<uint8_t>{0x00, 0x04, 0x00, 0xB5, 0x03, 0x01, 0x00, 0x20,
                                    0x68, 0x01, 0x00, 0x00}));
}

TEST_F(BrickTest, GetOutputState) {
    transport->reply(Opcode::DIRECT_GET_OUT_STATE, 0x00,
                     concat({{0x02, 0x32, 0x05, 0x01, 0xF6, 0x20},
                             u32le(720), u32le(static_cast<uint32_t>(-90)),
                             u32le(10), u32le(3)}));

    OutputState s = brick->getOutputState(OutPort::C);
    EXPECT_EQ(s.port, OutPort::C);
    EXPECT_EQ(s.power, 50);
    EXPECT_TRUE(s.mode.has(OutMode::ON));
    EXPECT_TRUE(s.mode.has(OutMode::REGULATED));
    EXPECT_FALSE(s.mode.has(OutMode::BRAKE));
    EXPECT_EQ(s.regulationMode, RegulationMode::SPEED);
    EXPECT_EQ(s.turnRatio, -10);
    EXPECT_EQ(s.runState, RunState::RUNNING);
    EXPECT_EQ(s.tachoLimit, 720u);
    EXPECT_EQ(s.tachoCount, -90);
    EXPECT_EQ(s.blockTachoCount, 10);
    EXPECT_EQ(s.rotationCount, 3);
}

TEST_F(BrickTest, GetOutputStateRejectsUnknownRunState) {
    transport->reply(Opcode::DIRECT_GET_OUT_STATE, 0x00,
                     concat({{0x00, 0x00, 0x00, 0x00, 0x00, 0x30},
                             u32le(0), u32le(0), u32le(0), u32le(0)}));
    EXPECT_EQ(codeOf([&] { brick->getOutputState(OutPort::A); }), ErrorCode::PARSE);
}

TEST_F(BrickTest, GetInputValues) {
    transport->replies.push_back(
        {0x02, 0x07, 0x00, 0x00, 0x01, 0x00, 0x01, 0x20, 0xFF, 0x03, 0xFF, 0x03, 0x01, 0x00, 0xFF, 0x03});

    InputValues v = brick->getInputValues(InPort::S1);
    EXPECT_EQ(v.port, InPort::S1);
    EXPECT_TRUE(v.valid);
    EXPECT_FALSE(v.calibrated);
    EXPECT_EQ(v.sensorType, SensorType::SWITCH);
    EXPECT_EQ(v.sensorMode, SensorMode::BOOL);
    EXPECT_EQ(v.rawValue, 1023);
    EXPECT_EQ(v.scaledValue, 1);
    EXPECT_EQ(v.toString(), "true");
}

TEST(InputValuesTest, ToStringByMode) {
    InputValues v;
    EXPECT_EQ(v.toString(), "...");

    v.valid = true;
    v.rawValue = 512;
    v.scaledValue = 42;
    v.sensorMode = SensorMode::RAW;
    EXPECT_EQ(v.toString(), "512");
    v.sensorMode = SensorMode::PERCENT;
    EXPECT_EQ(v.toString(), "42%");
    v.sensorMode = SensorMode::ROTATION;
    EXPECT_EQ(v.toString(), "42 ticks");
}

TEST_F(BrickTest, ResetMotorPosition) {
    transport->reply(Opcode::DIRECT_RESET_POSITION, 0x00);
    brick->resetMotorPosition(OutPort::B, true);
    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x00, 0x0A, 0x01, 0x01}));
}

TEST_F(BrickTest, InputModeAndReset) {
    transport->reply(Opcode::DIRECT_SET_IN_MODE, 0x00);
    transport->reply(Opcode::DIRECT_RESET_IN_VAL, 0x00);
    transport->reply(Opcode::DIRECT_LS_GET_STATUS, 0x00, {0x04});

    brick->setInputMode(InPort::S3, SensorType::LIGHT_ACTIVE, SensorMode::PERCENT);
    brick->resetInputScaledValue(InPort::S3);
    EXPECT_EQ(brick->lsGetStatus(InPort::S3), 4);

    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x00, 0x05, 0x02, 0x05, 0x80}));
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x00, 0x08, 0x02}));
    EXPECT_EQ(transport->sent[2], (std::vector<uint8_t>{0x00, 0x0E, 0x02}));
}

TEST_F(BrickTest, LowSpeedReadWrite) {
    transport->reply(Opcode::DIRECT_LS_WRITE, 0x00);
    transport->reply(Opcode::DIRECT_LS_READ, 0x00, {0x02, 0x11, 0x22, 0x00, 0x00});

    brick->lsWrite(InPort::S4, {0x02, 0x42}, 2);
    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x00, 0x0F, 0x03, 0x02, 0x02, 0x02, 0x42}));
    EXPECT_EQ(brick->lsRead(InPort::S4), (std::vector<uint8_t>{0x11, 0x22}));

    EXPECT_EQ(codeOf([&] { brick->lsWrite(InPort::S1, std::vector<uint8_t>(256), 0); }),
              ErrorCode::SERIALISE);
}

// ============================================================================
// Mailboxes
// ============================================================================

TEST_F(BrickTest, MessageWriteFraming) {
    transport->reply(Opcode::DIRECT_MESSAGE_WRITE, 0x00);
    brick->messageWrite(3, {'h', 'i'});
    EXPECT_EQ(transport->sent[0], (std::vector<uint8_t>{0x00, 0x09, 0x03, 0x03, 'h', 'i', 0x00}));
}

TEST_F(BrickTest, MessageWriteLimits) {
    EXPECT_EQ(codeOf([&] { brick->messageWrite(MAX_INBOX_ID + 1, {'x'}); }), ErrorCode::SERIALISE);
    EXPECT_EQ(codeOf([&] { brick->messageWrite(0, std::vector<uint8_t>(MAX_MESSAGE_LEN + 1, 'x')); }),
              ErrorCode::SERIALISE);
    EXPECT_TRUE(transport->sent.empty());

    transport->reply(Opcode::DIRECT_MESSAGE_WRITE, 0x00);
    EXPECT_NO_THROW(brick->messageWrite(MAX_INBOX_ID, std::vector<uint8_t>(MAX_MESSAGE_LEN, 'x')));
}

TEST_F(BrickTest, MessageRead) {
    transport->reply(Opcode::DIRECT_MESSAGE_READ, 0x00, {0x00, 0x03, 'o', 'k', 0x00});
    EXPECT_EQ(brick->messageRead(10, 0, true), (std::vector<uint8_t>{'o', 'k', 0x00}));
}

TEST_F(BrickTest, MessageReadQueueEmpty) {
    transport->reply(Opcode::DIRECT_MESSAGE_READ, 0x40);
    try {
        brick->messageRead(10, 0, true);
        FAIL() << "expected device error";
    } catch (const Error& e) {
        EXPECT_TRUE(e.deviceError() == DeviceError::QUEUE_EMPTY);
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_F(BrickTest, FileReadWriteClose) {
    transport->reply(Opcode::SYSTEM_OPEN_READ, 0x00, concat({{0x05}, u32le(3)}));
    transport->reply(Opcode::SYSTEM_READ, 0x00, {0x05, 0x03, 0x00, 'a', 'b', 'c'});
    transport->reply(Opcode::SYSTEM_CLOSE, 0x00, {0x05});

    FileHandle h = brick->fileOpenRead("notes.txt");
    EXPECT_EQ(h.handle, 5);
    EXPECT_EQ(h.len, 3u);
    EXPECT_EQ(brick->fileRead(h, 3), (std::vector<uint8_t>{'a', 'b', 'c'}));
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x01, 0x82, 0x05, 0x03, 0x00}));
    brick->fileClose(h);
}

TEST_F(BrickTest, FileOpenWrite) {
    transport->reply(Opcode::SYSTEM_OPEN_WRITE, 0x00, {0x02});
    transport->reply(Opcode::SYSTEM_WRITE, 0x00, {0x02, 0x04, 0x00});

    FileHandle h = brick->fileOpenWrite("log.dat", 4);
    EXPECT_EQ(h.handle, 2);
    EXPECT_EQ(h.len, 4u);
    EXPECT_EQ(brick->fileWrite(h, {1, 2, 3, 4}), 4);

    std::vector<uint8_t> open = concat({{0x01, 0x81}, filename("log.dat"), u32le(4)});
    EXPECT_EQ(transport->sent[0], open);
}

TEST_F(BrickTest, FileOpenWriteVariants) {
    transport->reply(Opcode::SYSTEM_OPEN_WRITE_LINEAR, 0x00, {0x03});
    transport->reply(Opcode::SYSTEM_OPEN_WRITE_DATA, 0x00, {0x04});
    transport->reply(Opcode::SYSTEM_OPEN_APPEND_DATA, 0x00, concat({{0x06}, u32le(120)}));

    EXPECT_EQ(brick->fileOpenWriteLinear("prog.rxe", 64).handle, 3);
    FileHandle data = brick->fileOpenWriteData("data.dat", 256);
    EXPECT_EQ(data.handle, 4);
    EXPECT_EQ(data.len, 256u);
    FileHandle append = brick->fileOpenAppendData("data.dat");
    EXPECT_EQ(append.handle, 6);
    EXPECT_EQ(append.len, 120u);

    EXPECT_EQ(transport->sent[0][1], 0x89);
    EXPECT_EQ(transport->sent[1][1], 0x8B);
    EXPECT_EQ(transport->sent[2], concat({{0x01, 0x8C}, filename("data.dat")}));
}

TEST_F(BrickTest, FileDelete) {
    transport->reply(Opcode::SYSTEM_DELETE, 0x00, filename("old.txt"));
    brick->fileDelete("old.txt");
    EXPECT_EQ(transport->sent[0], concat({{0x01, 0x85}, filename("old.txt")}));

    transport->reply(Opcode::SYSTEM_DELETE, 0x87);
    EXPECT_EQ(codeOf([&] { brick->fileDelete("old.txt"); }), ErrorCode::DEVICE);
}

TEST_F(BrickTest, FileOpenReadNotFound) {
    transport->reply(Opcode::SYSTEM_OPEN_READ, 0x87);
    try {
        brick->fileOpenRead("missing.txt");
        FAIL() << "expected device error";
    } catch (const Error& e) {
        EXPECT_TRUE(e.deviceError() == DeviceError::FILE_NOT_FOUND);
    }
}

TEST_F(BrickTest, FindNextThreadsLatestHandle) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x00, findReply(1, "a.rxe", 100));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x00, findReply(2, "b.rso", 200));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x00, findReply(3, "c.ric", 300));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x87);

    FindFileHandle first = brick->fileFindFirst("*.*");
    FindFileHandle second = brick->fileFindNext(first);
    FindFileHandle third = brick->fileFindNext(second);
    EXPECT_EQ(third.name, "c.ric");
    EXPECT_EQ(codeOf([&] { brick->fileFindNext(third); }), ErrorCode::DEVICE);

    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x01, 0x87, 0x01}));
    EXPECT_EQ(transport->sent[2], (std::vector<uint8_t>{0x01, 0x87, 0x02}));
    EXPECT_EQ(transport->sent[3], (std::vector<uint8_t>{0x01, 0x87, 0x03}));
}

TEST_F(BrickTest, ListFilesStopsAtTerminalError) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x00, findReply(1, "a.rxe", 100));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x00, findReply(1, "b.rso", 200));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x00, findReply(1, "c.ric", 300));
    transport->reply(Opcode::SYSTEM_FIND_NEXT, 0x87);

    auto files = brick->listFiles();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "a.rxe");
    EXPECT_EQ(files[1].len, 200u);
    EXPECT_EQ(files[2].name, "c.ric");

    // k matches need k + 1 requests and nothing after the terminal error
    EXPECT_EQ(transport->sent.size(), 4u);
    EXPECT_TRUE(transport->replies.empty());
}

TEST_F(BrickTest, ListFilesNoMatch) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x87);
    EXPECT_TRUE(brick->listFiles("*.xyz").empty());
    EXPECT_EQ(transport->sent.size(), 1u);
}

TEST_F(BrickTest, ListFilesPropagatesTransportFailure) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x00, findReply(1, "a.rxe", 100));
    EXPECT_EQ(codeOf([&] { brick->listFiles(); }), ErrorCode::TRANSPORT);
}

TEST_F(BrickTest, ListFilesPropagatesMismatch) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x00, findReply(1, "a.rxe", 100));
    transport->reply(Opcode::SYSTEM_FIND_FIRST, 0x00, findReply(1, "a.rxe", 100));
    EXPECT_EQ(codeOf([&] { brick->listFiles(); }), ErrorCode::REPLY_MISMATCH);
}

// ============================================================================
// Modules / IO map
// ============================================================================

TEST_F(BrickTest, ListModules) {
    auto module = [](uint8_t handle, const std::string& name, uint32_t id) {
        return concat({{handle}, filename(name), u32le(id), u32le(0), {0x20, 0x00}});
    };
    transport->reply(Opcode::SYSTEM_FIND_FIRST_MODULE, 0x00, module(0, "Display.mod", 0xA0001));
    transport->reply(Opcode::SYSTEM_FIND_NEXT_MODULE, 0x00, module(0, "Sound.mod", 0x80001));
    transport->reply(Opcode::SYSTEM_FIND_NEXT_MODULE, 0x90);

    auto modules = brick->listModules();
    ASSERT_EQ(modules.size(), 2u);
    EXPECT_EQ(modules[0].name, "Display.mod");
    EXPECT_EQ(modules[0].id, 0xA0001u);
    EXPECT_EQ(modules[1].iomapLen, 0x20);
}

TEST_F(BrickTest, ModuleFindAndClose) {
    transport->reply(Opcode::SYSTEM_FIND_FIRST_MODULE, 0x00,
                     concat({{0x01}, filename("Sound.mod"), u32le(0x80001), u32le(0x1C0), {0x30, 0x00}}));
    transport->reply(Opcode::SYSTEM_FIND_NEXT_MODULE, 0x90);
    transport->reply(Opcode::SYSTEM_CLOSE_MOD_HANDLE, 0x00, {0x01});

    ModuleHandle module = brick->moduleFindFirst("*.mod");
    EXPECT_EQ(module.handle, 1);
    EXPECT_EQ(module.name, "Sound.mod");
    EXPECT_EQ(module.id, 0x80001u);
    EXPECT_EQ(module.len, 0x1C0u);
    EXPECT_EQ(module.iomapLen, 0x30);

    try {
        brick->moduleFindNext(module);
        FAIL() << "expected device error";
    } catch (const Error& e) {
        EXPECT_TRUE(e.deviceError() == DeviceError::MODULE_NOT_FOUND);
    }

    brick->moduleClose(module);
    EXPECT_EQ(transport->sent[1], (std::vector<uint8_t>{0x01, 0x91, 0x01}));
    EXPECT_EQ(transport->sent[2], (std::vector<uint8_t>{0x01, 0x92, 0x01}));
}

TEST_F(BrickTest, ReadIoMap) {
    transport->reply(Opcode::SYSTEM_IOMAP_READ, 0x00, concat({u32le(0xA0001), {0x03, 0x00, 0x01, 0x02, 0x03}}));
    EXPECT_EQ(brick->readIoMap(0xA0001, 4, 3), (std::vector<uint8_t>{0x01, 0x02, 0x03}));
    EXPECT_EQ(transport->sent[0],
              (std::vector<uint8_t>{0x01, 0x94, 0x01, 0x00, 0x0A, 0x00, 0x04, 0x00, 0x03, 0x00}));
}

TEST_F(BrickTest, WriteIoMap) {
    transport->reply(Opcode::SYSTEM_IOMAP_WRITE, 0x00, concat({u32le(0xA0001), {0x02, 0x00}}));
    EXPECT_EQ(brick->writeIoMap(0xA0001, 119, {0xFF, 0x00}), 2);
    EXPECT_EQ(transport->sent[0],
              (std::vector<uint8_t>{0x01, 0x95, 0x01, 0x00, 0x0A, 0x00, 0x77, 0x00, 0x02, 0x00, 0xFF, 0x00}));

    EXPECT_EQ(codeOf([&] { brick->writeIoMap(0xA0001, 0, std::vector<uint8_t>(0x10000)); }),
              ErrorCode::INT_OUT_OF_RANGE);
}

TEST_F(BrickTest, DisplayDataChunks) {
    for (size_t i = 0; i < DISPLAY_NUM_CHUNKS; ++i) {
        std::vector<uint8_t> chunk(DISPLAY_DATA_CHUNK_SIZE, static_cast<uint8_t>(i));
        transport->reply(Opcode::SYSTEM_IOMAP_READ, 0x00,
                         concat({u32le(MOD_DISPLAY), {DISPLAY_DATA_CHUNK_SIZE, 0x00}, chunk}));
    }

    DisplayData frame = brick->getDisplayData();
    EXPECT_EQ(frame[0], 0);
    EXPECT_EQ(frame[DISPLAY_DATA_CHUNK_SIZE], 1);
    EXPECT_EQ(frame[DISPLAY_DATA_LEN - 1], DISPLAY_NUM_CHUNKS - 1);

    ASSERT_EQ(transport->sent.size(), DISPLAY_NUM_CHUNKS);
    // Last chunk: offset 119 + 24 * 32 = 887 (0x0377)
    EXPECT_EQ(transport->sent.back(),
              (std::vector<uint8_t>{0x01, 0x94, 0x01, 0x00, 0x0A, 0x00, 0x77, 0x03, 0x20, 0x00}));
}

TEST_F(BrickTest, DisplayDataShortChunk) {
    transport->reply(Opcode::SYSTEM_IOMAP_READ, 0x00, concat({u32le(MOD_DISPLAY), {0x01, 0x00}, {0xAA}}));
    EXPECT_EQ(codeOf([&] { brick->getDisplayData(); }), ErrorCode::PARSE);
}
