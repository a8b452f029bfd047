#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the NXT brick client
 */

#include "../../src/common/Error.hpp"
#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/protocol/Packet.hpp"
#include "../../src/transport/ITransport.hpp"
#include "../../src/transport/RfcommTransport.hpp"
#include "../../src/transport/UsbTransport.hpp"
#include "../../src/brick/Brick.hpp"
