#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the UR Teleop Core library
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/network/NetworkScanner.hpp"
#include "../../src/session/ConnectionManager.hpp"
#include "../../src/teleop/TeleopLoop.hpp"
#include "../../src/recording/Recorder.hpp"
#include "../../src/app/TeleopShell.hpp"
#include "../../src/ipc/IpcServer.hpp"
