//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial level comes from MCPAUTH_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCPAUTH_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
