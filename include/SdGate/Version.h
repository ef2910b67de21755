/**
 * @file Version.h
 * @brief SdGate library version.
 */

#pragma once

#define SDGATE_VERSION_MAJOR 1
#define SDGATE_VERSION_MINOR 2
#define SDGATE_VERSION_PATCH 0
#define SDGATE_VERSION "1.2.0"
