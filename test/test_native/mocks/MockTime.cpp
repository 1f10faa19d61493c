/**
 * @file MockTime.cpp
 * @brief Mock clock storage
 */

#include "MockTime.h"

// Shared by every test file, reset in setUp()
uint32_t g_mockMillis = 0;
