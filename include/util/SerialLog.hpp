#pragma once
#include "util/Logger.hpp"

namespace util {

// Route Logger output to Serial, timestamped with millis()
void attachSerialLogging(unsigned long baud = 115200);

} // namespace util
