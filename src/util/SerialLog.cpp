#include "util/SerialLog.hpp"
#include <Arduino.h>

namespace util {

void attachSerialLogging(unsigned long baud) {
    Serial.begin(baud);
    Logger::setClock([]() { return static_cast<uint32_t>(millis()); });
    Logger::setSink([](LogLevel, const char* line) { Serial.println(line); });
}

} // namespace util
