#pragma once

#include <cstdint>

namespace thermo::command {

// ESC/POS control bytes
constexpr char ESC = 0x1B;  // Starts most commands
constexpr char GS = 0x1D;   // Starts GS commands
constexpr char FS = 0x1C;
constexpr char DLE = 0x10;  // Real-time commands
constexpr char EOT = 0x04;
constexpr char LF = 0x0A;
constexpr char FF = 0x0C;
constexpr char CR = 0x0D;
constexpr char HT = 0x09;
constexpr char CAN = 0x18;

}  // namespace thermo::command
