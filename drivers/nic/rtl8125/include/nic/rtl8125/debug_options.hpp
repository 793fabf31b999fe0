#pragma once

namespace pcinet::nic::rtl8125 {

constexpr bool logDriverStart = true;
constexpr bool logRXDescriptor = false;
constexpr bool logTXDescriptor = false;
constexpr bool logRegisterDump = false;

} // namespace pcinet::nic::rtl8125
