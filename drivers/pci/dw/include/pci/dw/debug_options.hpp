#pragma once

namespace pcinet::pci::dw {

constexpr bool logAtuPrograms = false;
constexpr bool dumpAtuOnFailure = true;
constexpr bool logConfigAccesses = false;

} // namespace pcinet::pci::dw
