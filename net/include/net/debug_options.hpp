#pragma once

namespace pcinet::net {

constexpr bool logReceivedFrames = false;

} // namespace pcinet::net
