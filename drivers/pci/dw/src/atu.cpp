#include <pci/dw/atu.hpp>

namespace pcinet::pci::dw {

template struct Atu<arch::mem_space>;

} // namespace pcinet::pci::dw
