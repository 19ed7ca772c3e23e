#include "brainrt/hardware.hpp"

#include <cstring>

namespace brainrt
{

HardwareFault HardwareFault::from_errno(int code) noexcept
{
   switch (code) {
      case ENXIO:  return {code, HardwareErrorKind::PortOutOfRange};
      case ENODEV: return {code, HardwareErrorKind::DeviceNotConnected};
      case EACCES: return {code, HardwareErrorKind::PortBusy};
      default:     return {code, HardwareErrorKind::Unknown};
   }
}

std::string_view HardwareFault::message() const noexcept
{
   if (kind != HardwareErrorKind::Unknown) return to_string(kind);
   return std::strerror(code);
}

std::string_view to_string(HardwareErrorKind kind) noexcept
{
   switch (kind) {
      case HardwareErrorKind::PortOutOfRange:     return "the port is out of range";
      case HardwareErrorKind::DeviceNotConnected: return "no device is connected to the port";
      case HardwareErrorKind::PortBusy:           return "the port is busy";
      case HardwareErrorKind::Unknown:            return "unknown hardware error";
   }
   return "unknown hardware error";
}

} // namespace brainrt
