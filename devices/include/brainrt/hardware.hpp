/**
 * @file hardware.hpp
 * @brief Error convention of the native hardware surface
 *
 * Hardware functions return a sentinel (HARDWARE_ERR for integers,
 * HARDWARE_ERR_F for floating point) and set errno. check_hardware()
 * turns that into std::expected so device code can propagate the fault.
 * Codes are passed through unchanged; kind() is only a classification.
 */

#ifndef BRAINRT_HARDWARE_HPP
#define BRAINRT_HARDWARE_HPP

#include <cerrno>
#include <cstdint>
#include <expected>
#include <limits>
#include <string_view>

namespace brainrt
{

inline constexpr std::int32_t HARDWARE_ERR   = std::numeric_limits<std::int32_t>::max();
inline constexpr double       HARDWARE_ERR_F = std::numeric_limits<double>::infinity();

enum class HardwareErrorKind : std::uint8_t
{
   PortOutOfRange,     // ENXIO
   DeviceNotConnected, // ENODEV
   PortBusy,           // EACCES
   Unknown,
};

struct HardwareFault
{
   int               code{0};
   HardwareErrorKind kind{HardwareErrorKind::Unknown};

   [[nodiscard]] static HardwareFault from_errno(int code) noexcept;

   [[nodiscard]] std::string_view message() const noexcept;

   bool operator==(HardwareFault const&) const = default;
};

[[nodiscard]] std::string_view to_string(HardwareErrorKind kind) noexcept;

/**
 * @brief Map a hardware call's return value
 * @return value, or the fault described by errno if value equals sentinel
 */
template<typename T>
[[nodiscard]] std::expected<T, HardwareFault> check_hardware(T value, T sentinel) noexcept
{
   if (value == sentinel) {
      return std::unexpected(HardwareFault::from_errno(errno));
   }
   return value;
}

[[nodiscard]] inline std::expected<std::int32_t, HardwareFault> check_hardware(std::int32_t value) noexcept
{
   return check_hardware(value, HARDWARE_ERR);
}

[[nodiscard]] inline std::expected<double, HardwareFault> check_hardware(double value) noexcept
{
   return check_hardware(value, HARDWARE_ERR_F);
}

} // namespace brainrt

#endif // BRAINRT_HARDWARE_HPP
