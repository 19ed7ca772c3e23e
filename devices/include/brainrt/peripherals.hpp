/**
 * @file peripherals.hpp
 * @brief Port ownership: registry, exclusive port handles, peripherals
 *
 * Every physical connector on the brain (21 smart ports, 8 ADI ports A..H,
 * plus 8 ADI ports on each ADI expander module) may be driven by at most one
 * device object at a time. The PortRegistry is the single source of truth
 * for which connectors are claimed. Handles are move-only and give their
 * port back to the registry when destroyed.
 *
 * Two ways to obtain ports:
 * - Peripherals::take(): every port as a named, typed member. Ownership is
 *   then transferred by moving members into device objects.
 * - DynamicPeripherals: claim ports chosen at run time, with a recoverable
 *   error on duplicates.
 */

#ifndef BRAINRT_PERIPHERALS_HPP
#define BRAINRT_PERIPHERALS_HPP

#include "brainrt/kernel.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

namespace brainrt
{

enum class PortKind : std::uint8_t
{
   Smart,
   Adi,
};

enum class PortError
{
   AlreadyInUse,         // Port is claimed by another live handle
   OutOfRange,           // Port number does not exist in that namespace
   ExpanderPortMismatch, // Ports of one device sit on different expanders
   PeripheralsTaken,     // Peripherals::take() already succeeded
};

[[nodiscard]] std::string_view to_string(PortError error) noexcept;

class PortRegistry;

/**
 * @brief Exclusive claim on one physical port
 *
 * Only created by PortRegistry::claim(). Cannot be copied; moving transfers
 * the claim, and the destructor releases it.
 */
class PortHandle
{
public:
   ~PortHandle();
   PortHandle(PortHandle&& other) noexcept;
   PortHandle& operator=(PortHandle&& other) noexcept;
   PortHandle(PortHandle const&)            = delete;
   PortHandle& operator=(PortHandle const&) = delete;

   [[nodiscard]] std::uint8_t number() const noexcept { return port; }
   [[nodiscard]] PortKind     kind()   const noexcept { return port_kind; }

   /**
    * @brief Smart port of the parent expander, if the port sits on one
    */
   [[nodiscard]] std::optional<std::uint8_t> expander() const noexcept
   {
      if (port_kind == PortKind::Adi && expander_index != config::INTERNAL_ADI_EXPANDER) {
         return expander_index;
      }
      return std::nullopt;
   }

   /**
    * @brief Expander index as the hardware API expects it
    *
    * config::INTERNAL_ADI_EXPANDER for the brain's own ADI ports.
    */
   [[nodiscard]] std::uint8_t internal_expander_index() const noexcept { return expander_index; }

   /**
    * @brief False for moved-from handles
    */
   [[nodiscard]] bool owns_claim() const noexcept { return registry != nullptr; }

   [[nodiscard]] PortRegistry* owner() const noexcept { return registry; }

private:
   friend class PortRegistry;
   PortHandle(PortRegistry& registry, std::uint8_t port, PortKind kind, std::uint8_t expander_index) noexcept
      : registry(&registry), port(port), port_kind(kind), expander_index(expander_index) {}

   void release() noexcept;

   PortRegistry* registry{nullptr};
   std::uint8_t  port{0};
   PortKind      port_kind{PortKind::Smart};
   std::uint8_t  expander_index{config::INTERNAL_ADI_EXPANDER};
};

/**
 * @brief Set of claimed ports for one brain
 *
 * claim() may be called from any OS task; the claimed set is guarded by a
 * Spinlock and only ever held for a few instructions.
 */
class PortRegistry
{
public:
   PortRegistry() = default;
   ~PortRegistry() = default;
   PortRegistry(PortRegistry const&)            = delete;
   PortRegistry& operator=(PortRegistry const&) = delete;
   PortRegistry(PortRegistry&&)                 = delete;
   PortRegistry& operator=(PortRegistry&&)      = delete;

   /**
    * @brief The registry for this brain's hardware
    */
   static PortRegistry& global() noexcept;

   /**
    * @brief Claim a port
    * @param port Port number (smart: 1..21, ADI: 1..8)
    * @param kind Port namespace
    * @param expander For ADI ports: smart port of the expander module, or
    *        config::INTERNAL_ADI_EXPANDER for the brain's own ADI ports
    * @return The handle, or AlreadyInUse / OutOfRange. A failed claim leaves
    *         the registry unchanged.
    */
   [[nodiscard]] std::expected<PortHandle, PortError> claim(std::uint8_t port,
                                                            PortKind kind,
                                                            std::uint8_t expander = config::INTERNAL_ADI_EXPANDER);

   [[nodiscard]] bool is_claimed(std::uint8_t port,
                                 PortKind kind,
                                 std::uint8_t expander = config::INTERNAL_ADI_EXPANDER) const;

   /**
    * @brief Number of live handles issued by this registry
    */
   [[nodiscard]] std::size_t claimed_count() const;

private:
   friend class PortHandle;
   friend class Peripherals;

   void release(PortHandle const& handle) noexcept;

   mutable Spinlock lock;
   std::uint32_t smart_claimed{0};                                             // bit n: smart port n
   std::array<std::uint8_t, config::INTERNAL_ADI_EXPANDER + 1> adi_claimed{}; // [expander] bit n-1: ADI port n
   std::atomic<bool> peripherals_taken{false};
};

/**
 * @brief An owned smart port
 */
class SmartPort
{
public:
   explicit SmartPort(PortHandle&& handle) noexcept : port(std::move(handle)) {}

   [[nodiscard]] std::uint8_t index() const noexcept { return port.number(); }
   [[nodiscard]] PortHandle const& handle() const noexcept { return port; }

private:
   PortHandle port;
};

/**
 * @brief An owned ADI (3-wire) port, on the brain or on an expander
 */
class AdiPort
{
public:
   explicit AdiPort(PortHandle&& handle) noexcept : port(std::move(handle)) {}

   [[nodiscard]] std::uint8_t index() const noexcept { return port.number(); }

   /**
    * @brief Smart port of the expander this port is on, if any
    */
   [[nodiscard]] std::optional<std::uint8_t> expander_index() const noexcept { return port.expander(); }
   [[nodiscard]] std::uint8_t internal_expander_index() const noexcept { return port.internal_expander_index(); }
   [[nodiscard]] PortHandle const& handle() const noexcept { return port; }

private:
   PortHandle port;
};

/**
 * @brief Devices spanning two ADI ports (e.g. a quadrature encoder) need
 *        both on the same expander
 */
[[nodiscard]] std::expected<void, PortError> check_same_expander(AdiPort const& a, AdiPort const& b) noexcept;

/**
 * @brief ADI expander module plugged into a smart port
 *
 * Owns the smart port for its whole lifetime and hands out the eight ADI
 * ports behind it.
 */
class AdiExpander
{
public:
   explicit AdiExpander(SmartPort port) noexcept : port(std::move(port)) {}

   [[nodiscard]] std::uint8_t port_index() const noexcept { return port.index(); }

   /**
    * @brief Claim ADI port index (1..8) on this expander
    */
   [[nodiscard]] std::expected<AdiPort, PortError> take_adi_port(std::uint8_t index);

private:
   SmartPort port;
};

/**
 * @brief Every port of the brain as a typed member
 *
 * take() succeeds once per registry. Move a member into the device that
 * uses it; dropping a member returns the port to the registry.
 */
class Peripherals
{
public:
   [[nodiscard]] static std::expected<Peripherals, PortError> take(PortRegistry& registry = PortRegistry::global());

   Peripherals(Peripherals&&)            = default;
   Peripherals& operator=(Peripherals&&) = default;

   SmartPort port_1;
   SmartPort port_2;
   SmartPort port_3;
   SmartPort port_4;
   SmartPort port_5;
   SmartPort port_6;
   SmartPort port_7;
   SmartPort port_8;
   SmartPort port_9;
   SmartPort port_10;
   SmartPort port_11;
   SmartPort port_12;
   SmartPort port_13;
   SmartPort port_14;
   SmartPort port_15;
   SmartPort port_16;
   SmartPort port_17;
   SmartPort port_18;
   SmartPort port_19;
   SmartPort port_20;
   SmartPort port_21;

   AdiPort adi_port_a;
   AdiPort adi_port_b;
   AdiPort adi_port_c;
   AdiPort adi_port_d;
   AdiPort adi_port_e;
   AdiPort adi_port_f;
   AdiPort adi_port_g;
   AdiPort adi_port_h;

   [[nodiscard]] PortRegistry& registry() const noexcept { return *owner; }

private:
   using SmartHandles = std::array<std::optional<PortHandle>, config::SMART_PORT_COUNT>;
   using AdiHandles   = std::array<std::optional<PortHandle>, config::ADI_PORT_COUNT>;

   Peripherals(PortRegistry& registry, SmartHandles& smart, AdiHandles& adi);

   PortRegistry* owner;
};

/**
 * @brief Claim ports by number at run time
 */
class DynamicPeripherals
{
public:
   explicit DynamicPeripherals(PortRegistry& registry = PortRegistry::global()) noexcept : registry(&registry) {}

   /**
    * @brief Give up the typed ports and switch to run-time claims
    */
   explicit DynamicPeripherals(Peripherals peripherals) noexcept;

   [[nodiscard]] std::expected<SmartPort, PortError> take_smart_port(std::uint8_t index);
   [[nodiscard]] std::expected<AdiPort,   PortError> take_adi_port(std::uint8_t index);

private:
   PortRegistry* registry;
};

} // namespace brainrt

#endif // BRAINRT_PERIPHERALS_HPP
