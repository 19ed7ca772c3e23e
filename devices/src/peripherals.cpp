#include "brainrt/peripherals.hpp"

#include <bit>
#include <cassert>
#include <utility>

#include "DEBUG_PRINT.hpp"

namespace brainrt
{

std::string_view to_string(PortError error) noexcept
{
   switch (error) {
      case PortError::AlreadyInUse:         return "the port is already in use";
      case PortError::OutOfRange:           return "the port number is out of range";
      case PortError::ExpanderPortMismatch: return "the ports are not on the same expander";
      case PortError::PeripheralsTaken:     return "peripherals have already been taken";
   }
   return "unknown port error";
}

// Wrap a successful claim in its typed port
template<typename Port>
static std::expected<Port, PortError> as_port(std::expected<PortHandle, PortError> claimed)
{
   if (!claimed) return std::unexpected(claimed.error());
   return Port(std::move(*claimed));
}

static constexpr bool valid_smart_port(std::uint8_t port) noexcept
{
   return 1 <= port && port <= config::SMART_PORT_COUNT;
}

static constexpr bool valid_adi_port(std::uint8_t port, std::uint8_t expander) noexcept
{
   bool const port_ok = 1 <= port && port <= config::ADI_PORT_COUNT;
   bool const expander_ok = valid_smart_port(expander) || expander == config::INTERNAL_ADI_EXPANDER;
   return port_ok && expander_ok;
}

/* ============================================================================
 * PortHandle
 * ========================================================================= */

PortHandle::~PortHandle()
{
   release();
}

PortHandle::PortHandle(PortHandle&& other) noexcept
   : registry(std::exchange(other.registry, nullptr)),
     port(other.port),
     port_kind(other.port_kind),
     expander_index(other.expander_index)
{
}

PortHandle& PortHandle::operator=(PortHandle&& other) noexcept
{
   if (this != &other) {
      release();
      registry       = std::exchange(other.registry, nullptr);
      port           = other.port;
      port_kind      = other.port_kind;
      expander_index = other.expander_index;
   }
   return *this;
}

void PortHandle::release() noexcept
{
   // Moved-from handles have no registry, so a claim is released exactly once
   if (auto* owner = std::exchange(registry, nullptr)) {
      owner->release(*this);
   }
}

/* ============================================================================
 * PortRegistry
 * ========================================================================= */

PortRegistry& PortRegistry::global() noexcept
{
   static PortRegistry registry;
   return registry;
}

std::expected<PortHandle, PortError> PortRegistry::claim(std::uint8_t port, PortKind kind, std::uint8_t expander)
{
   if (kind == PortKind::Smart) {
      if (!valid_smart_port(port)) return std::unexpected(PortError::OutOfRange);

      SpinlockGuard guard(lock);
      std::uint32_t const bit = 1u << port;
      if (smart_claimed & bit) {
         LOG_REGISTRY("smart port %u already in use", port);
         return std::unexpected(PortError::AlreadyInUse);
      }
      smart_claimed |= bit;
      LOG_REGISTRY("claimed smart port %u", port);
      return PortHandle(*this, port, kind, config::INTERNAL_ADI_EXPANDER);
   }

   if (!valid_adi_port(port, expander)) return std::unexpected(PortError::OutOfRange);

   SpinlockGuard guard(lock);
   std::uint8_t const bit = static_cast<std::uint8_t>(1u << (port - 1));
   auto& claimed = adi_claimed[expander];
   if (claimed & bit) {
      LOG_REGISTRY("ADI port %u (expander %u) already in use", port, expander);
      return std::unexpected(PortError::AlreadyInUse);
   }
   claimed |= bit;
   LOG_REGISTRY("claimed ADI port %u (expander %u)", port, expander);
   return PortHandle(*this, port, kind, expander);
}

bool PortRegistry::is_claimed(std::uint8_t port, PortKind kind, std::uint8_t expander) const
{
   SpinlockGuard guard(lock);
   if (kind == PortKind::Smart) {
      return valid_smart_port(port) && (smart_claimed & (1u << port)) != 0;
   }
   return valid_adi_port(port, expander) && (adi_claimed[expander] & (1u << (port - 1))) != 0;
}

std::size_t PortRegistry::claimed_count() const
{
   SpinlockGuard guard(lock);
   std::size_t count = std::popcount(smart_claimed);
   for (auto mask : adi_claimed) {
      count += std::popcount(mask);
   }
   return count;
}

void PortRegistry::release(PortHandle const& handle) noexcept
{
   SpinlockGuard guard(lock);
   if (handle.kind() == PortKind::Smart) {
      assert((smart_claimed & (1u << handle.number())) && "Releasing an unclaimed smart port");
      smart_claimed &= ~(1u << handle.number());
      LOG_REGISTRY("released smart port %u", handle.number());
   } else {
      auto& claimed = adi_claimed[handle.internal_expander_index()];
      std::uint8_t const bit = static_cast<std::uint8_t>(1u << (handle.number() - 1));
      assert((claimed & bit) && "Releasing an unclaimed ADI port");
      claimed &= static_cast<std::uint8_t>(~bit);
      LOG_REGISTRY("released ADI port %u (expander %u)", handle.number(), handle.internal_expander_index());
   }
}

/* ============================================================================
 * Ports
 * ========================================================================= */

std::expected<void, PortError> check_same_expander(AdiPort const& a, AdiPort const& b) noexcept
{
   if (a.internal_expander_index() != b.internal_expander_index()) {
      return std::unexpected(PortError::ExpanderPortMismatch);
   }
   return {};
}

std::expected<AdiPort, PortError> AdiExpander::take_adi_port(std::uint8_t index)
{
   auto* registry = port.handle().owner();
   assert(registry && "Expander built from a moved-from port");

   return as_port<AdiPort>(registry->claim(index, PortKind::Adi, port.index()));
}

/* ============================================================================
 * Peripherals
 * ========================================================================= */

std::expected<Peripherals, PortError> Peripherals::take(PortRegistry& registry)
{
   if (registry.peripherals_taken.exchange(true, std::memory_order_acq_rel)) {
      return std::unexpected(PortError::PeripheralsTaken);
   }

   // Claim everything first; on failure the handles already claimed are
   // released by their destructors.
   SmartHandles smart;
   AdiHandles   adi;

   for (std::uint8_t i = 0; i < config::SMART_PORT_COUNT; ++i) {
      auto handle = registry.claim(i + 1, PortKind::Smart);
      if (!handle) {
         registry.peripherals_taken.store(false, std::memory_order_release);
         return std::unexpected(handle.error());
      }
      smart[i].emplace(std::move(*handle));
   }
   for (std::uint8_t i = 0; i < config::ADI_PORT_COUNT; ++i) {
      auto handle = registry.claim(i + 1, PortKind::Adi);
      if (!handle) {
         registry.peripherals_taken.store(false, std::memory_order_release);
         return std::unexpected(handle.error());
      }
      adi[i].emplace(std::move(*handle));
   }

   return Peripherals(registry, smart, adi);
}

Peripherals::Peripherals(PortRegistry& registry, SmartHandles& smart, AdiHandles& adi) :
   port_1(std::move(*smart[0])),
   port_2(std::move(*smart[1])),
   port_3(std::move(*smart[2])),
   port_4(std::move(*smart[3])),
   port_5(std::move(*smart[4])),
   port_6(std::move(*smart[5])),
   port_7(std::move(*smart[6])),
   port_8(std::move(*smart[7])),
   port_9(std::move(*smart[8])),
   port_10(std::move(*smart[9])),
   port_11(std::move(*smart[10])),
   port_12(std::move(*smart[11])),
   port_13(std::move(*smart[12])),
   port_14(std::move(*smart[13])),
   port_15(std::move(*smart[14])),
   port_16(std::move(*smart[15])),
   port_17(std::move(*smart[16])),
   port_18(std::move(*smart[17])),
   port_19(std::move(*smart[18])),
   port_20(std::move(*smart[19])),
   port_21(std::move(*smart[20])),
   adi_port_a(std::move(*adi[0])),
   adi_port_b(std::move(*adi[1])),
   adi_port_c(std::move(*adi[2])),
   adi_port_d(std::move(*adi[3])),
   adi_port_e(std::move(*adi[4])),
   adi_port_f(std::move(*adi[5])),
   adi_port_g(std::move(*adi[6])),
   adi_port_h(std::move(*adi[7])),
   owner(&registry)
{
   static_assert(config::SMART_PORT_COUNT == 21 && config::ADI_PORT_COUNT == 8,
                 "Peripherals members must match the configured port counts");
}

/* ============================================================================
 * DynamicPeripherals
 * ========================================================================= */

DynamicPeripherals::DynamicPeripherals(Peripherals peripherals) noexcept
   : registry(&peripherals.registry())
{
   // peripherals is destroyed on return, giving every typed port back
}

std::expected<SmartPort, PortError> DynamicPeripherals::take_smart_port(std::uint8_t index)
{
   return as_port<SmartPort>(registry->claim(index, PortKind::Smart));
}

std::expected<AdiPort, PortError> DynamicPeripherals::take_adi_port(std::uint8_t index)
{
   return as_port<AdiPort>(registry->claim(index, PortKind::Adi));
}

} // namespace brainrt
