// Native.hpp
// Boundary to the native automation subsystem. Implemented by the host platform layer (or by the
// loopback instance in-process); the core only calls through these interfaces.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/WireValue.hpp>

#include <expected>
#include <span>

namespace UIAExtend::Patterns
{

  // Native pattern object obtained from an element on the consumer side.
  class IPatternInstance
  {
  public:
    virtual ~IPatternInstance() = default;

    // Writes the property at `index` into `out`. Current and cached reads are distinct requests.
    virtual std::expected<void, Error> GetProperty(NGIN::UInt32 index, bool cached, ValueType type, WireValue &out) = 0;

    // `parameters` holds in slots followed by pending out slots; out slots are written in place.
    virtual std::expected<void, Error> CallMethod(NGIN::UInt32 index, std::span<WireValue> parameters) = 0;
  };

  // Provider-side entry point handed to the native subsystem at registration.
  class IPatternHandler
  {
  public:
    virtual ~IPatternHandler() = default;

    virtual std::expected<void, Error> GetProperty(void *target, NGIN::UInt32 index, WireValue &out) = 0;
    virtual std::expected<void, Error> Dispatch(void *target, NGIN::UInt32 index, std::span<WireValue> parameters) = 0;
  };

  struct PatternRegistration
  {
    PatternId patternId{0};
    PropertyId availabilityPropertyId{0};
    // One id per indexed property, in property index order.
    NGIN::Containers::Vector<PropertyId> propertyIds{};
  };

  class IPatternRegistrar
  {
  public:
    virtual ~IPatternRegistrar() = default;

    virtual std::expected<PatternRegistration, Error> RegisterPattern(const PatternDescriptor &descriptor,
                                                                      IPatternHandler &handler) = 0;
    virtual std::expected<PropertyId, Error> RegisterProperty(const PropertyDesc &property) = 0;
  };

  // Element-level property access used for standalone properties.
  class IStandalonePropertySource
  {
  public:
    virtual ~IStandalonePropertySource() = default;

    virtual std::expected<WireValue, Error> GetPropertyValue(PropertyId id, bool cached) = 0;
  };

} // namespace UIAExtend::Patterns
