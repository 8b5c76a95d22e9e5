// PatternHandler.hpp
// Object handed to the native registrar for one interface pair
#pragma once

#include <UIAExtend/Patterns/Native.hpp>
#include <UIAExtend/Patterns/PatternClient.hpp>
#include <UIAExtend/Patterns/PatternDispatcher.hpp>
#include <UIAExtend/Patterns/Schema.hpp>

#include <expected>
#include <span>

namespace UIAExtend::Patterns
{

  template <class IProvider, class IPattern>
  class PatternHandler final : public IPatternHandler
  {
  public:
    explicit PatternHandler(const PatternDescriptor &desc) noexcept : m_desc(&desc) {}

    // Opaque target the native side passes back to GetProperty/Dispatch.
    [[nodiscard]] static void *Target(IProvider &provider) noexcept { return static_cast<void *>(&provider); }

    std::expected<void, Error> GetProperty(void *target, NGIN::UInt32 index, WireValue &out) override
    {
      return PatternDispatcher{*m_desc, target}.GetProperty(index, out);
    }

    std::expected<void, Error> Dispatch(void *target, NGIN::UInt32 index, std::span<WireValue> parameters) override
    {
      return PatternDispatcher{*m_desc, target}.CallMethod(index, parameters);
    }

    [[nodiscard]] PatternClient<IPattern> CreateClient(IPatternInstance &instance) const noexcept
    {
      return PatternClient<IPattern>{*m_desc, instance};
    }

    [[nodiscard]] const PatternDescriptor &Descriptor() const noexcept { return *m_desc; }

  private:
    const PatternDescriptor *m_desc;
  };

} // namespace UIAExtend::Patterns
