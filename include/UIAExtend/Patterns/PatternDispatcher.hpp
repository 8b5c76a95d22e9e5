// PatternDispatcher.hpp
// Provider-side dispatcher: answers indexed native requests against a provider object
#pragma once

#include <NGIN/Primitives.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/TypeMapper.hpp>

#include <expected>
#include <span>
#include <string_view>

namespace UIAExtend::Patterns
{

  class UIAEXTEND_PATTERNS_API PatternDispatcher
  {
  public:
    // `provider` must point at an object of the descriptor's provider type, or be null.
    PatternDispatcher(const PatternDescriptor &desc, void *provider) noexcept
        : m_desc(&desc), m_provider(provider)
    {
    }

    template <class IProvider>
    [[nodiscard]] static std::expected<PatternDispatcher, Error> Bind(const PatternDescriptor &desc, IProvider &provider)
    {
      if (desc.providerTypeId != detail::TypeIdOf<IProvider>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "provider type does not match the descriptor"});
      return PatternDispatcher{desc, static_cast<void *>(&provider)};
    }

    std::expected<void, Error> GetProperty(NGIN::UInt32 index, WireValue &out) const;
    std::expected<void, Error> CallMethod(NGIN::UInt32 index, std::span<WireValue> parameters) const;
    std::expected<void, Error> GetStandaloneProperty(std::string_view name, WireValue &out) const;

    [[nodiscard]] const PatternDescriptor &Descriptor() const noexcept { return *m_desc; }
    [[nodiscard]] bool HasProvider() const noexcept { return m_provider != nullptr; }

  private:
    const PatternDescriptor *m_desc;
    void *m_provider;
  };

  // Answers a standalone property request by numeric identifier.
  [[nodiscard]] UIAEXTEND_PATTERNS_API std::expected<void, Error> ServeStandalone(const PatternDispatcher &dispatcher,
                                                                                  const RegistrationRecord &record,
                                                                                  PropertyId id, WireValue &out);

} // namespace UIAExtend::Patterns
