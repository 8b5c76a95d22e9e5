// Standalone.hpp
// Reads of properties registered on their own instead of through a pattern's property table
#pragma once

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Native.hpp>
#include <UIAExtend/Patterns/Registry.hpp>
#include <UIAExtend/Patterns/TypeMapper.hpp>

#include <expected>
#include <string_view>
#include <type_traits>

namespace UIAExtend::Patterns
{

  // Looks the property up by its numeric identifier and checks the wire type against the descriptor.
  [[nodiscard]] UIAEXTEND_PATTERNS_API std::expected<WireValue, Error>
  ReadStandaloneValue(const RegistrationRecord &record, IStandalonePropertySource &source, std::string_view name,
                      bool cached);

  template <class T>
  [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error>
  ReadStandalone(IStandalonePropertySource &source, const RegistrationRecord &record, std::string_view name,
                 bool cached = false)
  {
    static_assert(WireRepresentable<T>, "Standalone properties carry one of the wire types");
    auto wire = ReadStandaloneValue(record, source, name, cached);
    if (!wire)
      return std::unexpected(std::move(wire.error()));
    return DecodeAs<T>(*wire);
  }

} // namespace UIAExtend::Patterns
