// TypeMapper.hpp - Conversion between semantic values and wire values
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/WireValue.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <type_traits>

namespace UIAExtend::Patterns
{

  namespace detail
  {
    // Compute FNV-based type id for a type; matches Any::GetTypeId().
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cvref_t<T>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }
  } // namespace detail

  // Semantic type bound to a C++ type. Anything outside the five wire types maps to None.
  template <class T>
  [[nodiscard]] constexpr ValueType ValueTypeOf() noexcept
  {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, bool>)
      return ValueType::Bool;
    else if constexpr (std::is_same_v<U, std::int32_t>)
      return ValueType::Int;
    else if constexpr (std::is_same_v<U, double>)
      return ValueType::Double;
    else if constexpr (std::is_same_v<U, std::string>)
      return ValueType::String;
    else if constexpr (std::is_same_v<U, ElementRef>)
      return ValueType::Element;
    else
      return ValueType::None;
  }

  template <class T>
  concept WireRepresentable = (ValueTypeOf<T>() != ValueType::None);

  // Encode an Any holding exactly the C++ type bound to `type`. No coercion.
  [[nodiscard]] UIAEXTEND_PATTERNS_API std::expected<WireValue, Error> Encode(const Any &value, ValueType type);

  // Decode a written wire slot whose tag equals `type`.
  [[nodiscard]] UIAEXTEND_PATTERNS_API std::expected<Any, Error> Decode(const WireValue &wire, ValueType type);

  template <class T>
  [[nodiscard]] std::expected<WireValue, Error> EncodeAs(const T &value)
  {
    if constexpr (!WireRepresentable<T>)
    {
      return std::unexpected(Error{ErrorCode::InvalidArgument, "type has no wire representation"});
    }
    else
    {
      return WireValue{static_cast<const std::remove_cvref_t<T> &>(value)};
    }
  }

  template <class T>
  [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> DecodeAs(const WireValue &wire)
  {
    using U = std::remove_cvref_t<T>;
    if constexpr (!WireRepresentable<U>)
    {
      return std::unexpected(Error{ErrorCode::InvalidArgument, "type has no wire representation"});
    }
    else
    {
      if (wire.Type() != ValueTypeOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "wire type mismatch"});
      const auto *p = wire.TryGet<U>();
      if (!p)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "wire slot holds no value"});
      return *p;
    }
  }

} // namespace UIAExtend::Patterns
