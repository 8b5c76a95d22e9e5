// WireValue.hpp - Type-tagged native variant carried across the process boundary
#pragma once

#include <UIAExtend/Patterns/Types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace UIAExtend::Patterns
{

  class WireValue
  {
  public:
    using Storage = std::variant<std::monostate, bool, std::int32_t, double, std::string, ElementRef>;

    WireValue() = default;
    explicit WireValue(bool v) : m_type(ValueType::Bool), m_value(v) {}
    explicit WireValue(std::int32_t v) : m_type(ValueType::Int), m_value(v) {}
    explicit WireValue(double v) : m_type(ValueType::Double), m_value(v) {}
    explicit WireValue(std::string v) : m_type(ValueType::String), m_value(std::move(v)) {}
    explicit WireValue(std::string_view v) : m_type(ValueType::String), m_value(std::string{v}) {}
    explicit WireValue(const char *v) : WireValue(std::string_view{v}) {}
    explicit WireValue(ElementRef v) : m_type(ValueType::Element), m_value(v) {}

    // A typed slot that has not been written yet (out-parameters before the call returns).
    [[nodiscard]] static WireValue Pending(ValueType type) noexcept
    {
      WireValue w;
      w.m_type = type;
      return w;
    }

    [[nodiscard]] ValueType Type() const noexcept { return m_type; }
    [[nodiscard]] bool HasValue() const noexcept { return !std::holds_alternative<std::monostate>(m_value); }

    template <class T>
    [[nodiscard]] const T *TryGet() const noexcept
    {
      return std::get_if<T>(&m_value);
    }

    [[nodiscard]] const Storage &Raw() const noexcept { return m_value; }

    friend bool operator==(const WireValue &, const WireValue &) = default;

  private:
    ValueType m_type{ValueType::None};
    Storage m_value{};
  };

} // namespace UIAExtend::Patterns
