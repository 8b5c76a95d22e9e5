#include <UIAExtend/Patterns/TypeMapper.hpp>

#include <string>

namespace UIAExtend::Patterns
{

  namespace
  {
    constexpr std::string_view kTypeMismatch = "value type does not match the wire type";

    template <class T>
    std::expected<WireValue, Error> EncodeExact(const Any &value)
    {
      if (value.GetTypeId() != detail::TypeIdOf<T>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, kTypeMismatch});
      return WireValue{value.Cast<T>()};
    }

    template <class T>
    std::expected<Any, Error> DecodeExact(const WireValue &wire)
    {
      auto v = DecodeAs<T>(wire);
      if (!v)
        return std::unexpected(std::move(v.error()));
      return Any{std::move(*v)};
    }
  } // namespace

  std::expected<WireValue, Error> Encode(const Any &value, ValueType type)
  {
    switch (type)
    {
    case ValueType::Bool:
      return EncodeExact<bool>(value);
    case ValueType::Int:
      return EncodeExact<std::int32_t>(value);
    case ValueType::Double:
      return EncodeExact<double>(value);
    case ValueType::String:
      return EncodeExact<std::string>(value);
    case ValueType::Element:
      return EncodeExact<ElementRef>(value);
    case ValueType::None:
      break;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "no wire representation for type None"});
  }

  std::expected<Any, Error> Decode(const WireValue &wire, ValueType type)
  {
    switch (type)
    {
    case ValueType::Bool:
      return DecodeExact<bool>(wire);
    case ValueType::Int:
      return DecodeExact<std::int32_t>(wire);
    case ValueType::Double:
      return DecodeExact<double>(wire);
    case ValueType::String:
      return DecodeExact<std::string>(wire);
    case ValueType::Element:
      return DecodeExact<ElementRef>(wire);
    case ValueType::None:
      break;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "no wire representation for type None"});
  }

} // namespace UIAExtend::Patterns
