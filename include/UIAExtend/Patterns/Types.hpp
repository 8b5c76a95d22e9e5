// Types.hpp
// Public-facing error codes, semantic value types and small identifier types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

namespace UIAExtend::Patterns
{

  using Any = NGIN::Utilities::Any<>;
  using NameId = NGIN::UInt32;
  using PatternId = std::int32_t;
  using PropertyId = std::int32_t;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    // Descriptor construction failed; see Error::diagnostics.
    Schema = 3,
    // An invocation could not be mapped to any property or method of the pattern.
    NotSupported = 4,
    // The native side refused to dispatch a method.
    UnsupportedOperation = 5,
  };

  enum class DiagnosticCode : unsigned
  {
    None = 0,
    MissingIdentifier = 1,
    UnsupportedType = 2,
    MissingCounterpart = 3,
    ShapeMismatch = 4,
    DuplicateMember = 5,
    BadParameterNames = 6,
  };

  struct SchemaDiagnostic
  {
    DiagnosticCode code{DiagnosticCode::None};
    std::string_view member{};
    std::string_view detail{};
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    std::string_view member{};
    NGIN::Containers::Vector<SchemaDiagnostic> diagnostics{};

    constexpr Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, std::string_view who) : code(c), message(m), member(who) {}
    Error(ErrorCode c, std::string_view m, NGIN::Containers::Vector<SchemaDiagnostic> d)
        : code(c), message(m), diagnostics(std::move(d))
    {
    }
  };

  // The only types that ever cross the wire.
  enum class ValueType : NGIN::UInt8
  {
    None = 0,
    Bool = 1,
    Int = 2,
    Double = 3,
    String = 4,
    Element = 5,
  };

  [[nodiscard]] constexpr std::string_view ToString(ValueType type) noexcept
  {
    switch (type)
    {
    case ValueType::Bool:
      return "Bool";
    case ValueType::Int:
      return "Int";
    case ValueType::Double:
      return "Double";
    case ValueType::String:
      return "String";
    case ValueType::Element:
      return "Element";
    case ValueType::None:
      break;
    }
    return "None";
  }

  enum class ParamDirection : NGIN::UInt8
  {
    In = 0,
    Out = 1,
  };

  // Opaque element token owned by the native layer. Copied verbatim, never acquired or released here.
  struct ElementRef
  {
    NGIN::UInt64 token{0};
    constexpr bool IsValid() const noexcept { return token != 0; }
    friend constexpr bool operator==(const ElementRef &, const ElementRef &) = default;
  };

  // Name of the synthetic out-parameter that carries a method's return value.
  // Not a valid identifier, so it cannot collide with a declared parameter.
  inline constexpr std::string_view ReturnSlotName = "<>retVal";

  inline constexpr NGIN::UInt32 InvalidIndex = static_cast<NGIN::UInt32>(-1);

  // Forward decls of descriptor types
  struct PropertyDesc;
  struct MethodDesc;
  struct ConsumerMemberDesc;
  struct PatternDescriptor;
  struct RegistrationRecord;
  class PatternRegistry;

} // namespace UIAExtend::Patterns
