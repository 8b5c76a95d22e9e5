// Schema.hpp
// Immutable pattern descriptors shared by the consumer interceptor and the provider dispatcher
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Guid.hpp>
#include <UIAExtend/Patterns/WireValue.hpp>

#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace UIAExtend::Patterns
{

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Process-wide name table. Views returned by NameFromId stay valid for the process lifetime.
    UIAEXTEND_PATTERNS_API NameId InternNameId(std::string_view s) noexcept;
    UIAEXTEND_PATTERNS_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    UIAEXTEND_PATTERNS_API std::string_view NameFromId(NameId id) noexcept;

    inline constexpr NameId InvalidNameId = static_cast<NameId>(-1);

    using PropertyGetFn = std::expected<Any, Error> (*)(void *provider);
    using MethodInvokeFn = std::expected<void, Error> (*)(void *provider, const MethodDesc &method,
                                                           std::span<WireValue> parameters);
  } // namespace detail

  struct ParamDesc
  {
    std::string_view name;
    ParamDirection direction{ParamDirection::In};
    ValueType type{ValueType::None};
  };

  struct PropertyDesc
  {
    std::string_view name;
    NameId nameId{detail::InvalidNameId};
    ValueType type{ValueType::None};
    Guid guid{};
    // Ordinal within the pattern (or within the standalone list when `standalone` is set).
    NGIN::UInt32 index{InvalidIndex};
    bool standalone{false};
    detail::PropertyGetFn Get{nullptr};
  };

  struct MethodDesc
  {
    std::string_view name;
    NameId nameId{detail::InvalidNameId};
    NGIN::UInt32 index{InvalidIndex};
    // Parameters as declared by the provider, return value excluded.
    NGIN::Containers::Vector<ParamDesc> declared;
    // Wire order: every in-parameter, then every out-parameter, then the return slot.
    NGIN::Containers::Vector<ParamDesc> params;
    NGIN::UInt32 inCount{0};
    NGIN::UInt32 outCount{0};
    // providerSlots[i] is the wire slot of declared parameter i.
    NGIN::Containers::Vector<NGIN::UInt32> providerSlots;
    std::optional<NGIN::UInt32> returnSlot{};
    bool returnsValue{false};
    ValueType returnType{ValueType::None};
    detail::MethodInvokeFn Invoke{nullptr};

    [[nodiscard]] NGIN::UInt32 SlotCount() const noexcept { return inCount + outCount; }
  };

  enum class ConsumerMemberKind : NGIN::UInt8
  {
    CurrentProperty = 0,
    CachedProperty = 1,
    Method = 2,
  };

  struct ConsumerMemberDesc
  {
    std::string_view name;
    NameId nameId{detail::InvalidNameId};
    ConsumerMemberKind kind{ConsumerMemberKind::Method};
    // Identity of the consumer member function; see detail::MemberKeyOf.
    NGIN::UInt64 key{0};
    // Property index or method index in the descriptor.
    NGIN::UInt32 target{InvalidIndex};
    // Consumer declaration order.
    NGIN::Containers::Vector<ParamDesc> params;
    bool returnsValue{false};
    ValueType returnType{ValueType::None};
    // wireToArg[slot] is the consumer argument bound to a wire slot; InvalidIndex for the return slot.
    NGIN::Containers::Vector<NGIN::UInt32> wireToArg;
  };

  struct PatternDescriptor
  {
    Guid guid{};
    std::string_view programmaticName;
    NGIN::UInt64 providerTypeId{0};
    NGIN::UInt64 consumerTypeId{0};

    NGIN::Containers::Vector<PropertyDesc> properties;
    NGIN::Containers::Vector<MethodDesc> methods;
    NGIN::Containers::Vector<PropertyDesc> standaloneProperties;
    NGIN::Containers::Vector<ConsumerMemberDesc> consumerMembers;

    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> methodIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> standaloneIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> consumerByName;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> consumerByKey;

    [[nodiscard]] UIAEXTEND_PATTERNS_API const PropertyDesc *FindProperty(std::string_view name) const;
    [[nodiscard]] UIAEXTEND_PATTERNS_API const MethodDesc *FindMethod(std::string_view name) const;
    [[nodiscard]] UIAEXTEND_PATTERNS_API const PropertyDesc *FindStandaloneProperty(std::string_view name) const;
    [[nodiscard]] UIAEXTEND_PATTERNS_API const ConsumerMemberDesc *FindConsumerMember(std::string_view name) const;
    [[nodiscard]] UIAEXTEND_PATTERNS_API const ConsumerMemberDesc *FindConsumerMember(NGIN::UInt64 key) const;
  };

  // Wire buffer for one method call, sized and typed from the method descriptor.
  class UIAEXTEND_PATTERNS_API ParameterBuffer
  {
  public:
    explicit ParameterBuffer(const MethodDesc &method);

    [[nodiscard]] NGIN::UInt32 InCount() const noexcept { return m_inCount; }
    [[nodiscard]] NGIN::UInt32 OutCount() const noexcept { return m_outCount; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_slots.size(); }

    WireValue &operator[](NGIN::UIntSize i) { return m_slots[i]; }
    const WireValue &operator[](NGIN::UIntSize i) const { return m_slots[i]; }

    [[nodiscard]] std::span<WireValue> Span() noexcept { return {m_slots.data(), m_slots.size()}; }

  private:
    std::vector<WireValue> m_slots;
    NGIN::UInt32 m_inCount{0};
    NGIN::UInt32 m_outCount{0};
  };

} // namespace UIAExtend::Patterns
