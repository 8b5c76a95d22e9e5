// PatternClient.hpp
// Consumer-side interceptor: turns typed consumer calls into indexed native calls
#pragma once

#include <NGIN/Primitives.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/SchemaBuilder.hpp>
#include <UIAExtend/Patterns/Native.hpp>

#include <array>
#include <expected>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace UIAExtend::Patterns
{

  // Dynamic call record: member name, boxed arguments in consumer order, boxed return value.
  // Out arguments are overwritten in place after the native call.
  struct Invocation
  {
    std::string_view member;
    std::span<Any> arguments{};
    Any returnValue{Any::MakeVoid()};
  };

  namespace detail
  {
    UIAEXTEND_PATTERNS_API std::expected<void, Error> InterceptMember(const PatternDescriptor &desc,
                                                                      const ConsumerMemberDesc &member,
                                                                      IPatternInstance &instance,
                                                                      std::span<Any> arguments, Any &returnValue);
  } // namespace detail

  class UIAEXTEND_PATTERNS_API PatternClientBase
  {
  public:
    PatternClientBase(const PatternDescriptor &desc, IPatternInstance &instance) noexcept
        : m_desc(&desc), m_instance(&instance)
    {
    }

    // Resolve by member name. Unknown names fail with NotSupported.
    std::expected<void, Error> Intercept(Invocation &invocation) const;

    [[nodiscard]] const PatternDescriptor &Descriptor() const noexcept { return *m_desc; }
    [[nodiscard]] IPatternInstance &Instance() const noexcept { return *m_instance; }

  protected:
    std::expected<void, Error> InterceptByKey(NGIN::UInt64 key, std::span<Any> arguments, Any &returnValue) const;

  private:
    const PatternDescriptor *m_desc;
    IPatternInstance *m_instance;
  };

  /// Typed client over a consumer interface. The instance is borrowed, never released.
  template <class C>
  class PatternClient : public PatternClientBase
  {
  public:
    using PatternClientBase::PatternClientBase;

    // Invoke<&IPattern::CurrentFoo>() or Invoke<&IPattern::DoThing>(a, b, outC).
    // Out-parameters must be lvalues; they receive the values written by the provider.
    template <auto Member, class... Args>
    auto Invoke(Args &&...args) const
        -> std::expected<std::remove_cvref_t<typename detail::ConsumerMemberTraits<decltype(Member)>::Ret>, Error>
    {
      using Traits = detail::ConsumerMemberTraits<decltype(Member)>;
      static_assert(std::is_same_v<typename Traits::Class, C>, "Member does not belong to this consumer interface");
      static_assert(sizeof...(Args) == Traits::Arity, "Argument count does not match the consumer member");
      return InvokeImpl<Member>(std::index_sequence_for<Args...>{}, std::forward<Args>(args)...);
    }

  private:
    template <auto Member, std::size_t... I, class... Args>
    auto InvokeImpl(std::index_sequence<I...>, Args &&...args) const
        -> std::expected<std::remove_cvref_t<typename detail::ConsumerMemberTraits<decltype(Member)>::Ret>, Error>
    {
      using Traits = detail::ConsumerMemberTraits<decltype(Member)>;
      using R = std::remove_cvref_t<typename Traits::Ret>;
      static_assert((... && (!Traits::template IsOut<I> || std::is_lvalue_reference_v<Args>)),
                    "Out-parameters must be passed as lvalues");

      std::array<Any, sizeof...(I)> boxed{Any{static_cast<typename Traits::template Value<I>>(args)}...};
      Any ret = Any::MakeVoid();
      auto r = InterceptByKey(detail::MemberKeyOf<Member>(), std::span<Any>{boxed.data(), boxed.size()}, ret);
      if (!r)
        return std::unexpected(std::move(r.error()));

      (WriteBack<Traits, I>(boxed[I], args), ...);
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return ret.template Cast<R>();
    }

    template <class Traits, std::size_t I, class A>
    static void WriteBack(Any &boxed, A &&arg)
    {
      if constexpr (Traits::template IsOut<I> && std::is_lvalue_reference_v<A &&> &&
                    !std::is_const_v<std::remove_reference_t<A>>)
        arg = boxed.template Cast<typename Traits::template Value<I>>();
    }
  };

} // namespace UIAExtend::Patterns
