// SchemaBuilder.hpp
// ProviderBuilder<P> / ConsumerBuilder<C> used inside the ADL describe hooks, and BuildSchema<P, C>()
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/TypeMapper.hpp>

#include <concepts>
#include <expected>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace UIAExtend::Patterns
{

  template <class T>
  struct Tag
  {
    using type = T;
  };

  template <class P>
  class ProviderBuilder;
  template <class C>
  class ConsumerBuilder;

  // Optional external customization point for interfaces you cannot modify.
  // Specialize in namespace UIAExtend::Patterns:
  //   template<> struct Describe<IFoo> { static void Do(ProviderBuilder<IFoo>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    struct SchemaDraft
    {
      PatternDescriptor &desc;
      NGIN::Containers::Vector<SchemaDiagnostic> diagnostics{};
      std::optional<Guid> consumerGuid{};

      void Report(DiagnosticCode code, std::string_view member, std::string_view detail)
      {
        diagnostics.PushBack(SchemaDiagnostic{code, member, detail});
      }
    };

    // Assigns indices, lays out wire slots and cross-references the consumer members.
    UIAEXTEND_PATTERNS_API std::expected<void, Error> FinalizeSchema(SchemaDraft &draft);

    inline std::string_view InternName(std::string_view s) noexcept { return NameFromId(InternNameId(s)); }

    // Named after the member pointer, so the key is a hash of "MemberKeyTag<&C::M>".
    // Equal in every binary that instantiates it, unlike an address.
    template <auto Member>
    struct MemberKeyTag
    {
    };

    template <auto Member>
    inline NGIN::UInt64 MemberKeyOf() noexcept
    {
      return TypeIdOf<MemberKeyTag<Member>>();
    }

    // Non-const lvalue references are out-parameters; everything else is passed in.
    template <class A>
    inline constexpr bool IsOutParam = std::is_lvalue_reference_v<A> && !std::is_const_v<std::remove_reference_t<A>>;

    template <class A>
    inline constexpr ParamDirection DirectionOf = IsOutParam<A> ? ParamDirection::Out : ParamDirection::In;

    template <class... A>
    inline void DescribeParams(NGIN::Containers::Vector<ParamDesc> &out, std::initializer_list<std::string_view> names)
    {
      auto it = names.begin();
      (out.PushBack(ParamDesc{InternName(*it++), DirectionOf<A>, ValueTypeOf<A>()}), ...);
    }

    template <class>
    struct GetterTraits;

    template <class C, class R>
    struct GetterTraits<R (C::*)() const>
    {
      using Class = C;
      using Ret = R;
      template <auto Getter>
      static std::expected<Any, Error> Get(void *obj)
      {
        const auto *c = static_cast<const C *>(obj);
        return Any{static_cast<std::remove_cvref_t<R>>((c->*Getter)())};
      }
    };

    template <class C, class R>
    struct GetterTraits<R (C::*)()>
    {
      using Class = C;
      using Ret = R;
      template <auto Getter>
      static std::expected<Any, Error> Get(void *obj)
      {
        auto *c = static_cast<C *>(obj);
        return Any{static_cast<std::remove_cvref_t<R>>((c->*Getter)())};
      }
    };

    // Decodes in-slots into locals, invokes, then encodes out-slots and the return slot.
    template <class R, class... A>
    struct MethodCall
    {
      using Params = std::tuple<A...>;
      using Locals = std::tuple<std::remove_cvref_t<A>...>;

      template <auto MemFn, class Obj>
      static std::expected<void, Error> Run(Obj *obj, const MethodDesc &m, std::span<WireValue> params)
      {
        return Run<MemFn>(obj, m, params, std::index_sequence_for<A...>{});
      }

    private:
      template <auto MemFn, class Obj, std::size_t... I>
      static std::expected<void, Error> Run(Obj *obj, const MethodDesc &m, std::span<WireValue> params,
                                            std::index_sequence<I...>)
      {
        Locals locals{};
        std::optional<Error> failure;
        (LoadIn<I>(locals, m, params, failure), ...);
        if (failure)
          return std::unexpected(std::move(*failure));

        if constexpr (std::is_void_v<R>)
        {
          (obj->*MemFn)(static_cast<A &&>(std::get<I>(locals))...);
        }
        else
        {
          auto result = (obj->*MemFn)(static_cast<A &&>(std::get<I>(locals))...);
          if (!m.returnSlot)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "method has no return slot", m.name});
          auto wire = EncodeAs<R>(result);
          if (!wire)
            return std::unexpected(std::move(wire.error()));
          params[*m.returnSlot] = std::move(*wire);
        }

        (StoreOut<I>(locals, m, params, failure), ...);
        if (failure)
          return std::unexpected(std::move(*failure));
        return {};
      }

      template <std::size_t I>
      static void LoadIn(Locals &locals, const MethodDesc &m, std::span<WireValue> params, std::optional<Error> &failure)
      {
        using Arg = std::tuple_element_t<I, Params>;
        if constexpr (!IsOutParam<Arg>)
        {
          if (failure)
            return;
          auto v = DecodeAs<Arg>(params[m.providerSlots[I]]);
          if (!v)
          {
            failure = Error{v.error().code, v.error().message, m.declared[I].name};
            return;
          }
          std::get<I>(locals) = std::move(*v);
        }
      }

      template <std::size_t I>
      static void StoreOut(Locals &locals, const MethodDesc &m, std::span<WireValue> params, std::optional<Error> &failure)
      {
        using Arg = std::tuple_element_t<I, Params>;
        if constexpr (IsOutParam<Arg>)
        {
          if (failure)
            return;
          auto w = EncodeAs<Arg>(std::get<I>(locals));
          if (!w)
          {
            failure = Error{w.error().code, w.error().message, m.declared[I].name};
            return;
          }
          params[m.providerSlots[I]] = std::move(*w);
        }
      }
    };

    template <class>
    struct ProviderMethodTraits;

    template <class C, class R, class... A>
    struct ProviderMethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      static void Params(NGIN::Containers::Vector<ParamDesc> &out, std::initializer_list<std::string_view> names)
      {
        DescribeParams<A...>(out, names);
      }
      template <auto MemFn>
      static std::expected<void, Error> Invoke(void *obj, const MethodDesc &m, std::span<WireValue> params)
      {
        return MethodCall<R, A...>::template Run<MemFn>(static_cast<C *>(obj), m, params);
      }
    };

    template <class C, class R, class... A>
    struct ProviderMethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      static void Params(NGIN::Containers::Vector<ParamDesc> &out, std::initializer_list<std::string_view> names)
      {
        DescribeParams<A...>(out, names);
      }
      template <auto MemFn>
      static std::expected<void, Error> Invoke(void *obj, const MethodDesc &m, std::span<WireValue> params)
      {
        return MethodCall<R, A...>::template Run<MemFn>(static_cast<const C *>(obj), m, params);
      }
    };

    template <class>
    struct ConsumerMemberTraits;

    template <class C, class R, class... A>
    struct ConsumerMemberTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      template <std::size_t I>
      using Arg = std::tuple_element_t<I, Args>;
      template <std::size_t I>
      using Value = std::remove_cvref_t<Arg<I>>;
      template <std::size_t I>
      static constexpr bool IsOut = IsOutParam<Arg<I>>;

      static void Params(NGIN::Containers::Vector<ParamDesc> &out, std::initializer_list<std::string_view> names)
      {
        DescribeParams<A...>(out, names);
      }
    };

    template <class C, class R, class... A>
    struct ConsumerMemberTraits<R (C::*)(A...) const> : ConsumerMemberTraits<R (C::*)(A...)>
    {
    };

    template <class T, class B>
    concept HasUiaDescribe = requires(B &b) {
      // ADL friend should be declared as: friend void UiaDescribe(Tag<T>, ProviderBuilder<T>&)
      { UiaDescribe(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class T, class B, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T, class B>
    struct HasDescribeImpl<T, B, std::void_t<decltype(Describe<T>::Do(std::declval<B &>()))>> : std::true_type
    {
    };

    template <class T, class B>
    concept IsDescribed = HasUiaDescribe<T, B> || HasDescribeImpl<T, B>::value;

    template <class T, class B>
    void RunDescribe(B &b)
    {
      if constexpr (HasUiaDescribe<T, B>)
        UiaDescribe(Tag<T>{}, b); // ADL - user describes the interface
      else
        Describe<T>::Do(b); // Trait fallback
    }
  } // namespace detail

  template <class P>
  class ProviderBuilder
  {
  public:
    // Note: constructed by BuildSchema when invoking the describe hook.
    explicit ProviderBuilder(detail::SchemaDraft &draft) : m_draft(&draft) {}

    ProviderBuilder &SetGuid(std::string_view guid)
    {
      auto g = Guid::Parse(guid);
      if (!g || g->IsNil())
        m_draft->Report(DiagnosticCode::MissingIdentifier, "<pattern>", "pattern GUID is missing or malformed");
      else
        m_draft->desc.guid = *g;
      return *this;
    }

    ProviderBuilder &SetName(std::string_view programmaticName)
    {
      m_draft->desc.programmaticName = detail::InternName(programmaticName);
      return *this;
    }

    // Read-only pattern property fetched through the indexed-property path.
    template <auto Getter>
    ProviderBuilder &Property(std::string_view name, std::string_view guid)
    {
      return AddProperty<Getter>(name, guid, false);
    }

    // Property registered on its own and fetched by its standalone identifier.
    template <auto Getter>
    ProviderBuilder &StandaloneProperty(std::string_view name, std::string_view guid)
    {
      return AddProperty<Getter>(name, guid, true);
    }

    // Parameter names are required; a non-void return becomes a synthetic out slot.
    template <auto MemFn>
    ProviderBuilder &Method(std::string_view name, std::initializer_list<std::string_view> paramNames = {});

  private:
    template <auto Getter>
    ProviderBuilder &AddProperty(std::string_view name, std::string_view guid, bool standalone);

    detail::SchemaDraft *m_draft;
  };

  template <class P>
  template <auto Getter>
  inline ProviderBuilder<P> &ProviderBuilder<P>::AddProperty(std::string_view name, std::string_view guid, bool standalone)
  {
    using Traits = detail::GetterTraits<decltype(Getter)>;
    static_assert(std::is_same_v<typename Traits::Class, P>, "Property getter must belong to the provider interface");
    static_assert(!std::is_void_v<typename Traits::Ret>, "Property getter must return a value");

    PropertyDesc p{};
    p.nameId = detail::InternNameId(name);
    p.name = detail::NameFromId(p.nameId);
    p.type = ValueTypeOf<typename Traits::Ret>();
    p.standalone = standalone;
    p.Get = &Traits::template Get<Getter>;
    if (p.type == ValueType::None)
      m_draft->Report(DiagnosticCode::UnsupportedType, p.name, "property type has no wire representation");
    if (auto g = Guid::Parse(guid); g && !g->IsNil())
      p.guid = *g;
    else
      m_draft->Report(DiagnosticCode::MissingIdentifier, p.name, "property GUID is missing or malformed");

    if (standalone)
      m_draft->desc.standaloneProperties.PushBack(std::move(p));
    else
      m_draft->desc.properties.PushBack(std::move(p));
    return *this;
  }

  template <class P>
  template <auto MemFn>
  inline ProviderBuilder<P> &ProviderBuilder<P>::Method(std::string_view name, std::initializer_list<std::string_view> paramNames)
  {
    using Traits = detail::ProviderMethodTraits<decltype(MemFn)>;
    static_assert(std::is_same_v<typename Traits::Class, P>, "Method must belong to the provider interface");

    MethodDesc m{};
    m.nameId = detail::InternNameId(name);
    m.name = detail::NameFromId(m.nameId);
    if (paramNames.size() != Traits::Arity)
    {
      m_draft->Report(DiagnosticCode::BadParameterNames, m.name, "parameter name count differs from the signature");
      return *this;
    }
    Traits::Params(m.declared, paramNames);
    for (NGIN::UIntSize i = 0; i < m.declared.Size(); ++i)
    {
      if (m.declared[i].type == ValueType::None)
        m_draft->Report(DiagnosticCode::UnsupportedType, m.declared[i].name, "parameter type has no wire representation");
    }
    if constexpr (!std::is_void_v<typename Traits::Ret>)
    {
      m.returnsValue = true;
      m.returnType = ValueTypeOf<typename Traits::Ret>();
      if (m.returnType == ValueType::None)
        m_draft->Report(DiagnosticCode::UnsupportedType, m.name, "return type has no wire representation");
    }
    m.Invoke = &Traits::template Invoke<MemFn>;
    m_draft->desc.methods.PushBack(std::move(m));
    return *this;
  }

  template <class C>
  class ConsumerBuilder
  {
  public:
    explicit ConsumerBuilder(detail::SchemaDraft &draft) : m_draft(&draft) {}

    // Optional; must equal the provider's GUID when given.
    ConsumerBuilder &SetGuid(std::string_view guid)
    {
      auto g = Guid::Parse(guid);
      if (!g || g->IsNil())
        m_draft->Report(DiagnosticCode::MissingIdentifier, "<pattern>", "consumer GUID is missing or malformed");
      else
        m_draft->consumerGuid = *g;
      return *this;
    }

    // Name must be Current<Property> or Cached<Property>.
    template <auto Getter>
    ConsumerBuilder &Property(std::string_view name)
    {
      using Traits = detail::ConsumerMemberTraits<decltype(Getter)>;
      static_assert(std::is_same_v<typename Traits::Class, C>, "Property getter must belong to the consumer interface");
      static_assert(Traits::Arity == 0, "Property getters take no arguments");
      static_assert(!std::is_void_v<typename Traits::Ret>, "Property getter must return a value");

      ConsumerMemberDesc e{};
      e.nameId = detail::InternNameId(name);
      e.name = detail::NameFromId(e.nameId);
      e.key = detail::MemberKeyOf<Getter>();
      if (e.name.starts_with("Current"))
        e.kind = ConsumerMemberKind::CurrentProperty;
      else if (e.name.starts_with("Cached"))
        e.kind = ConsumerMemberKind::CachedProperty;
      else
      {
        m_draft->Report(DiagnosticCode::ShapeMismatch, e.name, "consumer property must be named Current<Name> or Cached<Name>");
        return *this;
      }
      e.returnsValue = true;
      e.returnType = ValueTypeOf<typename Traits::Ret>();
      if (e.returnType == ValueType::None)
        m_draft->Report(DiagnosticCode::UnsupportedType, e.name, "property type has no wire representation");
      m_draft->desc.consumerMembers.PushBack(std::move(e));
      return *this;
    }

    template <auto MemFn>
    ConsumerBuilder &Method(std::string_view name, std::initializer_list<std::string_view> paramNames = {})
    {
      using Traits = detail::ConsumerMemberTraits<decltype(MemFn)>;
      static_assert(std::is_same_v<typename Traits::Class, C>, "Method must belong to the consumer interface");

      ConsumerMemberDesc e{};
      e.nameId = detail::InternNameId(name);
      e.name = detail::NameFromId(e.nameId);
      e.key = detail::MemberKeyOf<MemFn>();
      e.kind = ConsumerMemberKind::Method;
      if (paramNames.size() != Traits::Arity)
      {
        m_draft->Report(DiagnosticCode::BadParameterNames, e.name, "parameter name count differs from the signature");
        return *this;
      }
      Traits::Params(e.params, paramNames);
      for (NGIN::UIntSize i = 0; i < e.params.Size(); ++i)
      {
        if (e.params[i].type == ValueType::None)
          m_draft->Report(DiagnosticCode::UnsupportedType, e.params[i].name, "parameter type has no wire representation");
      }
      if constexpr (!std::is_void_v<typename Traits::Ret>)
      {
        e.returnsValue = true;
        e.returnType = ValueTypeOf<typename Traits::Ret>();
        if (e.returnType == ValueType::None)
          m_draft->Report(DiagnosticCode::UnsupportedType, e.name, "return type has no wire representation");
      }
      m_draft->desc.consumerMembers.PushBack(std::move(e));
      return *this;
    }

  private:
    detail::SchemaDraft *m_draft;
  };

  // Build the descriptor for a provider/consumer interface pair. Deterministic: the same pair
  // always yields the same indices, identifiers and parameter permutations.
  template <class P, class C>
  [[nodiscard]] std::expected<PatternDescriptor, Error> BuildSchema()
  {
    static_assert(detail::IsDescribed<P, ProviderBuilder<P>>,
                  "Provider interface needs a UiaDescribe(Tag<P>, ProviderBuilder<P>&) hook or a Describe<P> specialization");
    static_assert(detail::IsDescribed<C, ConsumerBuilder<C>>,
                  "Consumer interface needs a UiaDescribe(Tag<C>, ConsumerBuilder<C>&) hook or a Describe<C> specialization");

    PatternDescriptor desc{};
    desc.providerTypeId = detail::TypeIdOf<P>();
    desc.consumerTypeId = detail::TypeIdOf<C>();

    detail::SchemaDraft draft{desc};
    {
      ProviderBuilder<P> b{draft};
      detail::RunDescribe<P>(b);
    }
    {
      ConsumerBuilder<C> b{draft};
      detail::RunDescribe<C>(b);
    }
    auto done = detail::FinalizeSchema(draft);
    if (!done)
      return std::unexpected(std::move(done.error()));
    return desc;
  }

} // namespace UIAExtend::Patterns
