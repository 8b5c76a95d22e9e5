#include <UIAExtend/Patterns/PatternClient.hpp>
#include <UIAExtend/Patterns/TypeMapper.hpp>

namespace UIAExtend::Patterns
{

  namespace detail
  {
    namespace
    {
      std::expected<void, Error> ReadProperty(const PatternDescriptor &desc, const ConsumerMemberDesc &member,
                                              IPatternInstance &instance, std::span<Any> arguments, Any &returnValue)
      {
        if (!arguments.empty())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "property accessors take no arguments", member.name});
        if (member.target >= desc.properties.Size())
          return std::unexpected(Error{ErrorCode::NotSupported, "property is not mapped", member.name});

        const auto &p = desc.properties[member.target];
        const bool cached = member.kind == ConsumerMemberKind::CachedProperty;
        WireValue out = WireValue::Pending(p.type);
        auto r = instance.GetProperty(p.index, cached, p.type, out);
        if (!r)
          return std::unexpected(std::move(r.error()));

        auto v = Decode(out, p.type);
        if (!v)
          return std::unexpected(Error{v.error().code, v.error().message, member.name});
        returnValue = std::move(*v);
        return {};
      }

      std::expected<void, Error> CallMethod(const PatternDescriptor &desc, const ConsumerMemberDesc &member,
                                            IPatternInstance &instance, std::span<Any> arguments, Any &returnValue)
      {
        if (member.target >= desc.methods.Size())
          return std::unexpected(Error{ErrorCode::NotSupported, "method is not mapped", member.name});
        const auto &m = desc.methods[member.target];
        if (arguments.size() != member.params.Size())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "argument count mismatch", member.name});

        ParameterBuffer buffer{m};
        for (NGIN::UInt32 s = 0; s < m.inCount; ++s)
        {
          const auto arg = member.wireToArg[s];
          auto w = Encode(arguments[arg], m.params[s].type);
          if (!w)
            return std::unexpected(Error{w.error().code, w.error().message, m.params[s].name});
          buffer[s] = std::move(*w);
        }

        auto r = instance.CallMethod(m.index, buffer.Span());
        if (!r)
          return std::unexpected(std::move(r.error()));

        for (NGIN::UInt32 s = m.inCount; s < m.SlotCount(); ++s)
        {
          auto v = Decode(buffer[s], m.params[s].type);
          if (!v)
            return std::unexpected(Error{v.error().code, v.error().message, m.params[s].name});
          if (m.returnSlot && *m.returnSlot == s)
            returnValue = std::move(*v);
          else
            arguments[member.wireToArg[s]] = std::move(*v);
        }
        return {};
      }
    } // namespace

    std::expected<void, Error> InterceptMember(const PatternDescriptor &desc, const ConsumerMemberDesc &member,
                                               IPatternInstance &instance, std::span<Any> arguments, Any &returnValue)
    {
      if (member.kind == ConsumerMemberKind::Method)
        return CallMethod(desc, member, instance, arguments, returnValue);
      return ReadProperty(desc, member, instance, arguments, returnValue);
    }
  } // namespace detail

  std::expected<void, Error> PatternClientBase::Intercept(Invocation &invocation) const
  {
    const auto *member = m_desc->FindConsumerMember(invocation.member);
    if (!member)
      return std::unexpected(Error{ErrorCode::NotSupported, "member is not part of the pattern", invocation.member});
    return detail::InterceptMember(*m_desc, *member, *m_instance, invocation.arguments, invocation.returnValue);
  }

  std::expected<void, Error> PatternClientBase::InterceptByKey(NGIN::UInt64 key, std::span<Any> arguments,
                                                               Any &returnValue) const
  {
    const auto *member = m_desc->FindConsumerMember(key);
    if (!member)
      return std::unexpected(Error{ErrorCode::NotSupported, "member is not part of the pattern"});
    return detail::InterceptMember(*m_desc, *member, *m_instance, arguments, returnValue);
  }

} // namespace UIAExtend::Patterns
