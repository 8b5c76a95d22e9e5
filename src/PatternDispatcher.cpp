#include <UIAExtend/Patterns/PatternDispatcher.hpp>
#include <UIAExtend/Patterns/Registry.hpp>

namespace UIAExtend::Patterns
{

  namespace
  {
    constexpr std::string_view kNoProvider = "no provider bound";

    std::expected<void, Error> ReadInto(const PropertyDesc &p, void *provider, WireValue &out)
    {
      auto value = p.Get(provider);
      if (!value)
        return std::unexpected(std::move(value.error()));
      auto wire = Encode(*value, p.type);
      if (!wire)
        return std::unexpected(Error{wire.error().code, wire.error().message, p.name});
      out = std::move(*wire);
      return {};
    }
  } // namespace

  std::expected<void, Error> PatternDispatcher::GetProperty(NGIN::UInt32 index, WireValue &out) const
  {
    if (!m_provider)
      return std::unexpected(Error{ErrorCode::UnsupportedOperation, kNoProvider});
    if (index >= m_desc->properties.Size())
      return std::unexpected(Error{ErrorCode::NotFound, "property index out of range"});
    return ReadInto(m_desc->properties[index], m_provider, out);
  }

  std::expected<void, Error> PatternDispatcher::CallMethod(NGIN::UInt32 index, std::span<WireValue> parameters) const
  {
    if (!m_provider)
      return std::unexpected(Error{ErrorCode::UnsupportedOperation, kNoProvider});
    if (index >= m_desc->methods.Size())
      return std::unexpected(Error{ErrorCode::NotFound, "method index out of range"});

    const auto &m = m_desc->methods[index];
    if (parameters.size() != m.SlotCount())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "parameter buffer size mismatch", m.name});
    for (NGIN::UInt32 s = 0; s < m.inCount; ++s)
    {
      if (parameters[s].Type() != m.params[s].type || !parameters[s].HasValue())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "in-parameter has the wrong wire type", m.params[s].name});
    }
    return m.Invoke(m_provider, m, parameters);
  }

  std::expected<void, Error> PatternDispatcher::GetStandaloneProperty(std::string_view name, WireValue &out) const
  {
    if (!m_provider)
      return std::unexpected(Error{ErrorCode::UnsupportedOperation, kNoProvider});
    const auto *p = m_desc->FindStandaloneProperty(name);
    if (!p)
      return std::unexpected(Error{ErrorCode::NotFound, "standalone property not found", name});
    return ReadInto(*p, m_provider, out);
  }

  std::expected<void, Error> ServeStandalone(const PatternDispatcher &dispatcher, const RegistrationRecord &record,
                                             PropertyId id, WireValue &out)
  {
    const auto &desc = dispatcher.Descriptor();
    for (NGIN::UIntSize i = 0; i < record.standalonePropertyIds.Size() && i < desc.standaloneProperties.Size(); ++i)
    {
      if (record.standalonePropertyIds[i] == id)
        return dispatcher.GetStandaloneProperty(desc.standaloneProperties[i].name, out);
    }
    return std::unexpected(Error{ErrorCode::NotFound, "property id is not a standalone property of this pattern"});
  }

} // namespace UIAExtend::Patterns
