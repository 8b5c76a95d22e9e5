#include <UIAExtend/Patterns/Loopback.hpp>

namespace UIAExtend::Patterns
{

  std::expected<void, Error> LoopbackPatternInstance::UpdateCache()
  {
    std::vector<WireValue> snapshot;
    snapshot.reserve(m_desc->properties.Size());
    for (NGIN::UIntSize i = 0; i < m_desc->properties.Size(); ++i)
    {
      WireValue v;
      auto r = m_handler->GetProperty(m_target, static_cast<NGIN::UInt32>(i), v);
      if (!r)
        return std::unexpected(std::move(r.error()));
      snapshot.push_back(std::move(v));
    }
    m_cache = std::move(snapshot);
    return {};
  }

  std::expected<void, Error> LoopbackPatternInstance::GetProperty(NGIN::UInt32 index, bool cached, ValueType type,
                                                                  WireValue &out)
  {
    if (index >= m_desc->properties.Size())
      return std::unexpected(Error{ErrorCode::NotFound, "property index out of range"});
    if (m_desc->properties[index].type != type)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "requested type differs from the property type",
                                   m_desc->properties[index].name});

    if (!cached)
      return m_handler->GetProperty(m_target, index, out);

    if (index >= m_cache.size())
      return std::unexpected(Error{ErrorCode::NotFound, "no cached value; call UpdateCache first",
                                   m_desc->properties[index].name});
    out = m_cache[index];
    return {};
  }

  std::expected<void, Error> LoopbackPatternInstance::CallMethod(NGIN::UInt32 index, std::span<WireValue> parameters)
  {
    // Marshal into a separate buffer the way a cross-process call would.
    std::vector<WireValue> remote(parameters.begin(), parameters.end());
    auto r = m_handler->Dispatch(m_target, index, std::span<WireValue>{remote.data(), remote.size()});
    if (!r)
      return std::unexpected(std::move(r.error()));
    if (index < m_desc->methods.Size())
    {
      const auto in = m_desc->methods[index].inCount;
      for (std::size_t s = in; s < parameters.size(); ++s)
        parameters[s] = std::move(remote[s]);
    }
    return {};
  }

} // namespace UIAExtend::Patterns
