#include <UIAExtend/Patterns/Standalone.hpp>

namespace UIAExtend::Patterns
{

  std::expected<WireValue, Error> ReadStandaloneValue(const RegistrationRecord &record,
                                                      IStandalonePropertySource &source, std::string_view name,
                                                      bool cached)
  {
    if (!record.descriptor)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "registration record has no descriptor", name});
    const auto *p = record.descriptor->FindStandaloneProperty(name);
    if (!p)
      return std::unexpected(Error{ErrorCode::NotFound, "standalone property not found", name});
    const auto id = record.StandalonePropertyIdOf(name);
    if (!id)
      return std::unexpected(Error{ErrorCode::NotFound, "standalone property is not registered", p->name});

    auto value = source.GetPropertyValue(*id, cached);
    if (!value)
      return std::unexpected(std::move(value.error()));
    if (value->Type() != p->type || !value->HasValue())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "standalone value has the wrong wire type", p->name});
    return value;
  }

} // namespace UIAExtend::Patterns
