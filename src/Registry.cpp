#include <UIAExtend/Patterns/Registry.hpp>

namespace UIAExtend::Patterns
{

  std::optional<PropertyId> RegistrationRecord::PropertyIdOf(std::string_view name) const
  {
    if (!descriptor)
      return std::nullopt;
    const auto *p = descriptor->FindProperty(name);
    if (!p || p->index >= propertyIds.Size())
      return std::nullopt;
    return propertyIds[p->index];
  }

  std::optional<PropertyId> RegistrationRecord::StandalonePropertyIdOf(std::string_view name) const
  {
    if (!descriptor)
      return std::nullopt;
    const auto *p = descriptor->FindStandaloneProperty(name);
    if (!p || p->index >= standalonePropertyIds.Size())
      return std::nullopt;
    return standalonePropertyIds[p->index];
  }

  PatternRegistry::~PatternRegistry() = default;

  std::optional<std::expected<const PatternDescriptor *, Error>>
  PatternRegistry::FindDescriptorLocked(NGIN::UInt64 providerTypeId, NGIN::UInt64 consumerTypeId) const
  {
    for (const auto &e : m_descriptors)
    {
      if (e.providerTypeId != providerTypeId || e.consumerTypeId != consumerTypeId)
        continue;
      using Result = std::expected<const PatternDescriptor *, Error>;
      if (e.error)
        return Result{std::unexpected(*e.error)};
      return Result{e.descriptor.get()};
    }
    return std::nullopt;
  }

  std::expected<const PatternDescriptor *, Error> PatternRegistry::GetOrBuildDescriptor(NGIN::UInt64 providerTypeId,
                                                                                       NGIN::UInt64 consumerTypeId,
                                                                                       BuildFn build)
  {
    {
      std::lock_guard lock{m_mutex};
      if (auto hit = FindDescriptorLocked(providerTypeId, consumerTypeId))
        return std::move(*hit);
    }

    // Describe hooks run unlocked and may use the registry themselves.
    auto built = build();

    std::lock_guard lock{m_mutex};
    // Another thread may have finished first; its result wins.
    if (auto hit = FindDescriptorLocked(providerTypeId, consumerTypeId))
      return std::move(*hit);

    DescriptorEntry entry{};
    entry.providerTypeId = providerTypeId;
    entry.consumerTypeId = consumerTypeId;
    if (built)
      entry.descriptor = std::make_unique<PatternDescriptor>(std::move(*built));
    else
      entry.error = std::move(built.error());
    m_descriptors.push_back(std::move(entry));

    auto &stored = m_descriptors.back();
    if (stored.error)
      return std::unexpected(*stored.error);
    return stored.descriptor.get();
  }

  IPatternHandler *PatternRegistry::AttachHandler(const PatternDescriptor &desc, HandlerFactory make)
  {
    std::lock_guard lock{m_mutex};
    for (auto &e : m_descriptors)
    {
      if (e.descriptor.get() != &desc)
        continue;
      if (!e.handler)
        e.handler = make(desc);
      return e.handler.get();
    }
    return nullptr;
  }

  std::expected<const RegistrationRecord *, Error> PatternRegistry::RegisterOnce(const PatternDescriptor &desc,
                                                                                IPatternRegistrar &registrar,
                                                                                IPatternHandler &handler)
  {
    if (desc.guid.IsNil())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "descriptor has no pattern GUID", desc.programmaticName});

    std::lock_guard serial{m_registerMutex};
    if (const auto *rec = Find(desc.guid))
      return rec;

    PendingRegistration *pending = nullptr;
    for (auto &p : m_pending)
    {
      if (p->guid == desc.guid)
        pending = p.get();
    }
    if (!pending)
    {
      auto fresh = std::make_unique<PendingRegistration>();
      fresh->guid = desc.guid;
      pending = fresh.get();
      m_pending.push_back(std::move(fresh));
    }
    if (pending->inProgress)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "pattern registration is already in progress",
                                   desc.programmaticName});

    pending->inProgress = true;
    auto done = CompleteRegistration(*pending, desc, registrar, handler);
    pending->inProgress = false;
    if (!done)
      return std::unexpected(std::move(done.error()));
    return Publish(*pending);
  }

  std::expected<void, Error> PatternRegistry::CompleteRegistration(PendingRegistration &pending,
                                                                   const PatternDescriptor &desc,
                                                                   IPatternRegistrar &registrar,
                                                                   IPatternHandler &handler)
  {
    auto &rec = pending.record;
    if (!pending.patternRegistered)
    {
      auto reg = registrar.RegisterPattern(desc, handler);
      if (!reg)
        return std::unexpected(std::move(reg.error()));
      rec.guid = desc.guid;
      rec.programmaticName = desc.programmaticName;
      rec.patternId = reg->patternId;
      rec.availabilityPropertyId = reg->availabilityPropertyId;
      rec.propertyIds = std::move(reg->propertyIds);
      rec.descriptor = &desc;
      pending.patternRegistered = true;
    }

    if (rec.propertyIds.Size() != desc.properties.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "registrar returned the wrong number of property ids",
                                   desc.programmaticName});

    // Ids already obtained are kept; only the remaining standalone properties are registered.
    while (rec.standalonePropertyIds.Size() < desc.standaloneProperties.Size())
    {
      auto id = registrar.RegisterProperty(desc.standaloneProperties[rec.standalonePropertyIds.Size()]);
      if (!id)
        return std::unexpected(std::move(id.error()));
      rec.standalonePropertyIds.PushBack(*id);
    }
    return {};
  }

  const RegistrationRecord *PatternRegistry::Publish(PendingRegistration &pending)
  {
    auto rec = std::make_unique<RegistrationRecord>(std::move(pending.record));
    const auto *out = rec.get();
    {
      std::lock_guard lock{m_mutex};
      m_recordByGuid.Insert(out->guid, static_cast<NGIN::UInt32>(m_records.size()));
      m_records.push_back(std::move(rec));
    }
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it)
    {
      if (it->get() == &pending)
      {
        m_pending.erase(it);
        break;
      }
    }
    return out;
  }

  const RegistrationRecord *PatternRegistry::Find(const Guid &guid) const
  {
    std::lock_guard lock{m_mutex};
    const auto slot = m_recordByGuid.Find(guid);
    if (!slot)
      return nullptr;
    return m_records[*slot].get();
  }

  NGIN::UIntSize PatternRegistry::RecordCount() const
  {
    std::lock_guard lock{m_mutex};
    return m_records.size();
  }

  NGIN::UIntSize PatternRegistry::DescriptorCount() const
  {
    std::lock_guard lock{m_mutex};
    return m_descriptors.size();
  }

  bool PatternRegistry::IsModuleInitialized(NGIN::UInt64 moduleId) const
  {
    std::lock_guard lock{m_mutex};
    return m_initializedModules.GetPtr(moduleId) != nullptr;
  }

  void PatternRegistry::MarkModuleInitialized(NGIN::UInt64 moduleId)
  {
    std::lock_guard lock{m_mutex};
    if (!m_initializedModules.GetPtr(moduleId))
      m_initializedModules.Insert(moduleId, NGIN::UInt8{1});
  }

  PatternRegistry &DefaultRegistry() noexcept
  {
    static PatternRegistry registry{};
    return registry;
  }

} // namespace UIAExtend::Patterns
