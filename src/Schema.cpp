#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/SchemaBuilder.hpp>

#include <mutex>
#include <string>

namespace UIAExtend::Patterns::detail
{

  namespace
  {
    struct NameTable
    {
      std::mutex mutex;
      StringInterner names;
    };

    NameTable &Names() noexcept
    {
      static NameTable table{};
      return table;
    }
  } // namespace

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &t = Names();
    std::lock_guard lock{t.mutex};
    const auto id = t.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &t = Names();
    std::lock_guard lock{t.mutex};
    StringInterner::IdType id{};
    if (!t.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    if (id == InvalidNameId)
      return {};
    auto &t = Names();
    std::lock_guard lock{t.mutex};
    return t.names.View(static_cast<StringInterner::IdType>(id));
  }

  namespace
  {
    constexpr std::string_view kPatternMember = "<pattern>";

    bool HasDiagnostic(const SchemaDraft &draft, DiagnosticCode code, std::string_view member)
    {
      for (NGIN::UIntSize i = 0; i < draft.diagnostics.Size(); ++i)
      {
        if (draft.diagnostics[i].code == code && draft.diagnostics[i].member == member)
          return true;
      }
      return false;
    }

    template <class Map>
    const NGIN::UInt32 *LookupByName(const Map &map, std::string_view name)
    {
      NameId id{};
      if (!FindNameId(name, id))
        return nullptr;
      return map.GetPtr(id);
    }

    void IndexProperties(SchemaDraft &draft, NGIN::Containers::Vector<PropertyDesc> &list,
                         NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> &index,
                         const NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> &other)
    {
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        auto &p = list[i];
        p.index = static_cast<NGIN::UInt32>(i);
        if (index.GetPtr(p.nameId) || other.GetPtr(p.nameId))
        {
          draft.Report(DiagnosticCode::DuplicateMember, p.name, "property declared more than once");
          continue;
        }
        index.Insert(p.nameId, p.index);
      }
    }

    // In-parameters first, then out-parameters, then the synthetic return slot.
    void LayoutMethod(SchemaDraft &draft, MethodDesc &m)
    {
      NGIN::Containers::Vector<ParamDesc> wire;
      NGIN::Containers::Vector<NGIN::UInt32> slots;
      NGIN::UInt32 inCount = 0;
      NGIN::UInt32 outCount = 0;

      for (NGIN::UIntSize i = 0; i < m.declared.Size(); ++i)
      {
        const auto &p = m.declared[i];
        if (p.name == ReturnSlotName || p.name.empty())
          draft.Report(DiagnosticCode::BadParameterNames, m.name, "parameter uses a reserved or empty name");
        for (NGIN::UIntSize j = 0; j < i; ++j)
        {
          if (m.declared[j].name == p.name)
            draft.Report(DiagnosticCode::BadParameterNames, m.name, "parameter name used more than once");
        }
        if (p.direction == ParamDirection::In)
          ++inCount;
      }

      NGIN::UInt32 nextIn = 0;
      NGIN::UInt32 nextOut = inCount;
      for (NGIN::UIntSize i = 0; i < m.declared.Size(); ++i)
        slots.PushBack(m.declared[i].direction == ParamDirection::In ? nextIn++ : nextOut++);

      for (NGIN::UIntSize i = 0; i < m.declared.Size(); ++i)
      {
        if (m.declared[i].direction == ParamDirection::In)
          wire.PushBack(m.declared[i]);
      }
      for (NGIN::UIntSize i = 0; i < m.declared.Size(); ++i)
      {
        if (m.declared[i].direction == ParamDirection::Out)
        {
          wire.PushBack(m.declared[i]);
          ++outCount;
        }
      }

      m.returnSlot.reset();
      if (m.returnsValue)
      {
        m.returnSlot = inCount + outCount;
        wire.PushBack(ParamDesc{ReturnSlotName, ParamDirection::Out, m.returnType});
        ++outCount;
      }

      m.params = std::move(wire);
      m.providerSlots = std::move(slots);
      m.inCount = inCount;
      m.outCount = outCount;
    }

    void MatchProperty(SchemaDraft &draft, ConsumerMemberDesc &e)
    {
      const auto &desc = draft.desc;
      const auto prefix = e.kind == ConsumerMemberKind::CurrentProperty ? std::string_view{"Current"}
                                                                         : std::string_view{"Cached"};
      const auto base = e.name.substr(prefix.size());
      const auto *idx = LookupByName(desc.propertyIndex, base);
      if (!idx)
      {
        draft.Report(DiagnosticCode::MissingCounterpart, e.name, "consumer property has no provider property");
        return;
      }
      if (desc.properties[*idx].type != e.returnType)
        draft.Report(DiagnosticCode::ShapeMismatch, e.name, "property type differs from the provider");
      e.target = *idx;
    }

    void MatchMethod(SchemaDraft &draft, ConsumerMemberDesc &e)
    {
      const auto &desc = draft.desc;
      const auto *idx = desc.methodIndex.GetPtr(e.nameId);
      if (!idx)
      {
        draft.Report(DiagnosticCode::MissingCounterpart, e.name, "consumer method has no provider method");
        return;
      }
      const auto &m = desc.methods[*idx];
      e.target = *idx;

      bool ok = true;
      if (e.returnsValue != m.returnsValue || e.returnType != m.returnType)
      {
        draft.Report(DiagnosticCode::ShapeMismatch, e.name, "return type differs from the provider");
        ok = false;
      }
      if (e.params.Size() != m.declared.Size())
      {
        draft.Report(DiagnosticCode::ShapeMismatch, e.name, "parameter count differs from the provider");
        return;
      }

      NGIN::Containers::Vector<NGIN::UInt32> wireToArg;
      for (NGIN::UInt32 s = 0; s < m.SlotCount(); ++s)
        wireToArg.PushBack(InvalidIndex);

      for (NGIN::UIntSize j = 0; j < e.params.Size(); ++j)
      {
        const auto &cp = e.params[j];
        for (NGIN::UIntSize k = 0; k < j; ++k)
        {
          if (e.params[k].name == cp.name)
          {
            draft.Report(DiagnosticCode::BadParameterNames, e.name, "parameter name used more than once");
            ok = false;
          }
        }

        NGIN::UIntSize found = m.declared.Size();
        for (NGIN::UIntSize k = 0; k < m.declared.Size(); ++k)
        {
          if (m.declared[k].name == cp.name)
          {
            found = k;
            break;
          }
        }
        if (found == m.declared.Size())
        {
          draft.Report(DiagnosticCode::ShapeMismatch, e.name, "parameter names differ from the provider");
          ok = false;
          continue;
        }
        const auto &pp = m.declared[found];
        if (pp.direction != cp.direction || pp.type != cp.type)
        {
          draft.Report(DiagnosticCode::ShapeMismatch, e.name, "parameter direction or type differs from the provider");
          ok = false;
          continue;
        }
        wireToArg[m.providerSlots[found]] = static_cast<NGIN::UInt32>(j);
      }
      if (ok)
        e.wireToArg = std::move(wireToArg);
    }

    bool HasConsumer(const PatternDescriptor &desc, std::string_view name, bool method)
    {
      const auto *idx = LookupByName(desc.consumerByName, name);
      if (!idx)
        return false;
      return (desc.consumerMembers[*idx].kind == ConsumerMemberKind::Method) == method;
    }
  } // namespace

  std::expected<void, Error> FinalizeSchema(SchemaDraft &draft)
  {
    auto &desc = draft.desc;

    if (desc.guid.IsNil() && !HasDiagnostic(draft, DiagnosticCode::MissingIdentifier, kPatternMember))
      draft.Report(DiagnosticCode::MissingIdentifier, kPatternMember, "pattern GUID is missing");
    if (desc.programmaticName.empty())
      draft.Report(DiagnosticCode::MissingIdentifier, kPatternMember, "pattern programmatic name is missing");
    if (draft.consumerGuid && !desc.guid.IsNil() && *draft.consumerGuid != desc.guid)
      draft.Report(DiagnosticCode::ShapeMismatch, kPatternMember, "consumer GUID differs from the provider GUID");

    IndexProperties(draft, desc.properties, desc.propertyIndex, desc.standaloneIndex);
    IndexProperties(draft, desc.standaloneProperties, desc.standaloneIndex, desc.propertyIndex);

    for (NGIN::UIntSize i = 0; i < desc.methods.Size(); ++i)
    {
      auto &m = desc.methods[i];
      m.index = static_cast<NGIN::UInt32>(i);
      if (desc.methodIndex.GetPtr(m.nameId) || desc.propertyIndex.GetPtr(m.nameId))
        draft.Report(DiagnosticCode::DuplicateMember, m.name, "method declared more than once");
      else
        desc.methodIndex.Insert(m.nameId, m.index);
      LayoutMethod(draft, m);
    }

    for (NGIN::UIntSize i = 0; i < desc.consumerMembers.Size(); ++i)
    {
      auto &e = desc.consumerMembers[i];
      if (desc.consumerByName.GetPtr(e.nameId))
      {
        draft.Report(DiagnosticCode::DuplicateMember, e.name, "consumer member declared more than once");
        continue;
      }
      desc.consumerByName.Insert(e.nameId, static_cast<NGIN::UInt32>(i));
      if (desc.consumerByKey.GetPtr(e.key))
        draft.Report(DiagnosticCode::DuplicateMember, e.name, "member function described under more than one name");
      else
        desc.consumerByKey.Insert(e.key, static_cast<NGIN::UInt32>(i));

      if (e.kind == ConsumerMemberKind::Method)
        MatchMethod(draft, e);
      else
        MatchProperty(draft, e);
    }

    for (NGIN::UIntSize i = 0; i < desc.properties.Size(); ++i)
    {
      const auto &p = desc.properties[i];
      const std::string name{p.name};
      if (!HasConsumer(desc, "Current" + name, false))
        draft.Report(DiagnosticCode::MissingCounterpart, p.name, "consumer lacks the Current property accessor");
      if (!HasConsumer(desc, "Cached" + name, false))
        draft.Report(DiagnosticCode::MissingCounterpart, p.name, "consumer lacks the Cached property accessor");
    }
    for (NGIN::UIntSize i = 0; i < desc.methods.Size(); ++i)
    {
      const auto &m = desc.methods[i];
      if (!HasConsumer(desc, m.name, true))
        draft.Report(DiagnosticCode::MissingCounterpart, m.name, "consumer lacks the method");
    }

    if (draft.diagnostics.Size() != 0)
      return std::unexpected(Error{ErrorCode::Schema, "schema validation failed", std::move(draft.diagnostics)});
    return {};
  }

} // namespace UIAExtend::Patterns::detail

namespace UIAExtend::Patterns
{

  namespace
  {
    template <class Map>
    const NGIN::UInt32 *FindIndex(const Map &map, std::string_view name)
    {
      NameId id{};
      if (!detail::FindNameId(name, id))
        return nullptr;
      return map.GetPtr(id);
    }
  } // namespace

  const PropertyDesc *PatternDescriptor::FindProperty(std::string_view name) const
  {
    const auto *i = FindIndex(propertyIndex, name);
    return i ? &properties[*i] : nullptr;
  }

  const MethodDesc *PatternDescriptor::FindMethod(std::string_view name) const
  {
    const auto *i = FindIndex(methodIndex, name);
    return i ? &methods[*i] : nullptr;
  }

  const PropertyDesc *PatternDescriptor::FindStandaloneProperty(std::string_view name) const
  {
    const auto *i = FindIndex(standaloneIndex, name);
    return i ? &standaloneProperties[*i] : nullptr;
  }

  const ConsumerMemberDesc *PatternDescriptor::FindConsumerMember(std::string_view name) const
  {
    const auto *i = FindIndex(consumerByName, name);
    return i ? &consumerMembers[*i] : nullptr;
  }

  const ConsumerMemberDesc *PatternDescriptor::FindConsumerMember(NGIN::UInt64 key) const
  {
    const auto *i = consumerByKey.GetPtr(key);
    return i ? &consumerMembers[*i] : nullptr;
  }

  ParameterBuffer::ParameterBuffer(const MethodDesc &method)
      : m_inCount(method.inCount), m_outCount(method.outCount)
  {
    m_slots.reserve(method.params.Size());
    for (NGIN::UIntSize i = 0; i < method.params.Size(); ++i)
      m_slots.push_back(WireValue::Pending(method.params[i].type));
  }

} // namespace UIAExtend::Patterns
