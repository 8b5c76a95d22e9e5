// Registry.hpp
// Registration info registry: lazily built descriptors, owned handlers and one record per pattern
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Guid.hpp>
#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/SchemaBuilder.hpp>
#include <UIAExtend/Patterns/Native.hpp>
#include <UIAExtend/Patterns/PatternHandler.hpp>

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace UIAExtend::Patterns
{

  // Numeric identifiers assigned by the native subsystem. Immutable once created.
  // The descriptor it was registered from must outlive the record.
  struct RegistrationRecord
  {
    Guid guid{};
    std::string_view programmaticName;
    PatternId patternId{0};
    PropertyId availabilityPropertyId{0};
    // In property index order.
    NGIN::Containers::Vector<PropertyId> propertyIds{};
    // In standalone property order.
    NGIN::Containers::Vector<PropertyId> standalonePropertyIds{};
    const PatternDescriptor *descriptor{nullptr};

    [[nodiscard]] UIAEXTEND_PATTERNS_API std::optional<PropertyId> PropertyIdOf(std::string_view name) const;
    [[nodiscard]] UIAEXTEND_PATTERNS_API std::optional<PropertyId> StandalonePropertyIdOf(std::string_view name) const;
  };

  namespace detail
  {
    // GUID -> slot. Buckets are keyed by hash; entries in a bucket are told apart by the full GUID.
    class GuidIndex
    {
    public:
      using HashFn = NGIN::UInt64 (*)(const Guid &) noexcept;

      GuidIndex() = default;
      explicit GuidIndex(HashFn hash) noexcept : m_hash(hash) {}

      [[nodiscard]] std::optional<NGIN::UInt32> Find(const Guid &guid) const
      {
        const auto *bucket = m_buckets.GetPtr(m_hash(guid));
        if (!bucket)
          return std::nullopt;
        for (NGIN::UIntSize i = 0; i < bucket->Size(); ++i)
        {
          if ((*bucket)[i].guid == guid)
            return (*bucket)[i].slot;
        }
        return std::nullopt;
      }

      // False if the GUID is already present.
      bool Insert(const Guid &guid, NGIN::UInt32 slot)
      {
        if (Find(guid))
          return false;
        const auto key = m_hash(guid);
        if (auto *bucket = m_buckets.GetPtr(key))
        {
          bucket->PushBack(Entry{guid, slot});
          return true;
        }
        NGIN::Containers::Vector<Entry> v;
        v.PushBack(Entry{guid, slot});
        m_buckets.Insert(key, std::move(v));
        return true;
      }

    private:
      struct Entry
      {
        Guid guid{};
        NGIN::UInt32 slot{0};
      };

      static NGIN::UInt64 HashOf(const Guid &guid) noexcept { return guid.Hash(); }

      HashFn m_hash{&HashOf};
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::Containers::Vector<Entry>> m_buckets;
    };
  } // namespace detail

  class UIAEXTEND_PATTERNS_API PatternRegistry
  {
  public:
    using BuildFn = std::expected<PatternDescriptor, Error> (*)();
    using HandlerFactory = std::unique_ptr<IPatternHandler> (*)(const PatternDescriptor &);

    PatternRegistry() = default;
    PatternRegistry(const PatternRegistry &) = delete;
    PatternRegistry &operator=(const PatternRegistry &) = delete;
    ~PatternRegistry();

    // Builds on first use; the descriptor (or the schema error) is kept for the registry's lifetime.
    template <class IProvider, class IPattern>
    std::expected<const PatternDescriptor *, Error> GetDescriptor()
    {
      return GetOrBuildDescriptor(detail::TypeIdOf<IProvider>(), detail::TypeIdOf<IPattern>(),
                                  &BuildSchema<IProvider, IPattern>);
    }

    template <class IProvider, class IPattern>
    std::expected<PatternHandler<IProvider, IPattern> *, Error> GetHandler()
    {
      auto desc = GetDescriptor<IProvider, IPattern>();
      if (!desc)
        return std::unexpected(std::move(desc.error()));
      auto *h = AttachHandler(**desc, [](const PatternDescriptor &d) -> std::unique_ptr<IPatternHandler>
                              { return std::make_unique<PatternHandler<IProvider, IPattern>>(d); });
      return static_cast<PatternHandler<IProvider, IPattern> *>(h);
    }

    // Describe, build and register the pair in one step.
    template <class IProvider, class IPattern>
    std::expected<const RegistrationRecord *, Error> Register(IPatternRegistrar &registrar)
    {
      auto handler = GetHandler<IProvider, IPattern>();
      if (!handler)
        return std::unexpected(std::move(handler.error()));
      return RegisterOnce((*handler)->Descriptor(), registrar, **handler);
    }

    // Idempotent per pattern GUID: RegisterPattern is called at most once per GUID once it has
    // succeeded. Errors propagate and leave no record; a later call resumes with the steps that are
    // still missing. The registrar is called without the registry lock held, so it may query the
    // registry. Registering the same GUID again from inside its own registrar call fails.
    std::expected<const RegistrationRecord *, Error> RegisterOnce(const PatternDescriptor &desc,
                                                                 IPatternRegistrar &registrar,
                                                                 IPatternHandler &handler);

    [[nodiscard]] const RegistrationRecord *Find(const Guid &guid) const;
    [[nodiscard]] NGIN::UIntSize RecordCount() const;
    [[nodiscard]] NGIN::UIntSize DescriptorCount() const;

    [[nodiscard]] bool IsModuleInitialized(NGIN::UInt64 moduleId) const;
    void MarkModuleInitialized(NGIN::UInt64 moduleId);

  private:
    struct DescriptorEntry
    {
      NGIN::UInt64 providerTypeId{0};
      NGIN::UInt64 consumerTypeId{0};
      std::unique_ptr<PatternDescriptor> descriptor;
      std::optional<Error> error;
      std::unique_ptr<IPatternHandler> handler;
    };

    // A registration whose native pattern call may already have succeeded.
    struct PendingRegistration
    {
      Guid guid{};
      bool inProgress{false};
      bool patternRegistered{false};
      RegistrationRecord record{};
    };

    std::expected<const PatternDescriptor *, Error> GetOrBuildDescriptor(NGIN::UInt64 providerTypeId,
                                                                         NGIN::UInt64 consumerTypeId, BuildFn build);
    std::optional<std::expected<const PatternDescriptor *, Error>> FindDescriptorLocked(NGIN::UInt64 providerTypeId,
                                                                                       NGIN::UInt64 consumerTypeId) const;
    IPatternHandler *AttachHandler(const PatternDescriptor &desc, HandlerFactory make);
    std::expected<void, Error> CompleteRegistration(PendingRegistration &pending, const PatternDescriptor &desc,
                                                    IPatternRegistrar &registrar, IPatternHandler &handler);
    const RegistrationRecord *Publish(PendingRegistration &pending);

    // Guards the tables below; never held while describe hooks or the registrar run.
    mutable std::mutex m_mutex;
    // Serialises RegisterOnce; recursive so a registrar may register other patterns.
    std::recursive_mutex m_registerMutex;
    std::vector<DescriptorEntry> m_descriptors;
    std::vector<std::unique_ptr<RegistrationRecord>> m_records;
    detail::GuidIndex m_recordByGuid;
    // Guarded by m_registerMutex.
    std::vector<std::unique_ptr<PendingRegistration>> m_pending;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt8> m_initializedModules;
  };

  // Process-wide registry.
  UIAEXTEND_PATTERNS_API PatternRegistry &DefaultRegistry() noexcept;

} // namespace UIAExtend::Patterns
