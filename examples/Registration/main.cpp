#include <UIAExtend/Patterns/Patterns.hpp>

#include <iostream>

// Registers a pattern with a stand-in for the native subsystem and reads a standalone property.

namespace Demo
{
  namespace UP = UIAExtend::Patterns;

  class IBusyProvider
  {
  public:
    virtual ~IBusyProvider() = default;
    virtual int GetProgress() const = 0;
    virtual bool GetIsBusy() const = 0;
    virtual void Cancel() = 0;

    friend void UiaDescribe(UP::Tag<IBusyProvider>, UP::ProviderBuilder<IBusyProvider> &b)
    {
      b.SetGuid("8d1f3c20-55aa-4b0e-b7f1-0c9e2d4a6b30").SetName("BusyPattern");
      b.Property<&IBusyProvider::GetProgress>("Progress", "8d1f3c20-55aa-4b0e-b7f1-0c9e2d4a6b31");
      b.StandaloneProperty<&IBusyProvider::GetIsBusy>("IsBusy", "8d1f3c20-55aa-4b0e-b7f1-0c9e2d4a6b32");
      b.Method<&IBusyProvider::Cancel>("Cancel");
    }
  };

  class IBusyPattern
  {
  public:
    virtual ~IBusyPattern() = default;
    virtual int CurrentProgress() const = 0;
    virtual int CachedProgress() const = 0;
    virtual void Cancel() = 0;

    friend void UiaDescribe(UP::Tag<IBusyPattern>, UP::ConsumerBuilder<IBusyPattern> &b)
    {
      b.Property<&IBusyPattern::CurrentProgress>("CurrentProgress");
      b.Property<&IBusyPattern::CachedProgress>("CachedProgress");
      b.Method<&IBusyPattern::Cancel>("Cancel");
    }
  };

  class Job final : public IBusyProvider
  {
  public:
    int GetProgress() const override { return progress; }
    bool GetIsBusy() const override { return busy; }
    void Cancel() override { busy = false; }

    int progress{64};
    bool busy{true};
  };

  // Prints each request and hands out sequential identifiers.
  class ConsoleRegistrar final : public UP::IPatternRegistrar
  {
  public:
    std::expected<UP::PatternRegistration, UP::Error> RegisterPattern(const UP::PatternDescriptor &desc,
                                                                      UP::IPatternHandler &) override
    {
      std::cout << "RegisterPattern " << desc.programmaticName << " {" << UP::ToString(desc.guid) << "}\n";
      UP::PatternRegistration r{};
      r.patternId = m_next++;
      r.availabilityPropertyId = m_next++;
      for (NGIN::UIntSize i = 0; i < desc.properties.Size(); ++i)
        r.propertyIds.PushBack(m_next++);
      return r;
    }

    std::expected<UP::PropertyId, UP::Error> RegisterProperty(const UP::PropertyDesc &p) override
    {
      std::cout << "RegisterProperty " << p.name << " {" << UP::ToString(p.guid) << "}\n";
      return m_next++;
    }

  private:
    int m_next{20000};
  };

  // Element-level property source backed by the provider-side dispatcher.
  class ElementSource final : public UP::IStandalonePropertySource
  {
  public:
    ElementSource(const UP::PatternDispatcher &d, const UP::RegistrationRecord &r) : m_dispatcher(&d), m_record(&r) {}

    std::expected<UP::WireValue, UP::Error> GetPropertyValue(UP::PropertyId id, bool) override
    {
      UP::WireValue out;
      auto r = UP::ServeStandalone(*m_dispatcher, *m_record, id, out);
      if (!r)
        return std::unexpected(std::move(r.error()));
      return out;
    }

  private:
    const UP::PatternDispatcher *m_dispatcher;
    const UP::RegistrationRecord *m_record;
  };
} // namespace Demo

int main()
{
  namespace UP = UIAExtend::Patterns;
  using Demo::IBusyPattern;
  using Demo::IBusyProvider;

  Demo::ConsoleRegistrar registrar;
  const bool ok = UP::EnsurePatternsRegistered(registrar, "Demo.Registration", [](UP::ModuleRegistration &m)
                                               { m.RegisterPattern<IBusyProvider, IBusyPattern>(); });
  // Second call is a no-op.
  UP::EnsurePatternsRegistered(registrar, "Demo.Registration", [](UP::ModuleRegistration &m)
                               { m.RegisterPattern<IBusyProvider, IBusyPattern>(); });
  if (!ok)
  {
    std::cout << "registration failed\n";
    return 1;
  }

  auto desc = UP::DefaultRegistry().GetDescriptor<IBusyProvider, IBusyPattern>();
  if (!desc)
    return 1;
  const auto *record = UP::DefaultRegistry().Find((*desc)->guid);
  if (!record)
    return 1;
  std::cout << "patternId=" << record->patternId << " availability=" << record->availabilityPropertyId
            << " Progress=" << record->PropertyIdOf("Progress").value_or(0)
            << " IsBusy=" << record->StandalonePropertyIdOf("IsBusy").value_or(0) << "\n";

  Demo::Job job;
  auto dispatcher = UP::PatternDispatcher::Bind<IBusyProvider>(**desc, job);
  if (!dispatcher)
    return 1;
  Demo::ElementSource source{*dispatcher, *record};
  std::cout << "IsBusy = " << std::boolalpha << UP::ReadStandalone<bool>(source, *record, "IsBusy").value_or(false)
            << "\n";
  return 0;
}
