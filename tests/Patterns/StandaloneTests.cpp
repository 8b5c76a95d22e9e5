// StandaloneTests.cpp - properties registered and read by their own identifier

#include <catch2/catch_test_macros.hpp>

#include "TestPatterns.hpp"

#include <vector>

using namespace PatternsTest;

namespace
{
  // Element-level source that serves standalone ids through the provider dispatcher.
  class DispatchingSource final : public UP::IStandalonePropertySource
  {
  public:
    DispatchingSource(const UP::PatternDispatcher &dispatcher, const UP::RegistrationRecord &record)
        : m_dispatcher(&dispatcher), m_record(&record)
    {
    }

    std::expected<UP::WireValue, UP::Error> GetPropertyValue(UP::PropertyId id, bool cached) override
    {
      requests.push_back(id);
      lastCached = cached;
      UP::WireValue out;
      auto r = UP::ServeStandalone(*m_dispatcher, *m_record, id, out);
      if (!r)
        return std::unexpected(std::move(r.error()));
      return out;
    }

    std::vector<UP::PropertyId> requests;
    bool lastCached{false};

  private:
    const UP::PatternDispatcher *m_dispatcher;
    const UP::RegistrationRecord *m_record;
  };

  class FixedSource final : public UP::IStandalonePropertySource
  {
  public:
    std::expected<UP::WireValue, UP::Error> GetPropertyValue(UP::PropertyId, bool) override { return value; }
    UP::WireValue value{};
  };
} // namespace

TEST_CASE("StandalonePropertyIsReadByItsIdentifier", "[patterns][Standalone]")
{
  UP::PatternRegistry registry;
  FakeRegistrar registrar;
  auto rec = registry.Register<IAllTypesProvider, IAllTypesPattern>(registrar);
  REQUIRE(rec.has_value());

  AllTypesProvider provider;
  provider.busy = true;
  auto dispatcher = UP::PatternDispatcher::Bind<IAllTypesProvider>(*(*rec)->descriptor, provider);
  REQUIRE(dispatcher.has_value());
  DispatchingSource source{*dispatcher, **rec};

  auto busy = UP::ReadStandalone<bool>(source, **rec, "IsBusy", true);
  REQUIRE(busy.has_value());
  CHECK(*busy);
  REQUIRE(source.requests.size() == 1);
  CHECK(source.requests[0] == (*rec)->StandalonePropertyIdOf("IsBusy").value());
  CHECK(source.lastCached);
}

TEST_CASE("UnknownStandaloneNamesAreNotFound", "[patterns][Standalone]")
{
  UP::PatternRegistry registry;
  FakeRegistrar registrar;
  auto rec = registry.Register<IAllTypesProvider, IAllTypesPattern>(registrar);
  REQUIRE(rec.has_value());

  FixedSource source;
  auto r = UP::ReadStandaloneValue(**rec, source, "Label", false);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::NotFound);
}

TEST_CASE("StandaloneValueMustCarryTheDeclaredType", "[patterns][Standalone]")
{
  UP::PatternRegistry registry;
  FakeRegistrar registrar;
  auto rec = registry.Register<IAllTypesProvider, IAllTypesPattern>(registrar);
  REQUIRE(rec.has_value());

  FixedSource source;
  source.value = UP::WireValue{std::int32_t{1}};
  auto r = UP::ReadStandalone<bool>(source, **rec, "IsBusy");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::InvalidArgument);
}

TEST_CASE("ProviderServesStandaloneByName", "[patterns][Standalone]")
{
  auto desc = UP::BuildSchema<IAllTypesProvider, IAllTypesPattern>();
  REQUIRE(desc.has_value());
  AllTypesProvider provider;
  UP::PatternDispatcher dispatcher{*desc, &static_cast<IAllTypesProvider &>(provider)};

  UP::WireValue out;
  REQUIRE(dispatcher.GetStandaloneProperty("IsBusy", out).has_value());
  CHECK(out == UP::WireValue{false});
  CHECK_FALSE(dispatcher.GetStandaloneProperty("Flag", out).has_value());
}
