// DispatcherTests.cpp - provider-side dispatch of indexed native requests

#include <catch2/catch_test_macros.hpp>

#include "TestPatterns.hpp"

#include <string>

using namespace PatternsTest;

TEST_CASE("DispatcherReadsPropertiesByIndex", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<IAllTypesProvider, IAllTypesPattern>();
  REQUIRE(desc.has_value());
  AllTypesProvider provider;
  auto dispatcher = UP::PatternDispatcher::Bind<IAllTypesProvider>(*desc, provider);
  REQUIRE(dispatcher.has_value());

  UP::WireValue out;
  REQUIRE(dispatcher->GetProperty(1, out).has_value());
  CHECK(out == UP::WireValue{std::int32_t{-7}});
  REQUIRE(dispatcher->GetProperty(3, out).has_value());
  CHECK(out == UP::WireValue{std::string{"alpha"}});
  REQUIRE(dispatcher->GetProperty(4, out).has_value());
  CHECK(out == UP::WireValue{UP::ElementRef{42}});

  auto bad = dispatcher->GetProperty(5, out);
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == UP::ErrorCode::NotFound);
}

TEST_CASE("DispatcherDecodesInSlotsInProviderOrder", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<IComputeProvider, IComputePattern>();
  REQUIRE(desc.has_value());
  ComputeProvider provider;
  UP::PatternDispatcher dispatcher{*desc, &static_cast<IComputeProvider &>(provider)};

  UP::ParameterBuffer buffer{desc->methods[0]};
  REQUIRE(buffer.Size() == 4u);
  buffer[0] = UP::WireValue{std::int32_t{10}};
  buffer[1] = UP::WireValue{std::int32_t{4}};

  auto r = dispatcher.CallMethod(0, buffer.Span());
  REQUIRE(r.has_value());
  CHECK(provider.lastA == 10);
  CHECK(provider.lastB == 4);
  CHECK(buffer[2] == UP::WireValue{std::int32_t{40}});
  CHECK(buffer[3] == UP::WireValue{std::int32_t{6}});
}

TEST_CASE("DispatcherWritesStringOutAndReturnSlots", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<IAllTypesProvider, IAllTypesPattern>();
  REQUIRE(desc.has_value());
  AllTypesProvider provider;
  UP::PatternDispatcher dispatcher{*desc, &static_cast<IAllTypesProvider &>(provider)};

  const auto *m = desc->FindMethod("Summarize");
  REQUIRE(m != nullptr);
  UP::ParameterBuffer buffer{*m};
  buffer[0] = UP::WireValue{false};
  buffer[1] = UP::WireValue{0.5};
  buffer[2] = UP::WireValue{UP::ElementRef{9}};

  REQUIRE(dispatcher.CallMethod(m->index, buffer.Span()).has_value());
  CHECK(buffer[3] == UP::WireValue{std::string{"alpha:off"}});
  CHECK(buffer[4] == UP::WireValue{std::string{"50@9"}});
}

TEST_CASE("DispatcherRejectsBadBuffers", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<ISelectionProvider, ISelectionPattern>();
  REQUIRE(desc.has_value());
  SelectionProvider provider;
  UP::PatternDispatcher dispatcher{*desc, &static_cast<ISelectionProvider &>(provider)};

  std::vector<UP::WireValue> empty;
  auto size = dispatcher.CallMethod(0, empty);
  REQUIRE_FALSE(size.has_value());
  CHECK(size.error().code == UP::ErrorCode::InvalidArgument);

  std::vector<UP::WireValue> wrongType{UP::WireValue{std::string{"5"}}};
  auto type = dispatcher.CallMethod(0, wrongType);
  REQUIRE_FALSE(type.has_value());
  CHECK(type.error().code == UP::ErrorCode::InvalidArgument);

  std::vector<UP::WireValue> ok{UP::WireValue{std::int32_t{3}}};
  auto index = dispatcher.CallMethod(1, ok);
  REQUIRE_FALSE(index.has_value());
  CHECK(index.error().code == UP::ErrorCode::NotFound);
  CHECK(provider.setCalls == 0);

  REQUIRE(dispatcher.CallMethod(0, ok).has_value());
  CHECK(provider.start == 3);
}

TEST_CASE("DispatcherWithoutProviderIsUnsupported", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<ISelectionProvider, ISelectionPattern>();
  REQUIRE(desc.has_value());
  UP::PatternDispatcher dispatcher{*desc, nullptr};

  std::vector<UP::WireValue> wire{UP::WireValue{std::int32_t{3}}};
  auto r = dispatcher.CallMethod(0, wire);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::UnsupportedOperation);
}

TEST_CASE("BindChecksProviderType", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<ISelectionProvider, ISelectionPattern>();
  REQUIRE(desc.has_value());
  ComputeProvider wrong;
  auto r = UP::PatternDispatcher::Bind<IComputeProvider>(*desc, wrong);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::InvalidArgument);
}

TEST_CASE("HandlerDispatchesThroughOpaqueTarget", "[patterns][Dispatcher]")
{
  auto desc = UP::BuildSchema<ISelectionProvider, ISelectionPattern>();
  REQUIRE(desc.has_value());
  UP::PatternHandler<ISelectionProvider, ISelectionPattern> handler{*desc};
  SelectionProvider provider;
  provider.start = 8;
  void *target = decltype(handler)::Target(provider);

  UP::WireValue out;
  REQUIRE(handler.GetProperty(target, 0, out).has_value());
  CHECK(out == UP::WireValue{std::int32_t{8}});

  std::vector<UP::WireValue> wire{UP::WireValue{std::int32_t{11}}};
  REQUIRE(handler.Dispatch(target, 0, wire).has_value());
  CHECK(provider.start == 11);
}
