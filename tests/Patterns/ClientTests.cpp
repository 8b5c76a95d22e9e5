// ClientTests.cpp - consumer-side interception against a recording native instance

#include <catch2/catch_test_macros.hpp>

#include "TestPatterns.hpp"

#include <array>
#include <string>

using namespace PatternsTest;

namespace
{
  const UP::PatternDescriptor &SelectionDescriptor()
  {
    static const UP::PatternDescriptor desc = UP::BuildSchema<ISelectionProvider, ISelectionPattern>().value();
    return desc;
  }

  const UP::PatternDescriptor &ComputeDescriptor()
  {
    static const UP::PatternDescriptor desc = UP::BuildSchema<IComputeProvider, IComputePattern>().value();
    return desc;
  }

  const UP::PatternDescriptor &AllTypesDescriptor()
  {
    static const UP::PatternDescriptor desc = UP::BuildSchema<IAllTypesProvider, IAllTypesPattern>().value();
    return desc;
  }
} // namespace

TEST_CASE("CurrentAndCachedReadsAreDistinctNativeRequests", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.nextProperty = UP::WireValue{std::int32_t{17}};
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  auto current = client.Invoke<&ISelectionPattern::CurrentSelectionStart>();
  auto cached = client.Invoke<&ISelectionPattern::CachedSelectionStart>();
  REQUIRE(current.has_value());
  REQUIRE(cached.has_value());
  CHECK(*current == 17);
  CHECK(*cached == 17);

  REQUIRE(native.reads.size() == 2);
  CHECK(native.reads[0].index == 0u);
  CHECK_FALSE(native.reads[0].cached);
  CHECK(native.reads[0].type == UP::ValueType::Int);
  CHECK(native.reads[1].index == 0u);
  CHECK(native.reads[1].cached);
  CHECK(native.calls.empty());
}

TEST_CASE("PropertyIndexFollowsDeclarationOrder", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.nextProperty = UP::WireValue{std::string{"beta"}};
  UP::PatternClient<IAllTypesPattern> client{AllTypesDescriptor(), native};

  auto label = client.Invoke<&IAllTypesPattern::CachedLabel>();
  REQUIRE(label.has_value());
  CHECK(*label == "beta");
  REQUIRE(native.reads.size() == 1);
  CHECK(native.reads[0].index == 3u);
  CHECK(native.reads[0].cached);
  CHECK(native.reads[0].type == UP::ValueType::String);
}

TEST_CASE("VoidMethodSendsOnlyInSlots", "[patterns][Client]")
{
  RecordingPatternInstance native;
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  auto r = client.Invoke<&ISelectionPattern::SetSelectionStart>(5);
  REQUIRE(r.has_value());
  REQUIRE(native.calls.size() == 1);
  CHECK(native.calls[0].index == 0u);
  REQUIRE(native.calls[0].wire.size() == 1);
  CHECK(native.calls[0].wire[0] == UP::WireValue{std::int32_t{5}});
}

TEST_CASE("ArgumentsArePermutedIntoWireOrder", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.onCall = [](std::span<UP::WireValue> wire)
  {
    wire[2] = UP::WireValue{std::int32_t{99}};
    wire[3] = UP::WireValue{std::int32_t{-1}};
  };
  UP::PatternClient<IComputePattern> client{ComputeDescriptor(), native};

  int c = 0;
  // Consumer order is (b, a, c).
  auto r = client.Invoke<&IComputePattern::Compute>(1, 2, c);
  REQUIRE(r.has_value());
  CHECK(*r == -1);
  CHECK(c == 99);

  REQUIRE(native.calls.size() == 1);
  const auto &wire = native.calls[0].wire;
  REQUIRE(wire.size() == 4);
  CHECK(wire[0] == UP::WireValue{std::int32_t{2}}); // a
  CHECK(wire[1] == UP::WireValue{std::int32_t{1}}); // b
  CHECK(wire[2].Type() == UP::ValueType::Int);
  CHECK_FALSE(wire[2].HasValue());
  CHECK_FALSE(wire[3].HasValue());
}

TEST_CASE("DynamicInterceptUsesMemberNames", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.onCall = [](std::span<UP::WireValue> wire)
  {
    wire[2] = UP::WireValue{std::int32_t{12}};
    wire[3] = UP::WireValue{std::int32_t{4}};
  };
  UP::PatternClient<IComputePattern> client{ComputeDescriptor(), native};

  std::array<UP::Any, 3> args{UP::Any{std::int32_t{3}}, UP::Any{std::int32_t{7}}, UP::Any{std::int32_t{0}}};
  UP::Invocation call{"Compute", args};
  auto r = client.Intercept(call);
  REQUIRE(r.has_value());
  CHECK(call.returnValue.Cast<std::int32_t>() == 4);
  CHECK(args[2].Cast<std::int32_t>() == 12);
  CHECK(native.calls[0].wire[0] == UP::WireValue{std::int32_t{7}});
  CHECK(native.calls[0].wire[1] == UP::WireValue{std::int32_t{3}});
}

TEST_CASE("UnknownMembersAreNotSupported", "[patterns][Client]")
{
  RecordingPatternInstance native;
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  UP::Invocation call{"CurrentSelectionEnd"};
  auto r = client.Intercept(call);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::NotSupported);
  CHECK(native.reads.empty());
  CHECK(native.calls.empty());
}

TEST_CASE("NativeUnsupportedOperationSurfacesUnchanged", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.failWith = UP::Error{UP::ErrorCode::UnsupportedOperation, "method not implemented"};
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  auto r = client.Invoke<&ISelectionPattern::SetSelectionStart>(1);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::UnsupportedOperation);
  CHECK(r.error().message == "method not implemented");
}

TEST_CASE("WireTypeMismatchFromNativeIsAnError", "[patterns][Client]")
{
  RecordingPatternInstance native;
  native.nextProperty = UP::WireValue{2.5};
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  auto r = client.Invoke<&ISelectionPattern::CurrentSelectionStart>();
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::InvalidArgument);
  CHECK(r.error().member == "CurrentSelectionStart");
}

TEST_CASE("DynamicArgumentsMustHaveExactTypes", "[patterns][Client]")
{
  RecordingPatternInstance native;
  UP::PatternClient<ISelectionPattern> client{SelectionDescriptor(), native};

  std::array<UP::Any, 1> args{UP::Any{5.0}};
  UP::Invocation call{"SetSelectionStart", args};
  auto r = client.Intercept(call);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == UP::ErrorCode::InvalidArgument);
  CHECK(native.calls.empty());

  std::array<UP::Any, 2> tooMany{UP::Any{std::int32_t{1}}, UP::Any{std::int32_t{2}}};
  UP::Invocation extra{"SetSelectionStart", tooMany};
  CHECK_FALSE(client.Intercept(extra).has_value());
}
