// TypeMapperTests.cpp - Encode/Decode between semantic values and wire values

#include <catch2/catch_test_macros.hpp>

#include <UIAExtend/Patterns/TypeMapper.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace
{
  using namespace UIAExtend::Patterns;

  template <class T>
  T RoundTrip(const T &v)
  {
    auto wire = Encode(Any{v}, ValueTypeOf<T>());
    REQUIRE(wire.has_value());
    CHECK(wire->Type() == ValueTypeOf<T>());
    auto back = Decode(*wire, ValueTypeOf<T>());
    REQUIRE(back.has_value());
    return back->template Cast<T>();
  }
} // namespace

TEST_CASE("ValueTypeOfMapsTheFiveWireTypes", "[patterns][TypeMapper]")
{
  STATIC_REQUIRE(ValueTypeOf<bool>() == ValueType::Bool);
  STATIC_REQUIRE(ValueTypeOf<std::int32_t>() == ValueType::Int);
  STATIC_REQUIRE(ValueTypeOf<const double &>() == ValueType::Double);
  STATIC_REQUIRE(ValueTypeOf<std::string &>() == ValueType::String);
  STATIC_REQUIRE(ValueTypeOf<ElementRef>() == ValueType::Element);
  STATIC_REQUIRE(ValueTypeOf<float>() == ValueType::None);
  STATIC_REQUIRE(ValueTypeOf<std::int64_t>() == ValueType::None);
  STATIC_REQUIRE_FALSE(WireRepresentable<const char *>);
}

TEST_CASE("EncodeDecodePreservesValues", "[patterns][TypeMapper]")
{
  CHECK(RoundTrip(false) == false);
  CHECK(RoundTrip(true) == true);
  CHECK(RoundTrip(std::int32_t{0}) == 0);
  CHECK(RoundTrip(std::int32_t{-12345}) == -12345);
  CHECK(RoundTrip(std::numeric_limits<std::int32_t>::min()) == std::numeric_limits<std::int32_t>::min());
  CHECK(RoundTrip(std::numeric_limits<std::int32_t>::max()) == std::numeric_limits<std::int32_t>::max());
  CHECK(RoundTrip(-0.5) == -0.5);
  CHECK(RoundTrip(std::string{}).empty());
  const std::string longText(4096, 'x');
  CHECK(RoundTrip(longText) == longText);
  CHECK(RoundTrip(std::string{"\xC3\xA9t\xC3\xA9"}) == "\xC3\xA9t\xC3\xA9");
  CHECK(RoundTrip(ElementRef{0xDEADBEEFull}) == ElementRef{0xDEADBEEFull});
}

TEST_CASE("EncodeRejectsMismatchedValueType", "[patterns][TypeMapper]")
{
  auto r = Encode(Any{1.5}, ValueType::Int);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);

  // No implicit widening or narrowing.
  CHECK_FALSE(Encode(Any{std::int32_t{1}}, ValueType::Double).has_value());
  CHECK_FALSE(Encode(Any{true}, ValueType::Int).has_value());
  CHECK_FALSE(Encode(Any{std::int32_t{1}}, ValueType::None).has_value());
}

TEST_CASE("DecodeRejectsMismatchedWireTag", "[patterns][TypeMapper]")
{
  auto r = Decode(WireValue{std::int32_t{3}}, ValueType::String);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);

  auto pending = Decode(WireValue::Pending(ValueType::Int), ValueType::Int);
  REQUIRE_FALSE(pending.has_value());
  CHECK(pending.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("TypedHelpersMatchDynamicMapping", "[patterns][TypeMapper]")
{
  auto w = EncodeAs<std::string>(std::string{"label"});
  REQUIRE(w.has_value());
  CHECK(w->Type() == ValueType::String);
  auto s = DecodeAs<const std::string &>(*w);
  REQUIRE(s.has_value());
  CHECK(*s == "label");

  CHECK_FALSE(DecodeAs<double>(*w).has_value());
}
