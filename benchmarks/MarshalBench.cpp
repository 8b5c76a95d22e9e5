#include <iostream>
#include <string>

#include <NGIN/Benchmark.hpp>
#include <UIAExtend/Patterns/Patterns.hpp>

using namespace NGIN;

namespace BenchDemo
{
  namespace UP = UIAExtend::Patterns;

  class IRangeProvider
  {
  public:
    virtual ~IRangeProvider() = default;
    virtual int GetValue() const = 0;
    virtual int Clamp(int low, int high, int &width) = 0;

    friend void UiaDescribe(UP::Tag<IRangeProvider>, UP::ProviderBuilder<IRangeProvider> &b)
    {
      b.SetGuid("b3e70000-0000-4000-8000-00000000be01").SetName("RangePattern");
      b.Property<&IRangeProvider::GetValue>("Value", "b3e70000-0000-4000-8000-00000000be02");
      b.Method<&IRangeProvider::Clamp>("Clamp", {"low", "high", "width"});
    }
  };

  class IRangePattern
  {
  public:
    virtual ~IRangePattern() = default;
    virtual int CurrentValue() const = 0;
    virtual int CachedValue() const = 0;
    virtual int Clamp(int high, int low, int &width) = 0;

    friend void UiaDescribe(UP::Tag<IRangePattern>, UP::ConsumerBuilder<IRangePattern> &b)
    {
      b.Property<&IRangePattern::CurrentValue>("CurrentValue");
      b.Property<&IRangePattern::CachedValue>("CachedValue");
      b.Method<&IRangePattern::Clamp>("Clamp", {"high", "low", "width"});
    }
  };

  class Range final : public IRangeProvider
  {
  public:
    int GetValue() const override { return value; }
    int Clamp(int low, int high, int &width) override
    {
      width = high - low;
      value = value < low ? low : (value > high ? high : value);
      return value;
    }
    int value{50};
  };
} // namespace BenchDemo

int main()
{
  namespace UP = UIAExtend::Patterns;
  using BenchDemo::IRangePattern;
  using BenchDemo::IRangeProvider;

  auto handler = UP::DefaultRegistry().GetHandler<IRangeProvider, IRangePattern>().value();
  BenchDemo::Range range;
  UP::LoopbackPatternInstance native{handler->Descriptor(), *handler, handler->Target(range)};
  auto client = handler->CreateClient(native);

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += client.Invoke<&IRangePattern::CurrentValue>().value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Client CurrentValue 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += range.GetValue();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct GetValue 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      int width = 0;
      sum += client.Invoke<&IRangePattern::Clamp>(100, 0, width).value() + width;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Client Clamp(high, low, out width) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      int width = 0;
      sum += range.Clamp(0, 100, width) + width;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct Clamp 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      auto desc = UP::BuildSchema<IRangeProvider, IRangePattern>();
      sum += static_cast<int>(desc->methods.Size());
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "BuildSchema 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
