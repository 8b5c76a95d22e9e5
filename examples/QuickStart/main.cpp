#include <UIAExtend/Patterns/Patterns.hpp>

#include <iostream>
#include <string>

namespace Demo
{
  namespace UP = UIAExtend::Patterns;

  class ICaretProvider
  {
  public:
    virtual ~ICaretProvider() = default;
    virtual int GetCaretOffset() const = 0;
    virtual std::string GetLine() const = 0;
    virtual bool MoveCaret(int offset, int &clampedTo) = 0;

    friend void UiaDescribe(UP::Tag<ICaretProvider>, UP::ProviderBuilder<ICaretProvider> &b)
    {
      b.SetGuid("{3e6a1b52-7c0d-4f1e-9a7b-5d2c8e4f1a00}").SetName("CaretPattern");
      b.Property<&ICaretProvider::GetCaretOffset>("CaretOffset", "3e6a1b52-7c0d-4f1e-9a7b-5d2c8e4f1a01");
      b.Property<&ICaretProvider::GetLine>("Line", "3e6a1b52-7c0d-4f1e-9a7b-5d2c8e4f1a02");
      b.Method<&ICaretProvider::MoveCaret>("MoveCaret", {"offset", "clampedTo"});
    }
  };

  class ICaretPattern
  {
  public:
    virtual ~ICaretPattern() = default;
    virtual int CurrentCaretOffset() const = 0;
    virtual int CachedCaretOffset() const = 0;
    virtual std::string CurrentLine() const = 0;
    virtual std::string CachedLine() const = 0;
    virtual bool MoveCaret(int offset, int &clampedTo) = 0;

    friend void UiaDescribe(UP::Tag<ICaretPattern>, UP::ConsumerBuilder<ICaretPattern> &b)
    {
      b.Property<&ICaretPattern::CurrentCaretOffset>("CurrentCaretOffset");
      b.Property<&ICaretPattern::CachedCaretOffset>("CachedCaretOffset");
      b.Property<&ICaretPattern::CurrentLine>("CurrentLine");
      b.Property<&ICaretPattern::CachedLine>("CachedLine");
      b.Method<&ICaretPattern::MoveCaret>("MoveCaret", {"offset", "clampedTo"});
    }
  };

  class TextBox final : public ICaretProvider
  {
  public:
    int GetCaretOffset() const override { return caret; }
    std::string GetLine() const override { return text; }
    bool MoveCaret(int offset, int &clampedTo) override
    {
      const int size = static_cast<int>(text.size());
      clampedTo = offset < 0 ? 0 : (offset > size ? size : offset);
      caret = clampedTo;
      return clampedTo == offset;
    }

    std::string text{"hello, automation"};
    int caret{0};
  };
} // namespace Demo

int main()
{
  namespace UP = UIAExtend::Patterns;
  using Demo::ICaretPattern;
  using Demo::ICaretProvider;

  std::cout << "Library: " << UP::LibraryName() << "\n";

  auto handler = UP::DefaultRegistry().GetHandler<ICaretProvider, ICaretPattern>();
  if (!handler)
  {
    std::cout << "schema error: " << handler.error().message << "\n";
    for (NGIN::UIntSize i = 0; i < handler.error().diagnostics.Size(); ++i)
    {
      const auto &d = handler.error().diagnostics[i];
      std::cout << "  " << d.member << ": " << d.detail << "\n";
    }
    return 1;
  }

  const auto &desc = (*handler)->Descriptor();
  std::cout << "Pattern " << desc.programmaticName << " {" << UP::ToString(desc.guid) << "}\n";
  for (NGIN::UIntSize i = 0; i < desc.methods.Size(); ++i)
  {
    const auto &m = desc.methods[i];
    std::cout << "  method #" << m.index << " " << m.name << "(";
    for (NGIN::UIntSize s = 0; s < m.params.Size(); ++s)
      std::cout << (s ? ", " : "") << (m.params[s].direction == UP::ParamDirection::Out ? "out " : "")
                << UP::ToString(m.params[s].type) << " " << m.params[s].name;
    std::cout << ")\n";
  }

  Demo::TextBox box;
  UP::LoopbackPatternInstance native{desc, **handler, (*handler)->Target(box)};
  auto client = (*handler)->CreateClient(native);

  int clamped = 0;
  auto exact = client.Invoke<&ICaretPattern::MoveCaret>(42, clamped);
  if (!exact)
  {
    std::cout << "MoveCaret failed: " << exact.error().message << "\n";
    return 1;
  }
  std::cout << "MoveCaret(42) exact=" << std::boolalpha << *exact << " clampedTo=" << clamped << "\n";
  std::cout << "CurrentCaretOffset = " << client.Invoke<&ICaretPattern::CurrentCaretOffset>().value_or(-1) << "\n";
  std::cout << "CurrentLine = " << client.Invoke<&ICaretPattern::CurrentLine>().value_or("<error>") << "\n";
  return 0;
}
