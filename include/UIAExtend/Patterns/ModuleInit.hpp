#pragma once

#include <string_view>
#include <type_traits>
#include <utility>

#include <UIAExtend/Patterns/Registry.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace UIAExtend::Patterns
{

  /**
   * Helper used by module authors to register their patterns explicitly.
   * Records the first registration error so the caller can report it.
   */
  class ModuleRegistration
  {
  public:
    ModuleRegistration(std::string_view moduleName, PatternRegistry &registry, IPatternRegistrar &registrar) noexcept
        : m_moduleName(moduleName),
          m_moduleId(NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size())),
          m_registry(&registry),
          m_registrar(&registrar)
    {
    }

    [[nodiscard]] std::string_view ModuleName() const noexcept { return m_moduleName; }
    [[nodiscard]] NGIN::UInt64 GetModuleId() const noexcept { return m_moduleId; }

    /** Register one provider/consumer pair. */
    template <class IProvider, class IPattern>
    std::expected<const RegistrationRecord *, Error> RegisterPattern()
    {
      auto r = m_registry->Register<IProvider, IPattern>(*m_registrar);
      if (!r && !m_firstError)
        m_firstError = r.error();
      return r;
    }

    [[nodiscard]] PatternRegistry &Registry() const noexcept { return *m_registry; }
    [[nodiscard]] bool Failed() const noexcept { return m_firstError.has_value(); }
    [[nodiscard]] const std::optional<Error> &FirstError() const noexcept { return m_firstError; }

  private:
    std::string_view m_moduleName;
    NGIN::UInt64 m_moduleId{0};
    PatternRegistry *m_registry;
    IPatternRegistrar *m_registrar;
    std::optional<Error> m_firstError{};
  };

  /**
   * Runs `fn` once per module and registry, and only marks the module as initialized
   * when every registration made through the helper succeeded. If `fn` returns a `bool`,
   * that value must also be true.
   */
  template <class Fn>
  bool EnsurePatternsRegistered(PatternRegistry &registry, IPatternRegistrar &registrar, std::string_view moduleName,
                                Fn &&fn)
  {
    ModuleRegistration registration{moduleName, registry, registrar};
    if (registry.IsModuleInitialized(registration.GetModuleId()))
      return true;

    using Result = std::invoke_result_t<Fn, ModuleRegistration &>;

    if constexpr (std::is_void_v<Result>)
    {
      std::forward<Fn>(fn)(registration);
    }
    else
    {
      static_assert(std::is_convertible_v<Result, bool>, "Registration callable must return void or bool");
      if (!static_cast<bool>(std::forward<Fn>(fn)(registration)))
        return false;
    }
    if (registration.Failed())
      return false;
    registry.MarkModuleInitialized(registration.GetModuleId());
    return true;
  }

  template <class Fn>
  bool EnsurePatternsRegistered(IPatternRegistrar &registrar, std::string_view moduleName, Fn &&fn)
  {
    return EnsurePatternsRegistered(DefaultRegistry(), registrar, moduleName, std::forward<Fn>(fn));
  }

} // namespace UIAExtend::Patterns
