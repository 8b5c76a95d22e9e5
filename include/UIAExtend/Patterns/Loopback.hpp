// Loopback.hpp
// In-process IPatternInstance that routes consumer calls straight into a pattern handler
#pragma once

#include <NGIN/Primitives.hpp>

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Native.hpp>
#include <UIAExtend/Patterns/Schema.hpp>

#include <expected>
#include <span>
#include <vector>

namespace UIAExtend::Patterns
{

  class UIAEXTEND_PATTERNS_API LoopbackPatternInstance final : public IPatternInstance
  {
  public:
    LoopbackPatternInstance(const PatternDescriptor &desc, IPatternHandler &handler, void *target) noexcept
        : m_desc(&desc), m_handler(&handler), m_target(target)
    {
    }

    // Snapshot every indexed property for later cached reads.
    std::expected<void, Error> UpdateCache();
    void ClearCache() noexcept { m_cache.clear(); }
    [[nodiscard]] bool HasCache() const noexcept { return !m_cache.empty(); }

    std::expected<void, Error> GetProperty(NGIN::UInt32 index, bool cached, ValueType type, WireValue &out) override;
    std::expected<void, Error> CallMethod(NGIN::UInt32 index, std::span<WireValue> parameters) override;

  private:
    const PatternDescriptor *m_desc;
    IPatternHandler *m_handler;
    void *m_target;
    std::vector<WireValue> m_cache;
  };

} // namespace UIAExtend::Patterns
