// Guid.hpp - Pattern and property identifiers
#pragma once

#include <NGIN/Primitives.hpp>
#include <UIAExtend/Patterns/Export.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace UIAExtend::Patterns
{

  struct Guid
  {
    std::uint32_t data1{0};
    std::uint16_t data2{0};
    std::uint16_t data3{0};
    std::array<std::uint8_t, 8> data4{};

    [[nodiscard]] constexpr bool IsNil() const noexcept
    {
      if (data1 != 0 || data2 != 0 || data3 != 0)
        return false;
      for (auto b : data4)
      {
        if (b != 0)
          return false;
      }
      return true;
    }

    [[nodiscard]] UIAEXTEND_PATTERNS_API NGIN::UInt64 Hash() const noexcept;

    friend constexpr bool operator==(const Guid &, const Guid &) = default;

    // Accepts "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", optionally wrapped in braces.
    [[nodiscard]] static constexpr std::optional<Guid> Parse(std::string_view text) noexcept
    {
      if (text.size() == 38 && text.front() == '{' && text.back() == '}')
        text = text.substr(1, 36);
      if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-')
        return std::nullopt;

      auto nibble = [](char c) -> int
      {
        if (c >= '0' && c <= '9')
          return c - '0';
        if (c >= 'a' && c <= 'f')
          return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
          return c - 'A' + 10;
        return -1;
      };
      bool ok = true;
      auto hex = [&](std::size_t pos, std::size_t digits) -> std::uint64_t
      {
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < digits; ++i)
        {
          const int n = nibble(text[pos + i]);
          if (n < 0)
          {
            ok = false;
            return 0;
          }
          v = (v << 4) | static_cast<std::uint64_t>(n);
        }
        return v;
      };

      Guid g{};
      g.data1 = static_cast<std::uint32_t>(hex(0, 8));
      g.data2 = static_cast<std::uint16_t>(hex(9, 4));
      g.data3 = static_cast<std::uint16_t>(hex(14, 4));
      g.data4[0] = static_cast<std::uint8_t>(hex(19, 2));
      g.data4[1] = static_cast<std::uint8_t>(hex(21, 2));
      for (std::size_t i = 0; i < 6; ++i)
        g.data4[2 + i] = static_cast<std::uint8_t>(hex(24 + i * 2, 2));
      if (!ok)
        return std::nullopt;
      return g;
    }
  };

  // Lower-case, unbraced canonical form.
  [[nodiscard]] UIAEXTEND_PATTERNS_API std::string ToString(const Guid &guid);

} // namespace UIAExtend::Patterns
