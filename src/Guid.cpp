#include <UIAExtend/Patterns/Guid.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <array>

namespace UIAExtend::Patterns
{

  NGIN::UInt64 Guid::Hash() const noexcept
  {
    std::array<std::uint8_t, 16> bytes{};
    bytes[0] = static_cast<std::uint8_t>(data1 >> 24);
    bytes[1] = static_cast<std::uint8_t>(data1 >> 16);
    bytes[2] = static_cast<std::uint8_t>(data1 >> 8);
    bytes[3] = static_cast<std::uint8_t>(data1);
    bytes[4] = static_cast<std::uint8_t>(data2 >> 8);
    bytes[5] = static_cast<std::uint8_t>(data2);
    bytes[6] = static_cast<std::uint8_t>(data3 >> 8);
    bytes[7] = static_cast<std::uint8_t>(data3);
    for (std::size_t i = 0; i < data4.size(); ++i)
      bytes[8 + i] = data4[i];
    return NGIN::Hashing::FNV1a64(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  }

  std::string ToString(const Guid &guid)
  {
    constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    auto put = [&](std::uint64_t v, int nibbles)
    {
      for (int i = nibbles - 1; i >= 0; --i)
        out.push_back(digits[(v >> (i * 4)) & 0xF]);
    };
    put(guid.data1, 8);
    out.push_back('-');
    put(guid.data2, 4);
    out.push_back('-');
    put(guid.data3, 4);
    out.push_back('-');
    put(guid.data4[0], 2);
    put(guid.data4[1], 2);
    out.push_back('-');
    for (std::size_t i = 2; i < 8; ++i)
      put(guid.data4[i], 2);
    return out;
  }

} // namespace UIAExtend::Patterns
