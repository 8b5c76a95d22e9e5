// Patterns.hpp - umbrella header for UIAExtend.Patterns
#pragma once

#include <UIAExtend/Patterns/Export.hpp>
#include <UIAExtend/Patterns/Types.hpp>
#include <UIAExtend/Patterns/Guid.hpp>
#include <UIAExtend/Patterns/WireValue.hpp>
#include <UIAExtend/Patterns/TypeMapper.hpp>
#include <UIAExtend/Patterns/Schema.hpp>
#include <UIAExtend/Patterns/SchemaBuilder.hpp>
#include <UIAExtend/Patterns/Native.hpp>
#include <UIAExtend/Patterns/PatternClient.hpp>
#include <UIAExtend/Patterns/PatternDispatcher.hpp>
#include <UIAExtend/Patterns/PatternHandler.hpp>
#include <UIAExtend/Patterns/Loopback.hpp>
#include <UIAExtend/Patterns/Registry.hpp>
#include <UIAExtend/Patterns/Standalone.hpp>
#include <UIAExtend/Patterns/ModuleInit.hpp>

#include <string_view>

namespace UIAExtend::Patterns
{
  constexpr std::string_view LibraryName() noexcept { return "UIAExtend.Patterns"; }
}
