#pragma once

#include <string_view>

namespace quarry::internal::platform {
    using namespace std::string_view_literals;

    namespace tool {
        inline constexpr auto llvm_nm = "llvm-nm"sv;
        inline constexpr auto llvm_objdump = "llvm-objdump"sv;
        // resolved at configure time; falls back to the bare tool name when not found
        inline constexpr auto llvm_nm_path = std::string_view{QUARRY_LLVM_NM_EXECUTABLE_PATH};
        inline constexpr auto llvm_objdump_path = std::string_view{QUARRY_LLVM_OBJDUMP_EXECUTABLE_PATH};
    }  // namespace tool

}  // namespace quarry::internal::platform
