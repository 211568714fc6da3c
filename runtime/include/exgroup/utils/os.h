#pragma once

#include <exgroup/config.h>

#include <cstdio>
#include <string>
#include <typeinfo>

namespace exgroup::os {

EXGROUP_API int pid();

EXGROUP_API int tid();

bool is_color_terminal() noexcept;

bool in_terminal(FILE* file);

// 类型的可读名字，编译器不支持还原时返回 type.name()
EXGROUP_API std::string type_name(const std::type_info& type);

#if defined(_WIN32)
// 启用虚拟终端
EXGROUP_API bool open_virtual_terminal();
#endif

}  // namespace exgroup::os
