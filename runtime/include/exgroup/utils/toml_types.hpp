#pragma once
#include <toml.hpp>

namespace exgroup {

using toml_value_t = toml::basic_value<TOML11_DEFAULT_COMMENT_STRATEGY>;
using toml_table_t = toml_value_t::table_type;
using toml_array_t = toml_value_t::array_type;
using toml_string_t = toml_value_t::string_type;

}  // namespace exgroup
