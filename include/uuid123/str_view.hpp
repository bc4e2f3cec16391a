#pragma once

// uuid123::str_view is std::string_view.  The alias keeps the
// signatures short and lets everything that takes text accept a
// const char*, a std::string or a string_view without copying.

#include <string_view>

namespace uuid123{
using str_view = std::string_view;
} // namespace uuid123
