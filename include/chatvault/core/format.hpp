#pragma once
#include <fmt/core.h>
namespace chatvault::compat {
    using fmt::format;
}
