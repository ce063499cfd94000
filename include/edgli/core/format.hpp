#pragma once

#include <fmt/core.h>

namespace edgli::compat {
    using fmt::format;
}
