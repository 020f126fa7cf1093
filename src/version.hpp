#pragma once

namespace toolhost {

constexpr const char* kVersion = "0.1.0";

} // namespace toolhost
