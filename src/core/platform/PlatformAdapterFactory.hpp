#pragma once

#include "core/platform/IPlatformAdapter.hpp"
#include <memory>

namespace herald {

class HeraldConfig;

/// Builds the backend named by platform.backend ("calendar" or
/// "absolute"). Returns nullptr for an unknown name.
std::unique_ptr<IPlatformAdapter> createPlatformAdapter(const HeraldConfig& config);

} // namespace herald
