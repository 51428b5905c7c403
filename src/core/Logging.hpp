#pragma once

#include <QString>
#include <boost/log/trivial.hpp>
#include <optional>

namespace herald {

/// trace, debug, info, warning (or warn), error, fatal; case-insensitive.
std::optional<boost::log::trivial::severity_level> severityFromName(const QString& name);

/// Installs a core filter at the named level. Unknown names leave the filter untouched.
bool applyLogLevel(const QString& name);

} // namespace herald
