#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace herald {

std::optional<boost::log::trivial::severity_level> severityFromName(const QString& name)
{
    using boost::log::trivial::severity_level;
    const QString n = name.trimmed().toLower();
    if (n == "trace") return severity_level::trace;
    if (n == "debug") return severity_level::debug;
    if (n == "info") return severity_level::info;
    if (n == "warning" || n == "warn") return severity_level::warning;
    if (n == "error") return severity_level::error;
    if (n == "fatal") return severity_level::fatal;
    return std::nullopt;
}

bool applyLogLevel(const QString& name)
{
    const auto level = severityFromName(name);
    if (!level) {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown log level '" << name.toStdString() << "'";
        return false;
    }
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= *level);
    return true;
}

} // namespace herald
