#include "core/platform/PlatformAdapterFactory.hpp"
#include "core/HeraldConfig.hpp"
#include "core/platform/AbsoluteTimePlatformAdapter.hpp"
#include "core/platform/CalendarPlatformAdapter.hpp"
#include <boost/log/trivial.hpp>

namespace herald {

std::unique_ptr<IPlatformAdapter> createPlatformAdapter(const HeraldConfig& config)
{
    const QString backend = config.platformBackend().trimmed().toLower();

    if (backend == "calendar") {
        return std::make_unique<CalendarPlatformAdapter>(config.permissionGranted(),
                                                         config.autoIncrementBadge());
    }
    if (backend == "absolute") {
        return std::make_unique<AbsoluteTimePlatformAdapter>(config.channelConfig(),
                                                             config.permissionGranted());
    }

    BOOST_LOG_TRIVIAL(error) << "[PlatformAdapterFactory] Unknown backend '" << backend.toStdString()
                             << "' (expected 'calendar' or 'absolute')";
    return nullptr;
}

} // namespace herald
