#include "mirror_for_plex/platform/ui_service.hpp"
#include <memory>

#ifdef USE_QT_UI
#include "mirror_for_plex/platform/qt/qt_ui_service.hpp"
#else
#include "mirror_for_plex/platform/console_ui_service.hpp"
#endif

namespace mirror_for_plex {
namespace platform {

std::unique_ptr<UiService> UiService::create_default() {
#ifdef USE_QT_UI
    return std::make_unique<qt::QtUiService>();
#else
    return std::make_unique<ConsoleUiService>();
#endif
}

} // namespace platform
} // namespace mirror_for_plex
