#include "app/app.h"
#include "app/app_args.h"

#include "core/log.h"

#include <optional>
#include <vector>

int main(int argc, char** argv) {
    bimview::core::initializeLogLevelFromEnvironment();

    const std::vector<const char*> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    const std::optional<bimview::app::AppArgs> parsed = bimview::app::parseAppArgs(args);
    if (!parsed.has_value()) {
        bimview::app::printUsage(argc > 0 ? argv[0] : nullptr);
        return 2;
    }
    if (parsed->help) {
        bimview::app::printUsage(argv[0]);
        return 0;
    }

    BIM_LOGI("main") << "startup";
    bimview::app::App app;
    if (!app.init(*parsed)) {
        BIM_LOGE("main") << "app initialization failed";
        app.shutdown();
        return 1;
    }

    app.run();
    app.shutdown();
    BIM_LOGI("main") << "shutdown";
    return 0;
}
