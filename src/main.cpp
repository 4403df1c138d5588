#include "seismic_monitor_application.hpp"
#include "monitor_session.hpp"
#include "logging.hpp"


int main(int argc, char *argv[])
{
    SeismicMonitorApplication app(argc, argv);
    if (!app.initialize()) {
        qCCritical(lcMain) << "Application initialization failed";
        return MonitorSession::ExitInitializationFailed;
    }

    const auto res = app.exec();

    // All cleanup is done in ~SeismicMonitorApplication
    return res;
}
