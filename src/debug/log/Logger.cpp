#include "Logger.hpp"

using namespace Kcursor;
using namespace Kcursor::Log;

CLogger::CLogger() {
    m_logger.setLogLevel(Env::isTrace() ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_DEBUG);
    m_logger.setEnableRolling(true);
    recheckEnv();
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {
    static bool TRACE = Env::isTrace();

    if (!m_logsEnabled)
        return;

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

// a library has no config file, the host steers logging through the environment
void CLogger::recheckEnv() {
    m_logsEnabled = !Env::envEnabled("KCURSOR_DISABLE_LOGS");

    m_logger.setEnableStdout(m_logsEnabled && Env::envEnabled("KCURSOR_LOG_STDOUT"));
    m_logger.setEnableColor(Env::envEnabled("KCURSOR_LOG_COLOR"));
    m_logger.setTime(true);

    if (const auto LOGFILE = Env::envValue("KCURSOR_LOG_FILE"); LOGFILE && m_logsEnabled)
        m_logger.setOutputFile(*LOGFILE);
}

bool CLogger::enabled() const {
    return m_logsEnabled;
}

const std::string& CLogger::rolling() {
    return m_logger.rollingLog();
}

Hyprutils::CLI::CLogger& CLogger::hu() {
    return m_logger;
}
