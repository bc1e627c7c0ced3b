#include "core/Logging.hpp"
#include <QtGlobal>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace ltr {

namespace {

void qtToBoost(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    const std::string text = message.toStdString();
    switch (type) {
    case QtDebugMsg:    BOOST_LOG_TRIVIAL(debug) << text; break;
    case QtInfoMsg:     BOOST_LOG_TRIVIAL(info) << text; break;
    case QtWarningMsg:  BOOST_LOG_TRIVIAL(warning) << text; break;
    case QtCriticalMsg: BOOST_LOG_TRIVIAL(error) << text; break;
    case QtFatalMsg:    BOOST_LOG_TRIVIAL(fatal) << text; break;
    }
}

} // namespace

bool parseSeverity(const QString& name, boost::log::trivial::severity_level& out)
{
    using namespace boost::log::trivial;
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("trace")) out = trace;
    else if (key == QLatin1String("debug")) out = debug;
    else if (key == QLatin1String("info")) out = info;
    else if (key == QLatin1String("warning") || key == QLatin1String("warn")) out = warning;
    else if (key == QLatin1String("error")) out = error;
    else if (key == QLatin1String("fatal")) out = fatal;
    else return false;
    return true;
}

void initLogging(boost::log::trivial::severity_level level)
{
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    qInstallMessageHandler(qtToBoost);
}

void initLogging(const QString& levelName)
{
    boost::log::trivial::severity_level level = boost::log::trivial::info;
    const bool known = parseSeverity(levelName, level);
    initLogging(level);
    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "Logging: unknown level '" << levelName.toStdString()
                                   << "', using info";
}

} // namespace ltr
