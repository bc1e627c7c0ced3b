#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace ltr {

/// "trace", "debug", "info", "warning", "error" or "fatal" (case-insensitive).
/// Returns false and leaves out untouched for anything else.
bool parseSeverity(const QString& name, boost::log::trivial::severity_level& out);

/// Sets the Boost.Log severity filter and routes Qt's qDebug/qInfo/qWarning output
/// (the protocol library logs that way) through BOOST_LOG_TRIVIAL, so one filter
/// governs both.
void initLogging(boost::log::trivial::severity_level level);
void initLogging(const QString& levelName);

} // namespace ltr
