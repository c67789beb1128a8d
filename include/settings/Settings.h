#pragma once

#include <QSettings>

namespace NodeMark {

inline constexpr const char* kOrganizationName = "NodeMark";
inline constexpr const char* kApplicationName = "NodeMark";

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace NodeMark
