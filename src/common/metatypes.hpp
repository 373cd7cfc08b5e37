#pragma once

#include <QMetaType>

#include "common/models.hpp"

Q_DECLARE_METATYPE(focuslens::FocusLevel)
Q_DECLARE_METATYPE(focuslens::SessionRecord)
Q_DECLARE_METATYPE(focuslens::InterruptionEvent)
Q_DECLARE_METATYPE(focuslens::ProductivityTrendPoint)
