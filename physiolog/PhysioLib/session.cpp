/* PhysioLib Session Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "PhysioLib/session.h"

PhysioSession::PhysioSession()
    : m_firstTime(0), m_lastTime(0)
{
}

bool PhysioSession::addChannel(const QString & name, const SampleArray & samples)
{
    for (auto value : samples) {
        if (value != 0) {
            m_channels[name] = samples;
            m_channelNames.append(name);
            return true;
        }
    }
    return false;
}

QStringList PhysioSession::summary() const
{
    QStringList lines;
    lines << QString("Slices in scan:      %1").arg(numSlices());
    lines << QString("Volumes in scan:     %1").arg(numVolumes());
    lines << QString("First timestamp:     %1").arg(m_firstTime);
    lines << QString("Last timestamp:      %1").arg(m_lastTime);
    lines << QString("Total scan duration: %1 ticks").arg(actualSamples());
    lines << QString("Total scan duration: %1 s").arg(durationSeconds(), 0, 'f', 4);
    return lines;
}
