/* PhysioLib Session Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PHYSIO_SESSION_H
#define PHYSIO_SESSION_H

#include <QHash>
#include <QStringList>

#include "PhysioLib/physio_common.h"
#include "PhysioLib/timingmap.h"

/*! \class PhysioSession
    \brief Everything decoded from the five logs of one scan

    All arrays are indexed in ticks relative to firstTime() and have expectedSamples() entries.
    Only channels with at least one nonzero sample are present.
  */
class PhysioSession
{
    friend class PhysioSessionLoader;
  public:
    PhysioSession();

    const QString & uuid() const { return m_uuid; }

    //! \brief Relative start/stop tick of each acquisition, [edge][volume][slice]
    const AcquisitionTimingMap & sliceMap() const { return m_sliceMap; }

    //! \brief 1 for every tick during which a slice was being acquired, 0 otherwise
    const SampleArray & acquisitionActive() const { return m_acq; }

    bool hasChannel(const QString & name) const { return m_channels.contains(name); }
    //! \brief Returns the named channel, or an empty array if it was not recorded
    SampleArray channel(const QString & name) const { return m_channels.value(name); }
    //! \brief Names of the present channels, in ECG1..ECG4, RESP, PULS, EXT, EXT2 order
    const QStringList & channelNames() const { return m_channelNames; }

    int numSlices() const { return m_sliceMap.numSlices(); }
    int numVolumes() const { return m_sliceMap.numVolumes(); }
    PhysioTick firstTime() const { return m_firstTime; }
    PhysioTick lastTime() const { return m_lastTime; }
    int actualSamples() const { return int(m_lastTime - m_firstTime) + 1; }
    int expectedSamples() const { return actualSamples() + SAMPLE_PADDING; }
    double durationSeconds() const { return double(actualSamples()) * TICK_DURATION_MS / 1000.0; }

    //! \brief Human readable scan summary, one line per entry
    QStringList summary() const;

  protected:
    //! \brief Adds the channel unless every sample is zero; returns whether it was added
    bool addChannel(const QString & name, const SampleArray & samples);

    QString m_uuid;
    AcquisitionTimingMap m_sliceMap;
    SampleArray m_acq;
    PhysioTick m_firstTime;
    PhysioTick m_lastTime;
    QHash<QString, SampleArray> m_channels;
    QStringList m_channelNames;
};

#endif // PHYSIO_SESSION_H
