/* PhysioLib Acquisition Timing Map Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef TIMINGMAP_H
#define TIMINGMAP_H

#include <QBitArray>
#include <QVector>

#include "PhysioLib/physio_common.h"

/*! \class AcquisitionTimingMap
    \brief Start and stop tick of every (volume, slice) acquisition, laid out as [edge][volume][slice]

    Volume and slice indices are 0-based. Each cell may be written once.
  */
class AcquisitionTimingMap
{
  public:
    enum Edge { Start = 0, Stop = 1 };

    AcquisitionTimingMap() : m_numVolumes(0), m_numSlices(0) {}
    AcquisitionTimingMap(int numVolumes, int numSlices);

    int numVolumes() const { return m_numVolumes; }
    int numSlices() const { return m_numSlices; }
    bool isEmpty() const { return m_data.isEmpty(); }

    bool contains(int volume, int slice) const {
        return volume >= 0 && volume < m_numVolumes && slice >= 0 && slice < m_numSlices;
    }

    PhysioTick at(Edge edge, int volume, int slice) const { return m_data.at(index(edge, volume, slice)); }
    PhysioTick start(int volume, int slice) const { return at(Start, volume, slice); }
    PhysioTick stop(int volume, int slice) const { return at(Stop, volume, slice); }

    //! \brief True once a row has been stored for this cell
    bool isSet(int volume, int slice) const { return m_written.testBit(volume * m_numSlices + slice); }
    int unsetCount() const;

    //! \brief Stores a cell, returning false if it was already written
    bool set(int volume, int slice, PhysioTick start, PhysioTick stop);

    //! \brief Converts absolute ticks to ticks relative to firstTime, saturating at zero
    void subtractOffset(PhysioTick firstTime);

    const QVector<PhysioTick> & data() const { return m_data; }

  protected:
    int index(Edge edge, int volume, int slice) const {
        return (int(edge) * m_numVolumes + volume) * m_numSlices + slice;
    }

    int m_numVolumes;
    int m_numSlices;
    QVector<PhysioTick> m_data;
    QBitArray m_written;
};

#endif // TIMINGMAP_H
