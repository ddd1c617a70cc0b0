/* PhysioLib Acquisition Timing Map Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "PhysioLib/timingmap.h"

AcquisitionTimingMap::AcquisitionTimingMap(int numVolumes, int numSlices)
    : m_numVolumes(numVolumes), m_numSlices(numSlices),
      m_data(2 * numVolumes * numSlices, 0),
      m_written(numVolumes * numSlices, false)
{
}

bool AcquisitionTimingMap::set(int volume, int slice, PhysioTick start, PhysioTick stop)
{
    int cell = volume * m_numSlices + slice;
    if (m_written.testBit(cell)) {
        return false;
    }
    m_written.setBit(cell);
    m_data[index(Start, volume, slice)] = start;
    m_data[index(Stop, volume, slice)] = stop;
    return true;
}

int AcquisitionTimingMap::unsetCount() const
{
    return m_written.size() - m_written.count(true);
}

void AcquisitionTimingMap::subtractOffset(PhysioTick firstTime)
{
    for (auto & tick : m_data) {
        tick = (tick > firstTime) ? tick - firstTime : 0;
    }
}
