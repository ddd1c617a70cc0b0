/* PhysioLib Acquisition Info Parser Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>

#include "acqinfo_parser.h"

AcquisitionInfoParser::AcquisitionInfoParser(const PhysioReadOptions & options)
    : PhysioLogParser(PLT_AcquisitionInfo, options),
      m_numSlices(0), m_numVolumes(0), m_firstTime(0), m_lastTime(0)
{
}

bool AcquisitionInfoParser::parseHeaderField(const PhysioLogLine & line)
{
    if (line.key == STR_KEY_NumSlices) {
        m_numSlices = readHeaderCount(line);
    } else if (line.key == STR_KEY_NumVolumes) {
        m_numVolumes = readHeaderCount(line);
    } else if (line.key == STR_KEY_FirstTime) {
        m_firstTime = readHeaderUInt(line);
    } else if (line.key == STR_KEY_LastTime) {
        m_lastTime = readHeaderUInt(line);
    } else {
        return false;
    }
    return true;
}

void AcquisitionInfoParser::validateHeader(bool hasRecords)
{
    Q_UNUSED(hasRecords)

    requireField(STR_KEY_NumSlices);
    requireField(STR_KEY_NumVolumes);
    requireField(STR_KEY_FirstTime);
    requireField(STR_KEY_LastTime);

    if (m_numSlices <= 0 || m_numVolumes <= 0) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("invalid acquisition shape: %1 volumes x %2 slices")
                              .arg(m_numVolumes).arg(m_numSlices),
                          m_filename);
    }
    // start and stop for every cell
    if (2 * qint64(m_numVolumes) * qint64(m_numSlices) > MAX_SESSION_SAMPLES) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("acquisition shape %1 volumes x %2 slices is too large")
                              .arg(m_numVolumes).arg(m_numSlices),
                          m_filename);
    }
}

int AcquisitionInfoParser::readHeaderCount(const PhysioLogLine & line) const
{
    quint32 value = readHeaderUInt(line);
    if (value > quint32(MAX_SESSION_SAMPLES)) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("[%1] is out of range: %2").arg(line.key).arg(line.value),
                          m_filename, line.number);
    }
    return int(value);
}

QStringList AcquisitionInfoParser::sizingKeys() const
{
    return QStringList() << STR_KEY_NumSlices << STR_KEY_NumVolumes;
}

void AcquisitionInfoParser::allocate()
{
    m_map = AcquisitionTimingMap(m_numVolumes, m_numSlices);
}

void AcquisitionInfoParser::parseRecord(const PhysioLogLine & line)
{
    checkFieldCount(line, 4);
    quint32 volume = readRecordUInt(line, 0, "volume");
    quint32 slice = readRecordUInt(line, 1, "slice");
    PhysioTick start = readRecordUInt(line, 2, "start time");
    PhysioTick stop = readRecordUInt(line, 3, "stop time");

    if (volume >= quint32(m_numVolumes) || slice >= quint32(m_numSlices)) {
        throw PhysioError(PhysioError::RecordOutOfRange,
                          QString("vol%1 slc%2 is outside the declared %3 volumes x %4 slices")
                              .arg(volume).arg(slice).arg(m_numVolumes).arg(m_numSlices),
                          m_filename, line.number);
    }
    if (start > stop || start < m_firstTime) {
        throw PhysioError(PhysioError::RecordOutOfRange,
                          QString("vol%1 slc%2 timing %3-%4 is invalid for FirstTime %5")
                              .arg(volume).arg(slice).arg(start).arg(stop).arg(m_firstTime),
                          m_filename, line.number);
    }
    if (!m_map.set(volume, slice, start, stop)) {
        throw PhysioError(PhysioError::DuplicateRecord,
                          QString("received duplicate timing data for vol%1 slc%2").arg(volume).arg(slice),
                          m_filename, line.number);
    }
}

void AcquisitionInfoParser::finish()
{
    int missing = m_map.unsetCount();
    if (missing > 0) {
        qWarning().noquote() << m_filename << "has no timing data for" << missing << "of"
                             << (m_numVolumes * m_numSlices) << "slices";
    }
    m_map.subtractOffset(m_firstTime);
}
