/* PhysioLib Acquisition Info Parser Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef ACQINFO_PARSER_H
#define ACQINFO_PARSER_H

#include "physiolog_parser.h"
#include "PhysioLib/timingmap.h"

/*! \class AcquisitionInfoParser
    \brief Parses the _Info.log file into the per (volume, slice) timing map

    Data rows are "volume slice start stop" with 0-based indices and absolute ticks.
    After parsing, the map holds ticks relative to FirstTime.
  */
class AcquisitionInfoParser : public PhysioLogParser
{
  public:
    AcquisitionInfoParser(const PhysioReadOptions & options = PhysioReadOptions());
    virtual ~AcquisitionInfoParser() {}

    int numSlices() const { return m_numSlices; }
    int numVolumes() const { return m_numVolumes; }
    PhysioTick firstTime() const { return m_firstTime; }
    PhysioTick lastTime() const { return m_lastTime; }
    const AcquisitionTimingMap & timingMap() const { return m_map; }

  protected:
    virtual bool parseHeaderField(const PhysioLogLine & line);
    virtual void validateHeader(bool hasRecords);
    virtual QStringList sizingKeys() const;
    virtual void allocate();
    virtual void parseRecord(const PhysioLogLine & line);
    virtual void finish();

    //! \brief Reads NumSlices or NumVolumes, which must fit in an int
    int readHeaderCount(const PhysioLogLine & line) const;

    int m_numSlices;
    int m_numVolumes;
    PhysioTick m_firstTime;
    PhysioTick m_lastTime;
    AcquisitionTimingMap m_map;
};

#endif // ACQINFO_PARSER_H
