/* PhysioLib Session Loader Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef SESSION_LOADER_H
#define SESSION_LOADER_H

#include "PhysioLib/physio_common.h"
#include "PhysioLib/session.h"

class SignalLogParser;

/*! \class PhysioSessionLoader
    \brief Reads the five logs of a CMRR physio session and cross-checks them

    Given the base name "Physio_DATE_TIME_UUID", the loader expects
    base_Info.log, base_ECG.log, base_RESP.log, base_PULS.log and base_EXT.log.
    Any problem throws a PhysioError and no session is returned.
  */
class PhysioSessionLoader
{
  public:
    PhysioSessionLoader(const PhysioReadOptions & options = PhysioReadOptions());

    PhysioSession Load(const QString & basename);

    const PhysioReadOptions & options() const { return m_options; }

    static QString logPath(const QString & basename, PhysioLogType type);

    //! \brief Throws FileNotFound for the first of the five logs that doesn't exist
    static void checkFilesExist(const QString & basename);

    //! \brief Marks [start, stop] of every timing map cell in an array of expectedSamples ticks
    static SampleArray buildAcquisitionActive(const AcquisitionTimingMap & map, int expectedSamples);

  protected:
    void checkUuid(const QString & infoUuid, const QString & basename, const SignalLogParser & parser) const;

    PhysioReadOptions m_options;
};

#endif // SESSION_LOADER_H
