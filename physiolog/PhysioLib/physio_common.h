/* PhysioLib Common Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PHYSIO_COMMON_H
#define PHYSIO_COMMON_H

#include <QString>
#include <QStringList>
#include <QVector>

// Do not change these without considering the consequences.. downstream pipelines expect
// 32-bit tick timestamps and 16-bit sample values.
typedef quint32 PhysioTick;
typedef quint16 PhysioSample;
typedef QVector<PhysioSample> SampleArray;

//! \brief Log format version written by the CMRR multiband sequences (>=R013, >=VD13A)
const QString STR_LogVersion_EJA1 = "EJA_1";

//! \brief Milliseconds per clock tick
const double TICK_DURATION_MS = 2.5;

//! \brief Extra samples allocated past the last timestamp for a worst case EXT sample at LastTime
const int SAMPLE_PADDING = 8;

const PhysioSample MAX_SAMPLE_VALUE = 0xFFFF;

//! \brief Upper bound on any per-tick array or timing map, so sizes always fit QVector's int indices
const int MAX_SESSION_SAMPLES = 0x7FFFFFFF;

// Header keys
const QString STR_KEY_LogVersion = "LogVersion";
const QString STR_KEY_LogDataType = "LogDataType";
const QString STR_KEY_UUID = "UUID";
const QString STR_KEY_SampleTime = "SampleTime";
const QString STR_KEY_NumSlices = "NumSlices";
const QString STR_KEY_NumVolumes = "NumVolumes";
const QString STR_KEY_FirstTime = "FirstTime";
const QString STR_KEY_LastTime = "LastTime";

/*! \enum PhysioLogType
    \brief The closed set of files written for one physio session
  */
enum PhysioLogType { PLT_AcquisitionInfo = 0, PLT_ECG, PLT_RESP, PLT_PULS, PLT_EXT };

const QVector<PhysioLogType> AllPhysioLogTypes = { PLT_AcquisitionInfo, PLT_ECG, PLT_RESP, PLT_PULS, PLT_EXT };

//! \brief Returns the LogDataType tag a file of this kind must declare
QString logDataTypeTag(PhysioLogType type);

//! \brief Returns the filename suffix appended to the session base name, e.g. "_ECG.log"
QString logFileSuffix(PhysioLogType type);

//! \brief Returns the channel labels recognized in data rows of this kind (empty for info files)
QStringList logChannelLabels(PhysioLogType type);

/*! \struct PhysioReadOptions
    \brief Settings passed into every parse
  */
struct PhysioReadOptions {
    PhysioReadOptions() : expectedVersion(STR_LogVersion_EJA1) {}

    QString expectedVersion;   //! \brief LogVersion value every file must declare
};

#endif // PHYSIO_COMMON_H
