/* PhysioLib Common Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "PhysioLib/physio_common.h"

QString logDataTypeTag(PhysioLogType type)
{
    switch (type) {
    case PLT_AcquisitionInfo:
        return "ACQUISITION_INFO";
    case PLT_ECG:
        return "ECG";
    case PLT_RESP:
        return "RESP";
    case PLT_PULS:
        return "PULS";
    case PLT_EXT:
        return "EXT";
    }
    return QString();
}

QString logFileSuffix(PhysioLogType type)
{
    switch (type) {
    case PLT_AcquisitionInfo:
        return "_Info.log";
    case PLT_ECG:
        return "_ECG.log";
    case PLT_RESP:
        return "_RESP.log";
    case PLT_PULS:
        return "_PULS.log";
    case PLT_EXT:
        return "_EXT.log";
    }
    return QString();
}

QStringList logChannelLabels(PhysioLogType type)
{
    switch (type) {
    case PLT_ECG:
        return QStringList() << "ECG1" << "ECG2" << "ECG3" << "ECG4";
    case PLT_RESP:
        return QStringList("RESP");
    case PLT_PULS:
        return QStringList("PULS");
    case PLT_EXT:
        return QStringList() << "EXT" << "EXT2";
    default:
        break;
    }
    return QStringList();
}
