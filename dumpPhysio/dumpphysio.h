/* dumpPhysio command line handling
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef DUMPPHYSIO_H
#define DUMPPHYSIO_H

#include <QStringList>

#include "PhysioLib/physio_common.h"
#include "PhysioLib/session.h"

// Exit status of dumpPhysio
const int DUMP_OK = 0;
const int DUMP_USAGE_ERROR = 1;
const int DUMP_LOAD_ERROR = 2;

struct DumpOptions {
    DumpOptions() : channels(false), quiet(false) {}

    PhysioReadOptions read;
    QString logfile;
    QString basename;
    bool channels;      //! \brief -c: print per-channel statistics
    bool quiet;         //! \brief -q: drop debug messages
};

//! \brief Fills options from argv-style args (args[0] is the program); false on a usage error
bool parseArguments(const QStringList & args, DumpOptions & options);

QStringList usageText(const QString & app);

//! \brief UUID, active acquisition ticks, then one line per present channel
QStringList channelReport(const PhysioSession & session);

//! \brief Loads the session and logs the requested report, returning DUMP_OK or DUMP_LOAD_ERROR
int dumpSession(const DumpOptions & options);

#endif // DUMPPHYSIO_H
