/* dumpPhysio command line handling
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>

#include "dumpphysio.h"
#include "PhysioLib/physio_error.h"
#include "PhysioLib/session_loader.h"

bool parseArguments(const QStringList & args, DumpOptions & options)
{
    if (args.size() < 2) {
        return false;
    }
    options.basename = args[args.size()-1];
    if (options.basename.startsWith('-')) {
        return false;
    }

    for (int i = 1; i < args.size()-1; i++) {
        if (args[i] == "-v" && i+1 < args.size()-1)
            options.read.expectedVersion = args[++i];
        else if (args[i] == "-l" && i+1 < args.size()-1)
            options.logfile = args[++i];
        else if (args[i] == "-c")
            options.channels = true;
        else if (args[i] == "-q")
            options.quiet = true;
        else
            return false;
    }
    return true;
}

QStringList usageText(const QString & app)
{
    QStringList lines;
    lines << QString("usage: %1 [-v VERSION] [-l LOGFILE] [-c] [-q] BASENAME").arg(app);
    lines << "  BASENAME is Physio_DATE_TIME_UUID, without the _Info.log etc. suffix";
    return lines;
}

QStringList channelReport(const PhysioSession & session)
{
    QStringList lines;
    int active = 0;
    for (auto v : session.acquisitionActive()) {
        if (v) active++;
    }
    lines << QString("UUID: %1").arg(session.uuid());
    lines << QString("Acquisition active ticks: %1 of %2").arg(active).arg(session.expectedSamples());

    for (const auto & name : session.channelNames()) {
        SampleArray samples = session.channel(name);
        int nonzero = 0;
        PhysioSample lo = MAX_SAMPLE_VALUE, hi = 0;
        for (auto v : samples) {
            if (v) nonzero++;
            lo = qMin(lo, v);
            hi = qMax(hi, v);
        }
        lines << QString("%1: %2 nonzero samples, min %3, max %4")
                     .arg(name, -5).arg(nonzero).arg(lo).arg(hi);
    }
    return lines;
}

int dumpSession(const DumpOptions & options)
{
    try {
        PhysioSessionLoader loader(options.read);
        PhysioSession session = loader.Load(options.basename);
        if (options.channels) {
            for (const auto & line : channelReport(session)) {
                qInfo().noquote() << line;
            }
        }
    } catch (const PhysioError & e) {
        qCritical().noquote() << e.what();
        return DUMP_LOAD_ERROR;
    }
    return DUMP_OK;
}
