/* PhysioLib Session Loader Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>
#include <QFileInfo>

#include "PhysioLib/session_loader.h"
#include "PhysioLib/physio_error.h"
#include "PhysioLib/log_parsers/acqinfo_parser.h"
#include "PhysioLib/log_parsers/signal_parser.h"

PhysioSessionLoader::PhysioSessionLoader(const PhysioReadOptions & options)
    : m_options(options)
{
}

QString PhysioSessionLoader::logPath(const QString & basename, PhysioLogType type)
{
    return basename + logFileSuffix(type);
}

void PhysioSessionLoader::checkFilesExist(const QString & basename)
{
    for (auto type : AllPhysioLogTypes) {
        QString path = logPath(basename, type);
        if (!QFileInfo(path).isFile()) {
            throw PhysioError(PhysioError::FileNotFound, QString("%1 not found!").arg(path), path);
        }
    }
}

SampleArray PhysioSessionLoader::buildAcquisitionActive(const AcquisitionTimingMap & map, int expectedSamples)
{
    SampleArray acq(expectedSamples, 0);
    for (int v = 0; v < map.numVolumes(); v++) {
        for (int s = 0; s < map.numSlices(); s++) {
            PhysioTick start = map.start(v, s);
            PhysioTick stop = map.stop(v, s);
            if (stop >= PhysioTick(expectedSamples)) {
                throw PhysioError(PhysioError::SampleOutOfRange,
                                  QString("vol%1 slc%2 stops at relative tick %3, past the end of the scan (%4 samples)")
                                      .arg(v).arg(s).arg(stop).arg(expectedSamples));
            }
            for (PhysioTick t = start; t <= stop; t++) {
                acq[int(t)] = 1;
            }
        }
    }
    return acq;
}

void PhysioSessionLoader::checkUuid(const QString & infoUuid, const QString & basename,
                                    const SignalLogParser & parser) const
{
    if (parser.uuid() != infoUuid) {
        throw PhysioError(PhysioError::UuidMismatch,
                          QString("UUID mismatch between Info and %1 files! (%2 vs %3, %4)")
                              .arg(parser.dataTypeTag()).arg(infoUuid).arg(parser.uuid())
                              .arg(logPath(basename, PLT_AcquisitionInfo)),
                          parser.filename());
    }
}

PhysioSession PhysioSessionLoader::Load(const QString & basename)
{
    checkFilesExist(basename);

    AcquisitionInfoParser info(m_options);
    info.Parse(logPath(basename, PLT_AcquisitionInfo));

    PhysioTick firstTime = info.firstTime();
    PhysioTick lastTime = info.lastTime();
    if (lastTime <= firstTime) {
        throw PhysioError(PhysioError::InvalidTimeRange,
                          QString("last timestamp %1 is not greater than first timestamp %2, aborting...")
                              .arg(lastTime).arg(firstTime),
                          info.filename());
    }

    quint64 span = quint64(lastTime) - firstTime + 1 + SAMPLE_PADDING;
    if (span > quint64(MAX_SESSION_SAMPLES)) {
        throw PhysioError(PhysioError::InvalidTimeRange,
                          QString("scan from %1 to %2 spans %3 ticks, more than the %4 that can be held")
                              .arg(firstTime).arg(lastTime).arg(span).arg(MAX_SESSION_SAMPLES),
                          info.filename());
    }
    int expectedSamples = int(span);

    ECGLogParser ecg(firstTime, expectedSamples, m_options);
    ecg.Parse(logPath(basename, PLT_ECG));
    checkUuid(info.uuid(), basename, ecg);

    RespLogParser resp(firstTime, expectedSamples, m_options);
    resp.Parse(logPath(basename, PLT_RESP));
    checkUuid(info.uuid(), basename, resp);

    PulsLogParser puls(firstTime, expectedSamples, m_options);
    puls.Parse(logPath(basename, PLT_PULS));
    checkUuid(info.uuid(), basename, puls);

    ExtLogParser ext(firstTime, expectedSamples, m_options);
    ext.Parse(logPath(basename, PLT_EXT));
    checkUuid(info.uuid(), basename, ext);

    qDebug() << "Formatting data...";

    PhysioSession session;
    session.m_uuid = info.uuid();
    session.m_sliceMap = info.timingMap();
    session.m_firstTime = firstTime;
    session.m_lastTime = lastTime;
    session.m_acq = buildAcquisitionActive(session.m_sliceMap, expectedSamples);

    // only keep active (nonzero) traces
    const SignalLogParser * signalParsers[] = { &ecg, &resp, &puls, &ext };
    for (auto parser : signalParsers) {
        for (int i = 0; i < parser->channelCount(); i++) {
            session.addChannel(parser->channelLabels().at(i), parser->samples(i));
        }
    }

    for (const auto & line : session.summary()) {
        qInfo().noquote() << line;
    }
    qDebug().noquote() << "Active channels:" << session.channelNames().join(", ");

    return session;
}
