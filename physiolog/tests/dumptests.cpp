/* dumpPhysio Unit Tests
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDir>
#include <QTemporaryDir>

#include "dumptests.h"
#include "physiotestdata.h"
#include "dumpphysio.h"
#include "logger.h"
#include "PhysioLib/session_loader.h"

static const QString BASENAME = "Physio_20220314_101502_4a6f2c3e";

static bool bufferContains(const QString & text)
{
    for (const auto & line : logger->buffer()) {
        if (line.contains(text)) {
            return true;
        }
    }
    return false;
}

void DumpPhysioTests::cleanup()
{
    shutdownLogger();
}

void DumpPhysioTests::testParseArguments()
{
    DumpOptions options;
    QVERIFY(parseArguments(QStringList() << "dumpPhysio" << "Physio_x", options));
    QCOMPARE(options.basename, QString("Physio_x"));
    QCOMPARE(options.read.expectedVersion, QString("EJA_1"));
    QVERIFY(!options.channels);
    QVERIFY(!options.quiet);
    QVERIFY(options.logfile.isEmpty());

    DumpOptions all;
    QVERIFY(parseArguments(QStringList() << "dumpPhysio" << "-v" << "EJA_2" << "-l" << "dump.txt"
                                         << "-c" << "-q" << "Physio_y", all));
    QCOMPARE(all.basename, QString("Physio_y"));
    QCOMPARE(all.read.expectedVersion, QString("EJA_2"));
    QCOMPARE(all.logfile, QString("dump.txt"));
    QVERIFY(all.channels);
    QVERIFY(all.quiet);
}

void DumpPhysioTests::testUsageErrors()
{
    DumpOptions options;
    QVERIFY(!parseArguments(QStringList() << "dumpPhysio", options));
    QVERIFY(!parseArguments(QStringList() << "dumpPhysio" << "-c", options));
    QVERIFY(!parseArguments(QStringList() << "dumpPhysio" << "-x" << "Physio_x", options));
    // -v without a value swallows nothing
    QVERIFY(!parseArguments(QStringList() << "dumpPhysio" << "-v" << "Physio_x", options));

    QStringList usage = usageText("dumpPhysio");
    QVERIFY(usage.first().startsWith("usage: dumpPhysio"));
}

void DumpPhysioTests::testChannelReport()
{
    QTemporaryDir dir;
    QString base = writeSessionLogs(dir.path(), BASENAME, defaultSessionLogs());
    PhysioSession session = PhysioSessionLoader().Load(base);

    QStringList report = channelReport(session);
    QCOMPARE(report.size(), 2 + 5);
    QCOMPARE(report[0], QString("UUID: %1").arg(TEST_UUID));
    QCOMPARE(report[1], QString("Acquisition active ticks: 7 of 18"));
    QCOMPARE(report[2], QString("ECG1 : 2 nonzero samples, min 0, max 2100"));
    QCOMPARE(report[3], QString("ECG2 : 1 nonzero samples, min 0, max 2050"));
    QCOMPARE(report[4], QString("RESP : 3 nonzero samples, min 0, max 7"));
    QCOMPARE(report[5], QString("PULS : 4 nonzero samples, min 0, max 910"));
    QCOMPARE(report[6], QString("EXT  : 1 nonzero samples, min 0, max 1"));
}

void DumpPhysioTests::testExitStatus()
{
    QTemporaryDir dir;
    QString good = writeSessionLogs(dir.path(), BASENAME, defaultSessionLogs());

    DumpOptions options;
    options.basename = good;
    QCOMPARE(dumpSession(options), DUMP_OK);

    options.read.expectedVersion = "EJA_2";
    QCOMPARE(dumpSession(options), DUMP_LOAD_ERROR);

    QHash<PhysioLogType, QString> logs = defaultSessionLogs();
    logs.remove(PLT_PULS);
    DumpOptions missing;
    missing.basename = writeSessionLogs(dir.path(), "Physio_missing_puls", logs);
    QCOMPARE(dumpSession(missing), DUMP_LOAD_ERROR);
}

void DumpPhysioTests::testChannelsLogged()
{
    QTemporaryDir dir;
    DumpOptions options;
    options.basename = writeSessionLogs(dir.path(), BASENAME, defaultSessionLogs());
    options.channels = true;

    initializeLogger();
    QCOMPARE(dumpSession(options), DUMP_OK);
    QVERIFY(bufferContains("Info: Slices in scan:      2"));
    QVERIFY(bufferContains("Info: ECG1 : 2 nonzero samples, min 0, max 2100"));
    QVERIFY(bufferContains("Info: Acquisition active ticks: 7 of 18"));

    options.basename = QDir(dir.path()).filePath("Physio_nothing_here");
    QCOMPARE(dumpSession(options), DUMP_LOAD_ERROR);
    QVERIFY(bufferContains("Critical: "));
    QVERIFY(bufferContains("[FileNotFound]"));
}

void DumpPhysioTests::testQuietDropsDebug()
{
    QTemporaryDir dir;
    DumpOptions options;
    options.basename = writeSessionLogs(dir.path(), BASENAME, defaultSessionLogs());
    options.quiet = true;

    initializeLogger(!options.quiet);
    QCOMPARE(dumpSession(options), DUMP_OK);
    QVERIFY(!bufferContains("Reading ECG file"));
    QVERIFY(!bufferContains("nonzero samples"));
    QVERIFY(bufferContains("Info: Total scan duration: 10 ticks"));
}
