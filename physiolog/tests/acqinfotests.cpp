/* Acquisition Info Parser Unit Tests
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "acqinfotests.h"
#include "physiotestdata.h"

void AcquisitionInfoTests::testTimingMap()
{
    AcquisitionInfoParser parser;
    parseText(parser, infoLogText());

    QCOMPARE(parser.uuid(), TEST_UUID);
    QCOMPARE(parser.numSlices(), 2);
    QCOMPARE(parser.numVolumes(), 1);
    QCOMPARE(parser.firstTime(), PhysioTick(100));
    QCOMPARE(parser.lastTime(), PhysioTick(109));

    // Stored relative to FirstTime.
    const AcquisitionTimingMap & map = parser.timingMap();
    QCOMPARE(map.start(0, 0), PhysioTick(0));
    QCOMPARE(map.stop(0, 0), PhysioTick(3));
    QCOMPARE(map.start(0, 1), PhysioTick(5));
    QCOMPARE(map.stop(0, 1), PhysioTick(7));
    QCOMPARE(map.unsetCount(), 0);
}

void AcquisitionInfoTests::testUnsetCellsAreZero()
{
    AcquisitionInfoParser parser;
    parseText(parser, infoLogText(QStringList() << "0 1 104 106"));

    const AcquisitionTimingMap & map = parser.timingMap();
    QVERIFY(!map.isSet(0, 0));
    QVERIFY(map.isSet(0, 1));
    QCOMPARE(map.unsetCount(), 1);
    QCOMPARE(map.start(0, 0), PhysioTick(0));
    QCOMPARE(map.stop(0, 0), PhysioTick(0));
    QCOMPARE(map.start(0, 1), PhysioTick(4));
}

void AcquisitionInfoTests::testDuplicateRecord()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText(QStringList() << "0 0 100 103" << "0 1 105 107" << "0 0 101 102");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::DuplicateRecord);
    QVERIFY(PhysioError::categoryOf(PhysioError::DuplicateRecord) == PhysioError::ConsistencyViolation);
}

void AcquisitionInfoTests::testVersionMismatch()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText().replace("EJA_1", "EJA_2");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::FormatVersionMismatch);
}

void AcquisitionInfoTests::testCustomVersion()
{
    PhysioReadOptions options;
    options.expectedVersion = "EJA_2";
    AcquisitionInfoParser parser(options);
    parseText(parser, infoLogText().replace("EJA_1", "EJA_2"));
    QCOMPARE(parser.header().logVersion, QString("EJA_2"));
}

void AcquisitionInfoTests::testDataTypeMismatch()
{
    AcquisitionInfoParser parser;
    QString text = signalLogText(PLT_ECG, 1, QStringList() << "100 ECG1 2048 0");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::DataTypeMismatch);
}

void AcquisitionInfoTests::testSampleTimeMisplaced()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText().replace("NumVolumes  = 1\n", "NumVolumes  = 1\nSampleTime  = 2\n");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::SchemaFieldMisplaced);
}

void AcquisitionInfoTests::testMissingSizingField()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText().remove("NumVolumes  = 1\n");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::MissingHeader);
}

void AcquisitionInfoTests::testRowBeforeHeader()
{
    AcquisitionInfoParser parser;
    QString text = "0 0 100 103\n" + infoLogText(QStringList() << "0 1 105 107");
    try {
        parseText(parser, text);
        QFAIL("data row ahead of NumSlices was accepted");
    } catch (const PhysioError & e) {
        QVERIFY(e.code() == PhysioError::MissingHeader);
        QCOMPARE(e.line(), 1);
        QCOMPARE(e.path(), QString("test.log"));
    }
}

void AcquisitionInfoTests::testRowOutOfRange()
{
    AcquisitionInfoParser parser;
    QVERIFY_PHYSIO_ERROR(parseText(parser, infoLogText(QStringList() << "1 0 100 103")),
                         PhysioError::RecordOutOfRange);

    AcquisitionInfoParser parser2;
    QVERIFY_PHYSIO_ERROR(parseText(parser2, infoLogText(QStringList() << "0 0 104 103")),
                         PhysioError::RecordOutOfRange);
}

void AcquisitionInfoTests::testMalformedRow()
{
    AcquisitionInfoParser parser;
    QVERIFY_PHYSIO_ERROR(parseText(parser, infoLogText(QStringList() << "0 0 100")),
                         PhysioError::MalformedRecord);

    AcquisitionInfoParser parser2;
    QVERIFY_PHYSIO_ERROR(parseText(parser2, infoLogText(QStringList() << "0 0 100 1x3")),
                         PhysioError::MalformedRecord);
}

void AcquisitionInfoTests::testUuidMissing()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText().remove(QString("UUID        = %1\n").arg(TEST_UUID));
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::UuidMissing);
}

void AcquisitionInfoTests::testNonNumericHeader()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText().replace("NumSlices   = 2", "NumSlices   = two");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::MalformedHeader);

    AcquisitionInfoParser negative;
    text = infoLogText().replace("FirstTime   = 100", "FirstTime   = -100");
    QVERIFY_PHYSIO_ERROR(parseText(negative, text), PhysioError::MalformedHeader);
}

void AcquisitionInfoTests::testShapeTooLarge()
{
    // 2 x 65536 x 32768 cells would not fit a QVector
    AcquisitionInfoParser parser;
    QString text = infoLogText(QStringList())
                       .replace("NumSlices   = 2", "NumSlices   = 32768")
                       .replace("NumVolumes  = 1", "NumVolumes  = 65536");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::MalformedHeader);

    AcquisitionInfoParser huge;
    text = infoLogText(QStringList()).replace("NumSlices   = 2", "NumSlices   = 4294967295");
    QVERIFY_PHYSIO_ERROR(parseText(huge, text), PhysioError::MalformedHeader);
}

void AcquisitionInfoTests::testSizingFieldRepeated()
{
    AcquisitionInfoParser parser;
    QString text = infoLogText() + "NumSlices   = 4\n";
    try {
        parseText(parser, text);
        QFAIL("NumSlices was accepted twice");
    } catch (const PhysioError & e) {
        QVERIFY(e.code() == PhysioError::MalformedHeader);
        QVERIFY(e.message().contains("line 5"));
    }
}

void AcquisitionInfoTests::testDuplicateAtFirstTime()
{
    // A cell written with (FirstTime, FirstTime) is zero once offset, but still written.
    AcquisitionInfoParser parser;
    QString text = infoLogText(QStringList() << "0 0 100 100" << "0 1 105 107" << "0 0 100 100");
    QVERIFY_PHYSIO_ERROR(parseText(parser, text), PhysioError::DuplicateRecord);

    AcquisitionInfoParser single;
    parseText(single, infoLogText(QStringList() << "0 0 100 100"));
    QVERIFY(single.timingMap().isSet(0, 0));
    QCOMPARE(single.timingMap().start(0, 0), PhysioTick(0));
    QCOMPARE(single.timingMap().stop(0, 0), PhysioTick(0));
}
