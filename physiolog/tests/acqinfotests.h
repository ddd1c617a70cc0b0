/* Acquisition Info Parser Unit Tests
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef ACQINFOTESTS_H
#define ACQINFOTESTS_H

#include "tests/AutoTest.h"
#include "../PhysioLib/log_parsers/acqinfo_parser.h"

class AcquisitionInfoTests : public QObject
{
    Q_OBJECT
private slots:
    void testTimingMap();
    void testUnsetCellsAreZero();
    void testDuplicateRecord();
    void testVersionMismatch();
    void testCustomVersion();
    void testDataTypeMismatch();
    void testSampleTimeMisplaced();
    void testMissingSizingField();
    void testRowBeforeHeader();
    void testRowOutOfRange();
    void testMalformedRow();
    void testUuidMissing();
    void testNonNumericHeader();
    void testShapeTooLarge();
    void testSizingFieldRepeated();
    void testDuplicateAtFirstTime();
};
DECLARE_TEST(AcquisitionInfoTests)

#endif // ACQINFOTESTS_H
