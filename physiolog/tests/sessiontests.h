/* Session Loader Unit Tests
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef SESSIONTESTS_H
#define SESSIONTESTS_H

#include "tests/AutoTest.h"
#include "../PhysioLib/session_loader.h"

class SessionLoaderTests : public QObject
{
    Q_OBJECT
private slots:
    void testLoadSession();
    void testSummary();
    void testLogPath();
    void testMissingFile();
    void testUuidMismatch();
    void testUuidMismatchInEverySignalLog();
    void testInvalidTimeRange();
    void testTimeRangeTooLong();
    void testDuplicateTimingAborts();
    void testVersionOption();
    void testBuildAcquisitionActive();
    void testAcquisitionPastEnd();
};
DECLARE_TEST(SessionLoaderTests)

#endif // SESSIONTESTS_H
