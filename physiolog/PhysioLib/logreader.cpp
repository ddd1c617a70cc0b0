/* PhysioLib Log Line Reader Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "PhysioLib/logreader.h"

bool PhysioLogLine::isLabelRow() const
{
    if (kind != DataRow || fields.isEmpty() || fields.at(0).isEmpty()) {
        return false;
    }
    QChar first = fields.at(0).at(0);
    return first < QLatin1Char('0') || first > QLatin1Char('9');
}

PhysioLogReader::PhysioLogReader(QIODevice & input)
    : m_stream(&input), m_lineNumber(0)
{
}

QString PhysioLogReader::stripComment(const QString & line)
{
    int pos = line.indexOf('#');
    if (pos > 0) {
        return line.left(pos).trimmed();
    }
    return line;
}

// Lines are classified purely on their shape here. Whether a key or row makes sense
// for a particular file is up to the parser.
bool PhysioLogReader::readLine(PhysioLogLine & line)
{
    QString text;

    // Read until the next non-empty line.
    do {
        text = m_stream.readLine();
        if (text.isNull()) {
            return false;
        }
        m_lineNumber++;
        text = stripComment(text.trimmed());
    } while (text.isEmpty());

    line = PhysioLogLine();
    line.number = m_lineNumber;

    int eq = text.indexOf('=');
    if (eq >= 0) {
        line.kind = PhysioLogLine::Assignment;
        line.key = text.left(eq).trimmed();
        line.value = text.mid(eq + 1).trimmed();
    } else {
        line.kind = PhysioLogLine::DataRow;
        line.fields = text.simplified().split(' ');
    }
    return true;
}

QList<PhysioLogLine> PhysioLogReader::readAll()
{
    QList<PhysioLogLine> lines;
    PhysioLogLine line;
    while (readLine(line)) {
        lines.append(line);
    }
    return lines;
}
