/* PhysioLib Log Line Reader Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef LOGREADER_H
#define LOGREADER_H

#include <QList>
#include <QStringList>
#include <QTextStream>

/*! \struct PhysioLogLine
    \brief One meaningful line of a physio log, either "key = value" or a whitespace separated row
  */
struct PhysioLogLine {
    enum Kind { Assignment, DataRow };

    PhysioLogLine() : kind(DataRow), number(0) {}

    Kind kind;
    int number;             //! \brief 1-based physical line number, for error messages
    QString key;            //! \brief Assignment only
    QString value;          //! \brief Assignment only
    QStringList fields;     //! \brief DataRow only

    bool isAssignment() const { return kind == Assignment; }

    //! \brief True for column title rows, whose first field does not start with an ASCII digit
    bool isLabelRow() const;
};

class PhysioLogReader
{
public:
    PhysioLogReader(QIODevice & input);
    virtual ~PhysioLogReader() = default;

    //! \brief Reads the next non-blank line, returning false at end of input
    bool readLine(PhysioLogLine & line);

    QList<PhysioLogLine> readAll();

    int lineNumber() const { return m_lineNumber; }

    //! \brief Drops a trailing "# comment"; a '#' in the first column is left alone
    static QString stripComment(const QString & line);

protected:
    QTextStream m_stream;
    int m_lineNumber;
};

#endif // LOGREADER_H
