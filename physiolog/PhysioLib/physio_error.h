/* PhysioLib Error Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PHYSIO_ERROR_H
#define PHYSIO_ERROR_H

#include <QByteArray>
#include <QString>
#include <stdexcept>

/*! \class PhysioError
    \brief Thrown for any problem that makes a physio session unusable.

    Nothing in PhysioLib recovers from these; the whole read is abandoned and no
    partial session is returned.
  */
class PhysioError : public std::runtime_error
{
  public:
    enum Category {
        MissingInput,
        FormatViolation,
        ConsistencyViolation,
        DataViolation,
    };

    enum Code {
        FileNotFound,
        FileUnreadable,
        FormatVersionMismatch,
        DataTypeMismatch,
        SchemaFieldMisplaced,
        MissingHeader,
        MalformedHeader,
        MalformedRecord,
        DuplicateRecord,
        RecordOutOfRange,
        InvalidChannel,
        SampleOutOfRange,
        UuidMissing,
        UuidMismatch,
        InvalidTimeRange,
    };

    PhysioError(Code code, const QString & message, const QString & path = QString(), int line = 0);
    virtual ~PhysioError() throw() {}

    Code code() const { return m_code; }
    Category category() const { return categoryOf(m_code); }
    const QString & message() const { return m_message; }
    const QString & path() const { return m_path; }
    int line() const { return m_line; }

    static Category categoryOf(Code code);
    static QString codeName(Code code);

  protected:
    static QByteArray describe(Code code, const QString & message, const QString & path, int line);

    Code m_code;
    QString m_message;
    QString m_path;
    int m_line;
};

#endif // PHYSIO_ERROR_H
