/* PhysioLib Log Parser Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef PHYSIOLOG_PARSER_H
#define PHYSIOLOG_PARSER_H

#include <QHash>
#include <QIODevice>
#include <QList>
#include <QString>

#include "PhysioLib/physio_common.h"
#include "PhysioLib/physio_error.h"
#include "PhysioLib/logreader.h"

/*! \struct LogHeader
    \brief The "key = value" fields every physio log carries
  */
struct LogHeader {
    QString logVersion;
    QString dataType;
    QString uuid;

    //! \brief Line on which each recognized key was (last) assigned
    QHash<QString, int> declaredAt;

    bool has(const QString & key) const { return declaredAt.contains(key); }
    int lineOf(const QString & key) const { return declaredAt.value(key, 0); }
};

/*! \class PhysioLogParser
    \brief Reads one of the five physio logs of a session

    Parsing is done in two passes over the file: all header assignments are applied and
    validated first, and only then is the output array allocated and filled from the data
    rows. A data row may still not precede the header fields that size its output; that
    is reported as MissingHeader rather than silently accepted.

    Subclasses handle their own header keys and data rows. Every problem is thrown as a
    PhysioError and the parser should be discarded afterwards.
  */
class PhysioLogParser
{
  public:
    PhysioLogParser(PhysioLogType type, const PhysioReadOptions & options);
    virtual ~PhysioLogParser();

    //! \brief Opens and parses the named file
    void Parse(const QString & path);

    //! \brief Parses an already open device; name is only used in messages
    void Parse(QIODevice & device, const QString & name);

    PhysioLogType type() const { return m_type; }
    QString dataTypeTag() const { return logDataTypeTag(m_type); }
    const LogHeader & header() const { return m_header; }
    const QString & uuid() const { return m_header.uuid; }
    const QString & filename() const { return m_filename; }

  protected:
    //! \brief Applies a type-specific header key, returning false if the key is not one of ours
    virtual bool parseHeaderField(const PhysioLogLine & line) = 0;

    //! \brief Throws if a required type-specific field is missing
    virtual void validateHeader(bool hasRecords) = 0;

    //! \brief Header keys that must be declared before any data row
    virtual QStringList sizingKeys() const = 0;

    //! \brief Allocates the output once the header is known to be valid
    virtual void allocate() = 0;

    virtual void parseRecord(const PhysioLogLine & line) = 0;

    //! \brief Called after the last data row
    virtual void finish() {}

    void requireField(const QString & key) const;
    void checkFieldCount(const PhysioLogLine & line, int count) const;
    quint32 readHeaderUInt(const PhysioLogLine & line) const;
    quint32 readRecordUInt(const PhysioLogLine & line, int field, const QString & what) const;

    PhysioLogType m_type;
    PhysioReadOptions m_options;
    QString m_filename;
    LogHeader m_header;

  private:
    void applyAssignment(const PhysioLogLine & line);
    void checkSizingDeclared(const PhysioLogLine & line) const;
};

#endif // PHYSIOLOG_PARSER_H
