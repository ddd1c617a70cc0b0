/* PhysioLib Log Parser Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include "physiolog_parser.h"

// Keys that belong to one kind of log only. Seeing one in the wrong kind of file is an error,
// any other unknown key is ignored.
static const QStringList s_acquisitionOnlyKeys = QStringList()
        << STR_KEY_NumSlices << STR_KEY_NumVolumes << STR_KEY_FirstTime << STR_KEY_LastTime;
static const QStringList s_signalOnlyKeys = QStringList() << STR_KEY_SampleTime;

PhysioLogParser::PhysioLogParser(PhysioLogType type, const PhysioReadOptions & options)
    : m_type(type), m_options(options)
{
}

PhysioLogParser::~PhysioLogParser()
{
}

void PhysioLogParser::Parse(const QString & path)
{
    QFile file(path);
    if (!file.exists()) {
        throw PhysioError(PhysioError::FileNotFound, QString("%1 not found").arg(path), path);
    }
    if (!file.open(QFile::ReadOnly | QFile::Text)) {
        throw PhysioError(PhysioError::FileUnreadable,
                          QString("couldn't open file: %1").arg(file.errorString()), path);
    }
    Parse(file, path);
}

void PhysioLogParser::Parse(QIODevice & device, const QString & name)
{
    m_filename = name;
    m_header = LogHeader();

    qDebug().noquote() << "Reading" << dataTypeTag() << "file" << QFileInfo(name).fileName();

    PhysioLogReader reader(device);
    const QList<PhysioLogLine> lines = reader.readAll();

    // Pass 1: header
    bool hasRecords = false;
    for (const auto & line : lines) {
        if (line.isAssignment()) {
            applyAssignment(line);
        } else if (!line.isLabelRow()) {
            hasRecords = true;
        }
    }

    requireField(STR_KEY_LogVersion);
    requireField(STR_KEY_LogDataType);
    if (!m_header.has(STR_KEY_UUID) || m_header.uuid.isEmpty()) {
        throw PhysioError(PhysioError::UuidMissing, "no UUID found", m_filename);
    }
    validateHeader(hasRecords);
    allocate();

    // Pass 2: data
    for (const auto & line : lines) {
        if (line.isAssignment() || line.isLabelRow()) {
            continue;
        }
        checkSizingDeclared(line);
        parseRecord(line);
    }

    finish();
}

void PhysioLogParser::applyAssignment(const PhysioLogLine & line)
{
    const QString & key = line.key;

    // A second value for a sizing key would change the shape of rows already seen.
    if (m_header.has(key) && sizingKeys().contains(key)) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("[%1] declared again (first on line %2)").arg(key).arg(m_header.lineOf(key)),
                          m_filename, line.number);
    }

    if (key == STR_KEY_LogVersion) {
        if (line.value != m_options.expectedVersion) {
            throw PhysioError(PhysioError::FormatVersionMismatch,
                              QString("file format [%1] not supported (expected [%2])")
                                  .arg(line.value).arg(m_options.expectedVersion),
                              m_filename, line.number);
        }
        m_header.logVersion = line.value;
    } else if (key == STR_KEY_LogDataType) {
        if (line.value != dataTypeTag()) {
            throw PhysioError(PhysioError::DataTypeMismatch,
                              QString("expected [%1] data, found [%2]? Check filenames?")
                                  .arg(dataTypeTag()).arg(line.value),
                              m_filename, line.number);
        }
        m_header.dataType = line.value;
    } else if (key == STR_KEY_UUID) {
        m_header.uuid = line.value;
    } else if (!parseHeaderField(line)) {
        if (s_acquisitionOnlyKeys.contains(key) || s_signalOnlyKeys.contains(key)) {
            throw PhysioError(PhysioError::SchemaFieldMisplaced,
                              QString("invalid [%1] parameter found in %2 log").arg(key).arg(dataTypeTag()),
                              m_filename, line.number);
        }
        qDebug().noquote() << m_filename << "ignoring header field" << key;
        return;
    }
    m_header.declaredAt[key] = line.number;
}

void PhysioLogParser::checkSizingDeclared(const PhysioLogLine & line) const
{
    for (const auto & key : sizingKeys()) {
        if (m_header.lineOf(key) > line.number) {
            throw PhysioError(PhysioError::MissingHeader,
                              QString("data row precedes the %1 header field (line %2)")
                                  .arg(key).arg(m_header.lineOf(key)),
                              m_filename, line.number);
        }
    }
}

void PhysioLogParser::requireField(const QString & key) const
{
    if (!m_header.has(key)) {
        throw PhysioError(PhysioError::MissingHeader,
                          QString("required header field [%1] not found").arg(key), m_filename);
    }
}

void PhysioLogParser::checkFieldCount(const PhysioLogLine & line, int count) const
{
    if (line.fields.size() != count) {
        throw PhysioError(PhysioError::MalformedRecord,
                          QString("expected %1 columns, found %2").arg(count).arg(line.fields.size()),
                          m_filename, line.number);
    }
}

quint32 PhysioLogParser::readHeaderUInt(const PhysioLogLine & line) const
{
    bool ok;
    quint32 value = line.value.toUInt(&ok);
    if (!ok) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("[%1] is not an unsigned integer: %2").arg(line.key).arg(line.value),
                          m_filename, line.number);
    }
    return value;
}

quint32 PhysioLogParser::readRecordUInt(const PhysioLogLine & line, int field, const QString & what) const
{
    bool ok;
    quint32 value = line.fields.at(field).toUInt(&ok);
    if (!ok) {
        throw PhysioError(PhysioError::MalformedRecord,
                          QString("%1 is not an unsigned integer: %2").arg(what).arg(line.fields.at(field)),
                          m_filename, line.number);
    }
    return value;
}
