/* PhysioLib Error Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "PhysioLib/physio_error.h"

PhysioError::PhysioError(Code code, const QString & message, const QString & path, int line)
    : std::runtime_error(describe(code, message, path, line).constData()),
      m_code(code), m_message(message), m_path(path), m_line(line)
{
}

PhysioError::Category PhysioError::categoryOf(Code code)
{
    switch (code) {
    case FileNotFound:
    case FileUnreadable:
        return MissingInput;
    case UuidMismatch:
    case DuplicateRecord:
    case InvalidTimeRange:
        return ConsistencyViolation;
    case InvalidChannel:
    case RecordOutOfRange:
    case SampleOutOfRange:
        return DataViolation;
    default:
        break;
    }
    return FormatViolation;
}

QString PhysioError::codeName(Code code)
{
    switch (code) {
    case FileNotFound:          return "FileNotFound";
    case FileUnreadable:        return "FileUnreadable";
    case FormatVersionMismatch: return "FormatVersionMismatch";
    case DataTypeMismatch:      return "DataTypeMismatch";
    case SchemaFieldMisplaced:  return "SchemaFieldMisplaced";
    case MissingHeader:         return "MissingHeader";
    case MalformedHeader:       return "MalformedHeader";
    case MalformedRecord:       return "MalformedRecord";
    case DuplicateRecord:       return "DuplicateRecord";
    case RecordOutOfRange:      return "RecordOutOfRange";
    case InvalidChannel:        return "InvalidChannel";
    case SampleOutOfRange:      return "SampleOutOfRange";
    case UuidMissing:           return "UuidMissing";
    case UuidMismatch:          return "UuidMismatch";
    case InvalidTimeRange:      return "InvalidTimeRange";
    }
    return "Unknown";
}

// "path:line: [Code] message", leaving out whatever context is unknown.
QByteArray PhysioError::describe(Code code, const QString & message, const QString & path, int line)
{
    QString text;
    if (!path.isEmpty()) {
        text = path;
        if (line > 0) {
            text += QString(":%1").arg(line);
        }
        text += ": ";
    }
    text += QString("[%1] %2").arg(codeName(code)).arg(message);
    return text.toLocal8Bit();
}
