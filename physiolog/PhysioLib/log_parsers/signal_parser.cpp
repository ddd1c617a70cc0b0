/* PhysioLib Signal Log Parser Implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QDebug>

#include "signal_parser.h"

SignalLogParser::SignalLogParser(PhysioLogType type, PhysioTick firstTime, int expectedSamples,
                                 const PhysioReadOptions & options)
    : PhysioLogParser(type, options),
      m_firstTime(firstTime), m_expectedSamples(expectedSamples), m_sampleTime(0), m_clipped(0),
      m_labels(logChannelLabels(type))
{
    Q_ASSERT(type != PLT_AcquisitionInfo);
}

SampleArray SignalLogParser::samples(const QString & label) const
{
    int idx = m_labels.indexOf(label);
    if (idx < 0 || idx >= m_channels.size()) {
        return SampleArray();
    }
    return m_channels.at(idx);
}

bool SignalLogParser::parseHeaderField(const PhysioLogLine & line)
{
    if (line.key != STR_KEY_SampleTime) {
        return false;
    }
    quint32 value = readHeaderUInt(line);
    if (value == 0 || value > quint32(m_expectedSamples)) {
        throw PhysioError(PhysioError::MalformedHeader,
                          QString("invalid [%1] parameter: %2").arg(line.key).arg(line.value),
                          m_filename, line.number);
    }
    m_sampleTime = value;
    return true;
}

void SignalLogParser::validateHeader(bool hasRecords)
{
    // A log without samples (e.g. no EXT triggers) doesn't need to say how long they last.
    if (hasRecords) {
        requireField(STR_KEY_SampleTime);
    }
}

QStringList SignalLogParser::sizingKeys() const
{
    return QStringList(STR_KEY_SampleTime);
}

void SignalLogParser::allocate()
{
    if (m_expectedSamples <= 0) {
        throw PhysioError(PhysioError::InvalidTimeRange,
                          QString("no room for samples (%1 expected)").arg(m_expectedSamples),
                          m_filename);
    }
    m_channels = QVector<SampleArray>(m_labels.size(), SampleArray(m_expectedSamples, 0));
}

int SignalLogParser::channelIndex(const PhysioLogLine & line) const
{
    // RESP and PULS only have one channel, so the label isn't checked.
    if (m_labels.size() == 1) {
        return 0;
    }
    int idx = m_labels.indexOf(line.fields.at(1));
    if (idx < 0) {
        throw PhysioError(PhysioError::InvalidChannel,
                          QString("invalid %1 channel ID [%2]").arg(dataTypeTag()).arg(line.fields.at(1)),
                          m_filename, line.number);
    }
    return idx;
}

void SignalLogParser::parseRecord(const PhysioLogLine & line)
{
    checkFieldCount(line, 4);
    PhysioTick timestamp = readRecordUInt(line, 0, "timestamp");
    int channel = channelIndex(line);
    quint32 value = readRecordUInt(line, 2, "value");
    // field 3 is the trigger flag, which isn't used

    if (timestamp < m_firstTime) {
        throw PhysioError(PhysioError::SampleOutOfRange,
                          QString("timestamp %1 precedes FirstTime %2").arg(timestamp).arg(m_firstTime),
                          m_filename, line.number);
    }
    quint64 begin = timestamp - m_firstTime;
    if (begin + m_sampleTime > quint64(m_expectedSamples)) {
        throw PhysioError(PhysioError::SampleOutOfRange,
                          QString("sample at %1 lasting %2 ticks runs past the end of the scan (%3 samples)")
                              .arg(timestamp).arg(m_sampleTime).arg(m_expectedSamples),
                          m_filename, line.number);
    }

    if (value > MAX_SAMPLE_VALUE) {
        value = MAX_SAMPLE_VALUE;
        m_clipped++;
    }

    SampleArray & dest = m_channels[channel];
    for (int i = 0; i < m_sampleTime; i++) {
        dest[int(begin) + i] = PhysioSample(value);
    }
}

void SignalLogParser::finish()
{
    if (m_clipped > 0) {
        qWarning().noquote() << m_filename << m_clipped << "sample values exceeded" << MAX_SAMPLE_VALUE
                             << "and were clipped";
    }
}
