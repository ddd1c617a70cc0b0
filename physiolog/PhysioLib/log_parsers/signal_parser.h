/* PhysioLib Signal Log Parser Header
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef SIGNAL_PARSER_H
#define SIGNAL_PARSER_H

#include <QVector>

#include "physiolog_parser.h"

/*! \class SignalLogParser
    \brief Parses an _ECG, _RESP, _PULS or _EXT log into dense per-channel sample arrays

    Data rows are "timestamp channel value trigger". Each value is held for SampleTime
    ticks starting at its timestamp, and later rows overwrite earlier ones. Index 0 of
    every array is FirstTime.
  */
class SignalLogParser : public PhysioLogParser
{
  public:
    SignalLogParser(PhysioLogType type, PhysioTick firstTime, int expectedSamples,
                    const PhysioReadOptions & options = PhysioReadOptions());
    virtual ~SignalLogParser() {}

    int sampleTime() const { return m_sampleTime; }
    PhysioTick firstTime() const { return m_firstTime; }
    int expectedSamples() const { return m_expectedSamples; }

    int channelCount() const { return m_labels.size(); }
    const QStringList & channelLabels() const { return m_labels; }
    const SampleArray & samples(int channel) const { return m_channels.at(channel); }
    //! \brief Returns the samples for a channel label, or an empty array if the label is unknown
    SampleArray samples(const QString & label) const;

    //! \brief Number of values that did not fit in 16 bits and were clipped
    int clippedCount() const { return m_clipped; }

  protected:
    virtual bool parseHeaderField(const PhysioLogLine & line);
    virtual void validateHeader(bool hasRecords);
    virtual QStringList sizingKeys() const;
    virtual void allocate();
    virtual void parseRecord(const PhysioLogLine & line);
    virtual void finish();

    int channelIndex(const PhysioLogLine & line) const;

    PhysioTick m_firstTime;
    int m_expectedSamples;
    int m_sampleTime;
    int m_clipped;
    QStringList m_labels;
    QVector<SampleArray> m_channels;
};

class ECGLogParser : public SignalLogParser
{
  public:
    ECGLogParser(PhysioTick firstTime, int expectedSamples, const PhysioReadOptions & options = PhysioReadOptions())
        : SignalLogParser(PLT_ECG, firstTime, expectedSamples, options) {}
};

class RespLogParser : public SignalLogParser
{
  public:
    RespLogParser(PhysioTick firstTime, int expectedSamples, const PhysioReadOptions & options = PhysioReadOptions())
        : SignalLogParser(PLT_RESP, firstTime, expectedSamples, options) {}
};

class PulsLogParser : public SignalLogParser
{
  public:
    PulsLogParser(PhysioTick firstTime, int expectedSamples, const PhysioReadOptions & options = PhysioReadOptions())
        : SignalLogParser(PLT_PULS, firstTime, expectedSamples, options) {}
};

class ExtLogParser : public SignalLogParser
{
  public:
    ExtLogParser(PhysioTick firstTime, int expectedSamples, const PhysioReadOptions & options = PhysioReadOptions())
        : SignalLogParser(PLT_EXT, firstTime, expectedSamples, options) {}
};

#endif // SIGNAL_PARSER_H
