#include "chordfield/voicing/VoicingProfile.h"

#include <QSettings>
#include <QtGlobal>
#include <algorithm>
#include <utility>

namespace chordfield::voicing {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }

static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }
static bool readB(QSettings& s, const QString& k, bool def) { return s.value(k, def).toBool(); }
static QString readS(QSettings& s, const QString& k, const QString& def) { return s.value(k, def).toString(); }

static int readMidi(QSettings& s, const QString& k, int def) { return clampInt(readInt(s, k, def), 0, 127); }

} // namespace

VoicingProfile defaultVoicingProfile() {
    VoicingProfile p;
    p.name = "Keyboard (Default)";
    return p;
}

VoicingProfile loadVoicingProfile(QSettings& settings, const QString& prefix) {
    VoicingProfile p = defaultVoicingProfile();
    const QString base = prefix;

    p.version = readInt(settings, base + "/version", p.version);
    p.name = readS(settings, base + "/name", p.name);

    p.minMidiNote = readMidi(settings, base + "/minMidiNote", p.minMidiNote);
    p.maxMidiNote = readMidi(settings, base + "/maxMidiNote", p.maxMidiNote);
    if (p.minMidiNote > p.maxMidiNote) std::swap(p.minMidiNote, p.maxMidiNote);
    // Octave wrapping needs at least one full octave.
    if (p.maxMidiNote - p.minMidiNote < 12) p.maxMidiNote = qMin(127, p.minMidiNote + 12);

    p.defaultCenter = clampInt(readInt(settings, base + "/defaultCenter", p.defaultCenter), p.minMidiNote, p.maxMidiNote);

    p.gravityLow = readMidi(settings, base + "/gravityLow", p.gravityLow);
    p.gravityHigh = readMidi(settings, base + "/gravityHigh", p.gravityHigh);
    if (p.gravityLow > p.gravityHigh) std::swap(p.gravityLow, p.gravityHigh);
    p.gravityTarget = clampInt(readInt(settings, base + "/gravityTarget", p.gravityTarget), p.gravityLow, p.gravityHigh);

    p.bassMinMidiNote = readMidi(settings, base + "/bassMinMidiNote", p.bassMinMidiNote);
    p.bassMaxMidiNote = readMidi(settings, base + "/bassMaxMidiNote", p.bassMaxMidiNote);
    if (p.bassMinMidiNote > p.bassMaxMidiNote) std::swap(p.bassMinMidiNote, p.bassMaxMidiNote);
    if (p.bassMaxMidiNote - p.bassMinMidiNote < 12) p.bassMaxMidiNote = qMin(127, p.bassMinMidiNote + 12);
    p.bassCenter = clampInt(readInt(settings, base + "/bassCenter", p.bassCenter), p.bassMinMidiNote, p.bassMaxMidiNote);

    p.maxBassSpread = clampInt(readInt(settings, base + "/maxBassSpread", p.maxBassSpread), 12, 36);

    p.openMinMidiNote = readMidi(settings, base + "/openMinMidiNote", p.openMinMidiNote);
    p.openMaxMidiNote = readMidi(settings, base + "/openMaxMidiNote", p.openMaxMidiNote);
    if (p.openMinMidiNote > p.openMaxMidiNote) std::swap(p.openMinMidiNote, p.openMaxMidiNote);
    if (p.openMaxMidiNote - p.openMinMidiNote < 12) p.openMaxMidiNote = qMin(127, p.openMinMidiNote + 12);
    p.openStartMidiNote = readMidi(settings, base + "/openStartMidiNote", p.openStartMidiNote);
    p.openStep = clampInt(readInt(settings, base + "/openStep", p.openStep), 1, 12);

    p.rootlessStartMidiNote = readMidi(settings, base + "/rootlessStartMidiNote", p.rootlessStartMidiNote);

    p.autoModulate = readB(settings, base + "/autoModulate", p.autoModulate);
    p.recentRootWindow = clampInt(readInt(settings, base + "/recentRootWindow", p.recentRootWindow), 0, 16);

    p.reasoningLogEnabled = readB(settings, base + "/reasoningLogEnabled", p.reasoningLogEnabled);

    return p;
}

void saveVoicingProfile(QSettings& settings, const QString& prefix, const VoicingProfile& p) {
    const QString base = prefix;

    settings.setValue(base + "/version", p.version);
    settings.setValue(base + "/name", p.name);

    settings.setValue(base + "/minMidiNote", p.minMidiNote);
    settings.setValue(base + "/maxMidiNote", p.maxMidiNote);
    settings.setValue(base + "/defaultCenter", p.defaultCenter);

    settings.setValue(base + "/gravityLow", p.gravityLow);
    settings.setValue(base + "/gravityHigh", p.gravityHigh);
    settings.setValue(base + "/gravityTarget", p.gravityTarget);

    settings.setValue(base + "/bassMinMidiNote", p.bassMinMidiNote);
    settings.setValue(base + "/bassMaxMidiNote", p.bassMaxMidiNote);
    settings.setValue(base + "/bassCenter", p.bassCenter);
    settings.setValue(base + "/maxBassSpread", p.maxBassSpread);

    settings.setValue(base + "/openMinMidiNote", p.openMinMidiNote);
    settings.setValue(base + "/openMaxMidiNote", p.openMaxMidiNote);
    settings.setValue(base + "/openStartMidiNote", p.openStartMidiNote);
    settings.setValue(base + "/openStep", p.openStep);

    settings.setValue(base + "/rootlessStartMidiNote", p.rootlessStartMidiNote);

    settings.setValue(base + "/autoModulate", p.autoModulate);
    settings.setValue(base + "/recentRootWindow", p.recentRootWindow);

    settings.setValue(base + "/reasoningLogEnabled", p.reasoningLogEnabled);
}

} // namespace chordfield::voicing
