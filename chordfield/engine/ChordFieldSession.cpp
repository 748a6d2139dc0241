#include "chordfield/engine/ChordFieldSession.h"

#include "chordfield/util/Pitch.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>
#include <QtDebug>
#include <QtGlobal>

namespace chordfield::engine {
namespace {

static QString notesToString(const voicing::Voicing& notes) {
    QStringList parts;
    for (int n : notes) parts << util::midiNoteName(n);
    return parts.join(' ');
}

} // namespace

QJsonObject TriggerResult::toJsonObject() const {
    QJsonObject o;
    o.insert("chord", chord.toJsonObject());
    QJsonArray n;
    for (int m : notes) n.push_back(m);
    o.insert("notes", n);
    o.insert("key", keyPc);
    if (!modeKey.isEmpty()) o.insert("mode", modeKey);
    if (modulation.detected) o.insert("modulation", modulation.toJsonObject());
    if (keyChanged) o.insert("key_changed", true);
    o.insert("glow", glow.toJsonArray());
    o.insert("suggestions", suggestions.toJsonObject());
    QJsonArray ctx;
    for (const auto& c : contextChords) ctx.push_back(c.toJsonObject());
    o.insert("context", ctx);
    return o;
}

QString TriggerResult::toJsonString(bool compact) const {
    const QJsonDocument doc(toJsonObject());
    return QString::fromUtf8(doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented));
}

ChordFieldSession::ChordFieldSession(const ChordFieldEngine& engine)
    : m_engine(engine)
    , m_autoModulate(engine.profile().autoModulate) {}

void ChordFieldSession::setKey(int keyPc) {
    keyPc = util::normalizePc(keyPc);
    if (keyPc == m_keyPc) return;
    m_keyPc = keyPc;
    resetVoiceLeading();
}

void ChordFieldSession::setMode(ontology::Mode mode) {
    if (!m_engine.tables().mode(mode) || mode == m_mode) return;
    m_mode = mode;
    resetVoiceLeading();
}

void ChordFieldSession::cycleMode(int direction) {
    setMode(ontology::ChordModel::cycleMode(m_mode, direction));
}

void ChordFieldSession::setOctaveOffset(int offset) {
    m_octaveOffset = qBound(-3, offset, 3);
}

void ChordFieldSession::setChromaticRoot(int pc) {
    m_chromaticRootPc = (pc < 0) ? -1 : util::normalizePc(pc);
}

void ChordFieldSession::resetVoiceLeading() {
    m_context.clear();
    m_hasLastChord = false;
}

TriggerResult ChordFieldSession::trigger(int row, int column, ontology::QualityModifier modifier) {
    ontology::ChordDescriptor chord = m_engine.gridChord(row, column, m_keyPc, m_mode, m_chromaticRootPc);
    const ontology::Quality upgraded = m_engine.model().applyQualityModifier(chord.quality, modifier);
    if (upgraded != chord.quality) {
        const ontology::ChordDescriptor base = chord;
        chord = m_engine.model().describe(base.rootPc, upgraded, m_keyPc, m_mode);
        chord.row = base.row;
        chord.column = base.column;
        chord.roman = m_engine.model().romanLabel(base.column, upgraded);
    }
    return play(chord);
}

TriggerResult ChordFieldSession::triggerChord(int rootPc, ontology::Quality quality) {
    return play(m_engine.model().describe(rootPc, quality, m_keyPc, m_mode));
}

void ChordFieldSession::rememberRoot(int rootPc) {
    const int window = m_engine.profile().recentRootWindow;
    m_recentRoots.push_back(rootPc);
    while (m_recentRoots.size() > window) m_recentRoots.removeFirst();
}

TriggerResult ChordFieldSession::play(const ontology::ChordDescriptor& chord) {
    TriggerResult r;
    r.chord = chord;
    r.notes = m_engine.voiceChord(chord.rootPc, chord.quality, m_voicingType,
                                  m_context.previousVoicing, m_octaveOffset, m_context.previousRootPc);

    if (m_hasLastChord) {
        r.modulation = m_engine.detectModulation(m_lastRootPc, m_lastQuality,
                                                 chord.rootPc, chord.quality, m_keyPc, m_mode);
    }

    // Commit only what was actually produced.
    if (!r.notes.isEmpty()) m_context.commit(r.notes, chord.rootPc);
    m_hasLastChord = true;
    m_lastRootPc = chord.rootPc;
    m_lastQuality = chord.quality;
    rememberRoot(chord.rootPc);

    if (r.modulation.detected && m_autoModulate) {
        qDebug().noquote() << QString("ChordField: modulating %1 -> %2 (%3, %4)")
                                  .arg(m_engine.model().keyName(m_keyPc),
                                       m_engine.model().keyName(r.modulation.newKeyPc),
                                       theory::confidenceKey(r.modulation.confidence),
                                       r.modulation.evidence);
        // Seamless: the chord just played keeps leading into the new key.
        m_keyPc = r.modulation.newKeyPc;
        m_mode = r.modulation.mode;
        r.keyChanged = true;
    }

    r.keyPc = m_keyPc;
    if (const ontology::ModeDef* m = m_engine.tables().mode(m_mode)) r.modeKey = m->key;
    r.glow = m_engine.glowGrid(chord.pitchClasses, m_keyPc, m_mode, m_chromaticRootPc);
    r.suggestions = m_engine.computeSuggestions(chord.rootPc, chord.quality, m_keyPc, m_mode, m_recentRoots);
    r.contextChords = m_engine.computeContextChords(chord.rootPc, chord.quality, m_keyPc, m_mode);

    if (m_engine.profile().reasoningLogEnabled) {
        qDebug().noquote() << QString("ChordField: %1 %2 -> [%3]")
                                  .arg(chord.name, chord.roman, notesToString(r.notes));
    }
    return r;
}

} // namespace chordfield::engine
