#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "chordfield/engine/ChordFieldEngine.h"

namespace chordfield::engine {

// Everything a surface needs after one chord trigger.
struct TriggerResult {
    ontology::ChordDescriptor chord;
    voicing::Voicing notes;
    theory::ModulationResult modulation;
    bool keyChanged = false;
    int keyPc = 0;                // key in effect after the trigger
    QString modeKey;
    theory::GlowGrid glow;        // relative to the chord just played
    theory::Suggestions suggestions;
    QVector<theory::ContextChord> contextChords;

    QJsonObject toJsonObject() const;
    QString toJsonString(bool compact = true) const;
};

// Per-surface performance state: key, mode, voicing selection and the
// voice-leading memory. Single writer; one session per input surface.
class ChordFieldSession {
public:
    explicit ChordFieldSession(const ChordFieldEngine& engine);

    int keyPc() const { return m_keyPc; }
    ontology::Mode mode() const { return m_mode; }
    ontology::VoicingType voicingType() const { return m_voicingType; }
    int octaveOffset() const { return m_octaveOffset; }
    int chromaticRootPc() const { return m_chromaticRootPc; }
    bool autoModulate() const { return m_autoModulate; }
    const voicing::VoiceLeadingContext& context() const { return m_context; }
    const QVector<int>& recentRoots() const { return m_recentRoots; }

    // Key and mode changes restart voice leading.
    void setKey(int keyPc);
    void setMode(ontology::Mode mode);
    void cycleMode(int direction);

    void setVoicingType(ontology::VoicingType type) { m_voicingType = type; }
    void setOctaveOffset(int offset);
    // -1 restores the default flat-II chromatic column.
    void setChromaticRoot(int pc);
    void setAutoModulate(bool on) { m_autoModulate = on; }

    void resetVoiceLeading();

    // Grid pad, optionally upgraded by the quality ring.
    TriggerResult trigger(int row, int column,
                          ontology::QualityModifier modifier = ontology::QualityModifier::Seventh);
    // Any chord (context pads, suggestions, ring).
    TriggerResult triggerChord(int rootPc, ontology::Quality quality);

private:
    TriggerResult play(const ontology::ChordDescriptor& chord);
    void rememberRoot(int rootPc);

    const ChordFieldEngine& m_engine;

    int m_keyPc = 0;
    ontology::Mode m_mode = ontology::Mode::Ionian;
    ontology::VoicingType m_voicingType = ontology::VoicingType::Close;
    int m_octaveOffset = 0;
    int m_chromaticRootPc = -1;
    bool m_autoModulate = true;

    voicing::VoiceLeadingContext m_context;
    QVector<int> m_recentRoots;

    bool m_hasLastChord = false;
    int m_lastRootPc = 0;
    ontology::Quality m_lastQuality = ontology::Quality::Maj7;
};

} // namespace chordfield::engine
