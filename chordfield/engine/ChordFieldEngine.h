#pragma once

#include "chordfield/ontology/ChordModel.h"
#include "chordfield/ontology/HarmonicTables.h"
#include "chordfield/theory/ChordSuggester.h"
#include "chordfield/theory/HarmonicContext.h"
#include "chordfield/theory/ModulationDetector.h"
#include "chordfield/voicing/VoicingEngine.h"
#include "chordfield/voicing/VoicingProfile.h"

namespace chordfield::engine {

// Immutable handle over tables, voicing and analysis. Holds no performance
// state, so one instance can serve several sessions.
class ChordFieldEngine {
public:
    explicit ChordFieldEngine(voicing::VoicingProfile profile = voicing::defaultVoicingProfile());
    // Members refer to each other.
    ChordFieldEngine(const ChordFieldEngine&) = delete;
    ChordFieldEngine& operator=(const ChordFieldEngine&) = delete;

    const ontology::HarmonicTables& tables() const { return m_tables; }
    const ontology::ChordModel& model() const { return m_model; }
    const voicing::VoicingProfile& profile() const { return m_voicer.profile(); }

    voicing::Voicing voiceChord(int rootPc,
                                ontology::Quality quality,
                                ontology::VoicingType type,
                                const voicing::Voicing& prev,
                                int octaveOffset = 0,
                                int prevRootPc = -1) const;

    voicing::Voicing voiceChord(int rootPc,
                                const QString& qualityKey,
                                const QString& voicingKey,
                                const voicing::Voicing& prev,
                                int octaveOffset = 0,
                                int prevRootPc = -1) const;

    ontology::ChordDescriptor gridChord(int row, int column, int keyPc, ontology::Mode mode,
                                        int chromaticRootPc = -1) const;

    theory::GlowGrid glowGrid(const QVector<int>& referencePcs, int keyPc, ontology::Mode mode,
                              int chromaticRootPc = -1) const;

    theory::Suggestions computeSuggestions(int rootPc, ontology::Quality quality, int keyPc, ontology::Mode mode,
                                           const QVector<int>& recentRoots = {}) const;

    QVector<theory::ContextChord> computeContextChords(int rootPc, ontology::Quality quality, int keyPc,
                                                       ontology::Mode mode) const;

    theory::RingChord innerRingChord(int index, int keyPc, ontology::Mode mode) const;

    theory::ModulationResult detectModulation(int prevRootPc, ontology::Quality prevQuality,
                                              int currentRootPc, ontology::Quality currentQuality,
                                              int currentKeyPc, ontology::Mode mode) const;

private:
    ontology::HarmonicTables m_tables;
    ontology::ChordModel m_model;
    voicing::VoicingEngine m_voicer;
    theory::ChordSuggester m_suggester;
    theory::ModulationDetector m_detector;
};

} // namespace chordfield::engine
