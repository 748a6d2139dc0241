#pragma once

#include <QString>

#include "chordfield/ontology/ChordModel.h"
#include "chordfield/voicing/VoiceLeading.h"
#include "chordfield/voicing/VoicingProfile.h"

namespace chordfield::voicing {

// Turns (root, quality, voicing type) into concrete MIDI notes, leading smoothly
// from the previous voicing when one is given.
//
// Every result is strictly ascending and inside the profile's playable range.
// Stateless: the previous voicing is always passed in by the caller.
class VoicingEngine {
public:
    VoicingEngine(const ontology::ChordModel& model, VoicingProfile profile);

    const VoicingProfile& profile() const { return m_profile; }

    // prevRootPc < 0 means absent (treated as C for tendency tones).
    Voicing voiceChord(int rootPc,
                       ontology::Quality quality,
                       ontology::VoicingType type,
                       const Voicing& prev = {},
                       int octaveOffset = 0,
                       int prevRootPc = -1) const;

    Voicing voiceChord(int rootPc,
                       ontology::Quality quality,
                       ontology::VoicingType type,
                       const VoiceLeadingContext& context,
                       int octaveOffset = 0) const;

    // String boundary: unknown quality -> empty voicing; unknown voicing type -> close.
    Voicing voiceChord(int rootPc,
                       const QString& qualityKey,
                       const QString& voicingKey,
                       const Voicing& prev = {},
                       int octaveOffset = 0,
                       int prevRootPc = -1) const;

private:
    Voicing construct(int rootPc, ontology::Quality quality, ontology::VoicingType type,
                      const Voicing& prev, int prevRootPc) const;

    // Independent bass plus upper voices (stacked from scratch or led against prev).
    Voicing bassWithUpper(int bassPc, const QVector<int>& upperPcs, const Voicing& prev, int prevRootPc) const;

    Voicing voiceClose(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const;
    Voicing voiceDrop(const QVector<int>& pcs, const Voicing& prev, int prevRootPc, int dropFromTop) const;
    Voicing voiceOpen(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const;
    Voicing voiceRootless(const QVector<int>& pcs, const Voicing& prev, int prevRootPc, bool typeB) const;
    Voicing voiceQuartal(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const;
    Voicing voiceTriad(int rootPc, ontology::Quality quality, const Voicing& prev, int prevRootPc) const;

    Voicing buildClosePosition(const QVector<int>& pcs, const Voicing& prev) const;

    const ontology::ChordModel& m_model;
    VoicingProfile m_profile;
};

} // namespace chordfield::voicing
