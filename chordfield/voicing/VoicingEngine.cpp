#include "chordfield/voicing/VoicingEngine.h"

#include "chordfield/util/Pitch.h"

#include <QtDebug>
#include <QtGlobal>
#include <algorithm>
#include <utility>

namespace chordfield::voicing {
namespace {

using ontology::Quality;
using ontology::VoicingType;
using util::normalizePc;

static Voicing sortedCopy(const Voicing& v) {
    Voicing s = v;
    std::sort(s.begin(), s.end());
    return s;
}

static int lowestNote(const Voicing& v) {
    if (v.isEmpty()) return 0;
    return *std::min_element(v.begin(), v.end());
}

// Nearest chord tone to `pc` on the pitch-class circle; first match wins ties.
static int snapToChordTone(int pc, const QVector<int>& chordPcs) {
    int best = chordPcs.isEmpty() ? pc : chordPcs.first();
    int bestDist = 99;
    for (int c : chordPcs) {
        const int up = normalizePc(c - pc);
        const int d = qMin(up, 12 - up);
        if (d < bestDist) {
            bestDist = d;
            best = c;
        }
    }
    return best;
}

} // namespace

VoicingEngine::VoicingEngine(const ontology::ChordModel& model, VoicingProfile profile)
    : m_model(model)
    , m_profile(std::move(profile)) {}

Voicing VoicingEngine::voiceChord(int rootPc, Quality quality, VoicingType type,
                                  const Voicing& prev, int octaveOffset, int prevRootPc) const {
    if (!m_model.tables().quality(quality)) {
        qWarning().noquote() << QString("VoicingEngine: unknown quality %1").arg(int(quality));
        return {};
    }
    if (!m_model.tables().voicing(type)) type = VoicingType::Close;

    rootPc = normalizePc(rootPc);
    Voicing v = construct(rootPc, quality, type, prev, prevRootPc);
    if (v.isEmpty()) return v;

    v = retainCommonTones(v, prev);
    v = applyRegisterGravity(v, m_profile);
    v = transposeOctaves(v, octaveOffset);
    v = clampToRange(v, m_profile);
    v = resolveUnisons(v, m_profile);
    v = applyMaxSpread(v, m_profile);
    return v;
}

Voicing VoicingEngine::voiceChord(int rootPc, Quality quality, VoicingType type,
                                  const VoiceLeadingContext& context, int octaveOffset) const {
    return voiceChord(rootPc, quality, type, context.previousVoicing, octaveOffset, context.previousRootPc);
}

Voicing VoicingEngine::voiceChord(int rootPc, const QString& qualityKey, const QString& voicingKey,
                                  const Voicing& prev, int octaveOffset, int prevRootPc) const {
    const ontology::QualityDef* q = m_model.tables().qualityForKey(qualityKey);
    if (!q) {
        qWarning().noquote() << QString("VoicingEngine: unknown quality '%1'").arg(qualityKey);
        return {};
    }
    const ontology::VoicingTypeDef* vt = m_model.tables().voicingForKey(voicingKey);
    if (!vt && !voicingKey.trimmed().isEmpty()) {
        qWarning().noquote() << QString("VoicingEngine: unknown voicing '%1', using close").arg(voicingKey);
    }
    return voiceChord(rootPc, q->quality, vt ? vt->type : VoicingType::Close, prev, octaveOffset, prevRootPc);
}

Voicing VoicingEngine::construct(int rootPc, Quality quality, VoicingType type,
                                 const Voicing& prev, int prevRootPc) const {
    const QVector<int> pcs = m_model.chordPitchClasses(rootPc, quality);
    if (pcs.isEmpty()) return {};

    switch (type) {
    case VoicingType::Close: return voiceClose(pcs, prev, prevRootPc);
    case VoicingType::Drop2: return voiceDrop(pcs, prev, prevRootPc, 2);
    case VoicingType::Drop3: return voiceDrop(pcs, prev, prevRootPc, 3);
    case VoicingType::Open: return voiceOpen(pcs, prev, prevRootPc);
    case VoicingType::RootlessA: return voiceRootless(pcs, prev, prevRootPc, false);
    case VoicingType::RootlessB: return voiceRootless(pcs, prev, prevRootPc, true);
    case VoicingType::Quartal: return voiceQuartal(pcs, prev, prevRootPc);
    case VoicingType::Triad: return voiceTriad(rootPc, quality, prev, prevRootPc);
    }
    return voiceClose(pcs, prev, prevRootPc);
}

Voicing VoicingEngine::bassWithUpper(int bassPc, const QVector<int>& upperPcs,
                                     const Voicing& prev, int prevRootPc) const {
    const int bass = voiceLeadBass(bassPc, lowestNote(prev), m_profile);

    Voicing out;
    out.push_back(bass);
    if (prev.size() > 1) {
        const Voicing upperPrev = sortedCopy(prev).mid(1);
        out += voiceLeadNatural(upperPcs, upperPrev, prevRootPc, m_profile);
    } else {
        int cur = bass;
        for (int pc : upperPcs) {
            cur = util::findNextAbove(pc, cur);
            out.push_back(cur);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

Voicing VoicingEngine::voiceClose(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const {
    return bassWithUpper(pcs[0], pcs.mid(1, 4), prev, prevRootPc);
}

Voicing VoicingEngine::buildClosePosition(const QVector<int>& pcs, const Voicing& prev) const {
    const int center = util::centroid(prev, m_profile.defaultCenter);
    Voicing notes;
    int cur = util::findClosest(pcs[0], center - 4);
    notes.push_back(cur);
    const int count = qMin(pcs.size(), 4);
    for (int i = 1; i < count; ++i) {
        cur = util::findNextAbove(pcs[i], cur);
        notes.push_back(cur);
    }
    return notes;
}

Voicing VoicingEngine::voiceDrop(const QVector<int>& pcs, const Voicing& prev, int prevRootPc, int dropFromTop) const {
    if (pcs.size() < 4) {
        if (!prev.isEmpty()) return voiceLeadNatural(pcs, prev, prevRootPc, m_profile);
        return voiceClose(pcs, prev, prevRootPc);
    }

    Voicing dropped = sortedCopy(buildClosePosition(pcs, prev));
    const int idx = dropped.size() - dropFromTop;
    if (idx >= 0) dropped[idx] -= 12;
    std::sort(dropped.begin(), dropped.end());
    if (prev.isEmpty()) return dropped;

    // The lowest voice leads on its own; the rest of the shape keeps its spread.
    const int bass = voiceLeadBass(dropped.first(), lowestNote(prev), m_profile);
    return transposeOctaves(dropped, (bass - dropped.first()) / 12);
}

Voicing VoicingEngine::voiceOpen(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const {
    const int noteCount = qMin(pcs.size(), 5);
    const QVector<int> upperPcs = pcs.mid(1, noteCount - 1);
    int bass = voiceLeadBass(pcs[0], lowestNote(prev), m_profile);

    Voicing upper;
    if (prev.size() > 1) {
        const Voicing sortedPrev = sortedCopy(prev);
        for (int n : voiceLeadNatural(upperPcs, sortedPrev.mid(1), prevRootPc, m_profile)) {
            upper.push_back(util::wrapIntoRange(n, m_profile.openMinMidiNote, m_profile.openMaxMidiNote));
        }
        std::sort(upper.begin(), upper.end());
        enforceContraryMotion(bass, upper, sortedPrev, m_profile);
    } else {
        for (int i = 0; i < upperPcs.size(); ++i) {
            const int target = m_profile.openStartMidiNote + m_profile.openStep * i;
            upper.push_back(util::wrapIntoRange(util::findClosest(upperPcs[i], target),
                                                m_profile.openMinMidiNote, m_profile.openMaxMidiNote));
        }
    }

    Voicing out;
    out.push_back(bass);
    out += upper;
    std::sort(out.begin(), out.end());
    return out;
}

Voicing VoicingEngine::voiceRootless(const QVector<int>& pcs, const Voicing& prev, int prevRootPc, bool typeB) const {
    if (pcs.size() < 4) return voiceClose(pcs, prev, prevRootPc);

    // A: 3-5-7-9, B: 7-9-3-5; the 9 only when the chord has one.
    QVector<int> order;
    if (typeB) {
        order.push_back(pcs[3]);
        if (pcs.size() > 4) order.push_back(pcs[4]);
        order.push_back(pcs[1]);
        order.push_back(pcs[2]);
    } else {
        order = pcs.mid(1, 4);
    }

    if (!prev.isEmpty()) return voiceLeadNatural(order, prev, prevRootPc, m_profile);

    Voicing out;
    int cursor = m_profile.rootlessStartMidiNote;
    for (int pc : order) {
        const int note = util::findClosest(pc, cursor);
        out.push_back(note);
        cursor = note + 3;
    }
    std::sort(out.begin(), out.end());
    return out;
}

Voicing VoicingEngine::voiceQuartal(const QVector<int>& pcs, const Voicing& prev, int prevRootPc) const {
    const int bass = voiceLeadBass(pcs[0], lowestNote(prev), m_profile);

    // Stack fourths above the bass, snapping each to the nearest chord tone.
    QVector<int> upperPcs;
    int q = bass + 5;
    for (int i = 0; i < 3; ++i) {
        upperPcs.push_back(snapToChordTone(normalizePc(q), pcs));
        q += 5;
    }
    return bassWithUpper(pcs[0], upperPcs, prev, prevRootPc);
}

Voicing VoicingEngine::voiceTriad(int rootPc, Quality quality, const Voicing& prev, int prevRootPc) const {
    const ontology::QualityDef* q = m_model.tables().quality(quality);
    const QVector<int> triad = m_model.chordPitchClasses(rootPc, q ? q->triad : Quality::Maj);
    return bassWithUpper(triad[0], triad.mid(1, 2), prev, prevRootPc);
}

} // namespace chordfield::voicing
