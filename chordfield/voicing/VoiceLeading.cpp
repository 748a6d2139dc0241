#include "chordfield/voicing/VoiceLeading.h"

#include "chordfield/util/Pitch.h"

#include <QSet>
#include <QtGlobal>
#include <algorithm>

namespace chordfield::voicing {
namespace {

using util::normalizePc;

static bool inRange(int m, int lo, int hi) { return m >= lo && m <= hi; }

static int sign(int v) { return (v > 0) - (v < 0); }

// Nearest placement of one of `pcs` to `prevNote` among the three surrounding octaves.
// Returns false when nothing fits the range.
static bool nearestPlacement(const QVector<int>& pcs, int prevNote, const VoicingProfile& p,
                             int& noteOut, int& pcOut) {
    int bestDist = 9999;
    bool found = false;
    const int octave = prevNote / 12;
    for (int pc : pcs) {
        for (int o = octave - 1; o <= octave + 1; ++o) {
            const int c = o * 12 + pc;
            if (!inRange(c, p.minMidiNote, p.maxMidiNote)) continue;
            const int d = qAbs(c - prevNote);
            if (d < bestDist) {
                bestDist = d;
                noteOut = c;
                pcOut = pc;
                found = true;
            }
        }
    }
    return found;
}

} // namespace

void VoiceLeadingContext::clear() {
    previousVoicing.clear();
    previousRootPc = -1;
}

void VoiceLeadingContext::commit(const Voicing& voicing, int rootPc) {
    previousVoicing = voicing;
    previousRootPc = normalizePc(rootPc);
}

int tendencyResolution(int intervalFromRoot) {
    switch (normalizePc(intervalFromRoot)) {
    case 10: return -1; // b7 -> 3rd of the next chord
    case 11: return -1; // maj7
    case 6: return -1;  // tritone
    case 1: return -1;  // b9
    case 8: return +1;  // #5/b13
    default: return 0;
    }
}

Voicing voiceLeadNatural(const QVector<int>& targetPcs, const Voicing& prev, int prevRootPc,
                         const VoicingProfile& profile) {
    if (prev.isEmpty()) return targetPcs;

    Voicing sortedPrev = prev;
    std::sort(sortedPrev.begin(), sortedPrev.end());
    const QVector<int> targets = util::uniquePitchClasses(targetPcs);
    const int prevRoot = (prevRootPc >= 0) ? normalizePc(prevRootPc) : 0;

    QVector<int> result(sortedPrev.size(), -1);
    QSet<int> placed;

    // 1) Common tones
    for (int i = 0; i < sortedPrev.size(); ++i) {
        const int pc = normalizePc(sortedPrev[i]);
        if (targets.contains(pc) && !placed.contains(pc)) {
            result[i] = sortedPrev[i];
            placed.insert(pc);
        }
    }

    // 2) Tendency tones
    for (int i = 0; i < sortedPrev.size(); ++i) {
        if (result[i] >= 0) continue;
        const int dir = tendencyResolution(sortedPrev[i] - prevRoot);
        if (dir == 0) continue;
        const int resolved = sortedPrev[i] + dir;
        const int pc = normalizePc(resolved);
        if (!inRange(resolved, profile.minMidiNote, profile.maxMidiNote)) continue;
        if (targets.contains(pc) && !placed.contains(pc)) {
            result[i] = resolved;
            placed.insert(pc);
        }
    }

    // 3) Stepwise: each free voice takes the nearest free pitch class.
    QVector<int> free;
    for (int pc : targets) {
        if (!placed.contains(pc)) free.push_back(pc);
    }
    for (int i = 0; i < sortedPrev.size(); ++i) {
        if (result[i] >= 0 || free.isEmpty()) continue;
        int note = -1;
        int pc = -1;
        if (nearestPlacement(free, sortedPrev[i], profile, note, pc)) {
            result[i] = note;
            free.removeOne(pc);
        }
    }

    // More voices than pitch classes: the voice holds its previous note.
    for (int i = 0; i < sortedPrev.size(); ++i) {
        if (result[i] < 0) result[i] = sortedPrev[i];
    }

    // More pitch classes than voices: place the rest around the old centre.
    const int center = util::centroid(sortedPrev, profile.defaultCenter);
    for (int pc : free) result.push_back(util::findClosest(pc, center));

    std::sort(result.begin(), result.end());
    return result;
}

int voiceLeadBass(int rootPc, int prevBass, const VoicingProfile& profile) {
    rootPc = normalizePc(rootPc);
    if (prevBass <= 0) {
        return util::wrapIntoRange(util::findClosest(rootPc, profile.bassCenter),
                                   profile.bassMinMidiNote, profile.bassMaxMidiNote);
    }

    int best = -1;
    int bestScore = 9999;
    for (int c = profile.bassMinMidiNote; c <= profile.bassMaxMidiNote; ++c) {
        if (normalizePc(c) != rootPc) continue;
        const int motion = qAbs(c - prevBass);
        const int interval = motion % 12;
        int score = motion;
        if (interval == 5 || interval == 7) score -= 3;
        if (interval <= 2) score -= 2;
        if (interval == 0) score -= 4;
        if (score < bestScore) {
            bestScore = score;
            best = c;
        }
    }

    if (best < 0) return util::findClosest(rootPc, profile.bassCenter);
    return best;
}

Voicing retainCommonTones(const Voicing& voicing, const Voicing& prev) {
    if (prev.isEmpty() || voicing.isEmpty()) return voicing;

    Voicing out = voicing;
    Voicing sortedPrev = prev;
    std::sort(sortedPrev.begin(), sortedPrev.end());

    for (int p : sortedPrev) {
        if (out.contains(p)) continue;
        const int pc = normalizePc(p);
        int bestIdx = -1;
        int bestDist = 9999;
        for (int i = 0; i < out.size(); ++i) {
            if (normalizePc(out[i]) != pc) continue;
            if (sortedPrev.contains(out[i])) continue; // already sitting on an old note
            const int d = qAbs(out[i] - p);
            if (d < bestDist) {
                bestDist = d;
                bestIdx = i;
            }
        }
        if (bestIdx >= 0) out[bestIdx] = p;
    }

    std::sort(out.begin(), out.end());
    return out;
}

Voicing applyRegisterGravity(const Voicing& voicing, const VoicingProfile& profile, int* octavesOut) {
    if (octavesOut) *octavesOut = 0;
    if (voicing.isEmpty()) return voicing;

    double sum = 0.0;
    for (int n : voicing) sum += n;
    const double mean = sum / double(voicing.size());
    if (mean >= profile.gravityLow && mean <= profile.gravityHigh) return voicing;

    const int octaves = util::roundHalfUp((profile.gravityTarget - mean) / 12.0);
    if (octavesOut) *octavesOut = octaves;
    return transposeOctaves(voicing, octaves);
}

Voicing transposeOctaves(const Voicing& voicing, int octaves) {
    if (octaves == 0) return voicing;
    Voicing out;
    out.reserve(voicing.size());
    for (int n : voicing) out.push_back(n + octaves * 12);
    return out;
}

Voicing clampToRange(const Voicing& voicing, const VoicingProfile& profile) {
    Voicing out;
    out.reserve(voicing.size());
    for (int n : voicing) out.push_back(util::wrapIntoRange(n, profile.minMidiNote, profile.maxMidiNote));
    return out;
}

Voicing resolveUnisons(const Voicing& voicing, const VoicingProfile& profile) {
    Voicing sorted = voicing;
    std::sort(sorted.begin(), sorted.end());

    Voicing out;
    out.reserve(sorted.size());
    for (int n : sorted) {
        int m = n;
        while (out.contains(m) && m + 12 <= profile.maxMidiNote) m += 12;
        if (!out.contains(m)) out.push_back(m);
        std::sort(out.begin(), out.end());
    }
    return out;
}

Voicing applyMaxSpread(const Voicing& voicing, const VoicingProfile& profile) {
    if (voicing.size() < 2) return voicing;
    Voicing out = voicing;
    const int gap = out[1] - out[0];
    if (gap > profile.maxBassSpread && out[0] + 12 < out[1]) {
        out[0] += 12;
        std::sort(out.begin(), out.end());
    }
    return out;
}

bool isStrictlyAscending(const Voicing& voicing) {
    for (int i = 1; i < voicing.size(); ++i) {
        if (voicing[i] <= voicing[i - 1]) return false;
    }
    return true;
}

void enforceContraryMotion(int& bass, Voicing& upper, const Voicing& sortedPrev, const VoicingProfile& profile) {
    if (upper.isEmpty() || sortedPrev.size() < 2) return;

    const int bassDir = sign(bass - sortedPrev.first());
    const int topDir = sign(upper.last() - sortedPrev.last());
    if (bassDir == 0 || bassDir != topDir) return;

    // Prefer moving the bass against the soprano.
    const int flippedBass = bass - 12 * bassDir;
    if (flippedBass >= profile.bassMinMidiNote && flippedBass <= profile.bassMaxMidiNote
        && flippedBass < upper.first() && upper.first() - flippedBass <= profile.maxBassSpread) {
        bass = flippedBass;
        return;
    }

    const int flippedTop = upper.last() - 12 * topDir;
    const int below = (upper.size() > 1) ? upper[upper.size() - 2] : bass;
    if (flippedTop >= profile.openMinMidiNote && flippedTop <= profile.openMaxMidiNote && flippedTop > below) {
        upper.last() = flippedTop;
    }
}

} // namespace chordfield::voicing
