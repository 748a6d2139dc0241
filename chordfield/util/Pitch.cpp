#include "chordfield/util/Pitch.h"

#include <QChar>
#include <QtGlobal>
#include <cmath>

namespace chordfield::util {
namespace {

static int letterToPc(QChar letter) {
    switch (letter.toUpper().unicode()) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default:  return -1;
    }
}

static int floorDiv12(int v) {
    return (v >= 0) ? (v / 12) : -((11 - v) / 12);
}

} // namespace

int roundHalfUp(double v) {
    return int(std::floor(v + 0.5));
}

bool parsePitchClass(QString token, int& pcOut) {
    token = token.trimmed();
    if (token.isEmpty()) return false;

    token.replace(QChar(0x266D), 'b'); // ♭
    token.replace(QChar(0x266F), '#'); // ♯

    const int base = letterToPc(token[0]);
    if (base < 0) return false;

    int acc = 0;
    for (int i = 1; i < token.size(); ++i) {
        const QChar c = token[i];
        if (c == 'b') acc -= 1;
        else if (c == '#') acc += 1;
        else break;
    }

    pcOut = normalizePc(base + acc);
    return true;
}

QString spellPitchClass(int pc, bool preferFlats) {
    pc = normalizePc(pc);
    static const char* kSharps[12] = {"C","C#","D","D#","E","F","F#","G","G#","A","A#","B"};
    static const char* kFlats[12]  = {"C","Db","D","Eb","E","F","Gb","G","Ab","A","Bb","B"};
    return preferFlats ? QString::fromLatin1(kFlats[pc]) : QString::fromLatin1(kSharps[pc]);
}

QString midiNoteName(int midi) {
    return spellPitchClass(midi, false) + QString::number(floorDiv12(midi) - 1);
}

int findClosest(int pc, int target) {
    pc = normalizePc(pc);
    const int octave = floorDiv12(target);
    int best = octave * 12 + pc;
    int bestDist = 9999;
    for (int o = octave - 1; o <= octave + 1; ++o) {
        const int candidate = o * 12 + pc;
        const int d = qAbs(candidate - target);
        if (d < bestDist) {
            bestDist = d;
            best = candidate;
        }
    }
    return best;
}

int findNextAbove(int pc, int current) {
    int m = floorDiv12(current) * 12 + normalizePc(pc);
    if (m <= current) m += 12;
    return m;
}

int wrapIntoRange(int midi, int lo, int hi) {
    if (hi - lo < 11) return qBound(lo, midi, hi);
    while (midi < lo) midi += 12;
    while (midi > hi) midi -= 12;
    return midi;
}

int centroid(const QVector<int>& notes, int fallback) {
    if (notes.isEmpty()) return fallback;
    double sum = 0.0;
    for (int n : notes) sum += n;
    return roundHalfUp(sum / double(notes.size()));
}

QVector<int> uniquePitchClasses(const QVector<int>& notesOrPcs) {
    QVector<int> out;
    out.reserve(notesOrPcs.size());
    for (int n : notesOrPcs) {
        const int pc = normalizePc(n);
        if (!out.contains(pc)) out.push_back(pc);
    }
    return out;
}

} // namespace chordfield::util
