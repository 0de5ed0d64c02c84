#include "seqscope/composition.hpp"
#include "seqscope/stats.hpp"

namespace seqscope {

CompositionResult composition(std::string_view sequence, SequenceKind kind) {
    CompositionResult result;

    result.rna = isRnaLike(sequence, kind);
    result.length = sequence.length();

    const char t = result.thymineSymbol();
    result.counts = OrderedCounter(std::vector<std::string>{"A", std::string(1, t), "G", "C"});

    for (char c : sequence) {
        if (c == 'A' || c == t || c == 'G' || c == 'C') {
            result.counts.add(std::string_view(&c, 1));
        }
    }

    const auto a = static_cast<double>(result.count('A'));
    const auto tu = static_cast<double>(result.count(t));
    const auto g = static_cast<double>(result.count('G'));
    const auto c = static_cast<double>(result.count('C'));
    const auto n = static_cast<double>(result.length);

    result.gc_content = stats::roundTo(stats::percentage(g + c, n), 2);
    result.at_content = stats::roundTo(stats::percentage(a + tu, n), 2);
    result.gc_skew = stats::roundTo(stats::skew(g, c), 3);
    result.at_skew = stats::roundTo(stats::skew(a, tu), 3);

    return result;
}

CompositionResult composition(const NormalizedSequence& seq) {
    return composition(seq.bases(), seq.kind());
}

} // namespace seqscope
