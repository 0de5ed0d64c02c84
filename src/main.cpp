#include "seqscope/sequence.hpp"
#include "seqscope/composition.hpp"
#include "seqscope/codon_usage.hpp"
#include "seqscope/protein.hpp"
#include "seqscope/orf.hpp"
#include "seqscope/mutation.hpp"

#include <iostream>
#include <iomanip>
#include <iterator>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

using namespace seqscope;

namespace {

constexpr std::string_view kDemoSequence =
    ">demo_orf_cluster\n"
    "ATGGCTAAAGGCTTCCTGGAATAACGATGCCCATTGGTTGCCAGCGCTTAG\n"
    "GGATGAAAGGGTAATAGCCATGTCTGAACGCAAAGTTCTGTATTGACCGT\n";

struct Options {
    SequenceKind kind = SequenceKind::DNA;
    size_t frame = 0;
    OrfOptions orf;
    std::optional<std::string> query;
    std::optional<std::string> input;
    bool run_benchmarks = false;
    bool help = false;
};

// Helper for timing
template<typename Func>
auto measureTime(Func&& func, const std::string& name, bool report) {
    auto start = std::chrono::high_resolution_clock::now();
    auto result = func();
    auto end = std::chrono::high_resolution_clock::now();

    if (report) {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        std::cout << "  [" << name << ": " << duration.count() << " us]\n";
    }

    return result;
}

// Restores std::cout formatting when a report returns
class StreamStateGuard {
public:
    explicit StreamStateGuard(std::ostream& os)
        : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~StreamStateGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

    StreamStateGuard(const StreamStateGuard&) = delete;
    StreamStateGuard& operator=(const StreamStateGuard&) = delete;

private:
    std::ostream& os_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [SEQUENCE | -]\n\n"
              << "Analyse a DNA, RNA or protein sequence. '-' reads raw text\n"
              << "(FASTA accepted) from standard input. Without a sequence a\n"
              << "built-in demonstration sequence is used.\n\n"
              << "Options:\n"
              << "  -t, --type dna|rna|protein  declared sequence kind (default dna)\n"
              << "  -f, --frame N               translation frame offset 0-2 (default 0)\n"
              << "  -c, --compare QUERY         compare SEQUENCE against QUERY\n"
              << "  -m, --min-orf N             minimum ORF protein length (default 5)\n"
              << "  -b, --benchmark             print per-analysis timings\n"
              << "  -h, --help                  show this message\n";
}

size_t parseCount(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        unsigned long parsed = std::stoul(value, &consumed);
        if (consumed != value.length()) throw std::invalid_argument(value);
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid value '" + value + "' for " + flag);
    }
}

Options parseArgs(int argc, char* argv[]) {
    Options options;

    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--benchmark" || arg == "-b") {
            options.run_benchmarks = true;
        } else if (arg == "--type" || arg == "-t") {
            options.kind = parseSequenceKind(next(i, arg));
        } else if (arg == "--frame" || arg == "-f") {
            options.frame = parseCount(arg, next(i, arg));
            if (options.frame > 2) {
                throw std::invalid_argument("Frame offset must be 0, 1 or 2");
            }
        } else if (arg == "--min-orf" || arg == "-m") {
            options.orf.min_protein_length = parseCount(arg, next(i, arg));
        } else if (arg == "--compare" || arg == "-c") {
            options.query = next(i, arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option " + arg);
        } else if (!options.input) {
            options.input = arg;
        } else {
            throw std::invalid_argument("Only one sequence may be given");
        }
    }

    if (options.query && !isNucleotide(options.kind)) {
        throw std::invalid_argument("--compare needs a dna or rna sequence");
    }

    return options;
}

std::string readRawInput(const Options& options) {
    if (!options.input) return std::string(kDemoSequence);
    if (*options.input != "-") return *options.input;

    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

template<typename Range>
void printList(const Range& values) {
    bool first = true;
    for (const auto& v : values) {
        if (!first) std::cout << ", ";
        std::cout << v;
        first = false;
    }
}

void reportComposition(const NormalizedSequence& seq, bool timed) {
    StreamStateGuard guard(std::cout);
    printSeparator("Composition");

    auto result = measureTime([&]() { return composition(seq); }, "composition", timed);

    std::cout << "Length: " << result.length << "\n";
    for (const auto& entry : result.counts) {
        std::cout << "  " << entry.key << ": " << entry.count << "\n";
    }
    std::cout << std::fixed << std::setprecision(2)
              << "GC content: " << result.gc_content << "%\n"
              << (result.rna ? "AU" : "AT") << " content: " << result.at_content << "%\n"
              << std::setprecision(3)
              << "GC skew: " << result.gc_skew << "\n"
              << (result.rna ? "AU" : "AT") << " skew: " << result.at_skew << "\n";
}

void reportCodonUsage(const NormalizedSequence& seq, bool timed) {
    StreamStateGuard guard(std::cout);
    printSeparator("Codon Usage");

    auto result = measureTime([&]() { return codonUsage(seq); }, "codon usage", timed);

    std::cout << "Total codons: " << result.total_codons
              << " (" << result.codons.uniqueCount() << " distinct, "
              << result.stop_codons << " stop)\n";
    std::cout << "Most frequent: ";
    printList(result.most_frequent);
    std::cout << "\nLeast frequent: ";
    printList(result.least_frequent);
    std::cout << "\nCodon bias: " << std::fixed << std::setprecision(3) << result.codon_bias << "\n";
}

void reportProtein(const ProteinProperties& props) {
    StreamStateGuard guard(std::cout);
    std::cout << std::fixed << std::setprecision(2)
              << "Length: " << props.length << " aa\n"
              << "Molecular weight: " << props.molecular_weight << " Da\n"
              << "Isoelectric point (estimate): " << props.isoelectric_point << "\n"
              << "Mean hydropathy: " << props.hydropathy << "\n";
}

void reportTranslation(const NormalizedSequence& seq, size_t frame, bool timed) {
    printSeparator("Translation (frame offset " + std::to_string(frame) + ")");

    auto result = measureTime([&]() { return translate(seq, frame); }, "translation", timed);

    std::cout << "Protein: " << result.protein << "\n";
    reportProtein(result.properties);
}

void reportORFs(const NormalizedSequence& seq, const OrfOptions& options, bool timed) {
    StreamStateGuard guard(std::cout);
    printSeparator("Open Reading Frames");

    auto orfs = measureTime([&]() { return findORFs(seq, options); }, "ORF search", timed);

    std::cout << orfs.size() << " ORF(s) with at least " << options.min_protein_length
              << " residues\n";
    for (const auto& orf : orfs) {
        std::cout << "  frame " << orf.frame << "  " << orf.start << ".." << orf.end
                  << "  " << orf.length() << " aa  " << orf.protein << "\n";
    }

    if (!orfs.empty()) {
        auto frames = frameDistribution(orfs);
        std::cout << std::fixed << std::setprecision(1)
                  << "Coverage: " << orfCoverage(orfs, seq.length()) << "% of sequence\n"
                  << "Frame distribution: 1=" << frames[0] << ", 2=" << frames[1]
                  << ", 3=" << frames[2] << "\n";
    }
}

void reportMutations(const NormalizedSequence& reference, const NormalizedSequence& query,
                     bool timed) {
    StreamStateGuard guard(std::cout);
    printSeparator("Mutation Comparison");

    auto analysis = measureTime([&]() { return compareMutations(reference, query); },
                                "comparison", timed);

    std::cout << "Total mutations: " << analysis.total_mutations << "\n"
              << "Mutation rate: " << std::fixed << std::setprecision(2)
              << analysis.mutation_rate << "%\n";

    for (const auto& m : analysis.mutations) {
        std::cout << "  " << m.position << "  " << m.original.value_or('-') << " -> "
                  << m.mutated.value_or('-') << "  " << toString(m.type) << " ("
                  << toString(m.effect) << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    }

    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        auto seq = NormalizedSequence::fromRaw(readRawInput(options), options.kind);
        if (seq.empty()) {
            std::cerr << "Error: input holds no sequence symbols\n\n";
            printUsage(argv[0]);
            return 2;
        }

        std::cout << "seqscope - " << toString(seq.kind()) << " sequence, "
                  << seq.length() << " symbols\n";

        if (!isNucleotide(seq.kind())) {
            printSeparator("Protein Properties");
            reportProtein(proteinProperties(seq));
        } else {
            reportComposition(seq, options.run_benchmarks);
            reportCodonUsage(seq, options.run_benchmarks);
            reportTranslation(seq, options.frame, options.run_benchmarks);
            reportORFs(seq, options.orf, options.run_benchmarks);

            if (options.query) {
                auto query = NormalizedSequence::fromRaw(*options.query, options.kind);
                reportMutations(seq, query, options.run_benchmarks);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
