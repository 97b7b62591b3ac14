#include "cli/cli_parser.hpp"
#include "core/errors.hpp"
#include "segment/pipeline.hpp"

#include <iostream>

static const char* kUsage =
    "Usage: tissueseg_segment [--in <brain_slice.png|.pgm|dicom>] [--out <masks.json>]\n";

static void print_row(const char* name, size_t n, size_t total) {
    const double pct = total ? 100.0 * static_cast<double>(n) / static_cast<double>(total) : 0.0;
    std::cout << "  " << name << ": " << n << " px (" << pct << "%)\n";
}

int main(int argc, char** argv) {
    tissueseg::CliParser cli;
    cli.parse(argc, argv);
    if (cli.has("help")) {
        std::cout << kUsage;
        return 0;
    }
    const auto unknown = cli.unknown_keys({"in", "out", "help"});
    if (!unknown.empty() || !cli.positional().empty()) {
        std::cerr << "[ERROR] unexpected argument: "
                  << (unknown.empty() ? cli.positional().front() : "--" + unknown.front()) << "\n"
                  << kUsage;
        return 1;
    }

    const std::string in = cli.get("in", "brain_slice.png");
    const std::string out = cli.get("out", "masks.json");

    try {
        const auto r = tissueseg::segment_file(in, out);

        std::cout << "input: " << in << " (" << r.width << "x" << r.height << ")\n";
        print_row("background", r.stats.background, r.stats.total());
        print_row("csf", r.stats.csf, r.stats.total());
        print_row("gm", r.stats.gm, r.stats.total());
        print_row("wm", r.stats.wm, r.stats.total());
        std::cout << "Wrote: " << out << " (" << r.json.size() << " bytes)\n";
        std::cout << "Masks generated successfully.\n";
        return 0;
    } catch (const tissueseg::InputError& e) {
        std::cerr << "[INPUT] " << tissueseg::to_string(e.kind()) << ": " << e.what() << "\n";
        return 2;
    } catch (const tissueseg::EncodingError& e) {
        std::cerr << "[ENCODE] " << e.what() << "\n";
        return 3;
    } catch (const tissueseg::OutputError& e) {
        std::cerr << "[OUTPUT] " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 5;
    }
}
