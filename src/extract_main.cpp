// Inverse of tissueseg_segment: masks.json -> wm.png, gm.png, csf.png.
#include "cli/cli_parser.hpp"
#include "core/errors.hpp"
#include "format/png_codec.hpp"
#include "io/file_io.hpp"
#include "segment/mask_document.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static const char* kUsage = "Usage: tissueseg_extract --in <masks.json> --out_dir <dir>\n";

int main(int argc, char** argv) {
    namespace fs = std::filesystem;

    tissueseg::CliParser cli;
    cli.parse(argc, argv);
    const std::string in = cli.get("in");
    const std::string out_dir = cli.get("out_dir");
    if (in.empty() || out_dir.empty() || !cli.unknown_keys({"in", "out_dir"}).empty()) {
        std::cerr << kUsage;
        return 1;
    }

    try {
        const std::vector<uint8_t> raw = tissueseg::read_all(in);
        const auto doc = tissueseg::parse_mask_document(std::string(raw.begin(), raw.end()));
        const auto masks = tissueseg::decode_mask_document(doc);

        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) throw tissueseg::OutputError("write: cannot create directory " + out_dir + ": " + ec.message());

        const std::pair<const char*, const tissueseg::RgbaImage*> layers[] = {
            {"wm", &masks.wm}, {"gm", &masks.gm}, {"csf", &masks.csf}};
        for (const auto& [name, mask] : layers) {
            const std::string path = (fs::path(out_dir) / (std::string(name) + ".png")).string();
            tissueseg::write_all(path, tissueseg::encode_png(*mask));
            std::cout << "Wrote: " << path << " (" << mask->width << "x" << mask->height << ")\n";
        }
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
