#include "io/file_io.hpp"

#include "core/errors.hpp"

#include <filesystem>
#include <fstream>

namespace tissueseg {
namespace {

void write_bytes(const std::string& path, const char* data, size_t n) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw OutputError("write: cannot open for writing: " + path);
    ofs.write(data, static_cast<std::streamsize>(n));
    ofs.flush();
    if (!ofs.good()) throw OutputError("write: failed writing: " + path);
}

} // namespace

std::vector<uint8_t> read_all(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw InputError(InputError::Kind::NotFound, "load: no such file: " + path);
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) {
        throw InputError(InputError::Kind::Unreadable, "load: cannot open file: " + path);
    }
    ifs.seekg(0, std::ios::end);
    const std::streamsize n = ifs.tellg();
    if (n < 0) throw InputError(InputError::Kind::Unreadable, "load: cannot size file: " + path);
    ifs.seekg(0, std::ios::beg);

    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) {
        throw InputError(InputError::Kind::Unreadable, "load: short read: " + path);
    }
    return buf;
}

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    write_bytes(path, reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void write_text(const std::string& path, const std::string& text) {
    write_bytes(path, text.data(), text.size());
}

} // namespace tissueseg
