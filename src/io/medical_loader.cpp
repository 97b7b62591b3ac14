#include "io/medical_loader.hpp"

#include <dcmtk/config/osconfig.h>   // MUST be first with DCMTK on some platforms
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/dcmdata/dcdeftag.h>
#include <dcmtk/dcmdata/dcxfer.h>

#include "core/errors.hpp"
#include "format/png_codec.hpp"
#include "io/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace tissueseg {
namespace {

static InputError malformed(const std::string& msg) {
    return InputError(InputError::Kind::Malformed, msg);
}

static void require(bool ok, const std::string& msg) {
    if (!ok) throw malformed(msg);
}

static void skip_ws_and_comments(std::istream& is) {
    while (true) {
        int c = is.peek();
        if (c == '#') {
            std::string dummy;
            std::getline(is, dummy);
            continue;
        }
        if (c == EOF) return;
        if (std::isspace(static_cast<unsigned char>(c))) {
            is.get();
            continue;
        }
        return;
    }
}

static std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static Image load_png(const std::string& path, const std::vector<uint8_t>& bytes) {
    try {
        return decode_png_gray(bytes);
    } catch (const EncodingError& e) {
        throw malformed("load: invalid PNG (" + path + "): " + e.what());
    }
}

static Image load_pgm(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw InputError(InputError::Kind::Unreadable, "load: cannot open file: " + path);

    std::string magic;
    ifs >> magic;
    require(magic == "P5", "load: only PGM P5 is supported: " + path);

    skip_ws_and_comments(ifs);
    int w = 0, h = 0;
    ifs >> w >> h;
    if (w <= 0 || h <= 0) throw InputError(InputError::Kind::Empty, "load: invalid PGM size: " + path);

    skip_ws_and_comments(ifs);
    int maxv = 0;
    ifs >> maxv;
    require(maxv > 0 && maxv <= 65535, "load: invalid PGM maxval: " + path);

    // consume one whitespace after header
    ifs.get();

    Image im;
    im.width = w;
    im.height = h;
    im.channels = 1;
    im.bits_allocated = (maxv <= 255) ? 8 : 16;
    im.bits_stored = im.bits_allocated;
    im.is_signed = false;
    im.type = (im.bits_allocated == 8) ? PixelType::U8 : PixelType::U16;
    im.pixels.resize(static_cast<size_t>(w) * h);

    if (im.bits_allocated == 8) {
        std::vector<uint8_t> buf(static_cast<size_t>(w) * h);
        ifs.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        require(ifs.gcount() == static_cast<std::streamsize>(buf.size()), "load: PGM payload too short: " + path);
        for (size_t i = 0; i < buf.size(); ++i) im.pixels[i] = static_cast<int32_t>(buf[i]);
    } else {
        // PGM 16-bit is big-endian
        const size_t n = static_cast<size_t>(w) * h;
        for (size_t i = 0; i < n; ++i) {
            uint8_t hi = 0, lo = 0;
            ifs.read(reinterpret_cast<char*>(&hi), 1);
            ifs.read(reinterpret_cast<char*>(&lo), 1);
            require(ifs.good(), "load: PGM payload too short: " + path);
            uint16_t v = static_cast<uint16_t>((hi << 8) | lo);
            im.pixels[i] = static_cast<int32_t>(v);
        }
    }
    return im;
}

static InputError dcmtk_error(const std::string& where, const OFCondition& cond) {
    return malformed("load: " + where + ": " + cond.text());
}

static void require_pixel_count(unsigned long count, size_t expected, const std::string& path) {
    require(count >= expected, "load: PixelData holds " + std::to_string(count) + " samples, expected " +
                                   std::to_string(expected) + ": " + path);
}

static int get_instance_number(const std::string& path) {
    DcmFileFormat file;
    OFCondition st = file.loadFile(path.c_str(), EXS_Unknown, EGL_noChange, 0);
    if (st.bad()) return 0;
    DcmDataset* ds = file.getDataset();
    if (!ds) return 0;

    Sint32 inst = 0;
    st = ds->findAndGetSint32(DCM_InstanceNumber, inst);
    if (st.good()) return static_cast<int>(inst);
    return 0;
}

static Image load_dicom_file_uncompressed(const std::string& path) {
    DcmFileFormat file;
    OFCondition st = file.loadFile(
        path.c_str(),
        EXS_Unknown,       // don't force transfer syntax
        EGL_noChange,      // keep group length encoding
        DCM_MaxReadLength  // read full value fields (incl. PixelData)
    );
    if (st.bad()) throw dcmtk_error("DICOM loadFile failed (" + path + ")", st);

    DcmDataset* ds = file.getDataset();
    require(ds != nullptr, "load: DICOM dataset is null: " + path);

    const DcmXfer xfer(ds->getOriginalXfer());
    require(!xfer.isEncapsulated(),
            "load: compressed/encapsulated DICOM is not supported (TransferSyntax=" +
            std::string(xfer.getXferName()) + "): " + path);

    Uint16 rows = 0, cols = 0;
    Uint16 bitsStored = 0, bitsAllocated = 0;
    Uint16 pixelRep = 0; // 0=unsigned, 1=signed
    Uint16 spp = 1;

    st = ds->findAndGetUint16(DCM_Rows, rows);
    if (st.bad()) throw dcmtk_error("missing/invalid Rows", st);
    st = ds->findAndGetUint16(DCM_Columns, cols);
    if (st.bad()) throw dcmtk_error("missing/invalid Columns", st);
    st = ds->findAndGetUint16(DCM_BitsStored, bitsStored);
    if (st.bad()) throw dcmtk_error("missing/invalid BitsStored", st);
    st = ds->findAndGetUint16(DCM_BitsAllocated, bitsAllocated);
    if (st.bad()) throw dcmtk_error("missing/invalid BitsAllocated", st);
    st = ds->findAndGetUint16(DCM_PixelRepresentation, pixelRep);
    if (st.bad()) throw dcmtk_error("missing/invalid PixelRepresentation", st);

    st = ds->findAndGetUint16(DCM_SamplesPerPixel, spp);
    if (st.good()) {
        require(spp == 1, "load: only SamplesPerPixel=1 (grayscale) is supported: " + path);
    }

    OFString photo;
    st = ds->findAndGetOFString(DCM_PhotometricInterpretation, photo);
    if (st.good()) {
        require(photo == "MONOCHROME2",
                "load: unsupported PhotometricInterpretation: " + std::string(photo.c_str()) + " (" + path + ")");
    }

    Sint32 nFrames = 1;
    st = ds->findAndGetSint32(DCM_NumberOfFrames, nFrames);
    if (st.bad()) nFrames = 1;
    require(nFrames == 1, "load: only single-frame DICOM is supported: " + path);

    require(bitsAllocated == 16 || bitsAllocated == 8,
            "load: only BitsAllocated=8 or 16 is supported: " + path);
    require(bitsStored >= 1 && bitsStored <= bitsAllocated,
            "load: invalid BitsStored: " + path);
    if (rows == 0 || cols == 0) {
        throw InputError(InputError::Kind::Empty, "load: DICOM has zero rows/columns: " + path);
    }

    const size_t N = static_cast<size_t>(cols) * static_cast<size_t>(rows);

    Image im;
    im.width = static_cast<int>(cols);
    im.height = static_cast<int>(rows);
    im.channels = 1;
    im.bits_stored = static_cast<int>(bitsStored);
    im.bits_allocated = static_cast<int>(bitsAllocated);
    im.is_signed = (pixelRep == 1);
    im.type = im.is_signed ? PixelType::S16 : (bitsAllocated <= 8 ? PixelType::U8 : PixelType::U16);
    im.pixels.resize(N);

    if (bitsAllocated == 8) {
        const Uint8* u8 = nullptr;
        unsigned long count = 0;
        st = ds->findAndGetUint8Array(DCM_PixelData, u8, &count);
        if (st.bad() || !u8) throw dcmtk_error("failed to read Uint8 PixelData", st);
        require_pixel_count(count, N, path);
        for (size_t i = 0; i < N; ++i) im.pixels[i] = static_cast<int32_t>(u8[i]);
        return im;
    }

    // PixelData with VR=OW may refuse findAndGetSint16Array even when signed;
    // try Uint16 first and reinterpret.
    const Uint16* u16 = nullptr;
    unsigned long count = 0;
    OFCondition st_u16 = ds->findAndGetUint16Array(DCM_PixelData, u16, &count);
    if (st_u16.good() && u16) {
        require_pixel_count(count, N, path);
        for (size_t i = 0; i < N; ++i) {
            if (im.is_signed) {
                const int16_t s = static_cast<int16_t>(u16[i]); // preserve bit-pattern
                im.pixels[i] = static_cast<int32_t>(s);
            } else {
                im.pixels[i] = static_cast<int32_t>(u16[i]);
            }
        }
        return im;
    }

    const Sint16* s16 = nullptr;
    OFCondition st_s16 = ds->findAndGetSint16Array(DCM_PixelData, s16, &count);
    if (st_s16.bad() || !s16) {
        throw dcmtk_error("failed to read Uint16 PixelData", st_u16);
    }
    require_pixel_count(count, N, path);
    for (size_t i = 0; i < N; ++i) im.pixels[i] = static_cast<int32_t>(s16[i]);
    return im;
}

static Image load_dicom_series(const std::string& dir) {
    namespace fs = std::filesystem;

    struct Item { std::string p; int inst; };
    std::vector<Item> items;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    const fs::directory_iterator end;
    while (!ec && it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            const std::string p = it->path().string();
            items.push_back({p, get_instance_number(p)});
        }
        it.increment(ec);
    }
    if (ec) {
        throw InputError(InputError::Kind::Unreadable, "load: cannot list folder " + dir + ": " + ec.message());
    }
    if (items.empty()) throw InputError(InputError::Kind::Empty, "load: no files in folder: " + dir);
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        if (a.inst != b.inst) return a.inst < b.inst;
        return a.p < b.p;
    });

    for (const auto& it : items) {
        try {
            return load_dicom_file_uncompressed(it.p);
        } catch (const InputError& e) {
#ifndef NDEBUG
            std::cerr << "skip " << it.p << ": " << e.what() << "\n";
#endif
        }
    }
    throw malformed("load: no readable DICOM found in folder: " + dir);
}

static void validate(const Image& im, const std::string& path) {
    if (im.width <= 0 || im.height <= 0 || im.empty()) {
        throw InputError(InputError::Kind::Empty, "load: image has no pixels: " + path);
    }
    if (im.pixels.size() != static_cast<size_t>(im.width) * static_cast<size_t>(im.height)) {
        throw InputError(InputError::Kind::Empty, "load: pixel buffer size mismatch: " + path);
    }
}

} // namespace

Image load_medical(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        throw InputError(InputError::Kind::NotFound, "load: no such file: " + path);
    }

    Image im;
    if (fs::is_directory(path, ec)) {
        im = load_dicom_series(path);
    } else {
        const std::vector<uint8_t> bytes = read_all(path);
        if (bytes.empty()) throw InputError(InputError::Kind::Empty, "load: file is empty: " + path);

        const std::string p = lower(path);
        if (has_png_signature(bytes)) {
            im = load_png(path, bytes);
        } else if (ends_with(p, ".pgm") || (bytes.size() >= 2 && bytes[0] == 'P' && bytes[1] == '5')) {
            im = load_pgm(path);
        } else {
            // DICOM commonly has no extension
            try {
                im = load_dicom_file_uncompressed(path);
            } catch (const InputError& e) {
                throw malformed(std::string("load: not a supported PNG/PGM/DICOM image: ") + e.what());
            }
        }
    }

    validate(im, path);
    return im;
}

GrayImage to_gray8(const Image& im) {
    if (im.channels != 1) throw malformed("load: only single-channel images can be reduced to gray");
    if (im.width <= 0 || im.height <= 0 ||
        im.pixels.size() != static_cast<size_t>(im.width) * static_cast<size_t>(im.height)) {
        throw InputError(InputError::Kind::Empty, "load: image has no pixels");
    }

    GrayImage g(im.width, im.height);
    if (im.bits_stored <= 8 && !im.is_signed) {
        for (size_t i = 0; i < im.pixels.size(); ++i) {
            g.pixels[i] = static_cast<uint8_t>(std::clamp<int32_t>(im.pixels[i], 0, 255));
        }
        return g;
    }

    const auto [mn_it, mx_it] = std::minmax_element(im.pixels.begin(), im.pixels.end());
    const double mn = *mn_it;
    double mx = *mx_it;
    if (mx <= mn) mx = mn + 1.0;
    const double scale = 255.0 / (mx - mn);
#ifndef NDEBUG
    std::cerr << "to_gray8: rescale [" << mn << ", " << mx << "] -> [0, 255]\n";
#endif
    for (size_t i = 0; i < im.pixels.size(); ++i) {
        const double v = (im.pixels[i] - mn) * scale + 0.5;
        g.pixels[i] = static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
    }
    return g;
}

GrayImage load_grayscale(const std::string& path) {
    return to_gray8(load_medical(path));
}

} // namespace tissueseg
