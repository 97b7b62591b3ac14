#include "format/png_codec.hpp"

#include "core/errors.hpp"

#include <png.h>

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <string>

namespace tissueseg {
namespace {

// Owns a png_image for the duration of a call; png_image_free is a no-op
// once libpng has already released it.
class PngImageGuard {
public:
    PngImageGuard() {
        std::memset(&image_, 0, sizeof(image_));
        image_.version = PNG_IMAGE_VERSION;
    }
    ~PngImageGuard() { png_image_free(&image_); }

    PngImageGuard(const PngImageGuard&) = delete;
    PngImageGuard& operator=(const PngImageGuard&) = delete;

    png_image* get() { return &image_; }
    png_image* operator->() { return &image_; }

private:
    png_image image_;
};

EncodingError image_error(const std::string& where, const png_image& im) {
    return EncodingError("png: " + where + ": " + im.message);
}

// Begins reading and switches the output format; returns the row stride in bytes.
size_t begin_read(PngImageGuard& img, const std::vector<uint8_t>& bytes, png_uint_32 format) {
    if (!has_png_signature(bytes)) throw EncodingError("png: bad signature");
    if (!png_image_begin_read_from_memory(img.get(), bytes.data(), bytes.size())) {
        throw image_error("header", *img.get());
    }
    img->format = format;
    if (img->width == 0 || img->height == 0) throw EncodingError("png: zero-sized image");
    return PNG_IMAGE_ROW_STRIDE(*img.get());
}

// Low-level read path for input images. Samples are taken as stored:
// no gamma handling, so gAMA/sRGB chunks never change intensities.
struct PngReadContext {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
    char message[128] = "unknown libpng error";
};

void on_png_read(png_structp png, png_bytep out, png_size_t n) {
    auto* ctx = static_cast<PngReadContext*>(png_get_io_ptr(png));
    if (n > ctx->size - ctx->pos) png_error(png, "unexpected end of data");
    std::memcpy(out, ctx->data + ctx->pos, n);
    ctx->pos += n;
}

void on_png_error(png_structp png, png_const_charp msg) {
    auto* ctx = static_cast<PngReadContext*>(png_get_error_ptr(png));
    std::snprintf(ctx->message, sizeof(ctx->message), "%s", msg);
    png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp) {}

class PngReadGuard {
public:
    explicit PngReadGuard(PngReadContext* ctx) {
        png_ = png_create_read_struct(PNG_LIBPNG_VER_STRING, ctx, on_png_error, on_png_warning);
        if (png_) info_ = png_create_info_struct(png_);
    }
    ~PngReadGuard() {
        if (png_) png_destroy_read_struct(&png_, info_ ? &info_ : nullptr, nullptr);
    }

    PngReadGuard(const PngReadGuard&) = delete;
    PngReadGuard& operator=(const PngReadGuard&) = delete;

    bool ok() const { return png_ != nullptr && info_ != nullptr; }
    png_structp png() { return png_; }
    png_infop info() { return info_; }

private:
    png_structp png_ = nullptr;
    png_infop info_ = nullptr;
};

struct PngLayout {
    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int channels = 0;
    size_t rowbytes = 0;
};

// libpng errors longjmp back into the two functions below, so they hold
// only trivially destructible locals.
bool read_layout(png_structp png, png_infop info, PngLayout* out) {
    if (setjmp(png_jmpbuf(png))) return false;

    png_read_info(png, info);
    png_uint_32 w = 0, h = 0;
    int depth = 0, colour = 0;
    png_get_IHDR(png, info, &w, &h, &depth, &colour, nullptr, nullptr, nullptr);

    if (colour == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
    if (colour == PNG_COLOR_TYPE_GRAY && depth < 8) png_set_expand_gray_1_2_4_to_8(png);
    // alpha (including palette tRNS expanded above) is dropped, never composited
    png_set_strip_alpha(png);
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    out->width = w;
    out->height = h;
    out->bit_depth = png_get_bit_depth(png, info);
    out->channels = png_get_channels(png, info);
    out->rowbytes = png_get_rowbytes(png, info);
    return true;
}

bool read_rows(png_structp png, png_infop info, png_bytepp rows) {
    if (setjmp(png_jmpbuf(png))) return false;
    png_read_image(png, rows);
    png_read_end(png, info);
    return true;
}

// 0.299 R + 0.587 G + 0.114 B on the stored values, 14-bit fixed point.
uint32_t luma(uint32_t r, uint32_t g, uint32_t b) {
    return (r * 4899u + g * 9617u + b * 1868u + 8192u) >> 14;
}

} // namespace

bool has_png_signature(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < sizeof(kPngSignature)) return false;
    return std::memcmp(bytes.data(), kPngSignature, sizeof(kPngSignature)) == 0;
}

std::vector<uint8_t> encode_png(const RgbaImage& im) {
    if (im.empty()) throw EncodingError("png: cannot encode an empty image");
    if (im.data.size() != im.pixel_count() * RgbaImage::kChannels) {
        throw EncodingError("png: buffer size mismatch");
    }

    PngImageGuard img;
    img->width = static_cast<png_uint_32>(im.width);
    img->height = static_cast<png_uint_32>(im.height);
    img->format = PNG_FORMAT_RGBA;

    const auto stride = static_cast<png_int_32>(im.stride());

    // first pass sizes the buffer, second pass writes into it
    png_alloc_size_t size = 0;
    if (!png_image_write_get_memory_size(*img.get(), size, 0, im.data.data(), stride, nullptr)) {
        throw image_error("sizing", *img.get());
    }

    std::vector<uint8_t> out(static_cast<size_t>(size));
    if (!png_image_write_to_memory(img.get(), out.data(), &size, 0, im.data.data(), stride, nullptr)) {
        throw image_error("write", *img.get());
    }
    out.resize(static_cast<size_t>(size));
    return out;
}

RgbaImage decode_png_rgba(const std::vector<uint8_t>& bytes) {
    PngImageGuard img;
    const size_t stride = begin_read(img, bytes, PNG_FORMAT_RGBA);

    RgbaImage out(static_cast<int>(img->width), static_cast<int>(img->height));
    if (stride != out.stride()) throw EncodingError("png: unexpected row stride");
    if (!png_image_finish_read(img.get(), nullptr, out.data.data(), 0, nullptr)) {
        throw image_error("read", *img.get());
    }
    return out;
}

Image decode_png_gray(const std::vector<uint8_t>& bytes) {
    if (!has_png_signature(bytes)) throw EncodingError("png: bad signature");

    PngReadContext ctx;
    ctx.data = bytes.data();
    ctx.size = bytes.size();

    PngReadGuard guard(&ctx);
    if (!guard.ok()) throw EncodingError("png: cannot create read struct");
    png_set_read_fn(guard.png(), &ctx, on_png_read);

    PngLayout layout;
    if (!read_layout(guard.png(), guard.info(), &layout)) {
        throw EncodingError(std::string("png: header: ") + ctx.message);
    }
    if (layout.width == 0 || layout.height == 0) throw EncodingError("png: zero-sized image");
    if ((layout.channels != 1 && layout.channels != 3) || (layout.bit_depth != 8 && layout.bit_depth != 16)) {
        throw EncodingError("png: unexpected layout after transforms (channels=" +
                            std::to_string(layout.channels) + ", depth=" +
                            std::to_string(layout.bit_depth) + ")");
    }

    const size_t w = layout.width;
    const size_t h = layout.height;
    std::vector<uint8_t> buf(layout.rowbytes * h);
    std::vector<png_bytep> rows(h);
    for (size_t y = 0; y < h; ++y) rows[y] = buf.data() + y * layout.rowbytes;
    if (!read_rows(guard.png(), guard.info(), rows.data())) {
        throw EncodingError(std::string("png: read: ") + ctx.message);
    }

    const bool deep = layout.bit_depth == 16;
    Image out;
    out.width = static_cast<int>(w);
    out.height = static_cast<int>(h);
    out.channels = 1;
    out.bits_allocated = deep ? 16 : 8;
    out.bits_stored = out.bits_allocated;
    out.is_signed = false;
    out.type = deep ? PixelType::U16 : PixelType::U8;
    out.pixels.resize(w * h);

    // PNG stores 16-bit samples big-endian
    auto sample = [&](const uint8_t* row, size_t i) -> uint32_t {
        if (!deep) return row[i];
        return (static_cast<uint32_t>(row[2 * i]) << 8) | row[2 * i + 1];
    };

    for (size_t y = 0; y < h; ++y) {
        const uint8_t* row = rows[y];
        for (size_t x = 0; x < w; ++x) {
            uint32_t v = 0;
            if (layout.channels == 1) {
                v = sample(row, x);
            } else {
                v = luma(sample(row, 3 * x), sample(row, 3 * x + 1), sample(row, 3 * x + 2));
            }
            out.pixels[y * w + x] = static_cast<int32_t>(v);
        }
    }
    return out;
}

} // namespace tissueseg
