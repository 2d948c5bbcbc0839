#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <doctest.h>

#include "Image.hpp"
#include "ImageProvider.hpp"
#include "strutils.hpp"

static std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return std::tolower(ch); });
    return s;
}

std::shared_ptr<ImageProvider> ImageProvider::create(const std::string& filename)
{
    std::string name = lowercase(filename);
    if (endswith(name, ".png")) {
        return std::make_shared<PNGFileImageProvider>(filename);
    }
    if (endswith(name, ".jpg") || endswith(name, ".jpeg")) {
        return std::make_shared<JPEGFileImageProvider>(filename);
    }
    return nullptr;
}

ImageProvider::Result ImageProvider::load(const std::string& filename)
{
    std::shared_ptr<ImageProvider> provider = create(filename);
    if (!provider) {
        return makeError("unsupported image format for '" + filename + "'");
    }
    while (!provider->isLoaded()) {
        provider->progress();
    }
    return provider->getResult();
}

extern "C" {
    #include <jpeglib.h>
}

class JPEGFileImageProvider::impl {
public:
    impl(JPEGFileImageProvider *provider)
        : cinfo(), file(nullptr), created(false), started(false),
        pixels(nullptr), scanline(nullptr), jerr(), provider(provider)
    {
        cinfo.client_data = this;
        cinfo.err = jpeg_std_error(&jerr);
        jerr.error_exit = &impl::onJPEGError;
    }

    ~impl()
    {
        if (created) {
            jpeg_destroy_decompress(&cinfo);
        }
        if (file) {
            fclose(file);
        }
        if (pixels) {
            free(pixels);
        }
    }

    float getProgressPercentage() const {
        if (pixels) {
            return (float)cinfo.output_scanline / cinfo.output_height;
        }
        else {
            return 0.f;
        }
    }

    void progress()
    {
        if (setjmp(jmpbuf)) {
            return;
        }

        if (!started) {
            file = fopen(provider->filename.c_str(), "rb");
            if (!file) {
                provider->onFinish(makeError(provider->filename + ": " + strerror(errno)));
                return;
            }
            jpeg_create_decompress(&cinfo);
            created = true;
            jpeg_stdio_src(&cinfo, file);
            jpeg_read_header(&cinfo, TRUE);
            jpeg_start_decompress(&cinfo);
            started = true;

            size_t rowwidth = (size_t)cinfo.output_width * cinfo.output_components;
            pixels = (uint8_t*) malloc(rowwidth * cinfo.output_height);
            if (!pixels) {
                provider->onFinish(makeError("cannot allocate the image"));
                return;
            }
            scanline = std::unique_ptr<unsigned char[]>(new unsigned char[rowwidth]);
        } else if (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW sample = scanline.get();
            jpeg_read_scanlines(&cinfo, &sample, 1);
            size_t rowwidth = (size_t)cinfo.output_width * cinfo.output_components;
            memcpy(pixels + (size_t)(cinfo.output_scanline - 1) * rowwidth, scanline.get(), rowwidth);
        } else {
            jpeg_finish_decompress(&cinfo);

            std::shared_ptr<Image> image = std::make_shared<Image>(pixels,
                cinfo.output_width, cinfo.output_height, cinfo.output_components, Image::U8);
            pixels = nullptr;
            provider->onFinish(image);
        }
    }

private:
    static void onJPEGError(j_common_ptr cinfo)
    {
        char buf[JMSG_LENGTH_MAX];
        impl* self = (impl*) cinfo->client_data;
        (*cinfo->err->format_message)(cinfo, buf);
        self->provider->onFinish(makeError(self->provider->filename + ": " + buf));
        std::longjmp(self->jmpbuf, 1);
    }

    struct jpeg_decompress_struct cinfo;
    FILE* file;
    bool created;
    bool started;
    uint8_t* pixels;
    std::unique_ptr<unsigned char[]> scanline;
    struct jpeg_error_mgr jerr;
    std::jmp_buf jmpbuf;
    JPEGFileImageProvider* provider;
};

JPEGFileImageProvider::JPEGFileImageProvider(const std::string& filename)
    : FileImageProvider(filename), pimpl(new impl(this))
{
}

JPEGFileImageProvider::~JPEGFileImageProvider()
{

}

float JPEGFileImageProvider::getProgressPercentage() const {
    return pimpl->getProgressPercentage();
}

void JPEGFileImageProvider::progress()
{
    return pimpl->progress();
}

#include <png.h>

struct PNGPrivate {
    PNGFileImageProvider* provider;

    FILE* file;
    png_structp png_ptr;
    png_infop info_ptr;
    uint32_t width, height;
    int channels;
    int depth;
    uint32_t cur;
    std::unique_ptr<png_byte[]> pngframe;

    uint32_t length;
    std::unique_ptr<png_byte[]> buffer;

    PNGPrivate(PNGFileImageProvider* provider)
        : provider(provider), file(nullptr), png_ptr(nullptr), info_ptr(nullptr),
          width(0), height(0), channels(0), depth(0), cur(0), pngframe(nullptr),
          length(0), buffer(nullptr)
    {}

    ~PNGPrivate() {
        if (png_ptr) {
            png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        }
        if (file) {
            fclose(file);
        }
    }

    size_t rowbytes() const
    {
        return (size_t)width * channels * depth / 8;
    }

    void info_callback()
    {
        // palettes and low bit depths are expanded to 8 bits samples
        png_set_expand(png_ptr);
        if (png_get_interlace_type(png_ptr, info_ptr) != PNG_INTERLACE_NONE) {
            png_set_interlace_handling(png_ptr);
        }
        png_read_update_info(png_ptr, info_ptr);

        width = png_get_image_width(png_ptr, info_ptr);
        height = png_get_image_height(png_ptr, info_ptr);
        channels = png_get_channels(png_ptr, info_ptr);
        depth = png_get_bit_depth(png_ptr, info_ptr);
        pngframe = std::unique_ptr<png_byte[]>(new png_byte[rowbytes() * height]());
    }

    void row_callback(png_bytep new_row, png_uint_32 row_num, int pass)
    {
        if (new_row) {
            png_progressive_combine_row(png_ptr, pngframe.get() + row_num * rowbytes(), new_row);
        }
        cur = row_num;
    }

    void end_callback()
    {
        cur = height;
    }

    std::shared_ptr<Image> getImage()
    {
        size_t n = (size_t)width * height * channels;
        switch (depth) {
            case 8: {
                uint8_t* pixels = (uint8_t*) malloc(n);
                if (!pixels)
                    return nullptr;
                memcpy(pixels, pngframe.get(), n);
                return std::make_shared<Image>(pixels, width, height, channels, Image::U8);
            }
            case 16: {
                uint16_t* pixels = (uint16_t*) malloc(n * sizeof(uint16_t));
                if (!pixels)
                    return nullptr;
                // samples are stored big endian
                for (size_t i = 0; i < n; i++) {
                    png_byte *b = pngframe.get() + i * 2;
                    pixels[i] = (uint16_t)((b[0] << 8) | b[1]);
                }
                return std::make_shared<Image>(pixels, width, height, channels, Image::U16);
            }
            default:
                return nullptr;
        }
    }
};

PNGFileImageProvider::~PNGFileImageProvider() = default;

float PNGFileImageProvider::getProgressPercentage() const
{
    if (!p || p->height == 0)
        return 0.f;
    return (float) p->cur / p->height;
}

static void on_error(png_structp pp, const char* msg)
{
    void* userdata = png_get_error_ptr(pp);
    PNGPrivate* p = (PNGPrivate*) userdata;
    p->provider->onPNGError(msg);
}

static void info_callback(png_structp png_ptr, png_infop info)
{
    void* userdata = png_get_progressive_ptr(png_ptr);
    PNGPrivate* p = (PNGPrivate*) userdata;
    p->info_callback();
}

static void row_callback(png_structp png_ptr, png_bytep new_row,
                         png_uint_32 row_num, int pass)
{
    void* userdata = png_get_progressive_ptr(png_ptr);
    PNGPrivate* p = (PNGPrivate*) userdata;
    p->row_callback(new_row, row_num, pass);
}

static void end_callback(png_structp png_ptr, png_infop info)
{
    void* userdata = png_get_progressive_ptr(png_ptr);
    PNGPrivate* p = (PNGPrivate*) userdata;
    p->end_callback();
}

int PNGFileImageProvider::initialize_png_reader()
{
    p->png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, (png_voidp) p.get(), on_error, nullptr);
    if (!p->png_ptr)
        return 1;

    p->info_ptr = png_create_info_struct(p->png_ptr);
    if (!p->info_ptr) {
        png_destroy_read_struct(&p->png_ptr, (png_infopp)nullptr,
                                (png_infopp)nullptr);
        return 1;
    }

    if (setjmp(png_jmpbuf(p->png_ptr))) {
        return 2;
    }

    png_set_progressive_read_fn(p->png_ptr, p.get(), ::info_callback, ::row_callback, ::end_callback);
    return 0;
}

void PNGFileImageProvider::progress()
{
    if (!p) {
        p = std::make_unique<PNGPrivate>(this);
        p->file = fopen(filename.c_str(), "rb");
        if (!p->file) {
            onFinish(makeError(filename + ": " + strerror(errno)));
            return;
        }

        int ret = initialize_png_reader();
        if (ret != 0) {
            onFinish(makeError("cannot initialize png reader"));
            return;
        }

        p->length = 1<<12;
        p->buffer = std::unique_ptr<png_byte[]>(new png_byte[p->length]);
        p->cur = 0;
    } else if (!feof(p->file)) {
        size_t read = fread(p->buffer.get(), 1, p->length, p->file);

        if (ferror(p->file)) {
            onFinish(makeError(filename + ": " + strerror(errno)));
            return;
        }

        if (setjmp(png_jmpbuf(p->png_ptr))) {
            return;
        }

        png_process_data(p->png_ptr, p->info_ptr, p->buffer.get(), read);
    } else {
        if (!p->pngframe || p->cur < p->height) {
            onFinish(makeError(filename + ": truncated png file"));
            return;
        }
        std::shared_ptr<Image> image = p->getImage();
        if (!image) {
            onFinish(makeError(filename + ": unsupported png bit depth"));
        } else {
            onFinish(image);
        }
    }
}

void PNGFileImageProvider::onPNGError(const std::string& error)
{
    onFinish(makeError(filename + ": " + error));
    longjmp(png_jmpbuf(p->png_ptr), 1);
}

static std::string tempPath(const std::string& name)
{
    const char* dir = std::getenv("TMPDIR");
    return std::string(dir ? dir : "/tmp") + "/" + name;
}

static bool writeTestPNG(const std::string& path, int w, int h, int depth, int colorType,
                         const std::vector<png_byte>& rows)
{
    FILE* f = fopen(path.c_str(), "wb");
    if (!f)
        return false;
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(f);
        return false;
    }
    png_init_io(png, f);
    png_set_IHDR(png, info, w, h, depth, colorType, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    size_t stride = rows.size() / h;
    for (int y = 0; y < h; y++)
        png_write_row(png, const_cast<png_bytep>(rows.data() + y * stride));
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    fclose(f);
    return true;
}

TEST_CASE("PNGFileImageProvider")
{
    SUBCASE("8 bits rgb")
    {
        std::string path = tempPath("ginga_provider_rgb.png");
        std::vector<png_byte> rows = {
            255, 0, 0,   0, 255, 0,   0, 0, 255,
            10, 20, 30,  40, 50, 60,  70, 80, 90,
        };
        REQUIRE(writeTestPNG(path, 3, 2, 8, PNG_COLOR_TYPE_RGB, rows));

        auto res = ImageProvider::load(path);
        REQUIRE(res.has_value());
        auto image = res.value();
        CHECK(image->w == 3);
        CHECK(image->h == 2);
        CHECK(image->c == 3);
        CHECK(image->format == Image::U8);
        CHECK(image->getOrder() == "RGB");
        CHECK(image->at(1, 0, 1) == 255.f);
        CHECK(image->at(2, 1, 0) == 70.f);
        remove(path.c_str());
    }

    SUBCASE("16 bits gray")
    {
        std::string path = tempPath("ginga_provider_gray16.png");
        std::vector<png_byte> rows = { 0x01, 0x02, 0xff, 0xff };
        REQUIRE(writeTestPNG(path, 2, 1, 16, PNG_COLOR_TYPE_GRAY, rows));

        auto res = ImageProvider::load(path);
        REQUIRE(res.has_value());
        auto image = res.value();
        CHECK(image->format == Image::U16);
        CHECK(image->getOrder() == "M");
        CHECK(image->at(0, 0, 0) == 258.f);
        CHECK(image->at(1, 0, 0) == 65535.f);
        remove(path.c_str());
    }

    SUBCASE("not a png")
    {
        std::string path = tempPath("ginga_provider_garbage.png");
        FILE* f = fopen(path.c_str(), "wb");
        REQUIRE(f);
        fputs("this is not an image", f);
        fclose(f);

        auto res = ImageProvider::load(path);
        CHECK(!res.has_value());
        remove(path.c_str());
    }
}

TEST_CASE("JPEGFileImageProvider")
{
    std::string path = tempPath("ginga_provider_flat.jpg");
    {
        FILE* f = fopen(path.c_str(), "wb");
        REQUIRE(f);
        struct jpeg_compress_struct cinfo;
        struct jpeg_error_mgr jerr;
        cinfo.err = jpeg_std_error(&jerr);
        jpeg_create_compress(&cinfo);
        jpeg_stdio_dest(&cinfo, f);
        cinfo.image_width = 8;
        cinfo.image_height = 4;
        cinfo.input_components = 1;
        cinfo.in_color_space = JCS_GRAYSCALE;
        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, 95, TRUE);
        jpeg_start_compress(&cinfo, TRUE);
        std::vector<unsigned char> row(8, 128);
        while (cinfo.next_scanline < cinfo.image_height) {
            JSAMPROW r = row.data();
            jpeg_write_scanlines(&cinfo, &r, 1);
        }
        jpeg_finish_compress(&cinfo);
        jpeg_destroy_compress(&cinfo);
        fclose(f);
    }

    auto res = ImageProvider::load(path);
    REQUIRE(res.has_value());
    auto image = res.value();
    CHECK(image->w == 8);
    CHECK(image->h == 4);
    CHECK(image->c == 1);
    CHECK(std::abs(image->at(3, 2, 0) - 128.f) <= 2.f);
    remove(path.c_str());

    SUBCASE("truncated")
    {
        FILE* f = fopen(path.c_str(), "wb");
        REQUIRE(f);
        const unsigned char soi[] = { 0xff, 0xd8, 0xff };
        fwrite(soi, 1, sizeof(soi), f);
        fclose(f);
        auto bad = ImageProvider::load(path);
        CHECK(!bad.has_value());
        remove(path.c_str());
    }
}

TEST_CASE("ImageProvider::load")
{
    CHECK(ImageProvider::create("a.PNG") != nullptr);
    CHECK(ImageProvider::create("b.jpeg") != nullptr);
    CHECK(ImageProvider::create("c.tif") == nullptr);

    auto res = ImageProvider::load("c.tif");
    REQUIRE(!res.has_value());
    CHECK(res.error().find("unsupported") != std::string::npos);

    res = ImageProvider::load(tempPath("ginga_does_not_exist.png"));
    CHECK(!res.has_value());
}
