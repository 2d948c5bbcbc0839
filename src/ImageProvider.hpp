#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <nonstd/expected.hpp>

#include "Progressable.hpp"

struct Image;
struct PNGPrivate;

class ImageProvider : public Progressable {
public:
    using Result = nonstd::expected<std::shared_ptr<Image>, std::string>;

private:
    std::atomic<bool> loaded;
    Result result;

protected:
    void onFinish(const Result& res)
    {
        this->result = res;
        loaded = true;
    }

    static Result makeError(typename Result::error_type e)
    {
        return nonstd::make_unexpected<typename Result::error_type>(std::move(e));
    }

public:
    ImageProvider()
        : loaded(false)
    {
    }

    virtual ~ImageProvider()
    {
    }

    Result getResult() const
    {
        if (!loaded)
            return makeError("image not loaded yet");
        return result;
    }

    bool isLoaded() const override
    {
        return loaded;
    }

    // picks a provider from the file extension, nullptr if none fits
    static std::shared_ptr<ImageProvider> create(const std::string& filename);
    // progresses a provider until the image is loaded
    static Result load(const std::string& filename);
};

class FileImageProvider : public ImageProvider {
protected:
    std::string filename;

public:
    FileImageProvider(const std::string& filename)
        : filename(filename)
    {
    }
};

// decodes one scanline per progress() call
class JPEGFileImageProvider : public FileImageProvider {
private:
    class impl;
    std::unique_ptr<impl> pimpl;

public:
    JPEGFileImageProvider(const std::string& filename);

    ~JPEGFileImageProvider() override;

    float getProgressPercentage() const override;

    void progress() override;
};

// reads the file by chunks of 4KiB through the progressive libpng reader
class PNGFileImageProvider : public FileImageProvider {
    std::unique_ptr<PNGPrivate> p;

    int initialize_png_reader();

public:
    PNGFileImageProvider(const std::string& filename)
        : FileImageProvider(filename)
    {
    }

    ~PNGFileImageProvider() override;

    float getProgressPercentage() const override;

    void progress() override;

    void onPNGError(const std::string& error);
};
