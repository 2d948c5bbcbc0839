#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Array.hpp"

struct Image {
    std::string ID;
    size_t w, h, c;
    enum Format {
        U8,
        U16,
        I8,
        I16,
        F32,
    } format;

    float min;
    float max;

    // takes ownership of a malloc'ed buffer of w*h*c samples
    Image(void* pixels, size_t w, size_t h, size_t c, Format format, const std::string& order = "");
    Image(const std::vector<float>& pixels, size_t w, size_t h, const std::string& order);
    Image(const std::vector<uint8_t>& pixels, size_t w, size_t h, const std::string& order);
    ~Image();

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    const std::string& getOrder() const { return order; }

    // largest sample value of the storage format, 1 for floats
    static float maxValue(Format format);
    float getMaxValue() const { return maxValue(format); }

    void getPixelValueAt(size_t x, size_t y, float* values, size_t d) const;
    std::pair<float, float> quantiles(float quantile) const;

    FloatArray getScaledCutout(int x1, int y1, int x2, int y2, float sx, float sy,
                               const std::string& method) const;

    float at(size_t p) const
    {
        switch (format) {
        case U8:
            return (float)reinterpret_cast<uint8_t*>(pixels)[p];
        case I8:
            return (float)reinterpret_cast<int8_t*>(pixels)[p];
        case U16:
            return (float)reinterpret_cast<uint16_t*>(pixels)[p];
        case I16:
            return (float)reinterpret_cast<int16_t*>(pixels)[p];
        case F32:
            return reinterpret_cast<float*>(pixels)[p];
        }
        return 0; // cannot happen
    }
    float at(size_t x, size_t y, size_t d) const
    {
        return at(index(x, y, d));
    }
    size_t index(size_t x, size_t y, size_t d) const
    {
        return (y * w + x) * c + d;
    }

private:
    void* pixels;
    std::string order;

    void computeMinMax();
};

std::string defaultOrder(size_t channels);
