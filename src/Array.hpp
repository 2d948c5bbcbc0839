#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Interleaved pixel array: h rows of w pixels of c samples.
template <typename T>
struct Array {
    size_t w, h, c;
    std::vector<T> data;

    Array()
        : w(0)
        , h(0)
        , c(0)
    {
    }

    Array(size_t w, size_t h, size_t c, T fill = T())
        : w(w)
        , h(h)
        , c(c)
        , data(w * h * c, fill)
    {
    }

    size_t index(size_t x, size_t y, size_t d) const
    {
        return (y * w + x) * c + d;
    }

    T& at(size_t x, size_t y, size_t d)
    {
        return data[index(x, y, d)];
    }

    const T& at(size_t x, size_t y, size_t d) const
    {
        return data[index(x, y, d)];
    }

    bool empty() const
    {
        return w == 0 || h == 0 || c == 0;
    }

    bool operator==(const Array<T>& other) const
    {
        return w == other.w && h == other.h && c == other.c && data == other.data;
    }

    void flipY()
    {
        size_t row = w * c;
        for (size_t y = 0; y < h / 2; y++) {
            T* top = &data[y * row];
            T* bottom = &data[(h - 1 - y) * row];
            for (size_t i = 0; i < row; i++) {
                std::swap(top[i], bottom[i]);
            }
        }
    }

    Array<T> channel(size_t d) const
    {
        Array<T> out(w, h, 1);
        for (size_t i = 0; i < w * h; i++)
            out.data[i] = data[i * c + d];
        return out;
    }

    Array<T> withoutChannel(size_t d) const
    {
        Array<T> out(w, h, c - 1);
        for (size_t i = 0; i < w * h; i++) {
            size_t k = 0;
            for (size_t j = 0; j < c; j++) {
                if (j != d)
                    out.data[i * (c - 1) + k++] = data[i * c + j];
            }
        }
        return out;
    }
};

using FloatArray = Array<float>;
using IndexArray = Array<uint32_t>;
using RGBArray = Array<uint8_t>;

// Position of a channel letter ('R', 'G', 'B', 'A', 'M') in an order string, or -1.
inline int orderIndex(const std::string& order, char channel)
{
    size_t i = order.find(channel);
    return i == std::string::npos ? -1 : (int)i;
}

inline bool hasAlpha(const std::string& order)
{
    return order.find('A') != std::string::npos;
}

inline std::string withoutAlpha(const std::string& order)
{
    std::string out;
    for (char ch : order) {
        if (ch != 'A')
            out += ch;
    }
    return out;
}
