#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Array.hpp"

struct ColorTable;

// Maps index arrays through a color table sampled into hashSize entries.
struct Colormap {
    std::string ID;
    std::shared_ptr<ColorTable> table;
    uint8_t maxc;

    Colormap(const std::string& tableName = "gray", size_t hashSize = 256);

    bool operator==(const Colormap& other);

    size_t getHashSize() const { return hashSize; }
    bool setHashSize(size_t size);

    void nextTable();
    void previousTable();
    const std::string& getTableName() const;
    bool setTable(const std::string& name);

    std::array<uint8_t, 3> lookup(uint32_t index) const;

    // idx is either a single channel (mapped through the table's RGB) or
    // has R, G and B channels, located through imageOrder, each mapped
    // through the matching table component. An 'A' in order is set to maxc.
    RGBArray getRGBArray(const IndexArray& idx, const std::string& order,
                         const std::string& imageOrder) const;

    // returns true when the table or the hash size changed
    bool displaySettings();
    bool parseArg(const std::string& arg);

private:
    size_t hashSize;
    std::vector<std::array<uint8_t, 3>> lut;

    void rebuild();
};
