#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Array.hpp"

struct Image;

// Cut-level policy: maps raw values linearly between a (low, high) pair into
// an index range, and knows how to pick that pair for an image.
class AutoCuts {
public:
    virtual ~AutoCuts() = default;

    virtual const std::string& getName() const = 0;
    virtual std::pair<float, float> calcCutLevels(const Image& image) const = 0;

    // low maps to vmin and high to vmax, values outside are clipped.
    // NaN maps to vmin. With low == high, values above low map to vmax.
    IndexArray cutLevels(const FloatArray& data, float low, float high,
                         uint32_t vmin, uint32_t vmax) const;

    static std::shared_ptr<AutoCuts> create(const std::string& name);
    static const std::vector<std::string>& getMethods();
};

class MinMaxCuts : public AutoCuts {
public:
    const std::string& getName() const override;
    std::pair<float, float> calcCutLevels(const Image& image) const override;
};

// clips the given fraction of samples at both ends of the histogram
class HistogramCuts : public AutoCuts {
private:
    float pct;

public:
    explicit HistogramCuts(float pct = 0.999f);

    const std::string& getName() const override;
    std::pair<float, float> calcCutLevels(const Image& image) const override;

    float getPct() const { return pct; }
};
