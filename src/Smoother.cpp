#include"Smoother.hpp"

namespace canoclass {

	namespace {
		using Histogram = std::array<int, 256>;

		class_t medianOf(const Histogram& h, int n) {
			int rank = n / 2;
			int seen = 0;
			for (int v = 0; v < 256; ++v) {
				seen += h[v];
				if (seen > rank) {
					return (class_t)v;
				}
			}
			return 255;
		}

		class_t majorityOf(const Histogram& h, bool centerHasValue, class_t center) {
			int best = 0;
			for (int v = 1; v < 256; ++v) {
				if (h[v] > h[best]) {
					best = v;
				}
			}
			if (centerHasValue && h[center] == h[best]) {
				return center;
			}
			return (class_t)best;
		}
	}

	SmoothFilter parseSmoothFilter(const std::string& name)
	{
		std::string lower = name;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		if (lower == "median") {
			return SmoothFilter::Median;
		}
		if (lower == "majority" || lower == "mode") {
			return SmoothFilter::Majority;
		}
		throw std::invalid_argument("Unknown smoothing filter: " + name + " (expected median or majority)");
	}

	std::string smoothFilterName(SmoothFilter filter)
	{
		return filter == SmoothFilter::Median ? "median" : "majority";
	}

	rowcol_t reflectIndex(rowcol_t i, rowcol_t n)
	{
		rowcol_t period = 2 * n;
		rowcol_t m = i % period;
		if (m < 0) {
			m += period;
		}
		return m < n ? m : period - 1 - m;
	}

	Raster<class_t> smoothClasses(const Raster<class_t>& r, int windowSize, SmoothFilter filter)
	{
		if (windowSize <= 0 || windowSize % 2 != 1) {
			throw std::invalid_argument("Invalid window size in smoothClasses: " + std::to_string(windowSize));
		}

		Raster<class_t> out{ (const Alignment&)r };
		const int lookDist = (windowSize - 1) / 2;

		auto addCell = [&](Histogram& h, int& n, rowcol_t row, rowcol_t col, int sign) {
			auto v = r.atRCUnsafe(reflectIndex(row, r.nrow()), reflectIndex(col, r.ncol()));
			if (v.has_value()) {
				h[v.value()] += sign;
				n += sign;
			}
			};

		for (rowcol_t row = 0; row < r.nrow(); ++row) {
			Histogram h{};
			int n = 0;
			for (rowcol_t dr = -lookDist; dr <= lookDist; ++dr) {
				for (rowcol_t dc = -lookDist; dc <= lookDist; ++dc) {
					addCell(h, n, row + dr, dc, 1);
				}
			}

			for (rowcol_t col = 0; col < r.ncol(); ++col) {
				if (col > 0) {
					//slide the window one column to the right
					for (rowcol_t dr = -lookDist; dr <= lookDist; ++dr) {
						addCell(h, n, row + dr, col - 1 - lookDist, -1);
						addCell(h, n, row + dr, col + lookDist, 1);
					}
				}
				auto o = out.atRCUnsafe(row, col);
				if (n == 0) {
					continue;
				}
				o.has_value() = true;
				if (filter == SmoothFilter::Median) {
					o.value() = medianOf(h, n);
				}
				else {
					auto center = r.atRCUnsafe(row, col);
					o.value() = majorityOf(h, center.has_value(), center.value());
				}
			}
		}
		return out;
	}
}
