#include"CanoClassSettings.hpp"
#include"CoordRef.hpp"

namespace canoclass {

	int defaultThreadCount()
	{
		return std::max(1, (int)std::thread::hardware_concurrency());
	}

	void CanoClassSettings::validate() const
	{
		if (threads < 1) {
			throw std::invalid_argument("threads must be at least 1");
		}
		if (smoothWindow <= 0 || smoothWindow % 2 != 1) {
			throw std::invalid_argument("The smoothing window must be odd and positive; got " + std::to_string(smoothWindow));
		}
		if (projection) {
			try {
				CoordRef crs{ *projection };
			}
			catch (const std::runtime_error& e) {
				throw std::invalid_argument(e.what());
			}
		}
	}

	std::filesystem::path CanoClassSettings::resolve(const std::filesystem::path& p) const
	{
		if (p.empty() || p.is_absolute() || workspace.empty()) {
			return p;
		}
		return workspace / p;
	}
}
