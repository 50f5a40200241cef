#include"projwrappers.hpp"

namespace canoclass {

	PJ_CONTEXT* ProjContextByThread::get()
	{
		static std::mutex mut;
		std::scoped_lock<std::mutex> lock{ mut };
		std::thread::id thisthread = std::this_thread::get_id();
		if (!_ctxs.count(thisthread)) {
			_ctxs.emplace(thisthread, getNewPJContext());
		}
		return _ctxs.at(thisthread).get();
	}
	SharedPJ makeSharedPJ(PJ* pj)
	{
		return SharedPJ(pj,
			[](PJ* pj) {
				if (pj) {
					proj_destroy(pj);
				}
			}
		);
	}
	SharedPJCtx getNewPJContext()
	{
		return SharedPJCtx(proj_context_create(),
			[](PJ_CONTEXT* pjc) {
				if (pjc) {
					proj_context_destroy(pjc);
				}
			}
		);
	}
	SharedPJ projCreateWrapper(const std::string& s)
	{
		PJ* pj = proj_create(ProjContextByThread::get(), s.c_str());
		if (!pj) {
			return SharedPJ();
		}
		return makeSharedPJ(pj);
	}
	std::string projAsWktWrapper(const SharedPJ& p)
	{
		if (!p) {
			return "";
		}
		const char* wkt = proj_as_wkt(ProjContextByThread::get(), p.get(), PJ_WKT1_GDAL, nullptr);
		return wkt ? std::string(wkt) : std::string();
	}
	std::string projNameWrapper(const SharedPJ& p)
	{
		if (!p) {
			return "";
		}
		const char* name = proj_get_name(p.get());
		return name ? std::string(name) : std::string();
	}
	bool projIsEquivalentWrapper(const SharedPJ& a, const SharedPJ& b)
	{
		if (!a || !b) {
			return false;
		}
		return proj_is_equivalent_to_with_ctx(ProjContextByThread::get(), a.get(), b.get(),
			PJ_COMP_EQUIVALENT_EXCEPT_AXIS_ORDER_GEOGCRS) != 0;
	}
}
