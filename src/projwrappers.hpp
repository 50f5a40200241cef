#pragma once
#ifndef canoclass_projwrappers_h
#define canoclass_projwrappers_h

#include"canoclass_pch.hpp"
#include"CanoClassTypeDefs.hpp"


namespace canoclass {

	using SharedPJ = std::shared_ptr<PJ>;
	SharedPJ makeSharedPJ(PJ* pj);

	using SharedPJCtx = std::shared_ptr<PJ_CONTEXT>;
	SharedPJCtx getNewPJContext();

	//PJ_CONTEXT objects are not thread-safe, so each thread gets its own
	class ProjContextByThread {
	private:
		inline static std::unordered_map<std::thread::id, SharedPJCtx> _ctxs;
	public:
		static PJ_CONTEXT* get();
	};

	SharedPJ projCreateWrapper(const std::string& s);

	//returns the WKT1 (GDAL flavor) representation of the object, or an empty string if PROJ can't produce one
	std::string projAsWktWrapper(const SharedPJ& p);
	std::string projNameWrapper(const SharedPJ& p);

	//true if the two objects describe the same CRS, ignoring axis order differences in geographic CRSs
	bool projIsEquivalentWrapper(const SharedPJ& a, const SharedPJ& b);
}

#endif
