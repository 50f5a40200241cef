#pragma once
#ifndef canoclass_pch_h
#define canoclass_pch_h

//std
#include<algorithm>
#include<array>
#include<atomic>
#include<cctype>
#include<cmath>
#include<cstdlib>
#include<cstdint>
#include<exception>
#include<filesystem>
#include<fstream>
#include<functional>
#include<iomanip>
#include<iostream>
#include<limits>
#include<map>
#include<memory>
#include<mutex>
#include<numeric>
#include<optional>
#include<random>
#include<sstream>
#include<stdexcept>
#include<string>
#include<thread>
#include<type_traits>
#include<unordered_map>
#include<unordered_set>
#include<variant>
#include<vector>

//gdal
#include<cpl_conv.h>
#include<cpl_error.h>
#include<gdal_priv.h>
#include<ogr_spatialref.h>
#include<ogrsf_frmts.h>

//proj
#include<proj.h>

//opencv
#include<opencv2/core.hpp>
#include<opencv2/ml.hpp>

//xtl
#include<xtl/xoptional.hpp>
#include<xtl/xoptional_sequence.hpp>

#endif
