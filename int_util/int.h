#ifndef ECBASE_INT_UTIL_INT_H_INCLUDED
#define ECBASE_INT_UTIL_INT_H_INCLUDED

#ifdef _MSC_VER
#pragma warning(disable: 4319) // C4319: '~': zero extending 'const unsigned long' to 'boost::multiprecision::double_limb_type' of greater size
#endif
#include <boost/multiprecision/cpp_int.hpp>

namespace ecbase {

// Signed despite the name; intermediate results of the curve equations go negative before reduction
using large_uint = boost::multiprecision::cpp_int;

} // namespace ecbase

#endif
